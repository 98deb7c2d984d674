#include "pod-validator/DocumentLoader.hpp"
#include "pod-validator/Logger.hpp"
#include "pod-validator/Options.hpp"
#include "pod-validator/SchemaValidator.hpp"
#include <iostream>
#include <string>

using namespace podval;

int main(int argc, char **argv) {
  const std::string program = argc > 0 ? argv[0] : "pod-validator";

  CliOptions options;
  try {
    options = parse_options(argc, argv);
  } catch (const UsageError &e) {
    std::cerr << "Error: " << e.what() << "\n";
    std::cerr << usage_text(program);
    return 2;
  }
  if (options.show_help) {
    std::cout << usage_text(program);
    return 0;
  }

  ValidatorLogger::instance().init(options.log_level, options.log_file);
  for (const auto &warning : options.warnings) {
    LOG_WARN("environment", "options", "{}", warning);
  }
  LOG_DEBUG(options.manifest_path, "main", "validating manifest");

  try {
    ValidationContext ctx = SchemaValidator::validate_file(options.manifest_path);

    if (options.format == OutputFormat::Json) {
      std::cout << ctx.to_json().dump(2) << std::endl;
    } else {
      ctx.flush(std::cout);
    }
    return ctx.has_errors() ? 1 : 0;
  } catch (const DocumentLoadError &e) {
    LOG_DEBUG(e.path(), "load", "load failed: {}", e.reason());
    std::cerr << e.what() << "\n";
    return 1;
  }
}
