#include "pod-validator/Options.hpp"

#include <cstdlib>
#include <vector>

namespace podval {

spdlog::level::level_enum parse_log_level(const std::string &level) {
  if (level == "trace")
    return spdlog::level::trace;
  if (level == "debug")
    return spdlog::level::debug;
  if (level == "info")
    return spdlog::level::info;
  if (level == "warn")
    return spdlog::level::warn;
  if (level == "error")
    return spdlog::level::err;
  if (level == "off")
    return spdlog::level::off;
  throw UsageError("Unknown log level: " + level);
}

OutputFormat parse_output_format(const std::string &format) {
  if (format == "text")
    return OutputFormat::Text;
  if (format == "json")
    return OutputFormat::Json;
  throw UsageError("Unknown output format: " + format);
}

CliOptions parse_options(int argc, const char *const *argv) {
  CliOptions options;
  std::vector<std::string> positional;
  bool level_from_flag = false;

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    auto value = [&]() -> std::string {
      if (i + 1 >= argc) {
        throw UsageError("Missing value for " + arg);
      }
      return argv[++i];
    };

    if (arg == "-h" || arg == "--help") {
      options.show_help = true;
    } else if (arg == "--log-level") {
      options.log_level = parse_log_level(value());
      level_from_flag = true;
    } else if (arg == "--log-file") {
      options.log_file = value();
    } else if (arg == "--format") {
      options.format = parse_output_format(value());
    } else if (arg.size() > 1 && arg[0] == '-') {
      throw UsageError("Unknown option: " + arg);
    } else {
      positional.push_back(arg);
    }
  }

  if (!level_from_flag) {
    if (const char *env = std::getenv("POD_VALIDATOR_LOG_LEVEL")) {
      try {
        options.log_level = parse_log_level(env);
      } catch (const UsageError &e) {
        options.warnings.push_back(
            std::string("ignoring POD_VALIDATOR_LOG_LEVEL: ") + e.what());
      }
    }
  }

  if (options.show_help) {
    return options;
  }
  if (positional.size() != 1) {
    throw UsageError("Expected exactly one manifest path, got " +
                     std::to_string(positional.size()));
  }
  options.manifest_path = positional.front();
  return options;
}

std::string usage_text(const std::string &program) {
  std::string text = "Usage: " + program + " [options] <path-to-yaml>\n\n";
  text += "Validates a Pod manifest and prints one line per violation.\n\n";
  text += "Options:\n";
  text += "  --format <text|json>     Diagnostic output format (default: "
          "text)\n";
  text += "  --log-level <level>      trace, debug, info, warn, error, off "
          "(default: warn)\n";
  text += "  --log-file <path>        Also write logs to a rotating file\n";
  text += "  -h, --help               Show this help\n";
  text += "\nExit status: 0 valid, 1 invalid or unreadable, 2 usage error\n";
  return text;
}

} // namespace podval
