#pragma once

#include "pod-validator/export.h"
#include "pod-validator/types.hpp"

#include <spdlog/common.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace podval {

/// Bad command line: wrong positional count, unknown option, missing value.
class POD_VALIDATOR_API UsageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct CliOptions {
  std::string manifest_path;
  spdlog::level::level_enum log_level = spdlog::level::warn;
  std::string log_file;
  OutputFormat format = OutputFormat::Text;
  bool show_help = false;
  // Problems that do not stop the run, logged once the logger is up
  std::vector<std::string> warnings;
};

POD_VALIDATOR_API spdlog::level::level_enum
parse_log_level(const std::string &level);

POD_VALIDATOR_API OutputFormat parse_output_format(const std::string &format);

/// Parse argv (argv[0] is skipped). Log level falls back to the
/// POD_VALIDATOR_LOG_LEVEL environment variable; an unknown level there is
/// ignored and noted in `warnings`. Throws UsageError for bad arguments.
POD_VALIDATOR_API CliOptions parse_options(int argc, const char *const *argv);

POD_VALIDATOR_API std::string usage_text(const std::string &program);

} // namespace podval
