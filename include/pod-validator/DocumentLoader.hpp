#pragma once

#include "pod-validator/export.h"

#include <stdexcept>
#include <string>
#include <yaml-cpp/yaml.h>

namespace podval {

/// Raised when a manifest cannot be turned into a node tree. These failures
/// bypass the diagnostic list entirely.
class POD_VALIDATOR_API DocumentLoadError : public std::runtime_error {
public:
  enum class Stage { Read, Parse };

  DocumentLoadError(Stage stage, const std::string &path,
                    const std::string &reason);

  Stage stage() const { return stage_; }
  const std::string &path() const { return path_; }
  const std::string &reason() const { return reason_; }

private:
  Stage stage_;
  std::string path_;
  std::string reason_;
};

/// Read the whole file. Throws DocumentLoadError (Read) on any I/O failure.
POD_VALIDATOR_API std::string read_document(const std::string &path);

/// Parse the first document of a YAML stream. Throws DocumentLoadError
/// (Parse) on malformed input. An empty stream yields a null node without a
/// source mark.
POD_VALIDATOR_API YAML::Node parse_document(const std::string &content,
                                            const std::string &path);

POD_VALIDATOR_API YAML::Node load_document(const std::string &path);

/// Last element of the path, as shown in diagnostics. Trailing separators
/// are ignored; a path with no elements (such as "/") is returned as given.
POD_VALIDATOR_API std::string display_name(const std::string &path);

} // namespace podval
