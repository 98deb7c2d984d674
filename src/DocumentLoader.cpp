#include "pod-validator/DocumentLoader.hpp"
#include "pod-validator/Logger.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace podval {

static std::string stage_message(DocumentLoadError::Stage stage) {
  return stage == DocumentLoadError::Stage::Read
             ? "cannot read file content"
             : "cannot unmarshal file content";
}

DocumentLoadError::DocumentLoadError(Stage stage, const std::string &path,
                                     const std::string &reason)
    : std::runtime_error(path + ": " + stage_message(stage) + ": " + reason),
      stage_(stage), path_(path), reason_(reason) {}

std::string read_document(const std::string &path) {
  std::error_code ec;
  if (std::filesystem::is_directory(path, ec)) {
    throw DocumentLoadError(DocumentLoadError::Stage::Read, path,
                            "is a directory");
  }

  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in) {
    throw DocumentLoadError(DocumentLoadError::Stage::Read, path,
                            std::strerror(errno));
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    throw DocumentLoadError(DocumentLoadError::Stage::Read, path,
                            "read failed");
  }
  LOG_DEBUG(path, "load", "read {} bytes", buffer.str().size());
  return buffer.str();
}

YAML::Node parse_document(const std::string &content, const std::string &path) {
  try {
    return YAML::Load(content);
  } catch (const YAML::Exception &e) {
    throw DocumentLoadError(DocumentLoadError::Stage::Parse, path, e.what());
  }
}

YAML::Node load_document(const std::string &path) {
  return parse_document(read_document(path), path);
}

std::string display_name(const std::string &path) {
  std::filesystem::path p = std::filesystem::path(path).lexically_normal();
  if (p.filename().empty() && p.has_relative_path()) {
    p = p.parent_path();
  }
  std::string name = p.filename().string();
  return name.empty() ? path : name;
}

} // namespace podval
