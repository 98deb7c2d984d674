#include "pod-validator/Diagnostics.hpp"

#include <utility>

namespace podval {

ValidationContext::ValidationContext(std::string filename, std::string source)
    : filename_(std::move(filename)), source_(std::move(source)) {}

void ValidationContext::record(std::optional<int> line, std::string message) {
  diagnostics_.push_back({line, std::move(message)});
}

std::string ValidationContext::render(const Diagnostic &diag) const {
  if (!diag.line) {
    return diag.message;
  }
  return filename_ + ":" + std::to_string(*diag.line) + " " + diag.message;
}

void ValidationContext::flush(std::ostream &out) const {
  for (const auto &diag : diagnostics_) {
    out << render(diag) << "\n";
  }
  out.flush();
}

nlohmann::json ValidationContext::to_json() const {
  nlohmann::json errors = nlohmann::json::array();
  for (const auto &diag : diagnostics_) {
    nlohmann::json entry;
    if (diag.line) {
      entry["line"] = *diag.line;
    } else {
      entry["line"] = nullptr;
    }
    entry["message"] = diag.message;
    errors.push_back(entry);
  }
  return {{"file", filename_}, {"valid", !has_errors()}, {"errors", errors}};
}

} // namespace podval
