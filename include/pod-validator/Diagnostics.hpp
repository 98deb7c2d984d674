#pragma once

#include "pod-validator/export.h"
#include "pod-validator/types.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace podval {

/// Per-run validation state: the subject filename used for display and the
/// diagnostics recorded so far, in traversal order. One context belongs to
/// exactly one validation run.
///
/// `source` is the document text, used to place empty values on the line
/// of their key or dash. Contexts built without it fall back to parser
/// marks.
class POD_VALIDATOR_API ValidationContext {
public:
  explicit ValidationContext(std::string filename, std::string source = "");

  void record(std::optional<int> line, std::string message);
  void required(const std::string &field) {
    record(std::nullopt, field + " is required");
  }

  bool has_errors() const { return !diagnostics_.empty(); }
  size_t error_count() const { return diagnostics_.size(); }

  const std::string &filename() const { return filename_; }
  const std::string &source() const { return source_; }
  const std::vector<Diagnostic> &diagnostics() const { return diagnostics_; }

  /// "<filename>:<line> <message>" for positioned diagnostics, the bare
  /// message for missing fields.
  std::string render(const Diagnostic &diag) const;

  /// Write every diagnostic, one per line, in insertion order.
  void flush(std::ostream &out) const;

  /// {"file": ..., "valid": ..., "errors": [{"line": ..., "message": ...}]}
  nlohmann::json to_json() const;

private:
  std::string filename_;
  std::string source_;
  std::vector<Diagnostic> diagnostics_;
};

} // namespace podval
