#pragma once

#include <optional>
#include <string>

namespace podval {

/// Structural kind of a parsed node. Null values are reported as scalars.
enum class NodeKind { Mapping, Sequence, Scalar };

enum class OutputFormat { Text, Json };

/// One recorded rule violation. A missing line means the field was absent
/// and there was no node to anchor a position to.
struct Diagnostic {
  std::optional<int> line;
  std::string message;
};

} // namespace podval
