#include "pod-validator/NodeView.hpp"

#include <algorithm>
#include <charconv>
#include <system_error>

namespace podval {

static const char *const PLAIN_SCALAR_TAG = "?";
static const char *const INT_TAG = "tag:yaml.org,2002:int";

std::optional<MappingView> MappingView::from(const YAML::Node &node) {
  if (node_kind(node) != NodeKind::Mapping) {
    return std::nullopt;
  }
  MappingView view;
  for (auto it = node.begin(); it != node.end(); ++it) {
    // Non-scalar keys project to the empty name
    std::string name = it->first.IsScalar() ? it->first.Scalar() : "";
    int line = source_line(it->first).value_or(0);
    auto existing = view.fields_.find(name);
    if (existing == view.fields_.end()) {
      view.keys_.push_back(name);
      view.fields_.emplace(name, Field{it->second, line});
    } else {
      existing->second = Field{it->second, line};
    }
  }
  return view;
}

std::optional<YAML::Node> MappingView::field(const std::string &name) const {
  auto it = fields_.find(name);
  if (it == fields_.end()) {
    return std::nullopt;
  }
  return it->second.value;
}

std::optional<int> MappingView::key_line(const std::string &name) const {
  auto it = fields_.find(name);
  if (it == fields_.end()) {
    return std::nullopt;
  }
  return it->second.key_line;
}

std::optional<NodeKind> node_kind(const YAML::Node &node) {
  if (!node.IsDefined()) {
    return std::nullopt;
  }
  switch (node.Type()) {
  case YAML::NodeType::Map:
    return NodeKind::Mapping;
  case YAML::NodeType::Sequence:
    return NodeKind::Sequence;
  case YAML::NodeType::Scalar:
  case YAML::NodeType::Null:
    return NodeKind::Scalar;
  default:
    return std::nullopt;
  }
}

std::optional<int> source_line(const YAML::Node &node) {
  if (!node.IsDefined()) {
    return std::nullopt;
  }
  YAML::Mark mark = node.Mark();
  if (mark.is_null()) {
    return std::nullopt;
  }
  return mark.line + 1;
}

// An explicit null (`~`, `null`) carries its own mark.
static bool starts_null_literal(const std::string &source, size_t pos) {
  static const char *const literals[] = {"~", "null", "Null", "NULL"};
  for (const char *literal : literals) {
    std::string text(literal);
    if (source.compare(pos, text.size(), text) != 0) {
      continue;
    }
    size_t end = pos + text.size();
    if (end == source.size() ||
        std::string(" \t\r\n,]}#").find(source[end]) != std::string::npos) {
      return true;
    }
  }
  return false;
}

std::optional<int> source_line(const YAML::Node &node,
                               const std::string &source) {
  auto line = source_line(node);
  if (!line || source.empty() || !node.IsNull()) {
    return line;
  }
  YAML::Mark mark = node.Mark();
  size_t pos = std::min(static_cast<size_t>(std::max(mark.pos, 0)),
                        source.size());
  if (starts_null_literal(source, pos)) {
    return line;
  }

  // Walk back over blanks and comment-only lines to the ':' or '-'
  int current = mark.line;
  size_t i = pos;
  while (i > 0) {
    char c = source[i - 1];
    if (c == '\n') {
      --current;
      --i;
      continue;
    }
    if (c == ' ' || c == '\t' || c == '\r') {
      --i;
      continue;
    }
    size_t start = source.rfind('\n', i - 1);
    start = start == std::string::npos ? 0 : start + 1;
    size_t first = source.find_first_not_of(" \t", start);
    if (source[first] == '#') {
      i = start;
      continue;
    }
    return current + 1;
  }
  return line;
}

std::optional<MappingView> as_mapping(const YAML::Node &node) {
  return MappingView::from(node);
}

std::optional<std::vector<YAML::Node>> as_sequence(const YAML::Node &node) {
  if (node_kind(node) != NodeKind::Sequence) {
    return std::nullopt;
  }
  std::vector<YAML::Node> items;
  items.reserve(node.size());
  for (const auto &item : node) {
    items.push_back(item);
  }
  return items;
}

std::optional<std::string> as_scalar_string(const YAML::Node &node) {
  if (node_kind(node) != NodeKind::Scalar) {
    return std::nullopt;
  }
  if (node.IsNull()) {
    return std::string();
  }
  return node.Scalar();
}

std::optional<int64_t> as_tagged_int(const YAML::Node &node) {
  if (!node.IsDefined() || !node.IsScalar()) {
    return std::nullopt;
  }
  const std::string &tag = node.Tag();
  if (tag != PLAIN_SCALAR_TAG && tag != INT_TAG) {
    return std::nullopt;
  }
  return parse_int(node.Scalar());
}

std::optional<int64_t> parse_int(const std::string &text) {
  if (text.empty()) {
    return std::nullopt;
  }
  const char *first = text.data();
  const char *last = text.data() + text.size();
  // from_chars rejects a leading '+', but only skip it when a digit follows
  if (*first == '+') {
    ++first;
    if (first == last || *first < '0' || *first > '9') {
      return std::nullopt;
    }
  }
  int64_t value = 0;
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return value;
}

} // namespace podval
