#pragma once

#include "pod-validator/export.h"
#include "pod-validator/types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace podval {

/// Read-only projection of a mapping node: field name -> value node, and
/// field name -> line of the key that declared it.
///
/// Duplicate keys are not an error at this layer: the last declared pair
/// wins, both for the value and for the key line. keys() lists every
/// distinct key once, in the order it first appeared in the source.
class POD_VALIDATOR_API MappingView {
public:
  struct Field {
    YAML::Node value;
    int key_line;
  };

  static std::optional<MappingView> from(const YAML::Node &node);

  std::optional<YAML::Node> field(const std::string &name) const;
  std::optional<int> key_line(const std::string &name) const;
  bool contains(const std::string &name) const {
    return fields_.count(name) != 0;
  }

  const std::vector<std::string> &keys() const { return keys_; }
  size_t size() const { return keys_.size(); }

private:
  MappingView() = default;

  std::map<std::string, Field> fields_;
  std::vector<std::string> keys_;
};

POD_VALIDATOR_API std::optional<NodeKind> node_kind(const YAML::Node &node);

/// 1-based source line of the node, if the parser recorded one.
POD_VALIDATOR_API std::optional<int> source_line(const YAML::Node &node);

/// Like source_line(node), but an empty value (`key:` or a bare `-`) is
/// placed on the line of the indicator that introduced it. yaml-cpp marks
/// such nulls at the following token, which can be several lines later or
/// past the end of the document. `source` is the text the node was parsed
/// from; when it is empty the plain mark line is returned.
POD_VALIDATOR_API std::optional<int> source_line(const YAML::Node &node,
                                                 const std::string &source);

POD_VALIDATOR_API std::optional<MappingView> as_mapping(const YAML::Node &node);
POD_VALIDATOR_API std::optional<std::vector<YAML::Node>>
as_sequence(const YAML::Node &node);

/// Raw scalar text, whatever the source tag. A quoted "42" and a bare 42
/// both come back as "42"; a null value comes back empty.
POD_VALIDATOR_API std::optional<std::string>
as_scalar_string(const YAML::Node &node);

/// Value of a scalar the author wrote as an integer: plain (untagged) or
/// explicitly tagged !!int, with decimal text. Quoted numerals are rejected.
POD_VALIDATOR_API std::optional<int64_t> as_tagged_int(const YAML::Node &node);

/// Optional sign followed by decimal digits, fitting in 64 bits.
POD_VALIDATOR_API std::optional<int64_t> parse_int(const std::string &text);

} // namespace podval
