#pragma once

#include "pod-validator/Diagnostics.hpp"
#include "pod-validator/export.h"

#include <string>
#include <yaml-cpp/yaml.h>

namespace podval {

/// Pod manifest schema. Every routine reads one schema node, records its
/// violations into the context and recurses into nested schema nodes. None
/// of them throw on a violation: a node of the wrong kind is recorded and
/// its subtree skipped, while sibling checks still run.
class POD_VALIDATOR_API SchemaValidator {
public:
  // Load and validate a manifest file. Throws DocumentLoadError when the
  // file cannot be read or parsed; diagnostics are keyed to the basename.
  static ValidationContext validate_file(const std::string &path);
  static ValidationContext validate_string(const std::string &content,
                                           const std::string &filename);

  // Root of a parsed stream (apiVersion, kind, metadata, spec)
  static void validate_document(ValidationContext &ctx,
                                const YAML::Node &root);

  static void validate_object_meta(ValidationContext &ctx,
                                   const YAML::Node &node);
  static void validate_pod_spec(ValidationContext &ctx, const YAML::Node &node);
  static void validate_os(ValidationContext &ctx, const YAML::Node &node);
  static void validate_container(ValidationContext &ctx,
                                 const YAML::Node &node);
  static void validate_container_port(ValidationContext &ctx,
                                      const YAML::Node &node);
  static void validate_probe(ValidationContext &ctx, const YAML::Node &node);
  static void validate_http_get(ValidationContext &ctx,
                                const YAML::Node &node);
  static void validate_resources(ValidationContext &ctx,
                                 const YAML::Node &node);
  static void validate_resource_set(ValidationContext &ctx,
                                    const YAML::Node &node);
};

} // namespace podval
