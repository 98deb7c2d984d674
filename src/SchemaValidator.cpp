#include "pod-validator/SchemaValidator.hpp"

#include "pod-validator/DocumentLoader.hpp"
#include "pod-validator/FormatRules.hpp"
#include "pod-validator/Logger.hpp"
#include "pod-validator/NodeView.hpp"

#include <optional>
#include <string>
#include <utility>

namespace podval {

static void add_error(ValidationContext &ctx, const YAML::Node &node,
                      const std::string &msg) {
  ctx.record(source_line(node, ctx.source()), msg);
}

static int line_or_zero(const YAML::Node &node) {
  return source_line(node).value_or(0);
}

// Required scalar compared against a single accepted literal.
static void check_literal(ValidationContext &ctx, const MappingView &mv,
                          const std::string &field,
                          const std::string &expected) {
  auto node = mv.field(field);
  if (!node) {
    ctx.required(field);
    return;
  }
  auto value = as_scalar_string(*node);
  if (!value) {
    add_error(ctx, *node, field + " must be string");
  } else if (*value != expected) {
    add_error(ctx, *node, field + " has unsupported value '" + *value + "'");
  }
}

// Required scalar of any text. Returns the text when it is usable for
// further format checks.
static std::optional<std::string>
check_required_string(ValidationContext &ctx, const MappingView &mv,
                      const std::string &field, const std::string &label) {
  auto node = mv.field(field);
  if (!node) {
    ctx.required(label);
    return std::nullopt;
  }
  auto value = as_scalar_string(*node);
  if (!value) {
    add_error(ctx, *node, label + " must be string");
  }
  return value;
}

// Integer port in (0, 65536). Returns false when the value is not even a
// scalar, so the caller can stop looking at the enclosing entry.
static bool check_port_value(ValidationContext &ctx, const YAML::Node &value,
                             const std::string &field) {
  auto text = as_scalar_string(value);
  if (!text) {
    add_error(ctx, value, field + " must be int");
    return false;
  }
  auto port = parse_int(*text);
  if (!port) {
    add_error(ctx, value, field + " must be int");
  } else if (!rules::port_in_range(*port)) {
    add_error(ctx, value, field + " value out of range");
  }
  return true;
}

static void log_summary(const ValidationContext &ctx) {
  if (ctx.has_errors()) {
    LOG_INFO(ctx.filename(), "summary", "{} violation(s) found",
             ctx.error_count());
  } else {
    LOG_INFO(ctx.filename(), "summary", "manifest is valid");
  }
}

ValidationContext SchemaValidator::validate_file(const std::string &path) {
  std::string content = read_document(path);
  YAML::Node root = parse_document(content, path);
  ValidationContext ctx(display_name(path), std::move(content));
  validate_document(ctx, root);
  log_summary(ctx);
  return ctx;
}

ValidationContext
SchemaValidator::validate_string(const std::string &content,
                                 const std::string &filename) {
  YAML::Node root = parse_document(content, filename);
  ValidationContext ctx(filename, content);
  validate_document(ctx, root);
  log_summary(ctx);
  return ctx;
}

void SchemaValidator::validate_document(ValidationContext &ctx,
                                        const YAML::Node &root) {
  // An empty stream has no node and therefore no mark
  if (!root.IsDefined() || (root.IsNull() && !source_line(root))) {
    ctx.record(std::nullopt, "document is required");
    return;
  }
  auto mv = as_mapping(root);
  if (!mv) {
    add_error(ctx, root, "document must be mapping");
    return;
  }
  LOG_DEBUG(ctx.filename(), "document", "{} top-level field(s)", mv->size());

  check_literal(ctx, *mv, "apiVersion", "v1");
  check_literal(ctx, *mv, "kind", "Pod");

  if (auto meta = mv->field("metadata")) {
    validate_object_meta(ctx, *meta);
  } else {
    ctx.required("metadata");
  }

  if (auto spec = mv->field("spec")) {
    validate_pod_spec(ctx, *spec);
  } else {
    ctx.required("spec");
  }
}

void SchemaValidator::validate_object_meta(ValidationContext &ctx,
                                           const YAML::Node &node) {
  auto mv = as_mapping(node);
  if (!mv) {
    add_error(ctx, node, "metadata must be object");
    return;
  }
  LOG_TRACE(ctx.filename(), "metadata", "line {}", line_or_zero(node));

  // Any string is an acceptable name
  check_required_string(ctx, *mv, "name", "metadata.name");

  if (auto ns = mv->field("namespace")) {
    if (!as_scalar_string(*ns)) {
      add_error(ctx, *ns, "metadata.namespace must be string");
    }
  }

  if (auto labels = mv->field("labels")) {
    auto lmv = as_mapping(*labels);
    if (!lmv) {
      add_error(ctx, *labels, "metadata.labels must be object");
      return;
    }
    for (const auto &key : lmv->keys()) {
      auto value = *lmv->field(key);
      if (!as_scalar_string(value)) {
        add_error(ctx, value, "metadata.labels." + key + " must be string");
      }
    }
  }
}

void SchemaValidator::validate_pod_spec(ValidationContext &ctx,
                                        const YAML::Node &node) {
  auto mv = as_mapping(node);
  if (!mv) {
    add_error(ctx, node, "spec must be object");
    return;
  }
  LOG_TRACE(ctx.filename(), "spec", "line {}", line_or_zero(node));

  if (auto os = mv->field("os")) {
    validate_os(ctx, *os);
  }

  auto containers = mv->field("containers");
  if (!containers) {
    ctx.required("spec.containers");
    return;
  }
  auto items = as_sequence(*containers);
  if (!items) {
    add_error(ctx, *containers, "spec.containers must be array");
    return;
  }
  if (items->empty()) {
    add_error(ctx, *containers, "spec.containers must not be empty");
  }
  for (const auto &container : *items) {
    validate_container(ctx, container);
  }
}

void SchemaValidator::validate_os(ValidationContext &ctx,
                                  const YAML::Node &node) {
  switch (node_kind(node).value_or(NodeKind::Sequence)) {
  case NodeKind::Scalar: {
    std::string value = as_scalar_string(node).value_or("");
    if (!rules::is_supported_os(value)) {
      add_error(ctx, node, "os has unsupported value '" + value + "'");
    }
    break;
  }
  case NodeKind::Mapping: {
    auto mv = as_mapping(node);
    auto name = check_required_string(ctx, *mv, "name", "name");
    if (name && !rules::is_supported_os(*name)) {
      add_error(ctx, *mv->field("name"),
                "name has unsupported value '" + *name + "'");
    }
    break;
  }
  default:
    add_error(ctx, node, "os must be string or object");
    break;
  }
}

void SchemaValidator::validate_container(ValidationContext &ctx,
                                         const YAML::Node &node) {
  auto mv = as_mapping(node);
  if (!mv) {
    add_error(ctx, node, "containers[] must be object");
    return;
  }
  LOG_TRACE(ctx.filename(), "container", "line {}", line_or_zero(node));

  auto name = check_required_string(ctx, *mv, "name", "containers.name");
  if (name && !rules::is_snake_case(*name)) {
    add_error(ctx, *mv->field("name"),
              "containers.name has invalid format '" + *name + "'");
  }

  auto image = check_required_string(ctx, *mv, "image", "containers.image");
  if (image && !rules::is_registry_image(*image)) {
    add_error(ctx, *mv->field("image"),
              "containers.image has invalid format '" + *image + "'");
  }

  if (auto ports = mv->field("ports")) {
    if (auto items = as_sequence(*ports)) {
      for (const auto &port : *items) {
        validate_container_port(ctx, port);
      }
    } else {
      add_error(ctx, *ports, "ports must be array");
    }
  }

  if (auto probe = mv->field("readinessProbe")) {
    validate_probe(ctx, *probe);
  }
  if (auto probe = mv->field("livenessProbe")) {
    validate_probe(ctx, *probe);
  }

  if (auto resources = mv->field("resources")) {
    validate_resources(ctx, *resources);
  } else {
    ctx.required("containers.resources");
  }
}

void SchemaValidator::validate_container_port(ValidationContext &ctx,
                                              const YAML::Node &node) {
  auto mv = as_mapping(node);
  if (!mv) {
    add_error(ctx, node, "ports must be object");
    return;
  }

  auto port = mv->field("containerPort");
  if (!port) {
    ctx.required("containerPort");
    return;
  }
  if (!check_port_value(ctx, *port, "containerPort")) {
    return;
  }

  if (auto protocol = mv->field("protocol")) {
    auto value = as_scalar_string(*protocol);
    if (!value) {
      add_error(ctx, *protocol, "protocol must be string");
    } else if (!rules::is_supported_protocol(*value)) {
      add_error(ctx, *protocol,
                "protocol has unsupported value '" + *value + "'");
    }
  }
}

void SchemaValidator::validate_probe(ValidationContext &ctx,
                                     const YAML::Node &node) {
  auto mv = as_mapping(node);
  if (!mv) {
    add_error(ctx, node, "probe must be object");
    return;
  }
  auto http_get = mv->field("httpGet");
  if (!http_get) {
    ctx.required("httpGet");
    return;
  }
  validate_http_get(ctx, *http_get);
}

void SchemaValidator::validate_http_get(ValidationContext &ctx,
                                        const YAML::Node &node) {
  auto mv = as_mapping(node);
  if (!mv) {
    add_error(ctx, node, "httpGet must be object");
    return;
  }

  auto path = check_required_string(ctx, *mv, "path", "path");
  if (path && !rules::is_absolute_http_path(*path)) {
    add_error(ctx, *mv->field("path"),
              "path has invalid format '" + *path + "'");
  }

  if (auto port = mv->field("port")) {
    check_port_value(ctx, *port, "port");
  } else {
    ctx.required("port");
  }
}

void SchemaValidator::validate_resources(ValidationContext &ctx,
                                         const YAML::Node &node) {
  auto mv = as_mapping(node);
  if (!mv) {
    add_error(ctx, node, "resources must be object");
    return;
  }
  if (auto requests = mv->field("requests")) {
    validate_resource_set(ctx, *requests);
  }
  if (auto limits = mv->field("limits")) {
    validate_resource_set(ctx, *limits);
  }
}

void SchemaValidator::validate_resource_set(ValidationContext &ctx,
                                            const YAML::Node &node) {
  auto mv = as_mapping(node);
  if (!mv) {
    add_error(ctx, node, "resources set must be object");
    return;
  }
  for (const auto &key : mv->keys()) {
    auto value = *mv->field(key);
    if (key == "cpu") {
      // Must be written as a bare integer, a quoted "4" is rejected
      if (!as_tagged_int(value)) {
        add_error(ctx, value, "cpu must be int");
      }
    } else if (key == "memory") {
      auto quantity = as_scalar_string(value);
      if (!quantity) {
        add_error(ctx, value, "memory must be string");
      } else if (!rules::is_memory_quantity(*quantity)) {
        add_error(ctx, value, "memory has invalid format '" + *quantity + "'");
      }
    } else {
      LOG_TRACE(ctx.filename(), "resources", "ignoring resource '{}'", key);
    }
  }
}

} // namespace podval
