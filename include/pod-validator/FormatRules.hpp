#pragma once

#include "pod-validator/export.h"

#include <cstdint>
#include <string>

namespace podval {
namespace rules {

/// Lowercase alphanumeric segments joined by single underscores.
POD_VALIDATOR_API bool is_snake_case(const std::string &s);

/// registry.bigbrother.io/<path>:<tag>
POD_VALIDATOR_API bool is_registry_image(const std::string &s);

/// Memory quantity such as 128Mi, 1Gi or 512Ki.
POD_VALIDATOR_API bool is_memory_quantity(const std::string &s);

POD_VALIDATOR_API bool port_in_range(int64_t port);

POD_VALIDATOR_API bool is_absolute_http_path(const std::string &s);

/// Case-insensitive linux / windows.
POD_VALIDATOR_API bool is_supported_os(const std::string &s);

/// Case-sensitive TCP / UDP.
POD_VALIDATOR_API bool is_supported_protocol(const std::string &s);

} // namespace rules
} // namespace podval
