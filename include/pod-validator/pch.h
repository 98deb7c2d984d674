#pragma once
// Project-wide precompiled header for pod-validator
// Keep this header stable (only include headers that rarely change)
//
// Notes:
// - CMake's target_precompile_headers will use this file if it exists.
// - Add only headers that are expensive to parse and change infrequently.

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

// Common third-party headers used by the project.
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <pod-validator/export.h>

// End of pch.h
