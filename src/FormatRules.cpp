#include "pod-validator/FormatRules.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace podval {
namespace rules {

static const std::regex &snake_case_re() {
  static const std::regex re("^[a-z0-9]+(?:_[a-z0-9]+)*$");
  return re;
}

static const std::regex &image_re() {
  static const std::regex re(
      R"(^registry\.bigbrother\.io/[a-z0-9._/-]+:[A-Za-z0-9._-]+$)");
  return re;
}

static const std::regex &memory_re() {
  static const std::regex re(R"(^[0-9]+(Gi|Mi|Ki)$)");
  return re;
}

static std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

bool is_snake_case(const std::string &s) {
  return std::regex_match(s, snake_case_re());
}

bool is_registry_image(const std::string &s) {
  return std::regex_match(s, image_re());
}

bool is_memory_quantity(const std::string &s) {
  return std::regex_match(s, memory_re());
}

bool port_in_range(int64_t port) { return port > 0 && port < 65536; }

bool is_absolute_http_path(const std::string &s) {
  return !s.empty() && s.front() == '/';
}

bool is_supported_os(const std::string &s) {
  std::string lowered = to_lower(s);
  return lowered == "linux" || lowered == "windows";
}

bool is_supported_protocol(const std::string &s) {
  return s == "TCP" || s == "UDP";
}

} // namespace rules
} // namespace podval
