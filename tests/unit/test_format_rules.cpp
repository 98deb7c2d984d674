#include <gtest/gtest.h>

#include "pod-validator/FormatRules.hpp"

using namespace podval::rules;

TEST(FormatRulesTest, SnakeCaseNames) {
  EXPECT_TRUE(is_snake_case("app"));
  EXPECT_TRUE(is_snake_case("web_server"));
  EXPECT_TRUE(is_snake_case("web_server_2"));
  EXPECT_TRUE(is_snake_case("0"));

  EXPECT_FALSE(is_snake_case(""));
  EXPECT_FALSE(is_snake_case("My-Container"));
  EXPECT_FALSE(is_snake_case("WebServer"));
  EXPECT_FALSE(is_snake_case("_leading"));
  EXPECT_FALSE(is_snake_case("trailing_"));
  EXPECT_FALSE(is_snake_case("double__underscore"));
  EXPECT_FALSE(is_snake_case("with-dash"));
}

TEST(FormatRulesTest, RegistryImages) {
  EXPECT_TRUE(is_registry_image("registry.bigbrother.io/app:latest"));
  EXPECT_TRUE(is_registry_image("registry.bigbrother.io/team/web-server:1.4.2"));
  EXPECT_TRUE(is_registry_image("registry.bigbrother.io/a.b/c_d:V1_RC-2"));

  EXPECT_FALSE(is_registry_image("registry.bigbrother.io/app"));
  EXPECT_FALSE(is_registry_image("registry.bigbrother.io/app:"));
  EXPECT_FALSE(is_registry_image("registry.bigbrother.io/App:1.0"));
  EXPECT_FALSE(is_registry_image("docker.io/library/nginx:latest"));
  EXPECT_FALSE(is_registry_image("registryXbigbrother.io/app:1.0"));
  EXPECT_FALSE(is_registry_image("registry.bigbrother.io/app:1.0+build"));
}

TEST(FormatRulesTest, MemoryQuantities) {
  EXPECT_TRUE(is_memory_quantity("128Mi"));
  EXPECT_TRUE(is_memory_quantity("1Gi"));
  EXPECT_TRUE(is_memory_quantity("512Ki"));

  EXPECT_FALSE(is_memory_quantity("1G"));
  EXPECT_FALSE(is_memory_quantity("Mi"));
  EXPECT_FALSE(is_memory_quantity("1.5Gi"));
  EXPECT_FALSE(is_memory_quantity("256mi"));
  EXPECT_FALSE(is_memory_quantity("256"));
}

TEST(FormatRulesTest, PortRangeIsExclusive) {
  EXPECT_FALSE(port_in_range(0));
  EXPECT_TRUE(port_in_range(1));
  EXPECT_TRUE(port_in_range(65535));
  EXPECT_FALSE(port_in_range(65536));
  EXPECT_FALSE(port_in_range(-80));
}

TEST(FormatRulesTest, HttpPathMustBeAbsolute) {
  EXPECT_TRUE(is_absolute_http_path("/"));
  EXPECT_TRUE(is_absolute_http_path("/healthz"));
  EXPECT_FALSE(is_absolute_http_path("healthz"));
  EXPECT_FALSE(is_absolute_http_path(""));
}

TEST(FormatRulesTest, OperatingSystemIgnoresCase) {
  EXPECT_TRUE(is_supported_os("linux"));
  EXPECT_TRUE(is_supported_os("Linux"));
  EXPECT_TRUE(is_supported_os("WINDOWS"));
  EXPECT_FALSE(is_supported_os("darwin"));
  EXPECT_FALSE(is_supported_os(""));
}

TEST(FormatRulesTest, ProtocolIsCaseSensitive) {
  EXPECT_TRUE(is_supported_protocol("TCP"));
  EXPECT_TRUE(is_supported_protocol("UDP"));
  EXPECT_FALSE(is_supported_protocol("tcp"));
  EXPECT_FALSE(is_supported_protocol("SCTP"));
}
