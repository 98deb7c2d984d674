#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <nlohmann/json.hpp>
#include <string>

#include "../test_utils/PlatformPaths.hpp"

using namespace podval::test;

namespace {

std::string manifest(const std::string &name) {
  return "\"" + get_manifest_path(name).string() + "\"";
}

} // namespace

TEST(CliTest, ValidManifestsSucceedSilently) {
  for (const auto *name : {"valid_pod.yaml", "minimal_pod.yaml"}) {
    auto result = run_cli(manifest(name));
    EXPECT_EQ(result.exit_code, 0) << name << ":\n" << result.out;
    EXPECT_EQ(result.out, "") << name;
  }
}

TEST(CliTest, UnsupportedApiVersion) {
  auto result = run_cli(manifest("bad_api_version.yaml"));
  EXPECT_EQ(result.exit_code, 1);
  EXPECT_EQ(result.out,
            "bad_api_version.yaml:1 apiVersion has unsupported value 'v2'\n");
}

TEST(CliTest, MissingFieldsPrintBareMessages) {
  auto result = run_cli(manifest("missing_spec.yaml"));
  EXPECT_EQ(result.exit_code, 1);
  EXPECT_EQ(result.out, "metadata.name is required\nspec is required\n");
}

TEST(CliTest, PortOutOfRange) {
  auto result = run_cli(manifest("port_out_of_range.yaml"));
  EXPECT_EQ(result.exit_code, 1);
  EXPECT_EQ(result.out,
            "port_out_of_range.yaml:10 containerPort value out of range\n");
}

TEST(CliTest, QuotedCpu) {
  auto result = run_cli(manifest("quoted_cpu.yaml"));
  EXPECT_EQ(result.exit_code, 1);
  EXPECT_EQ(result.out, "quoted_cpu.yaml:11 cpu must be int\n");
}

TEST(CliTest, EmptyValuesStayOnTheirKeyLines) {
  auto result = run_cli(manifest("empty_values.yaml"));
  EXPECT_EQ(result.exit_code, 1);
  // The trailing `cpu:` sits on the last line of the file
  EXPECT_EQ(result.out, "empty_values.yaml:6 os has unsupported value ''\n"
                        "empty_values.yaml:8 containers[] must be object\n"
                        "empty_values.yaml:13 cpu must be int\n");
}

TEST(CliTest, ReportsAllViolationsInOneRun) {
  auto result = run_cli(manifest("many_violations.yaml"));
  EXPECT_EQ(result.exit_code, 1);
  EXPECT_EQ(result.out,
            "many_violations.yaml:2 kind has unsupported value 'Deployment'\n"
            "many_violations.yaml:6 metadata.labels.app must be string\n"
            "many_violations.yaml:8 os has unsupported value 'solaris'\n"
            "many_violations.yaml:10 containers.name has invalid format "
            "'My-Container'\n"
            "many_violations.yaml:11 containers.image has invalid format "
            "'docker.io/library/nginx:latest'\n"
            "many_violations.yaml:13 containerPort must be int\n"
            "many_violations.yaml:14 protocol has unsupported value 'tcp'\n"
            "many_violations.yaml:17 path has invalid format 'ready'\n"
            "many_violations.yaml:18 port value out of range\n"
            "containers.resources is required\n"
            "many_violations.yaml:23 memory has invalid format '1G'\n");
}

TEST(CliTest, JsonFormat) {
  auto result = run_cli("--format json " + manifest("bad_api_version.yaml"));
  EXPECT_EQ(result.exit_code, 1);
  auto report = nlohmann::json::parse(result.out);
  EXPECT_EQ(report["file"], "bad_api_version.yaml");
  EXPECT_EQ(report["valid"], false);
  ASSERT_EQ(report["errors"].size(), 1u);
  EXPECT_EQ(report["errors"][0]["line"], 1);
  EXPECT_EQ(report["errors"][0]["message"],
            "apiVersion has unsupported value 'v2'");

  auto ok = run_cli("--format json " + manifest("valid_pod.yaml"));
  EXPECT_EQ(ok.exit_code, 0);
  EXPECT_EQ(nlohmann::json::parse(ok.out)["valid"], true);
}

TEST(CliTest, ParseFailureGoesToStderr) {
  auto result = run_cli(manifest("not_yaml.yaml"));
  EXPECT_EQ(result.exit_code, 1);
  EXPECT_EQ(result.out, "");

  auto merged = run_cli(manifest("not_yaml.yaml") + " 2>&1");
  EXPECT_NE(merged.out.find("cannot unmarshal file content"),
            std::string::npos);
}

TEST(CliTest, MissingFile) {
  auto result = run_cli(manifest("no_such_manifest.yaml") + " 2>&1");
  EXPECT_EQ(result.exit_code, 1);
  EXPECT_NE(result.out.find("cannot read file content"), std::string::npos);
}

TEST(CliTest, UsageErrors) {
  EXPECT_EQ(run_cli("").exit_code, 2);
  EXPECT_EQ(run_cli(manifest("valid_pod.yaml") + " " +
                    manifest("minimal_pod.yaml"))
                .exit_code,
            2);
  EXPECT_EQ(run_cli("--bogus " + manifest("valid_pod.yaml")).exit_code, 2);
}

#ifndef _WIN32
TEST(CliTest, UnknownEnvironmentLogLevelStillValidates) {
  setenv("POD_VALIDATOR_LOG_LEVEL", "loud", 1);
  auto result = run_cli(manifest("valid_pod.yaml"));
  auto merged = run_cli(manifest("valid_pod.yaml") + " 2>&1");
  unsetenv("POD_VALIDATOR_LOG_LEVEL");

  EXPECT_EQ(result.exit_code, 0);
  EXPECT_EQ(result.out, "");
  EXPECT_EQ(merged.exit_code, 0);
  EXPECT_NE(merged.out.find("ignoring POD_VALIDATOR_LOG_LEVEL"),
            std::string::npos);
}
#endif

TEST(CliTest, Help) {
  auto result = run_cli("--help");
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_NE(result.out.find("Usage:"), std::string::npos);
}

TEST(CliTest, LoggingStaysOffStdout) {
  auto log_file =
      std::filesystem::temp_directory_path() / "pod_validator_cli_test.log";
  std::filesystem::remove(log_file);
  auto result = run_cli("--log-level debug --log-file \"" + log_file.string() +
                        "\" " + manifest("quoted_cpu.yaml"));
  EXPECT_EQ(result.exit_code, 1);
  EXPECT_EQ(result.out, "quoted_cpu.yaml:11 cpu must be int\n");

  std::ifstream in(log_file);
  std::string contents((std::istreambuf_iterator<char>(in)),
                       std::istreambuf_iterator<char>());
  EXPECT_NE(contents.find("[quoted_cpu.yaml] [summary]"), std::string::npos);
  std::filesystem::remove(log_file);
}
