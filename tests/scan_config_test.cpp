#include "scan_config.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <vector>

namespace threat_scanner {
namespace {

std::tuple<ScanConfig, error> parse(std::vector<const char*> args,
                                    ScanConfig base = ScanConfig()) {
  args.insert(args.begin(), "threat_scanner");
  return ScanConfig::FromArgs(static_cast<int>(args.size()), args.data(),
                              base);
}

class EnvironmentTest : public ::testing::Test {
 protected:
  void SetUp() override { clear(); }
  void TearDown() override { clear(); }

  static void clear() {
    unsetenv("LOG_FILE_PATH");
    unsetenv("SCAN_WORKERS");
    unsetenv("SCAN_RESULT_PATH");
  }
};

TEST(ScanConfigTest, Defaults) {
  ScanConfig config;
  EXPECT_EQ(config.inputPath, "sample_logs/auth.log");
  EXPECT_EQ(config.workerCount, 4);
  EXPECT_EQ(config.resultPath, "results/analysis_result.json");
  EXPECT_EQ(config.Validate(), nullptr);
}

TEST(ScanConfigTest, ArgsOverrideBase) {
  auto [config, err] =
      parse({"--workers", "3", "-o", "out/r.json", "data/flows.csv"});
  ASSERT_EQ(err, nullptr);
  EXPECT_EQ(config.workerCount, 3);
  EXPECT_EQ(config.resultPath, "out/r.json");
  EXPECT_EQ(config.inputPath, "data/flows.csv");
}

TEST(ScanConfigTest, NoArgsKeepsBase) {
  ScanConfig base;
  base.inputPath = "x.log";
  base.workerCount = 2;
  auto [config, err] = parse({}, base);
  ASSERT_EQ(err, nullptr);
  EXPECT_EQ(config.inputPath, "x.log");
  EXPECT_EQ(config.workerCount, 2);
}

TEST(ScanConfigTest, BadArgsAreInvalidConfig) {
  std::vector<std::vector<const char*>> cases = {
      {"--workers"},
      {"-n", "four"},
      {"-n", "3x"},
      {"--verbose"},
      {"a.log", "b.log"},
  };
  for (const auto& args : cases) {
    auto [config, err] = parse(args);
    ASSERT_NE(err, nullptr) << args.front();
    EXPECT_TRUE(errors::IsKind(err, errors::Kind::InvalidConfig))
        << err->What();
  }
}

TEST(ScanConfigTest, ValidateRejectsNonPositiveWorkers) {
  auto [config, err] = parse({"-n", "0"});
  ASSERT_EQ(err, nullptr);
  error invalid = config.Validate();
  ASSERT_NE(invalid, nullptr);
  EXPECT_TRUE(errors::IsKind(invalid, errors::Kind::InvalidConfig));

  config.workerCount = -2;
  EXPECT_NE(config.Validate(), nullptr);
}

TEST(ScanConfigTest, ValidateRejectsEmptyPaths) {
  ScanConfig config;
  config.inputPath.clear();
  EXPECT_NE(config.Validate(), nullptr);

  config = ScanConfig();
  config.resultPath.clear();
  EXPECT_NE(config.Validate(), nullptr);
}

TEST_F(EnvironmentTest, UnsetVariablesGiveDefaults) {
  auto [config, err] = ScanConfig::FromEnvironment();
  ASSERT_EQ(err, nullptr);
  EXPECT_EQ(config.inputPath, ScanConfig().inputPath);
  EXPECT_EQ(config.workerCount, ScanConfig().workerCount);
}

TEST_F(EnvironmentTest, VariablesOverrideDefaults) {
  setenv("LOG_FILE_PATH", "/var/log/auth.log", 1);
  setenv("SCAN_WORKERS", "8", 1);
  setenv("SCAN_RESULT_PATH", "/tmp/r.json", 1);

  auto [config, err] = ScanConfig::FromEnvironment();
  ASSERT_EQ(err, nullptr);
  EXPECT_EQ(config.inputPath, "/var/log/auth.log");
  EXPECT_EQ(config.workerCount, 8);
  EXPECT_EQ(config.resultPath, "/tmp/r.json");
}

TEST_F(EnvironmentTest, MalformedWorkerCount) {
  setenv("SCAN_WORKERS", "many", 1);
  auto [config, err] = ScanConfig::FromEnvironment();
  ASSERT_NE(err, nullptr);
  EXPECT_TRUE(errors::IsKind(err, errors::Kind::InvalidConfig));
}

}  // namespace
}  // namespace threat_scanner
