#include "scan_engine.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include "test_support.hpp"

namespace threat_scanner {
namespace {

using testing::TempDir;

const std::vector<RawRecord> kFlowRecords = {
    "srcip,dstip,proto,attack_cat",
    "10.0.0.1,192.168.0.1,tcp,Exploits",
    "10.0.0.2,192.168.0.1,udp,Normal",
    "10.0.0.1,192.168.0.2,tcp,DoS",
    "10.0.0.3,192.168.0.3,tcp,",
    "10.0.0.4,192.168.0.1,tcp,Fuzzers",
    "10.0.0.1,192.168.0.9,tcp,Exploits",
    "10.0.0.2,192.168.0.1,udp,-",
    "10.0.0.5,192.168.0.7,tcp,Reconnaissance",
};

const std::vector<RawRecord> kAuthRecords = {
    "Jan 10 10:00:01 srv sshd[101]: Failed password for root from 1.1.1.1 "
    "port 22 ssh2",
    "Jan 10 10:00:02 srv sshd[102]: Accepted password for bob from 2.2.2.2 "
    "port 22 ssh2",
    "Jan 10 10:00:03 srv sshd[103]: Failed password for invalid user x from "
    "1.1.1.1 port 22 ssh2",
    "Jan 10 10:00:04 srv kernel: link up",
    "Jan 10 10:00:05 srv sshd[104]: Failed password for root from 3.3.3.3 "
    "port 22 ssh2",
};

const std::vector<RawRecord> kUnlabelledRecords = {
    "src_ip,bytes,pkts,dur,sport,dport,ttl,win",
    "5.5.5.5,100,2,30,1234,80,64,512",
    "6.6.6.6,200,4,10,1235,443,64,512",
    "5.5.5.5,150,3,20,1236,80,64,1024",
    "5.5.5.5,175,3,25,1237,22,128,2048",
};

std::string joinLines(const std::vector<RawRecord>& records) {
  std::string out;
  for (const auto& r : records) out += r + "\n";
  return out;
}

std::shared_ptr<ScanEngine> engineFor(const std::string& input,
                                      const std::string& output,
                                      int workers) {
  ScanConfig cfg;
  cfg.inputPath = input;
  cfg.resultPath = output;
  cfg.workerCount = workers;
  auto [engine, err] = ScanEngine::Create(cfg);
  EXPECT_EQ(err, nullptr);
  return engine;
}

AnalysisResult analyze(const std::vector<RawRecord>& records, int workers) {
  auto engine = engineFor("unused.log", "unused.json", workers);
  auto [result, err] = engine->Analyze(records);
  EXPECT_EQ(err, nullptr);
  return result;
}

TEST(ScanEngineTest, CreateRejectsZeroWorkers) {
  ScanConfig cfg;
  cfg.workerCount = 0;
  auto [engine, err] = ScanEngine::Create(cfg);
  ASSERT_NE(err, nullptr);
  EXPECT_TRUE(errors::IsKind(err, errors::Kind::InvalidConfig));
  EXPECT_EQ(engine, nullptr);
}

TEST(ScanEngineTest, LabelledFlowsAreIndependentOfWorkerCount) {
  const SuspiciousIpTally expected = {
      {"10.0.0.1", 3}, {"10.0.0.3", 1}, {"10.0.0.4", 1}, {"10.0.0.5", 1}};
  for (int workers : {1, 2, 3, 4, 7}) {
    AnalysisResult result = analyze(kFlowRecords, workers);
    EXPECT_EQ(result.Tally(), expected) << "workers=" << workers;
  }
}

TEST(ScanEngineTest, AuthLogIsIndependentOfWorkerCount) {
  const SuspiciousIpTally expected = {
      {"1.1.1.1", 2}, {"2.2.2.2", 1}, {"3.3.3.3", 1}};
  for (int workers : {1, 2, 3, 4, 7}) {
    AnalysisResult result = analyze(kAuthRecords, workers);
    EXPECT_EQ(result.Tally(), expected) << "workers=" << workers;
  }
}

TEST(ScanEngineTest, RepeatThresholdSpansPartitions) {
  for (int workers : {1, 2, 3}) {
    AnalysisResult result = analyze(kUnlabelledRecords, workers);
    EXPECT_EQ(result.Tally(), (SuspiciousIpTally{{"5.5.5.5", 3}}))
        << "workers=" << workers;
  }
}

TEST(ScanEngineTest, MoreWorkersThanRecords) {
  AnalysisResult result = analyze({"failed login from 9.9.9.9"}, 4);
  EXPECT_EQ(result.Tally(), (SuspiciousIpTally{{"9.9.9.9", 1}}));
}

TEST(ScanEngineTest, RunWritesSameArtifactForAnyWorkerCount) {
  TempDir dir;
  std::string input = dir.Write("flows.csv", joinLines(kFlowRecords));

  std::string first = dir.Path("out/one.json");
  std::string second = dir.Path("out/four.json");
  {
    auto [result, err] = engineFor(input, first, 1)->Run();
    ASSERT_EQ(err, nullptr) << err->What();
  }
  {
    auto [result, err] = engineFor(input, second, 4)->Run();
    ASSERT_EQ(err, nullptr) << err->What();
  }

  std::string written = TempDir::Read(first);
  EXPECT_EQ(written, TempDir::Read(second));
  EXPECT_EQ(written,
            "{\n"
            "    \"10.0.0.1\": 3,\n"
            "    \"10.0.0.3\": 1,\n"
            "    \"10.0.0.4\": 1,\n"
            "    \"10.0.0.5\": 1\n"
            "}\n");
  EXPECT_FALSE(std::filesystem::exists(first + ".tmp"));
}

TEST(ScanEngineTest, RunReplacesPreviousArtifact) {
  TempDir dir;
  std::string input = dir.Write("auth.log", joinLines(kAuthRecords));
  std::string output = dir.Write("result.json", "stale");

  auto [result, err] = engineFor(input, output, 2)->Run();
  ASSERT_EQ(err, nullptr) << err->What();
  EXPECT_EQ(TempDir::Read(output),
            "{\n"
            "    \"1.1.1.1\": 2,\n"
            "    \"2.2.2.2\": 1,\n"
            "    \"3.3.3.3\": 1\n"
            "}\n");
}

TEST(ScanEngineTest, NonUtf8InputStillWritesArtifact) {
  TempDir dir;
  std::string input =
      dir.Write("flows.csv", "src,label\ncaf\xe9,attack\n1.2.3.4,benign\n");
  std::string output = dir.Path("result.json");

  auto [result, err] = engineFor(input, output, 2)->Run();
  ASSERT_EQ(err, nullptr) << err->What();
  EXPECT_EQ(TempDir::Read(output),
            "{\n"
            "    \"caf\": 1\n"
            "}\n");
  EXPECT_FALSE(std::filesystem::exists(output + ".tmp"));
}

TEST(ScanEngineTest, NoFindingsWritesSentinel) {
  TempDir dir;
  std::string quiet = dir.Write("quiet.log", "service started\nall good\n");
  std::string empty = dir.Write("empty.log", "");
  const std::string sentinel =
      "{\n"
      "    \"message\": \"No suspicious IPs or attack patterns detected.\"\n"
      "}\n";

  for (const auto& input : {quiet, empty}) {
    std::string output = input + ".json";
    auto [result, err] = engineFor(input, output, 3)->Run();
    ASSERT_EQ(err, nullptr) << err->What();
    EXPECT_TRUE(result.IsSentinel());
    EXPECT_EQ(TempDir::Read(output), sentinel) << input;
  }
}

TEST(ScanEngineTest, UnsupportedFormatWritesNothing) {
  TempDir dir;
  std::string input = dir.Write("capture.pcap", "1.2.3.4\n");
  std::string output = dir.Path("result.json");

  auto [result, err] = engineFor(input, output, 2)->Run();
  ASSERT_NE(err, nullptr);
  EXPECT_TRUE(errors::IsKind(err, errors::Kind::UnsupportedFormat));
  EXPECT_FALSE(std::filesystem::exists(output));
}

TEST(ScanEngineTest, LoadFailureWritesNothing) {
  TempDir dir;
  std::string output = dir.Path("result.json");

  auto [result, err] = engineFor(dir.Path("missing.csv"), output, 2)->Run();
  ASSERT_NE(err, nullptr);
  EXPECT_TRUE(errors::IsKind(err, errors::Kind::LoadFailure));
  EXPECT_FALSE(std::filesystem::exists(output));
}

}  // namespace
}  // namespace threat_scanner
