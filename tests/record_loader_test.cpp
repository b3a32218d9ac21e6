#include "record_loader.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "test_support.hpp"

namespace threat_scanner {
namespace {

using testing::TempDir;

TEST(FormatFromPathTest, KnownExtensions) {
  struct Case {
    std::string path;
    DeclaredFormat format;
  };
  std::vector<Case> cases = {
      {"auth.log", DeclaredFormat::LineText},
      {"notes.TXT", DeclaredFormat::LineText},
      {"/data/flows.Csv", DeclaredFormat::DelimitedText},
      {"book.xlsx", DeclaredFormat::Spreadsheet},
      {"old.XLS", DeclaredFormat::Spreadsheet},
      {"dump.json", DeclaredFormat::Json},
  };
  for (const auto& c : cases) {
    auto [format, err] = FormatFromPath(c.path);
    EXPECT_EQ(err, nullptr) << c.path;
    EXPECT_EQ(format, c.format) << c.path;
  }
}

TEST(FormatFromPathTest, UnknownExtensionIsUnsupported) {
  for (const std::string path : {"capture.pcap", "README", "archive.tar.gz"}) {
    auto [format, err] = FormatFromPath(path);
    ASSERT_NE(err, nullptr) << path;
    EXPECT_TRUE(errors::IsKind(err, errors::Kind::UnsupportedFormat)) << path;
  }
}

TEST(RecordLoaderTest, UnsupportedExtensionIsNotALoadFailure) {
  TempDir dir;
  std::string path = dir.Write("capture.pcap", "1.2.3.4\n");

  RecordLoader loader;
  auto [records, err] = loader.Load(path);
  ASSERT_NE(err, nullptr);
  EXPECT_TRUE(errors::IsKind(err, errors::Kind::UnsupportedFormat));
  EXPECT_FALSE(errors::IsKind(err, errors::Kind::LoadFailure));
  EXPECT_TRUE(records.empty());
}

TEST(RecordLoaderTest, LineTextDropsBlankLinesAndCarriageReturns) {
  TempDir dir;
  std::string path = dir.Write(
      "auth.log",
      "Jan 1 sshd: Failed password for root from 1.2.3.4 port 22\r\n"
      "\r\n"
      "   \n"
      "second line\n"
      "third line without newline");

  RecordLoader loader;
  auto [records, err] = loader.Load(path);
  ASSERT_EQ(err, nullptr);
  EXPECT_EQ(records,
            (std::vector<RawRecord>{
                "Jan 1 sshd: Failed password for root from 1.2.3.4 port 22",
                "second line", "third line without newline"}));
}

TEST(RecordLoaderTest, InvalidUtf8BytesAreDropped) {
  TempDir dir;
  std::string path = dir.Write("flows.csv",
                               "src,label\ncaf\xe9,attack\n"
                               "caf\xc3\xa9,scan\n\xff\xfe\n");

  RecordLoader loader;
  auto [records, err] = loader.Load(path);
  ASSERT_EQ(err, nullptr);
  EXPECT_EQ(records, (std::vector<RawRecord>{"src,label", "caf,attack",
                                             "caf\xc3\xa9,scan"}));
}

TEST(RecordLoaderTest, DelimitedTextKeepsHeaderAsFirstRecord) {
  TempDir dir;
  std::string path =
      dir.Write("flows.csv", "srcip,attack_cat\n1.1.1.1,Exploits\n\n");

  RecordLoader loader;
  auto [records, err] = loader.Load(path);
  ASSERT_EQ(err, nullptr);
  EXPECT_EQ(records,
            (std::vector<RawRecord>{"srcip,attack_cat", "1.1.1.1,Exploits"}));
}

TEST(RecordLoaderTest, JsonArrayElementsBecomeRecords) {
  TempDir dir;
  std::string path = dir.Write("items.json", R"(["a", 1, {"k": "v"}])");

  RecordLoader loader;
  auto [records, err] = loader.Load(path);
  ASSERT_EQ(err, nullptr);
  EXPECT_EQ(records, (std::vector<RawRecord>{"a", "1", R"({"k":"v"})"}));
}

TEST(RecordLoaderTest, JsonObjectMembersKeepFileOrder) {
  TempDir dir;
  std::string path = dir.Write("obj.json", R"({"b": 1, "a": "x"})");

  RecordLoader loader;
  auto [records, err] = loader.Load(path);
  ASSERT_EQ(err, nullptr);
  EXPECT_EQ(records, (std::vector<RawRecord>{"b: 1", "a: x"}));
}

TEST(RecordLoaderTest, JsonScalarIsSingleRecord) {
  TempDir dir;
  std::string path = dir.Write("n.json", "42");

  RecordLoader loader;
  auto [records, err] = loader.Load(path);
  ASSERT_EQ(err, nullptr);
  EXPECT_EQ(records, (std::vector<RawRecord>{"42"}));
}

TEST(RecordLoaderTest, MalformedJsonIsLoadFailure) {
  TempDir dir;
  std::string path = dir.Write("bad.json", R"({"a": [1, 2)");

  RecordLoader loader;
  auto [records, err] = loader.Load(path);
  ASSERT_NE(err, nullptr);
  EXPECT_TRUE(errors::IsKind(err, errors::Kind::LoadFailure));
  EXPECT_TRUE(records.empty());
}

TEST(RecordLoaderTest, MissingFileIsLoadFailure) {
  TempDir dir;
  RecordLoader loader;
  auto [records, err] = loader.Load(dir.Path("absent.log"));
  ASSERT_NE(err, nullptr);
  EXPECT_TRUE(errors::IsKind(err, errors::Kind::LoadFailure));
}

TEST(RecordLoaderTest, BinaryWorkbookIsLoadFailure) {
  TempDir dir;
  std::string ole2("\xD0\xCF\x11\xE0\xA1\xB1\x1A\xE1", 8);
  ole2 += std::string(504, '\0');
  std::string path = dir.Write("legacy.xls", ole2);

  RecordLoader loader;
  auto [records, err] = loader.Load(path);
  ASSERT_NE(err, nullptr);
  EXPECT_TRUE(errors::IsKind(err, errors::Kind::LoadFailure));
  EXPECT_NE(err->What().find("BIFF"), std::string::npos);
}

TEST(RecordLoaderTest, EmptyFileLoadsNoRecords) {
  TempDir dir;
  std::string path = dir.Write("empty.log", "");

  RecordLoader loader;
  auto [records, err] = loader.Load(path);
  ASSERT_EQ(err, nullptr);
  EXPECT_TRUE(records.empty());
}

}  // namespace
}  // namespace threat_scanner
