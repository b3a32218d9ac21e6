// format_sniffer.hpp
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <variant>
#include <vector>

#include "ports/errors/errors.hpp"
#include "scan_types.hpp"
#include "tabular_view.hpp"

namespace threat_scanner {

struct Delimiter {
  char ch = ',';
  bool whitespaceRuns = false;

  static Delimiter Char(char c) { return Delimiter{c, false}; }
  static Delimiter Whitespace() { return Delimiter{' ', true}; }

  std::string Describe() const;
  bool operator==(const Delimiter& other) const {
    return whitespaceRuns == other.whitespaceRuns &&
           (whitespaceRuns || ch == other.ch);
  }
};

// Outcomes of trying to read a partition as a table.
struct NotTabular {};
struct ParseFailed {
  error reason;
};
using SniffOutcome = std::variant<TabularView, NotTabular, ParseFailed>;

enum class DetectionStrategy {
  Tabular,
  FreeForm,
  FreeFormAfterParseFailure,
};

const char* StrategyName(DetectionStrategy strategy);

// The whole fallback table: a parsed table is scanned as such, everything
// else goes to the free-form detector.
DetectionStrategy SelectStrategy(const SniffOutcome& outcome);

class FormatSniffer {
 public:
  static constexpr size_t kSampleRecords = 10;
  static constexpr size_t kSniffWindowChars = 4096;

  // Classifies a partition and, when it is tabular, parses all of it.
  static SniffOutcome Sniff(const std::vector<RawRecord>& lines);

  // A delimiter character, or a run of two or more whitespace characters,
  // occurs in the sample.
  static bool LooksTabular(const std::vector<RawRecord>& sample);

  // Frequency-consistency delimiter detection. Empty when no character is
  // consistent enough across the lines of text.
  static std::optional<char> DetectDelimiter(std::string_view text);

  // DetectDelimiter over the first kSniffWindowChars of the sample, then
  // tab, semicolon, comma, and finally whitespace runs.
  static Delimiter InferDelimiter(const std::string& sampleText);

  // First non-blank line is the header; an all-digit header is replaced by
  // col0..colN-1 and not kept as data.
  static std::tuple<TabularView, error> ParseTable(
      const std::vector<RawRecord>& lines, const Delimiter& delimiter);

 private:
  static std::tuple<std::vector<std::string>, error> splitLine(
      const std::string& line, const Delimiter& delimiter);
  static std::vector<std::string> headerNames(
      const std::vector<std::string>& tokens);
  static std::string joinSample(const std::vector<RawRecord>& lines);
};

}  // namespace threat_scanner
