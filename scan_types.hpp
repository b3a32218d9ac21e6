// scan_types.hpp
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace threat_scanner {

// One input line, or one spreadsheet row flattened to text.
using RawRecord = std::string;

// ip -> occurrences. Ordered so that serialization is reproducible.
using SuspiciousIpTally = std::map<std::string, int64_t>;

struct Partition {
  int rank = 0;
  std::vector<RawRecord> records;
  // First record of the whole load, handed to ranks other than 0 so they
  // can read their rows against the same header.
  std::optional<RawRecord> headerHint;
};

class AnalysisResult {
 public:
  static constexpr const char* kNoFindingsMessage =
      "No suspicious IPs or attack patterns detected.";

  // Empty tally collapses to the sentinel.
  static AnalysisResult FromTally(SuspiciousIpTally tally);
  static AnalysisResult NoFindings();

  bool IsSentinel() const {
    return std::holds_alternative<NoFindingsMarker>(value);
  }
  const SuspiciousIpTally& Tally() const;
  std::string Message() const;

  bool operator==(const AnalysisResult& other) const {
    return value == other.value;
  }

 private:
  struct NoFindingsMarker {
    bool operator==(const NoFindingsMarker&) const { return true; }
  };

  explicit AnalysisResult(std::variant<SuspiciousIpTally, NoFindingsMarker> v)
      : value(std::move(v)) {}

  std::variant<SuspiciousIpTally, NoFindingsMarker> value;
};

}  // namespace threat_scanner
