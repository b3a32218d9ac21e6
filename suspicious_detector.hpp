// suspicious_detector.hpp
#pragma once

#include <kvalog/kvalog.hpp>

#include <cstdint>
#include <vector>

#include "column_inferencer.hpp"
#include "format_sniffer.hpp"
#include "scan_types.hpp"
#include "tabular_view.hpp"

namespace threat_scanner {

struct DetectionReport {
  SuspiciousIpTally tally;
  // IP-shaped source values and their counts, collected only when the
  // tabular scan flagged nothing. The repeat threshold is applied by the
  // aggregator, across all partitions.
  SuspiciousIpTally frequencyCandidates;
  DetectionStrategy strategy = DetectionStrategy::FreeForm;
};

class SuspiciousRecordDetector {
 public:
  static constexpr int64_t kMinRepeatCount = 2;
  static constexpr size_t kTrailingColumns = 6;

  explicit SuspiciousRecordDetector(int rank);

  // Sniffs the partition, runs the tabular variant when it parses as a
  // table and the free-form variant otherwise. A tabular scan that fails
  // falls back to free-form for this partition only.
  DetectionReport Detect(const Partition& partition);

  static DetectionReport DetectTabular(const TabularView& view,
                                       const InferredColumns& columns);

  // A "Failed password ... from <ip>" line counts its source IP once; any
  // other line counts every IP-shaped token it contains.
  static DetectionReport DetectFreeForm(const std::vector<RawRecord>& records);

  static bool IsBenignLabel(const std::string& value);

 private:
  int rank;
  kvalog::Logger logger;

  static bool hasTextualTail(const TabularView& view, size_t row);
  DetectionReport recoverFreeForm(const std::vector<RawRecord>& records,
                                  const std::string& reason);
};

}  // namespace threat_scanner
