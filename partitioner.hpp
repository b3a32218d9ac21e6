// partitioner.hpp
#pragma once

#include <tuple>
#include <vector>

#include "ports/errors/errors.hpp"
#include "scan_types.hpp"
#include "suspicious_detector.hpp"

namespace threat_scanner {

// Round-robin split: record i goes to partition i mod W.
class Partitioner {
 public:
  static std::tuple<Partitioner, error> Create(int workerCount);

  int WorkerCount() const { return workerCount; }

  // Always returns WorkerCount() partitions, some possibly empty. Ranks other
  // than 0 receive the first record as their header hint.
  std::vector<Partition> Split(const std::vector<RawRecord>& records) const;

 private:
  explicit Partitioner(int count) : workerCount(count) {}

  int workerCount;
};

class Aggregator {
 public:
  // Sums counts per key. Order of the inputs does not matter.
  static AnalysisResult Aggregate(const std::vector<SuspiciousIpTally>& tallies);

  // Merges worker reports. When no worker flagged anything, the frequency
  // candidates of all workers are merged instead and only repeated IPs kept.
  static AnalysisResult Aggregate(const std::vector<DetectionReport>& reports);

  static void MergeInto(SuspiciousIpTally& into, const SuspiciousIpTally& from);
};

}  // namespace threat_scanner
