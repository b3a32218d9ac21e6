// partitioner.cpp
#include "partitioner.hpp"

#include <string>
#include <utility>

namespace threat_scanner {

std::tuple<Partitioner, error> Partitioner::Create(int workerCount) {
  if (workerCount < 1) {
    return {Partitioner(1),
            errors::OfKind(errors::Kind::InvalidConfig,
                           "worker count must be at least 1, got " +
                               std::to_string(workerCount))};
  }
  return {Partitioner(workerCount), nullptr};
}

std::vector<Partition> Partitioner::Split(
    const std::vector<RawRecord>& records) const {
  std::vector<Partition> partitions(static_cast<size_t>(workerCount));
  for (int rank = 0; rank < workerCount; ++rank) {
    Partition& p = partitions[static_cast<size_t>(rank)];
    p.rank = rank;
    p.records.reserve(records.size() / static_cast<size_t>(workerCount) + 1);
    if (rank != 0 && !records.empty()) {
      p.headerHint = records.front();
    }
  }

  for (size_t i = 0; i < records.size(); ++i) {
    partitions[i % static_cast<size_t>(workerCount)].records.push_back(
        records[i]);
  }
  return partitions;
}

// ─────────────────────────────────────────────────────────────────────────────
// Aggregator
// ─────────────────────────────────────────────────────────────────────────────

void Aggregator::MergeInto(SuspiciousIpTally& into,
                           const SuspiciousIpTally& from) {
  for (const auto& [ip, count] : from) {
    into[ip] += count;
  }
}

AnalysisResult Aggregator::Aggregate(
    const std::vector<SuspiciousIpTally>& tallies) {
  SuspiciousIpTally merged;
  for (const auto& tally : tallies) {
    MergeInto(merged, tally);
  }
  return AnalysisResult::FromTally(std::move(merged));
}

AnalysisResult Aggregator::Aggregate(
    const std::vector<DetectionReport>& reports) {
  SuspiciousIpTally merged;
  for (const auto& report : reports) {
    MergeInto(merged, report.tally);
  }
  if (!merged.empty()) {
    return AnalysisResult::FromTally(std::move(merged));
  }

  SuspiciousIpTally candidates;
  for (const auto& report : reports) {
    MergeInto(candidates, report.frequencyCandidates);
  }
  for (const auto& [ip, count] : candidates) {
    if (count >= SuspiciousRecordDetector::kMinRepeatCount) {
      merged[ip] = count;
    }
  }
  return AnalysisResult::FromTally(std::move(merged));
}

}  // namespace threat_scanner
