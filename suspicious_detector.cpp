// suspicious_detector.cpp
#include "suspicious_detector.hpp"

#include <exception>
#include <set>
#include <string>

#include "text_patterns.hpp"

namespace threat_scanner {

SuspiciousRecordDetector::SuspiciousRecordDetector(int rank)
    : rank(rank), logger(kvalog::CreateLogger("threat_scanner", "detector")) {}

DetectionReport SuspiciousRecordDetector::Detect(const Partition& partition) {
  const std::vector<RawRecord>* lines = &partition.records;
  std::vector<RawRecord> withHeader;
  if (partition.headerHint) {
    withHeader.reserve(partition.records.size() + 1);
    withHeader.push_back(*partition.headerHint);
    withHeader.insert(withHeader.end(), partition.records.begin(),
                      partition.records.end());
    lines = &withHeader;
  }

  SniffOutcome outcome = FormatSniffer::Sniff(*lines);
  DetectionReport report;

  switch (SelectStrategy(outcome)) {
    case DetectionStrategy::Tabular: {
      const auto& view = std::get<TabularView>(outcome);
      try {
        report = DetectTabular(view, ColumnInferencer::Infer(view));
      } catch (const std::exception& e) {
        return recoverFreeForm(partition.records,
                               std::string("tabular scan failed: ") + e.what());
      }
      logger.Info("rank=" + std::to_string(rank) +
                  " strategy=" + StrategyName(report.strategy) + " columns=" +
                  std::to_string(view.ColumnCount()) +
                  " rows=" + std::to_string(view.RowCount()) +
                  " flagged=" + std::to_string(report.tally.size()));
      return report;
    }
    case DetectionStrategy::FreeFormAfterParseFailure:
      return recoverFreeForm(partition.records,
                             std::get<ParseFailed>(outcome).reason->What());
    case DetectionStrategy::FreeForm:
      break;
  }

  report = DetectFreeForm(partition.records);
  logger.Info("rank=" + std::to_string(rank) +
              " strategy=" + StrategyName(report.strategy) +
              " lines=" + std::to_string(partition.records.size()) +
              " flagged=" + std::to_string(report.tally.size()));
  return report;
}

// ─────────────────────────────────────────────────────────────────────────────
// Variants
// ─────────────────────────────────────────────────────────────────────────────

DetectionReport SuspiciousRecordDetector::DetectTabular(
    const TabularView& view, const InferredColumns& columns) {
  DetectionReport report;
  report.strategy = DetectionStrategy::Tabular;
  if (!columns.sourceIp) {
    return report;
  }
  const size_t src = *columns.sourceIp;

  for (size_t row = 0; row < view.RowCount(); ++row) {
    std::string ip = view.TrimmedCell(row, src);
    if (ip.empty() || text::ToLower(ip) == "nan") continue;

    std::string label =
        columns.attack ? view.TrimmedCell(row, *columns.attack) : "";
    if (!label.empty()) {
      if (!IsBenignLabel(label)) ++report.tally[ip];
    } else if (hasTextualTail(view, row)) {
      ++report.tally[ip];
    }
  }

  if (report.tally.empty()) {
    for (size_t row = 0; row < view.RowCount(); ++row) {
      std::string value = view.TrimmedCell(row, src);
      if (text::StartsWithIp(value)) ++report.frequencyCandidates[value];
    }
  }
  return report;
}

DetectionReport SuspiciousRecordDetector::DetectFreeForm(
    const std::vector<RawRecord>& records) {
  DetectionReport report;
  report.strategy = DetectionStrategy::FreeForm;
  for (const auto& record : records) {
    std::string failedFrom = text::MatchFailedPassword(record);
    if (!failedFrom.empty()) {
      ++report.tally[failedFrom];
      continue;
    }
    for (const auto& ip : text::FindAllIps(record)) {
      ++report.tally[ip];
    }
  }
  return report;
}

bool SuspiciousRecordDetector::IsBenignLabel(const std::string& value) {
  static const std::set<std::string> benign = {"0",      "-",    "normal",
                                               "benign", "none", ""};
  return benign.count(text::ToLower(text::Trim(value))) > 0;
}

// ─────────────────────────────────────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────────────────────────────────────

bool SuspiciousRecordDetector::hasTextualTail(const TabularView& view,
                                              size_t row) {
  size_t count = view.ColumnCount();
  size_t first = count > kTrailingColumns ? count - kTrailingColumns : 0;
  for (size_t col = first; col < count; ++col) {
    if (!view.TrimmedCell(row, col).empty() && !view.IsNumericCell(row, col)) {
      return true;
    }
  }
  return false;
}

DetectionReport SuspiciousRecordDetector::recoverFreeForm(
    const std::vector<RawRecord>& records, const std::string& reason) {
  logger.Warning("rank=" + std::to_string(rank) +
                 " falling back to free-form scan: " + reason);
  DetectionReport report = DetectFreeForm(records);
  report.strategy = DetectionStrategy::FreeFormAfterParseFailure;
  return report;
}

}  // namespace threat_scanner
