// scan_types.cpp
#include "scan_types.hpp"

namespace threat_scanner {

AnalysisResult AnalysisResult::FromTally(SuspiciousIpTally tally) {
  if (tally.empty()) {
    return NoFindings();
  }
  return AnalysisResult(std::move(tally));
}

AnalysisResult AnalysisResult::NoFindings() {
  return AnalysisResult(NoFindingsMarker{});
}

const SuspiciousIpTally& AnalysisResult::Tally() const {
  static const SuspiciousIpTally empty;
  if (const auto* tally = std::get_if<SuspiciousIpTally>(&value)) {
    return *tally;
  }
  return empty;
}

std::string AnalysisResult::Message() const {
  return IsSentinel() ? kNoFindingsMessage : std::string();
}

}  // namespace threat_scanner
