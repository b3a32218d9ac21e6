// result_writer.cpp
#include "result_writer.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <system_error>
#include <utility>
#include <vector>

namespace threat_scanner {

ResultWriter::ResultWriter()
    : logger(kvalog::CreateLogger("threat_scanner", "result_writer")) {}

nlohmann::json ResultWriter::ToJson(const AnalysisResult& result) {
  nlohmann::json doc = nlohmann::json::object();
  if (result.IsSentinel()) {
    doc["message"] = result.Message();
    return doc;
  }
  for (const auto& [ip, count] : result.Tally()) {
    doc[ip] = count;
  }
  return doc;
}

error ResultWriter::Write(const AnalysisResult& result,
                          const std::string& path) {
  namespace fs = std::filesystem;

  // Bytes that are not UTF-8 become U+FFFD instead of failing the dump.
  std::string body;
  try {
    body = ToJson(result).dump(4, ' ', false,
                               nlohmann::json::error_handler_t::replace);
  } catch (const nlohmann::json::exception& e) {
    return errors::OfKind(errors::Kind::WriteFailure,
                          std::string("failed to serialize result: ") +
                              e.what());
  }

  std::error_code ec;
  fs::path target(path);
  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
      return errors::OfKind(errors::Kind::WriteFailure,
                            "failed to create result directory " +
                                target.parent_path().string() + ": " +
                                ec.message());
    }
  }

  fs::path staging = target;
  staging += ".tmp";
  {
    std::ofstream out(staging, std::ios::out | std::ios::trunc);
    if (!out.is_open()) {
      return errors::OfKind(errors::Kind::WriteFailure,
                            "failed to open result file: " + staging.string());
    }
    out << body << "\n";
    out.flush();
    if (!out) {
      fs::remove(staging, ec);
      return errors::OfKind(errors::Kind::WriteFailure,
                            "failed to write result file: " + staging.string());
    }
  }

  fs::rename(staging, target, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(staging, ignored);
    return errors::OfKind(errors::Kind::WriteFailure,
                          "failed to replace " + path + ": " + ec.message());
  }

  logger.Info("analysis result saved at " + path + " entries=" +
              std::to_string(result.Tally().size()));
  return nullptr;
}

void ResultWriter::PrintReport(const AnalysisResult& result,
                               std::ostream& out) {
  out << "========================================" << std::endl;
  out << "       SUSPICIOUS SOURCE IP REPORT" << std::endl;
  out << "========================================" << std::endl;

  if (result.IsSentinel()) {
    out << result.Message() << std::endl;
    out << "========================================" << std::endl;
    return;
  }

  std::vector<std::pair<std::string, int64_t>> ranked(result.Tally().begin(),
                                                      result.Tally().end());
  std::stable_sort(
      ranked.begin(), ranked.end(),
      [](const auto& a, const auto& b) { return a.second > b.second; });

  int64_t total = 0;
  for (const auto& entry : ranked) total += entry.second;

  out << "Distinct IPs: " << ranked.size() << std::endl;
  out << "Total hits:   " << total << std::endl;
  out << std::endl;
  for (size_t i = 0; i < ranked.size(); ++i) {
    out << "  " << std::setw(3) << i + 1 << ". " << std::left << std::setw(18)
        << ranked[i].first << std::right << ranked[i].second << std::endl;
  }
  out << "========================================" << std::endl;
}

}  // namespace threat_scanner
