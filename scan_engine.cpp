// scan_engine.cpp
#include "scan_engine.hpp"

#include <exception>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

#include "record_loader.hpp"
#include "result_writer.hpp"

namespace threat_scanner {

ScanEngine::ScanEngine(const ScanConfig& cfg, const Partitioner& partitioner)
    : config(cfg),
      partitioner(partitioner),
      logger(kvalog::CreateLogger("threat_scanner", "engine")) {}

std::tuple<std::shared_ptr<ScanEngine>, error> ScanEngine::Create(
    const ScanConfig& cfg) {
  if (auto err = cfg.Validate()) {
    return {nullptr, err};
  }
  auto [partitioner, err] = Partitioner::Create(cfg.workerCount);
  if (err) {
    return {nullptr, err};
  }
  return {std::shared_ptr<ScanEngine>(new ScanEngine(cfg, partitioner)),
          nullptr};
}

// ─────────────────────────────────────────────────────────────────────────────
// Public interface
// ─────────────────────────────────────────────────────────────────────────────

std::tuple<AnalysisResult, error> ScanEngine::Run() {
  RecordLoader loader;
  auto [records, err] = loader.Load(config.inputPath);
  if (err) {
    logger.Error("scan aborted: " + err->What());
    return {AnalysisResult::NoFindings(), err};
  }
  if (records.empty()) {
    logger.Warning("no readable data found in " + config.inputPath);
  }

  auto [result, scanErr] = Analyze(records);
  if (scanErr) {
    logger.Error("scan aborted: " + scanErr->What());
    return {result, scanErr};
  }

  ResultWriter writer;
  if (auto writeErr = writer.Write(result, config.resultPath)) {
    logger.Error("scan aborted: " + writeErr->What());
    return {result, writeErr};
  }

  logger.Flush();
  return {result, nullptr};
}

std::tuple<AnalysisResult, error> ScanEngine::Analyze(
    const std::vector<RawRecord>& records) {
  std::vector<Partition> partitions = partitioner.Split(records);
  logger.Info("distributing " + std::to_string(records.size()) +
              " records over " + std::to_string(partitions.size()) +
              " workers");

  auto [reports, err] = scatterGather(std::move(partitions));
  if (err) {
    return {AnalysisResult::NoFindings(), err};
  }

  AnalysisResult result = Aggregator::Aggregate(reports);
  logger.Info(result.IsSentinel()
                  ? std::string("no suspicious activity detected")
                  : "flagged " + std::to_string(result.Tally().size()) +
                        " source IPs");
  return {result, nullptr};
}

// ─────────────────────────────────────────────────────────────────────────────
// Scatter / gather
// ─────────────────────────────────────────────────────────────────────────────

std::tuple<std::vector<DetectionReport>, error> ScanEngine::scatterGather(
    std::vector<Partition> partitions) {
  const size_t n = partitions.size();
  std::vector<DetectionReport> reports(n);
  std::vector<error> failures(n);

  // Each worker touches only its own slot of partitions, reports and
  // failures.
  auto work = [&partitions, &reports, &failures](size_t slot) {
    const Partition& partition = partitions[slot];
    try {
      SuspiciousRecordDetector detector(partition.rank);
      reports[slot] = detector.Detect(partition);
    } catch (const std::exception& e) {
      failures[slot] = errors::OfKind(
          errors::Kind::WorkerFailure,
          "rank " + std::to_string(partition.rank) + " failed: " + e.what());
    }
  };

  std::vector<std::thread> workers;
  workers.reserve(n);
  for (size_t slot = 1; slot < n; ++slot) {
    try {
      workers.emplace_back(work, slot);
    } catch (const std::system_error& e) {
      failures[slot] = errors::OfKind(
          errors::Kind::WorkerFailure,
          "could not start rank " + std::to_string(slot) + ": " + e.what());
    }
  }

  if (n > 0) {
    work(0);
  }

  for (auto& worker : workers) {
    worker.join();
  }

  if (auto err = errors::Join(failures)) {
    return {std::vector<DetectionReport>(), err};
  }
  return {reports, nullptr};
}

}  // namespace threat_scanner
