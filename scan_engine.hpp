// scan_engine.hpp
#pragma once

#include <kvalog/kvalog.hpp>

#include <memory>
#include <tuple>
#include <vector>

#include "partitioner.hpp"
#include "ports/errors/errors.hpp"
#include "scan_config.hpp"
#include "scan_types.hpp"
#include "suspicious_detector.hpp"

namespace threat_scanner {

// Runs one scan with a fixed number of worker ranks. The calling thread is
// rank 0: it loads, partitions and writes, and scans its own partition like
// every other rank.
class ScanEngine {
 public:
  static std::tuple<std::shared_ptr<ScanEngine>, error> Create(
      const ScanConfig& cfg);

  // Load the input, scan it and replace the result artifact.
  std::tuple<AnalysisResult, error> Run();

  // Scan records already in memory. Nothing is written.
  std::tuple<AnalysisResult, error> Analyze(
      const std::vector<RawRecord>& records);

 private:
  ScanEngine(const ScanConfig& cfg, const Partitioner& partitioner);

  // Hands each partition to its worker, then blocks until every worker has
  // reported. Any failed worker fails the whole scan.
  std::tuple<std::vector<DetectionReport>, error> scatterGather(
      std::vector<Partition> partitions);

  ScanConfig config;
  Partitioner partitioner;
  kvalog::Logger logger;
};

}  // namespace threat_scanner
