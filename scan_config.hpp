// scan_config.hpp
#pragma once

#include <string>
#include <tuple>

#include "ports/errors/errors.hpp"

namespace threat_scanner {

struct ScanConfig {
  std::string inputPath = "sample_logs/auth.log";
  int workerCount = 4;
  std::string resultPath = "results/analysis_result.json";

  // LOG_FILE_PATH, SCAN_WORKERS and SCAN_RESULT_PATH over the defaults.
  static std::tuple<ScanConfig, error> FromEnvironment();

  // [--workers N | -n N] [--output PATH | -o PATH] [INPUT], over base.
  static std::tuple<ScanConfig, error> FromArgs(int argc, const char* const* argv,
                                                ScanConfig base);

  error Validate() const;
};

}  // namespace threat_scanner
