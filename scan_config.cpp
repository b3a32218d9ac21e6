// scan_config.cpp
#include "scan_config.hpp"

#include <charconv>
#include <cstdlib>
#include <string_view>

namespace threat_scanner {

namespace {

error parseWorkerCount(std::string_view text, int* out) {
  int value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return errors::OfKind(errors::Kind::InvalidConfig,
                          "worker count is not an integer: '" +
                              std::string(text) + "'");
  }
  *out = value;
  return nullptr;
}

}  // namespace

std::tuple<ScanConfig, error> ScanConfig::FromEnvironment() {
  ScanConfig config;

  if (const char* path = std::getenv("LOG_FILE_PATH"); path && *path) {
    config.inputPath = path;
  }
  if (const char* workers = std::getenv("SCAN_WORKERS"); workers && *workers) {
    if (auto err = parseWorkerCount(workers, &config.workerCount)) {
      return {config, errors::Wrap(err, "SCAN_WORKERS")};
    }
  }
  if (const char* out = std::getenv("SCAN_RESULT_PATH"); out && *out) {
    config.resultPath = out;
  }
  return {config, nullptr};
}

std::tuple<ScanConfig, error> ScanConfig::FromArgs(int argc,
                                                   const char* const* argv,
                                                   ScanConfig base) {
  ScanConfig config = base;
  bool haveInput = false;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg == "--workers" || arg == "-n" || arg == "--output" || arg == "-o") {
      if (i + 1 >= argc) {
        return {config, errors::OfKind(errors::Kind::InvalidConfig,
                                       "missing value for " + std::string(arg))};
      }
      std::string_view value = argv[++i];
      if (arg == "--workers" || arg == "-n") {
        if (auto err = parseWorkerCount(value, &config.workerCount)) {
          return {config, err};
        }
      } else {
        config.resultPath = std::string(value);
      }
    } else if (!arg.empty() && arg[0] == '-') {
      return {config, errors::OfKind(errors::Kind::InvalidConfig,
                                     "unknown option " + std::string(arg))};
    } else if (haveInput) {
      return {config, errors::OfKind(errors::Kind::InvalidConfig,
                                     "more than one input file given")};
    } else {
      config.inputPath = std::string(arg);
      haveInput = true;
    }
  }
  return {config, nullptr};
}

error ScanConfig::Validate() const {
  if (inputPath.empty()) {
    return errors::OfKind(errors::Kind::InvalidConfig, "input path is empty");
  }
  if (resultPath.empty()) {
    return errors::OfKind(errors::Kind::InvalidConfig, "result path is empty");
  }
  if (workerCount < 1) {
    return errors::OfKind(errors::Kind::InvalidConfig,
                          "worker count must be at least 1, got " +
                              std::to_string(workerCount));
  }
  return nullptr;
}

}  // namespace threat_scanner
