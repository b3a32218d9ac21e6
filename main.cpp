#include <iostream>
#include <string>

#include "result_writer.hpp"
#include "scan_config.hpp"
#include "scan_engine.hpp"

namespace {

void printUsage(const char* prog) {
  std::cerr << "Usage: " << prog
            << " [--workers N] [--output PATH] [input.{log,txt,csv,json,xlsx,xls}]"
            << std::endl;
  std::cerr << "Environment: LOG_FILE_PATH, SCAN_WORKERS, SCAN_RESULT_PATH"
            << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      printUsage(argv[0]);
      return 0;
    }
  }

  auto [envConfig, envErr] = threat_scanner::ScanConfig::FromEnvironment();
  if (envErr) {
    std::cerr << "Error: " << envErr->What() << std::endl;
    return 1;
  }

  auto [config, argErr] =
      threat_scanner::ScanConfig::FromArgs(argc, argv, envConfig);
  if (argErr) {
    std::cerr << "Error: " << argErr->What() << std::endl;
    printUsage(argv[0]);
    return 1;
  }

  auto [engine, err] = threat_scanner::ScanEngine::Create(config);
  if (err) {
    std::cerr << "Error: " << err->What() << std::endl;
    return 1;
  }

  std::cout << "Analyzing file: " << config.inputPath << std::endl;
  std::cout << "Workers: " << config.workerCount << std::endl;
  std::cout << std::endl;

  auto [result, runErr] = engine->Run();
  if (runErr) {
    std::cerr << "Error: " << runErr->What() << std::endl;
    return 1;
  }

  threat_scanner::ResultWriter::PrintReport(result);
  std::cout << "Analysis complete. Results saved at: " << config.resultPath
            << std::endl;
  return 0;
}
