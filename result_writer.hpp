// result_writer.hpp
#pragma once

#include <kvalog/kvalog.hpp>

#include <iostream>
#include <nlohmann/json.hpp>
#include <string>

#include "ports/errors/errors.hpp"
#include "scan_types.hpp"

namespace threat_scanner {

class ResultWriter {
 public:
  ResultWriter();

  // Replaces the artifact at path: written beside it, then renamed over it.
  error Write(const AnalysisResult& result, const std::string& path);

  // {"ip": count, ...} or {"message": "..."}.
  static nlohmann::json ToJson(const AnalysisResult& result);

  // Ranked by count, highest first.
  static void PrintReport(const AnalysisResult& result,
                          std::ostream& out = std::cout);

 private:
  kvalog::Logger logger;
};

}  // namespace threat_scanner
