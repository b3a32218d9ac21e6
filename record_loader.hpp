// record_loader.hpp
#pragma once

#include <kvalog/kvalog.hpp>

#include <string>
#include <tuple>
#include <vector>

#include "ports/errors/errors.hpp"
#include "scan_types.hpp"

namespace threat_scanner {

enum class DeclaredFormat {
  LineText,       // .log, .txt
  DelimitedText,  // .csv
  Spreadsheet,    // .xlsx, .xls
  Json,           // .json
};

const char* FormatName(DeclaredFormat format);

// Maps a file extension (case-insensitive) to its declared format. Anything
// else is an UnsupportedFormat error.
std::tuple<DeclaredFormat, error> FormatFromPath(const std::string& path);

class RecordLoader {
 public:
  RecordLoader();

  // Declared format taken from the path's extension.
  std::tuple<std::vector<RawRecord>, error> Load(const std::string& path);

  std::tuple<std::vector<RawRecord>, error> Load(const std::string& path,
                                                 DeclaredFormat format);

 private:
  kvalog::Logger logger;

  static std::tuple<std::vector<RawRecord>, error> readLines(
      const std::string& path);
  static std::tuple<std::vector<RawRecord>, error> readJson(
      const std::string& path);
  static std::tuple<std::vector<RawRecord>, error> readSpreadsheet(
      const std::string& path);
};

}  // namespace threat_scanner
