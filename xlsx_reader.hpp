// xlsx_reader.hpp
#pragma once

#include <string>
#include <tuple>
#include <vector>

#include "ports/errors/errors.hpp"

namespace threat_scanner {

// Reads the cell text of the first worksheet of an Office Open XML workbook.
class XlsxReader {
 public:
  using Sheet = std::vector<std::vector<std::string>>;

  static std::tuple<Sheet, error> ReadFirstSheet(const std::string& path);

  // Same, from the bytes of the workbook file.
  static std::tuple<Sheet, error> ParseWorkbook(const std::string& bytes);

 private:
  static std::tuple<std::vector<std::string>, error> parseSharedStrings(
      const std::string& xml);
  static std::tuple<Sheet, error> parseSheet(
      const std::string& xml, const std::vector<std::string>& sharedStrings);
  static std::string resolveFirstSheetPath(const std::string& workbookXml,
                                           const std::string& relsXml);
};

}  // namespace threat_scanner
