// tabular_view.hpp
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace threat_scanner {

// Column-oriented reading of a partition that sniffed as delimited data.
// Rows are padded to the header width; absent cells read as "".
class TabularView {
 public:
  TabularView() = default;
  TabularView(std::vector<std::string> columnNames,
              std::vector<std::vector<std::string>> rowCells);

  size_t ColumnCount() const { return columns.size(); }
  size_t RowCount() const { return rows.size(); }

  const std::vector<std::string>& Columns() const { return columns; }
  const std::string& ColumnName(size_t col) const { return columns.at(col); }

  // Case-insensitive exact lookup.
  std::optional<size_t> FindColumn(std::string_view name) const;

  const std::string& Cell(size_t row, size_t col) const;
  std::string TrimmedCell(size_t row, size_t col) const;
  // Trimmed cell is an optionally signed integer or decimal.
  bool IsNumericCell(size_t row, size_t col) const;

  // First `limit` raw values of a column, in row order.
  std::vector<std::string> ColumnSample(size_t col, size_t limit) const;

 private:
  std::vector<std::string> columns;
  std::vector<std::vector<std::string>> rows;
};

}  // namespace threat_scanner
