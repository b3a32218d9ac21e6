// tabular_view.cpp
#include "tabular_view.hpp"

#include <algorithm>
#include <utility>

#include "text_patterns.hpp"

namespace threat_scanner {

TabularView::TabularView(std::vector<std::string> columnNames,
                         std::vector<std::vector<std::string>> rowCells)
    : columns(std::move(columnNames)), rows(std::move(rowCells)) {
  for (auto& row : rows) {
    row.resize(columns.size());
  }
}

std::optional<size_t> TabularView::FindColumn(std::string_view name) const {
  std::string wanted = text::ToLower(name);
  for (size_t i = 0; i < columns.size(); ++i) {
    if (text::ToLower(columns[i]) == wanted) {
      return i;
    }
  }
  return std::nullopt;
}

const std::string& TabularView::Cell(size_t row, size_t col) const {
  return rows.at(row).at(col);
}

std::string TabularView::TrimmedCell(size_t row, size_t col) const {
  return text::Trim(Cell(row, col));
}

bool TabularView::IsNumericCell(size_t row, size_t col) const {
  return text::IsNumeric(TrimmedCell(row, col));
}

std::vector<std::string> TabularView::ColumnSample(size_t col,
                                                   size_t limit) const {
  std::vector<std::string> sample;
  size_t n = std::min(limit, rows.size());
  sample.reserve(n);
  for (size_t r = 0; r < n; ++r) {
    sample.push_back(rows[r].at(col));
  }
  return sample;
}

}  // namespace threat_scanner
