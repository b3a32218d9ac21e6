// column_inferencer.hpp
#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "tabular_view.hpp"

namespace threat_scanner {

struct InferredColumns {
  std::optional<size_t> sourceIp;  // set whenever the view has a column
  std::optional<size_t> attack;
};

class ColumnInferencer {
 public:
  static constexpr size_t kIpSampleSize = 200;
  static constexpr size_t kLabelSampleSize = 500;
  static constexpr size_t kTrailingColumns = 6;

  static InferredColumns Infer(const TabularView& view);

  // Name match, then the first column dense enough in IP-shaped values,
  // then the first column.
  static std::optional<size_t> InferSourceColumn(const TabularView& view);

  // Name match, then the rightmost of the trailing columns holding any
  // non-numeric value.
  static std::optional<size_t> InferAttackColumn(const TabularView& view);

 private:
  static std::optional<size_t> findByName(
      const TabularView& view, const std::vector<std::string_view>& tokens);
};

}  // namespace threat_scanner
