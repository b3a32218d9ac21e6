// column_inferencer.cpp
#include "column_inferencer.hpp"

#include <algorithm>

#include "text_patterns.hpp"

namespace threat_scanner {

namespace {

const std::vector<std::string_view> kSourceNameTokens = {
    "src", "source", "sip", "src_ip", "source_ip"};
const std::vector<std::string_view> kAttackNameTokens = {"attack", "label",
                                                         "cat", "class"};

}  // namespace

InferredColumns ColumnInferencer::Infer(const TabularView& view) {
  return InferredColumns{InferSourceColumn(view), InferAttackColumn(view)};
}

std::optional<size_t> ColumnInferencer::InferSourceColumn(
    const TabularView& view) {
  if (view.ColumnCount() == 0) return std::nullopt;

  if (auto byName = findByName(view, kSourceNameTokens)) {
    return byName;
  }

  for (size_t col = 0; col < view.ColumnCount(); ++col) {
    auto sample = view.ColumnSample(col, kIpSampleSize);
    size_t hits = 0;
    for (const auto& value : sample) {
      hits += text::CountIps(value);
    }
    size_t needed =
        std::max<size_t>(1, std::min<size_t>(10, sample.size() / 10));
    if (hits >= needed) {
      return col;
    }
  }

  return size_t{0};
}

std::optional<size_t> ColumnInferencer::InferAttackColumn(
    const TabularView& view) {
  if (auto byName = findByName(view, kAttackNameTokens)) {
    return byName;
  }

  size_t count = view.ColumnCount();
  size_t first = count > kTrailingColumns ? count - kTrailingColumns : 0;
  for (size_t col = count; col-- > first;) {
    auto sample = view.ColumnSample(col, kLabelSampleSize);
    bool textual = std::any_of(sample.begin(), sample.end(), [](const auto& v) {
      return !text::IsNumeric(text::Trim(v));
    });
    if (textual) {
      return col;
    }
  }
  return std::nullopt;
}

std::optional<size_t> ColumnInferencer::findByName(
    const TabularView& view, const std::vector<std::string_view>& tokens) {
  for (size_t col = 0; col < view.ColumnCount(); ++col) {
    if (text::ContainsAny(text::ToLower(view.ColumnName(col)), tokens)) {
      return col;
    }
  }
  return std::nullopt;
}

}  // namespace threat_scanner
