// format_sniffer.cpp
#include "format_sniffer.hpp"

#include <algorithm>
#include <set>
#include <sstream>
#include <utility>

#include "text_patterns.hpp"

namespace threat_scanner {

namespace {

constexpr char kPreferredDelimiters[] = {',', '\t', ';', ' ', ':'};
constexpr int kAsciiLimit = 127;
constexpr double kConsistencyThreshold = 0.9;

std::vector<std::string_view> splitNonEmptyLines(std::string_view text) {
  std::vector<std::string_view> lines;
  size_t start = 0;
  while (start <= text.size()) {
    size_t nl = text.find('\n', start);
    if (nl == std::string_view::npos) nl = text.size();
    if (nl > start) lines.push_back(text.substr(start, nl - start));
    start = nl + 1;
  }
  return lines;
}

// (count value, number of lines), kept in first-seen order so that ties
// resolve to the earliest value.
using FrequencyTable = std::vector<std::pair<size_t, size_t>>;

void bump(FrequencyTable& table, size_t freq) {
  for (auto& [value, lines] : table) {
    if (value == freq) {
      ++lines;
      return;
    }
  }
  table.emplace_back(freq, 1);
}

}  // namespace

std::string Delimiter::Describe() const {
  if (whitespaceRuns) return "whitespace";
  switch (ch) {
    case '\t':
      return "tab";
    case ' ':
      return "space";
    default:
      return std::string("'") + ch + "'";
  }
}

const char* StrategyName(DetectionStrategy strategy) {
  switch (strategy) {
    case DetectionStrategy::Tabular:
      return "tabular";
    case DetectionStrategy::FreeForm:
      return "free-form";
    case DetectionStrategy::FreeFormAfterParseFailure:
      return "free-form (tabular parse failed)";
  }
  return "unknown";
}

DetectionStrategy SelectStrategy(const SniffOutcome& outcome) {
  if (std::holds_alternative<TabularView>(outcome)) {
    return DetectionStrategy::Tabular;
  }
  if (std::holds_alternative<ParseFailed>(outcome)) {
    return DetectionStrategy::FreeFormAfterParseFailure;
  }
  return DetectionStrategy::FreeForm;
}

// ─────────────────────────────────────────────────────────────────────────────
// Classification
// ─────────────────────────────────────────────────────────────────────────────

SniffOutcome FormatSniffer::Sniff(const std::vector<RawRecord>& lines) {
  std::vector<RawRecord> sample(
      lines.begin(), lines.begin() + std::min(lines.size(), kSampleRecords));
  if (!LooksTabular(sample)) {
    return NotTabular{};
  }

  Delimiter delimiter = InferDelimiter(joinSample(sample));
  auto [view, err] = ParseTable(lines, delimiter);
  if (err) {
    return ParseFailed{errors::OfKind(
        errors::Kind::PartitionParseFailure,
        "parsing with delimiter " + delimiter.Describe(), err)};
  }
  return view;
}

bool FormatSniffer::LooksTabular(const std::vector<RawRecord>& sample) {
  for (const auto& record : sample) {
    if (record.find_first_of(",\t;") != std::string::npos) return true;
    if (text::HasWhitespaceRun(record)) return true;
  }
  return false;
}

std::optional<char> FormatSniffer::DetectDelimiter(std::string_view text) {
  std::vector<std::string_view> data = splitNonEmptyLines(text);
  if (data.empty()) return std::nullopt;

  const size_t chunkLength = std::min<size_t>(10, data.size());
  std::vector<FrequencyTable> charFrequency(kAsciiLimit);
  std::vector<std::pair<char, std::pair<size_t, size_t>>> delims;

  size_t iteration = 0;
  for (size_t start = 0, end = chunkLength; start < data.size();
       start = end, end += chunkLength) {
    ++iteration;
    for (size_t l = start; l < std::min(end, data.size()); ++l) {
      size_t counts[kAsciiLimit] = {};
      for (char c : data[l]) {
        auto u = static_cast<unsigned char>(c);
        if (u < kAsciiLimit) ++counts[u];
      }
      for (int c = 0; c < kAsciiLimit; ++c) {
        bump(charFrequency[c], counts[c]);
      }
    }

    // Modal count per character, its support reduced by the lines that
    // disagree with it.
    std::vector<std::pair<char, std::pair<size_t, size_t>>> modes;
    for (int c = 0; c < kAsciiLimit; ++c) {
      const FrequencyTable& table = charFrequency[c];
      if (table.size() == 1 && table[0].first == 0) continue;
      auto mode = *std::max_element(
          table.begin(), table.end(),
          [](const auto& a, const auto& b) { return a.second < b.second; });
      size_t others = 0;
      for (const auto& entry : table) others += entry.second;
      others -= mode.second;
      long support = static_cast<long>(mode.second) - static_cast<long>(others);
      modes.push_back({static_cast<char>(c),
                       {mode.first, support > 0 ? static_cast<size_t>(support)
                                                : size_t{0}}});
    }

    double total = static_cast<double>(
        std::min(chunkLength * iteration, data.size()));
    for (double consistency = 1.0;
         delims.empty() && consistency >= kConsistencyThreshold;
         consistency -= 0.01) {
      for (const auto& [c, mode] : modes) {
        if (mode.first > 0 && mode.second > 0 &&
            static_cast<double>(mode.second) / total >= consistency) {
          delims.push_back({c, mode});
        }
      }
    }

    if (delims.size() == 1) return delims[0].first;
  }

  if (delims.empty()) return std::nullopt;

  for (char preferred : kPreferredDelimiters) {
    for (const auto& d : delims) {
      if (d.first == preferred) return preferred;
    }
  }

  auto best = std::max_element(
      delims.begin(), delims.end(), [](const auto& a, const auto& b) {
        return std::tie(a.second, a.first) < std::tie(b.second, b.first);
      });
  return best->first;
}

Delimiter FormatSniffer::InferDelimiter(const std::string& sampleText) {
  std::string_view window(sampleText);
  window = window.substr(0, std::min(window.size(), kSniffWindowChars));
  if (auto detected = DetectDelimiter(window)) {
    return Delimiter::Char(*detected);
  }

  if (sampleText.find('\t') != std::string::npos) return Delimiter::Char('\t');
  if (sampleText.find(';') != std::string::npos) return Delimiter::Char(';');
  if (sampleText.find(',') != std::string::npos) return Delimiter::Char(',');
  return Delimiter::Whitespace();
}

// ─────────────────────────────────────────────────────────────────────────────
// Parsing
// ─────────────────────────────────────────────────────────────────────────────

std::tuple<TabularView, error> FormatSniffer::ParseTable(
    const std::vector<RawRecord>& lines, const Delimiter& delimiter) {
  std::vector<std::string> columns;
  std::vector<std::vector<std::string>> rows;
  bool haveHeader = false;

  for (size_t lineNo = 0; lineNo < lines.size(); ++lineNo) {
    const std::string& line = lines[lineNo];
    if (text::Trim(line).empty()) continue;

    auto [fields, err] = splitLine(line, delimiter);
    if (err) {
      return {TabularView(),
              errors::Wrap(err, "line " + std::to_string(lineNo + 1))};
    }

    if (!haveHeader) {
      haveHeader = true;
      std::vector<std::string> trimmed;
      for (const auto& f : fields) trimmed.push_back(text::Trim(f));
      bool numeric = std::all_of(trimmed.begin(), trimmed.end(),
                                 [](const auto& t) { return text::IsDigits(t); });
      if (numeric) {
        for (size_t i = 0; i < trimmed.size(); ++i) {
          columns.push_back("col" + std::to_string(i));
        }
      } else {
        columns = headerNames(trimmed);
      }
      continue;
    }

    if (fields.size() > columns.size()) {
      std::ostringstream msg;
      msg << "expected " << columns.size() << " fields in line "
          << lineNo + 1 << ", saw " << fields.size();
      return {TabularView(), errors::New(msg.str())};
    }
    rows.push_back(std::move(fields));
  }

  if (!haveHeader) {
    return {TabularView(), errors::New("no columns to parse from input")};
  }
  return {TabularView(std::move(columns), std::move(rows)), nullptr};
}

std::tuple<std::vector<std::string>, error> FormatSniffer::splitLine(
    const std::string& line, const Delimiter& delimiter) {
  std::vector<std::string> fields;

  if (delimiter.whitespaceRuns) {
    std::istringstream in(line);
    std::string token;
    while (in >> token) fields.push_back(token);
    return {fields, nullptr};
  }

  std::string field;
  bool inQuotes = false;
  for (size_t i = 0; i < line.size(); ++i) {
    char c = line[i];
    if (inQuotes) {
      if (c == '"') {
        if (i + 1 < line.size() && line[i + 1] == '"') {
          field += '"';
          ++i;
        } else {
          inQuotes = false;
        }
      } else {
        field += c;
      }
    } else if (c == delimiter.ch) {
      fields.push_back(field);
      field.clear();
    } else if (c == '"' && field.empty()) {
      inQuotes = true;
    } else {
      field += c;
    }
  }
  if (inQuotes) {
    return {std::vector<std::string>(),
            errors::New("unterminated quoted field")};
  }
  fields.push_back(field);
  return {fields, nullptr};
}

std::vector<std::string> FormatSniffer::headerNames(
    const std::vector<std::string>& tokens) {
  std::vector<std::string> names;
  std::set<std::string> used;
  for (size_t i = 0; i < tokens.size(); ++i) {
    std::string name =
        tokens[i].empty() ? "Unnamed: " + std::to_string(i) : tokens[i];
    if (used.count(name)) {
      std::string base = name;
      for (int n = 1; used.count(name); ++n) {
        name = base + "." + std::to_string(n);
      }
    }
    used.insert(name);
    names.push_back(name);
  }
  return names;
}

std::string FormatSniffer::joinSample(const std::vector<RawRecord>& lines) {
  std::string joined;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) joined += '\n';
    joined += lines[i];
  }
  return joined;
}

}  // namespace threat_scanner
