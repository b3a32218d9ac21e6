// record_loader.cpp
#include "record_loader.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>

#include "text_patterns.hpp"
#include "xlsx_reader.hpp"

namespace threat_scanner {

namespace {

std::string stringify(const nlohmann::ordered_json& value) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  return value.dump();
}

}  // namespace

const char* FormatName(DeclaredFormat format) {
  switch (format) {
    case DeclaredFormat::LineText:
      return "line text";
    case DeclaredFormat::DelimitedText:
      return "delimited text";
    case DeclaredFormat::Spreadsheet:
      return "spreadsheet";
    case DeclaredFormat::Json:
      return "json";
  }
  return "unknown";
}

std::tuple<DeclaredFormat, error> FormatFromPath(const std::string& path) {
  std::string ext =
      text::ToLower(std::filesystem::path(path).extension().string());

  if (ext == ".csv") return {DeclaredFormat::DelimitedText, nullptr};
  if (ext == ".xlsx" || ext == ".xls") {
    return {DeclaredFormat::Spreadsheet, nullptr};
  }
  if (ext == ".json") return {DeclaredFormat::Json, nullptr};
  if (ext == ".log" || ext == ".txt") return {DeclaredFormat::LineText, nullptr};

  return {DeclaredFormat::LineText,
          errors::OfKind(errors::Kind::UnsupportedFormat,
                         "unsupported file type: '" + ext + "'")};
}

// ─────────────────────────────────────────────────────────────────────────────
// Constructor / public interface
// ─────────────────────────────────────────────────────────────────────────────

RecordLoader::RecordLoader()
    : logger(kvalog::CreateLogger("threat_scanner", "loader")) {}

std::tuple<std::vector<RawRecord>, error> RecordLoader::Load(
    const std::string& path) {
  auto [format, err] = FormatFromPath(path);
  if (err) {
    return {std::vector<RawRecord>(), err};
  }
  return Load(path, format);
}

std::tuple<std::vector<RawRecord>, error> RecordLoader::Load(
    const std::string& path, DeclaredFormat format) {
  std::vector<RawRecord> records;
  error err;

  switch (format) {
    case DeclaredFormat::LineText:
    case DeclaredFormat::DelimitedText:
      std::tie(records, err) = readLines(path);
      break;
    case DeclaredFormat::Spreadsheet:
      std::tie(records, err) = readSpreadsheet(path);
      break;
    case DeclaredFormat::Json:
      std::tie(records, err) = readJson(path);
      break;
  }

  if (err) {
    return {std::vector<RawRecord>(),
            errors::OfKind(errors::Kind::LoadFailure,
                           "error loading file " + path, err)};
  }

  logger.Info("loaded " + std::to_string(records.size()) + " records from " +
              path + " format=" + FormatName(format));
  return {records, nullptr};
}

// ─────────────────────────────────────────────────────────────────────────────
// Readers
// ─────────────────────────────────────────────────────────────────────────────

std::tuple<std::vector<RawRecord>, error> RecordLoader::readLines(
    const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return {std::vector<RawRecord>(), errors::New("failed to open " + path)};
  }

  std::vector<RawRecord> records;
  std::string line;
  while (std::getline(file, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    std::string clean = text::DropInvalidUtf8(line);
    if (text::Trim(clean).empty()) continue;
    records.push_back(clean);
  }
  if (file.bad()) {
    return {std::vector<RawRecord>(), errors::New("read error on " + path)};
  }
  return {records, nullptr};
}

std::tuple<std::vector<RawRecord>, error> RecordLoader::readJson(
    const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return {std::vector<RawRecord>(), errors::New("failed to open " + path)};
  }

  // Members stay in file order; partition assignment depends on it.
  nlohmann::ordered_json doc =
      nlohmann::ordered_json::parse(file, nullptr, false);
  if (doc.is_discarded()) {
    return {std::vector<RawRecord>(), errors::New("malformed JSON document")};
  }

  std::vector<RawRecord> records;
  if (doc.is_array()) {
    for (const auto& item : doc) {
      records.push_back(stringify(item));
    }
  } else if (doc.is_object()) {
    for (const auto& [key, value] : doc.items()) {
      records.push_back(key + ": " + stringify(value));
    }
  } else {
    records.push_back(stringify(doc));
  }
  return {records, nullptr};
}

std::tuple<std::vector<RawRecord>, error> RecordLoader::readSpreadsheet(
    const std::string& path) {
  auto [sheet, err] = XlsxReader::ReadFirstSheet(path);
  if (err) {
    return {std::vector<RawRecord>(), err};
  }

  size_t width = 0;
  for (const auto& row : sheet) {
    width = std::max(width, row.size());
  }

  std::vector<RawRecord> records;
  for (auto row : sheet) {
    bool allEmpty = std::all_of(row.begin(), row.end(), [](const auto& cell) {
      return text::Trim(cell).empty();
    });
    if (allEmpty) continue;

    row.resize(width);
    std::string joined;
    for (size_t i = 0; i < row.size(); ++i) {
      if (i > 0) joined += '\t';
      joined += row[i];
    }
    records.push_back(text::DropInvalidUtf8(joined));
  }
  return {records, nullptr};
}

}  // namespace threat_scanner
