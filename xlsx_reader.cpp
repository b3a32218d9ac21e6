// xlsx_reader.cpp
#include "xlsx_reader.hpp"

#include <pugixml.hpp>
#include <zlib.h>

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <map>
#include <sstream>
#include <string_view>

namespace threat_scanner {

namespace {

// ─────────────────────────────────────────────────────────────────────────────
// ZIP container
// ─────────────────────────────────────────────────────────────────────────────

constexpr uint32_t kEndOfCentralDirSig = 0x06054b50;
constexpr uint32_t kCentralDirEntrySig = 0x02014b50;
constexpr uint32_t kLocalHeaderSig = 0x04034b50;
constexpr size_t kEndOfCentralDirSize = 22;
constexpr size_t kMaxZipCommentSize = 0xFFFF;
// Declared sizes come from the archive and are not trusted for allocation.
constexpr size_t kMaxReserveBytes = 1 << 20;

constexpr unsigned char kOle2Signature[4] = {0xD0, 0xCF, 0x11, 0xE0};

uint16_t readU16(const std::string& b, size_t off) {
  return static_cast<uint16_t>(static_cast<unsigned char>(b[off]) |
                               static_cast<unsigned char>(b[off + 1]) << 8);
}

uint32_t readU32(const std::string& b, size_t off) {
  return static_cast<uint32_t>(readU16(b, off)) |
         static_cast<uint32_t>(readU16(b, off + 2)) << 16;
}

struct ZipEntry {
  uint16_t method = 0;
  uint32_t compressedSize = 0;
  uint32_t uncompressedSize = 0;
  uint32_t localHeaderOffset = 0;
};

class ZipArchive {
 public:
  explicit ZipArchive(const std::string& bytes) : data(bytes) {}

  error Index() {
    if (data.size() < kEndOfCentralDirSize) {
      return errors::New("file is too short to be a ZIP archive");
    }

    size_t last = data.size() - kEndOfCentralDirSize;
    size_t first = last > kMaxZipCommentSize ? last - kMaxZipCommentSize : 0;
    size_t eocd = std::string::npos;
    for (size_t pos = last + 1; pos-- > first;) {
      if (readU32(data, pos) == kEndOfCentralDirSig) {
        eocd = pos;
        break;
      }
    }
    if (eocd == std::string::npos) {
      return errors::New("end of central directory not found");
    }

    uint16_t count = readU16(data, eocd + 10);
    uint32_t offset = readU32(data, eocd + 16);
    if (offset == 0xFFFFFFFF) {
      return errors::New("ZIP64 archives are not supported");
    }

    size_t p = offset;
    for (uint16_t i = 0; i < count; ++i) {
      if (p + 46 > data.size() || readU32(data, p) != kCentralDirEntrySig) {
        return errors::New("corrupt central directory entry");
      }
      ZipEntry entry;
      entry.method = readU16(data, p + 10);
      entry.compressedSize = readU32(data, p + 20);
      entry.uncompressedSize = readU32(data, p + 24);
      uint16_t nameLen = readU16(data, p + 28);
      uint16_t extraLen = readU16(data, p + 30);
      uint16_t commentLen = readU16(data, p + 32);
      entry.localHeaderOffset = readU32(data, p + 42);
      if (p + 46 + nameLen > data.size()) {
        return errors::New("corrupt central directory entry name");
      }
      entries[data.substr(p + 46, nameLen)] = entry;
      p += 46 + nameLen + extraLen + commentLen;
    }
    return nullptr;
  }

  bool Has(const std::string& name) const { return entries.count(name) > 0; }

  std::tuple<std::string, error> Extract(const std::string& name) const {
    auto it = entries.find(name);
    if (it == entries.end()) {
      return {"", errors::New("missing archive member " + name)};
    }
    const ZipEntry& entry = it->second;

    size_t lh = entry.localHeaderOffset;
    if (lh + 30 > data.size() || readU32(data, lh) != kLocalHeaderSig) {
      return {"", errors::New("corrupt local header for " + name)};
    }
    size_t start = lh + 30 + readU16(data, lh + 26) + readU16(data, lh + 28);
    if (start + entry.compressedSize > data.size()) {
      return {"", errors::New("truncated archive member " + name)};
    }

    switch (entry.method) {
      case 0:
        return {data.substr(start, entry.compressedSize), nullptr};
      case 8:
        return inflateRaw(data.data() + start, entry.compressedSize,
                          entry.uncompressedSize, name);
      default:
        return {"", errors::New("unsupported compression method " +
                                std::to_string(entry.method) + " for " +
                                name)};
    }
  }

 private:
  static std::tuple<std::string, error> inflateRaw(const char* src,
                                                   uint32_t size,
                                                   uint32_t expected,
                                                   const std::string& name) {
    z_stream strm{};
    if (inflateInit2(&strm, -MAX_WBITS) != Z_OK) {
      return {"", errors::New("inflateInit2 failed for " + name)};
    }
    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(src));
    strm.avail_in = size;

    std::string out;
    out.reserve(std::min<size_t>(expected, kMaxReserveBytes));
    char buf[16384];
    int ret = Z_OK;
    do {
      strm.next_out = reinterpret_cast<Bytef*>(buf);
      strm.avail_out = sizeof(buf);
      ret = inflate(&strm, Z_NO_FLUSH);
      if (ret != Z_OK && ret != Z_STREAM_END) {
        inflateEnd(&strm);
        return {"", errors::New("inflate failed for " + name + " (zlib code " +
                                std::to_string(ret) + ")")};
      }
      out.append(buf, sizeof(buf) - strm.avail_out);
    } while (ret != Z_STREAM_END);

    inflateEnd(&strm);
    return {out, nullptr};
  }

  const std::string& data;
  std::map<std::string, ZipEntry> entries;
};

// ─────────────────────────────────────────────────────────────────────────────
// SpreadsheetML helpers
// ─────────────────────────────────────────────────────────────────────────────

// Keeps the text of whitespace-only <t> elements.
constexpr unsigned int kParseFlags =
    pugi::parse_default | pugi::parse_ws_pcdata_single;

error loadPart(pugi::xml_document& doc, const std::string& xml,
               const std::string& part) {
  pugi::xml_parse_result res = doc.load_buffer(xml.data(), xml.size(),
                                               kParseFlags, pugi::encoding_utf8);
  if (!res) {
    return errors::New("malformed " + part + ": " + res.description() +
                       " at offset " + std::to_string(res.offset));
  }
  return nullptr;
}

// Element and attribute names without their namespace prefix.
std::string_view localName(const char* qualified) {
  std::string_view name(qualified);
  size_t colon = name.find(':');
  return colon == std::string_view::npos ? name : name.substr(colon + 1);
}

pugi::xml_node child(const pugi::xml_node& parent, std::string_view name) {
  for (pugi::xml_node node : parent.children()) {
    if (node.type() == pugi::node_element && localName(node.name()) == name) {
      return node;
    }
  }
  return pugi::xml_node();
}

std::vector<pugi::xml_node> children(const pugi::xml_node& parent,
                                     std::string_view name) {
  std::vector<pugi::xml_node> out;
  for (pugi::xml_node node : parent.children()) {
    if (node.type() == pugi::node_element && localName(node.name()) == name) {
      out.push_back(node);
    }
  }
  return out;
}

std::string attr(const pugi::xml_node& node, std::string_view name) {
  for (pugi::xml_attribute a : node.attributes()) {
    if (localName(a.name()) == name) return a.value();
  }
  return "";
}

// Text of a shared or inline string item: a plain <t>, or the <t> of every
// rich-text run. Phonetic runs (<rPh>) are not part of the value.
std::string stringItemText(const pugi::xml_node& item) {
  std::string text;
  if (pugi::xml_node t = child(item, "t")) {
    text += t.text().get();
  }
  for (const pugi::xml_node& run : children(item, "r")) {
    text += child(run, "t").text().get();
  }
  return text;
}

// "BC12" -> 54
size_t columnIndex(const std::string& cellRef, size_t fallback) {
  size_t col = 0;
  size_t letters = 0;
  for (char c : cellRef) {
    if (c >= 'A' && c <= 'Z') {
      col = col * 26 + static_cast<size_t>(c - 'A' + 1);
      ++letters;
    } else if (c >= 'a' && c <= 'z') {
      col = col * 26 + static_cast<size_t>(c - 'a' + 1);
      ++letters;
    } else {
      break;
    }
  }
  return letters == 0 ? fallback : col - 1;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Public interface
// ─────────────────────────────────────────────────────────────────────────────

std::tuple<XlsxReader::Sheet, error> XlsxReader::ReadFirstSheet(
    const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return {Sheet(), errors::New("failed to open workbook: " + path)};
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    return {Sheet(), errors::New("failed to read workbook: " + path)};
  }
  return ParseWorkbook(buffer.str());
}

std::tuple<XlsxReader::Sheet, error> XlsxReader::ParseWorkbook(
    const std::string& bytes) {
  if (bytes.size() >= 4 &&
      std::memcmp(bytes.data(), kOle2Signature, sizeof(kOle2Signature)) == 0) {
    return {Sheet(),
            errors::New("legacy binary (BIFF) workbooks are not supported")};
  }

  ZipArchive archive(bytes);
  if (auto err = archive.Index()) {
    return {Sheet(), errors::Wrap(err, "not an Office Open XML workbook")};
  }

  std::vector<std::string> sharedStrings;
  if (archive.Has("xl/sharedStrings.xml")) {
    auto [xml, err] = archive.Extract("xl/sharedStrings.xml");
    if (err) {
      return {Sheet(), err};
    }
    auto [strings, parseErr] = parseSharedStrings(xml);
    if (parseErr) {
      return {Sheet(), parseErr};
    }
    sharedStrings = std::move(strings);
  }

  std::string sheetPath = "xl/worksheets/sheet1.xml";
  if (archive.Has("xl/workbook.xml") &&
      archive.Has("xl/_rels/workbook.xml.rels")) {
    auto [workbook, wbErr] = archive.Extract("xl/workbook.xml");
    auto [rels, relsErr] = archive.Extract("xl/_rels/workbook.xml.rels");
    if (!wbErr && !relsErr) {
      std::string resolved = resolveFirstSheetPath(workbook, rels);
      if (!resolved.empty() && archive.Has(resolved)) {
        sheetPath = resolved;
      }
    }
  }

  auto [sheetXml, err] = archive.Extract(sheetPath);
  if (err) {
    return {Sheet(), err};
  }
  return parseSheet(sheetXml, sharedStrings);
}

// ─────────────────────────────────────────────────────────────────────────────
// Parts
// ─────────────────────────────────────────────────────────────────────────────

std::tuple<std::vector<std::string>, error> XlsxReader::parseSharedStrings(
    const std::string& xml) {
  pugi::xml_document doc;
  if (auto err = loadPart(doc, xml, "shared strings")) {
    return {std::vector<std::string>(), err};
  }

  std::vector<std::string> strings;
  for (const pugi::xml_node& item : children(child(doc, "sst"), "si")) {
    strings.push_back(stringItemText(item));
  }
  return {strings, nullptr};
}

std::tuple<XlsxReader::Sheet, error> XlsxReader::parseSheet(
    const std::string& xml, const std::vector<std::string>& sharedStrings) {
  pugi::xml_document doc;
  if (auto err = loadPart(doc, xml, "worksheet")) {
    return {Sheet(), err};
  }

  Sheet rows;
  pugi::xml_node sheetData = child(child(doc, "worksheet"), "sheetData");
  for (const pugi::xml_node& rowNode : children(sheetData, "row")) {
    std::vector<std::string> row;
    for (const pugi::xml_node& cellNode : children(rowNode, "c")) {
      std::string type = attr(cellNode, "t");
      std::string value = child(cellNode, "v").text().get();
      size_t col = columnIndex(attr(cellNode, "r"), row.size());

      std::string cell;
      if (type == "s") {
        size_t idx = 0;
        auto [ptr, ec] =
            std::from_chars(value.data(), value.data() + value.size(), idx);
        if (ec != std::errc() || idx >= sharedStrings.size()) {
          return {Sheet(),
                  errors::New("bad shared string index '" + value + "'")};
        }
        cell = sharedStrings[idx];
      } else if (type == "inlineStr") {
        cell = stringItemText(child(cellNode, "is"));
      } else if (type == "b") {
        cell = value.empty() ? "" : (value == "1" ? "True" : "False");
      } else {
        cell = value;
      }

      if (row.size() <= col) row.resize(col + 1);
      row[col] = cell;
    }
    rows.push_back(row);
  }
  return {rows, nullptr};
}

std::string XlsxReader::resolveFirstSheetPath(const std::string& workbookXml,
                                              const std::string& relsXml) {
  pugi::xml_document workbook;
  pugi::xml_document rels;
  if (loadPart(workbook, workbookXml, "workbook") ||
      loadPart(rels, relsXml, "workbook relationships")) {
    return "";
  }

  pugi::xml_node sheet = child(child(child(workbook, "workbook"), "sheets"),
                               "sheet");
  std::string relId = attr(sheet, "id");
  if (relId.empty()) return "";

  for (const pugi::xml_node& rel :
       children(child(rels, "Relationships"), "Relationship")) {
    if (attr(rel, "Id") != relId) continue;
    std::string target = attr(rel, "Target");
    if (!target.empty() && target[0] == '/') return target.substr(1);
    return "xl/" + target;
  }
  return "";
}

}  // namespace threat_scanner
