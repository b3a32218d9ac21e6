// text_patterns.cpp
#include "text_patterns.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <regex>

namespace threat_scanner {
namespace text {

namespace {

const std::regex& ipPattern() {
  static const std::regex re(R"((?:\d{1,3}\.){3}\d{1,3})");
  return re;
}

constexpr std::string_view kFailedPasswordMarker = "Failed password for";
constexpr std::string_view kFromMarker = "from ";

bool isDigit(char c) { return c >= '0' && c <= '9'; }

// Length of a valid UTF-8 sequence starting at s[i], 0 if it is not one.
size_t utf8SequenceLength(std::string_view s, size_t i) {
  auto byte = [&](size_t k) { return static_cast<unsigned char>(s[k]); };
  auto cont = [&](size_t k, unsigned char lo = 0x80, unsigned char hi = 0xBF) {
    return k < s.size() && byte(k) >= lo && byte(k) <= hi;
  };

  unsigned char lead = byte(i);
  if (lead < 0x80) return 1;
  if (lead >= 0xC2 && lead <= 0xDF) return cont(i + 1) ? 2 : 0;
  if (lead >= 0xE0 && lead <= 0xEF) {
    unsigned char lo = lead == 0xE0 ? 0xA0 : 0x80;
    unsigned char hi = lead == 0xED ? 0x9F : 0xBF;
    return cont(i + 1, lo, hi) && cont(i + 2) ? 3 : 0;
  }
  if (lead >= 0xF0 && lead <= 0xF4) {
    unsigned char lo = lead == 0xF0 ? 0x90 : 0x80;
    unsigned char hi = lead == 0xF4 ? 0x8F : 0xBF;
    return cont(i + 1, lo, hi) && cont(i + 2) && cont(i + 3) ? 4 : 0;
  }
  return 0;
}

// Source IP named by one line of text: the last "from <ip>" after the
// marker, as a greedy "Failed password for.*from (ip)" would pick it.
std::string failedPasswordSource(std::string_view line) {
  size_t marker = line.find(kFailedPasswordMarker);
  if (marker == std::string_view::npos) return {};

  size_t floor = marker + kFailedPasswordMarker.size();
  size_t pos = line.size();
  while (pos > floor) {
    pos = line.rfind(kFromMarker, pos - 1);
    if (pos == std::string_view::npos || pos < floor) break;
    std::string_view rest = line.substr(pos + kFromMarker.size());
    std::match_results<std::string_view::const_iterator> m;
    if (std::regex_search(rest.begin(), rest.end(), m, ipPattern(),
                          std::regex_constants::match_continuous)) {
      return m.str();
    }
  }
  return {};
}

}  // namespace

std::string Trim(std::string_view s) {
  size_t begin = 0;
  size_t end = s.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
    --end;
  }
  return std::string(s.substr(begin, end - begin));
}

std::string ToLower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

bool ContainsAny(std::string_view haystack,
                 const std::vector<std::string_view>& needles) {
  return std::any_of(needles.begin(), needles.end(), [&](std::string_view n) {
    return haystack.find(n) != std::string_view::npos;
  });
}

bool IsNumeric(std::string_view s) {
  if (!s.empty() && s.front() == '-') s.remove_prefix(1);
  size_t dot = s.find('.');
  std::string_view whole = s.substr(0, dot);
  if (whole.empty() || !std::all_of(whole.begin(), whole.end(), isDigit)) {
    return false;
  }
  if (dot == std::string_view::npos) return true;
  std::string_view fraction = s.substr(dot + 1);
  return !fraction.empty() &&
         std::all_of(fraction.begin(), fraction.end(), isDigit);
}

bool HasWhitespaceRun(std::string_view s) {
  for (size_t i = 1; i < s.size(); ++i) {
    if (std::isspace(static_cast<unsigned char>(s[i - 1])) &&
        std::isspace(static_cast<unsigned char>(s[i]))) {
      return true;
    }
  }
  return false;
}

bool IsDigits(std::string_view s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
    return std::isdigit(c) != 0;
  });
}

bool StartsWithIp(std::string_view s) {
  std::cmatch m;
  return std::regex_search(s.data(), s.data() + s.size(), m, ipPattern(),
                           std::regex_constants::match_continuous);
}

std::vector<std::string> FindAllIps(std::string_view s) {
  std::vector<std::string> ips;
  std::cregex_iterator it(s.data(), s.data() + s.size(), ipPattern());
  for (std::cregex_iterator end; it != end; ++it) {
    ips.push_back(it->str());
  }
  return ips;
}

size_t CountIps(std::string_view s) {
  std::cregex_iterator it(s.data(), s.data() + s.size(), ipPattern());
  return static_cast<size_t>(std::distance(it, std::cregex_iterator()));
}

std::string MatchFailedPassword(std::string_view s) {
  // "." does not cross line breaks, so each line is matched on its own.
  size_t start = 0;
  while (start <= s.size()) {
    size_t end = s.find_first_of("\r\n", start);
    if (end == std::string_view::npos) end = s.size();
    std::string ip = failedPasswordSource(s.substr(start, end - start));
    if (!ip.empty()) return ip;
    start = end + 1;
  }
  return {};
}

std::string DropInvalidUtf8(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size();) {
    size_t len = utf8SequenceLength(s, i);
    if (len == 0) {
      ++i;
      continue;
    }
    out.append(s.substr(i, len));
    i += len;
  }
  return out;
}

}  // namespace text
}  // namespace threat_scanner
