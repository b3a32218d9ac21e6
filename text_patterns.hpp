// text_patterns.hpp
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace threat_scanner {

// Shared lexical predicates of the heuristics. An "IP" here is any four
// dot-separated groups of 1-3 digits; octet ranges are not checked.
namespace text {

std::string Trim(std::string_view s);
std::string ToLower(std::string_view s);
bool ContainsAny(std::string_view haystack,
                 const std::vector<std::string_view>& needles);

// Whole value is an optionally signed integer or decimal.
bool IsNumeric(std::string_view s);
// Two or more consecutive whitespace characters occur somewhere in s.
bool HasWhitespaceRun(std::string_view s);
// Non-empty and digits only, no sign or decimal point.
bool IsDigits(std::string_view s);

// The value starts with an IP-shaped token.
bool StartsWithIp(std::string_view s);
// Every non-overlapping IP-shaped substring, left to right.
std::vector<std::string> FindAllIps(std::string_view s);
size_t CountIps(std::string_view s);
// Source IP of a "Failed password for ... from <ip>" line, empty if none.
std::string MatchFailedPassword(std::string_view s);

// s with every byte that is not part of a well-formed UTF-8 sequence removed.
std::string DropInvalidUtf8(std::string_view s);

}  // namespace text
}  // namespace threat_scanner
