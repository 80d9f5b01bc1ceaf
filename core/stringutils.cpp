/*
 * This file is part of InspectDoc.
 * Copyright (C) 2025 Luisma Peramato
 *
 * InspectDoc is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * InspectDoc is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with InspectDoc. If not, see <https://www.gnu.org/licenses/>.
 */
#include "stringutils.h"

#include <algorithm>
#include <cctype>
#include <utility>

#include <nlohmann/json.hpp>

namespace StringUtils {

std::string ToUpper(const std::string &s) {
  std::string out = s;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return out;
}

std::string ToLower(const std::string &s) {
  std::string out = s;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

std::string Trim(const std::string &s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])))
    ++start;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])))
    --end;
  return s.substr(start, end - start);
}

bool StartsWith(const std::string &s, const std::string &prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool EndsWith(const std::string &s, const std::string &suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool Contains(const std::string &s, const std::string &needle) {
  return s.find(needle) != std::string::npos;
}

bool EqualsIgnoreCase(const std::string &a, const std::string &b) {
  return ToLower(a) == ToLower(b);
}

std::string JoinNonEmpty(const std::vector<std::string> &parts,
                         const std::string &separator) {
  std::string out;
  for (const auto &part : parts) {
    if (part.empty())
      continue;
    if (!out.empty())
      out += separator;
    out += part;
  }
  return out;
}

std::string CleanValue(const std::string &value) {
  std::string val = Trim(value);
  if (!StartsWith(val, "[\"") && !StartsWith(val, "['"))
    return val;

  const std::string candidate = EndsWith(val, "]") ? val : val + "\"]";
  nlohmann::json parsed = nlohmann::json::parse(candidate, nullptr, false);
  if (!parsed.is_discarded()) {
    if (parsed.is_array() && !parsed.empty()) {
      const auto &first = parsed.front();
      return first.is_string() ? first.get<std::string>() : first.dump();
    }
    return val;
  }

  // Not valid JSON (single quotes): strip the punctuation by hand.
  size_t start = val.find_first_not_of('[');
  if (start == std::string::npos)
    return {};
  size_t end = val.find_last_not_of(']');
  val = val.substr(start, end - start + 1);
  start = val.find_first_not_of("'\"");
  if (start == std::string::npos)
    return {};
  end = val.find_last_not_of("'\"");
  return val.substr(start, end - start + 1);
}

std::string NormalizeSymbols(const std::string &utf8) {
  static const std::pair<const char *, const char *> kReplacements[] = {
      {"\xCE\xA9", "Ohm"},     // U+03A9 greek capital omega
      {"\xE2\x84\xA6", "Ohm"}, // U+2126 ohm sign
      {"\xCE\xBC", "u"},       // U+03BC micro
      {"\xCE\xB1", "a"},       {"\xCE\xB2", "b"},
      {"\xCE\xB3", "g"},       {"\xCE\xB4", "d"},
      {"\xE2\x84\x83", "C"},   // U+2103 degree celsius
      {"\xE2\x84\x89", "F"},   // U+2109 degree fahrenheit
      {"\xE2\x88\x9E", "inf"}, // U+221E
      {"\xE2\x89\xA4", "<="},  {"\xE2\x89\xA5", ">="},
      {"\xE2\x89\xA0", "!="},
  };
  std::string out = utf8;
  for (const auto &entry : kReplacements) {
    const std::string from = entry.first;
    const std::string to = entry.second;
    size_t pos = 0;
    while ((pos = out.find(from, pos)) != std::string::npos) {
      out.replace(pos, from.size(), to);
      pos += to.size();
    }
  }
  return out;
}

namespace {

bool IsDigits(const std::string &s, size_t pos, size_t count) {
  if (pos + count > s.size())
    return false;
  for (size_t i = pos; i < pos + count; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(s[i])))
      return false;
  }
  return true;
}

bool HasIsoDate(const std::string &iso) {
  return IsDigits(iso, 0, 4) && iso.size() >= 10 && iso[4] == '-' &&
         IsDigits(iso, 5, 2) && iso[7] == '-' && IsDigits(iso, 8, 2);
}

bool HasIsoTime(const std::string &iso) {
  return iso.size() >= 16 && (iso[10] == 'T' || iso[10] == ' ') &&
         IsDigits(iso, 11, 2) && iso[13] == ':' && IsDigits(iso, 14, 2);
}

} // namespace

std::string FormatIsoDate(const std::string &iso) {
  if (!HasIsoDate(iso))
    return {};
  return iso.substr(8, 2) + "/" + iso.substr(5, 2) + "/" + iso.substr(0, 4);
}

std::string FormatIsoDateTime(const std::string &iso) {
  std::string date = FormatIsoDate(iso);
  if (date.empty() || !HasIsoTime(iso))
    return date;
  return date + " " + iso.substr(11, 5);
}

std::string FormatCaptureTimestamp(const std::string &iso) {
  std::string out = iso.substr(0, std::min<size_t>(16, iso.size()));
  std::replace(out.begin(), out.end(), 'T', ' ');
  return out;
}

} // namespace StringUtils
