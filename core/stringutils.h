/*
 * This file is part of Letterpress.
 * Copyright (C) 2025 Luisma Peramato
 *
 * Letterpress is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Letterpress is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Letterpress. If not, see <https://www.gnu.org/licenses/>.
 */
#pragma once

#include <cctype>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace StringUtils {

inline std::string ToLowerCopy(std::string_view input) {
  std::string lower;
  lower.reserve(input.size());
  for (char ch : input)
    lower.push_back(
        static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
  return lower;
}

inline std::string Trim(const std::string &s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])))
    ++start;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])))
    --end;
  return s.substr(start, end - start);
}

// Replaces every occurrence of `from` and returns the number of replacements.
inline size_t ReplaceAll(std::string &text, const std::string &from,
                         const std::string &to) {
  if (from.empty())
    return 0;
  size_t count = 0;
  size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
    ++count;
  }
  return count;
}

inline std::vector<std::string> SplitCSV(const std::string &s) {
  std::vector<std::string> result;
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, ',')) {
    std::string trimmed = Trim(item);
    if (!trimmed.empty())
      result.push_back(trimmed);
  }
  return result;
}

inline std::string JoinCSV(const std::vector<std::string> &items) {
  std::string out;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i)
      out += ',';
    out += items[i];
  }
  return out;
}

} // namespace StringUtils
