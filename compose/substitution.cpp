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
#include "substitution.h"

#include "stringutils.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <utility>

namespace {

constexpr size_t kMaxPlaceholderLength = 64;

bool IsPlaceholderChar(char ch) {
  unsigned char c = static_cast<unsigned char>(ch);
  if (std::isalnum(c) || c >= 0x80)
    return true;
  switch (ch) {
  case ' ':
  case '_':
  case '-':
  case '(':
  case ')':
  case '.':
  case '/':
  case '#':
    return true;
  default:
    return false;
  }
}

bool IsAmountField(const std::string &name,
                   const std::vector<std::string> &amountFields) {
  return std::find(amountFields.begin(), amountFields.end(), name) !=
         amountFields.end();
}

void ReplacePlaceholder(std::string &text, const std::string &name,
                        const std::string &value) {
  StringUtils::ReplaceAll(text, "{{" + name + "}}", value);
  StringUtils::ReplaceAll(text, "{" + name + "}", value);
}

} // namespace

SystemValues SystemValues::FromTime(std::chrono::system_clock::time_point now) {
  const std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm local{};
#ifdef _WIN32
  localtime_s(&local, &t);
#else
  localtime_r(&t, &local);
#endif
  SystemValues values;
  std::ostringstream date;
  date << std::put_time(&local, "%B %d, %Y");
  values.date = date.str();
  values.year = std::to_string(local.tm_year + 1900);
  return values;
}

std::string FormatAmount(const std::string &value) {
  const std::string trimmed = StringUtils::Trim(value);
  if (trimmed.empty())
    return value;
  double parsed = 0.0;
  const char *begin = trimmed.data();
  const char *end = begin + trimmed.size();
  auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (ec != std::errc() || ptr != end)
    return value;
  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << parsed;
  return out.str();
}

SubstitutionResult SubstituteVariables(const std::string &templateText,
                                       const DonorRecord &donor,
                                       const SystemValues &system,
                                       const SubstitutionOptions &options) {
  SubstitutionResult result;
  result.text = templateText;

  for (const auto &[name, value] : donor.Fields()) {
    if (name.empty())
      continue;
    const std::string rendered =
        IsAmountField(name, options.amountFields) ? FormatAmount(value) : value;
    ReplacePlaceholder(result.text, name, rendered);
  }

  const std::pair<const char *, const std::string *> systemFields[] = {
      {"Date", &system.date},
      {"Current Year", &system.year},
      {"Year", &system.year},
  };
  for (const auto &[name, value] : systemFields) {
    if (donor.Has(name) || value->empty())
      continue;
    ReplacePlaceholder(result.text, name, *value);
  }

  result.unresolved = FindUnresolvedPlaceholders(result.text);
  return result;
}

std::vector<std::string> FindUnresolvedPlaceholders(const std::string &text) {
  std::vector<std::string> names;
  size_t pos = 0;
  while ((pos = text.find('{', pos)) != std::string::npos) {
    size_t start = pos + 1;
    while (start < text.size() && text[start] == '{')
      ++start;
    size_t end = start;
    while (end < text.size() && end - start <= kMaxPlaceholderLength &&
           IsPlaceholderChar(text[end]))
      ++end;
    if (end < text.size() && text[end] == '}' && end > start &&
        std::isalpha(static_cast<unsigned char>(text[start]))) {
      std::string name = StringUtils::Trim(text.substr(start, end - start));
      if (!name.empty() &&
          std::find(names.begin(), names.end(), name) == names.end())
        names.push_back(name);
    }
    pos = start;
  }
  return names;
}
