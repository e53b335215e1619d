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
#include <string>
#include <string_view>

// Tag recognition shared by the normalizer and the inline parser. Only the
// tag names below count as markup; the name must be followed by a blank, '/'
// or '>' and the tag must close on the same line. Anything else, such as
// "<receipts@charity.org>" or "x<y", is literal text.

struct MarkupTag {
  std::string name; // lower-case, without '/' or attributes
  bool closing = false;
};

inline bool IsKnownMarkupTagName(std::string_view name) {
  static constexpr std::string_view kNames[] = {
      // inline emphasis
      "strong", "b", "em", "i",
      // blocks and lists
      "p", "div", "br", "hr", "ul", "ol", "li",
      "h1", "h2", "h3", "h4", "h5", "h6",
      // document scaffolding
      "!doctype", "html", "head", "body", "style", "script", "title", "meta",
      // rich-text editor output dropped without effect
      "span", "font", "u", "a", "small", "sup", "sub", "center"};
  for (std::string_view known : kNames) {
    if (name == known)
      return true;
  }
  return false;
}

// Returns the index one past the closing '>' if `pos` starts a tag,
// std::string::npos otherwise.
inline size_t FindMarkupTagEnd(const std::string &text, size_t pos) {
  if (pos >= text.size() || text[pos] != '<')
    return std::string::npos;
  size_t i = pos + 1;
  if (i < text.size() && text[i] == '/')
    ++i;
  std::string name;
  while (i < text.size()) {
    const unsigned char c = static_cast<unsigned char>(text[i]);
    if (!(std::isalnum(c) || (c == '!' && name.empty())))
      break;
    name.push_back(static_cast<char>(std::tolower(c)));
    ++i;
  }
  if (i >= text.size() || !IsKnownMarkupTagName(name))
    return std::string::npos;
  const char after = text[i];
  if (after != '>' && after != '/' && after != ' ' && after != '\t')
    return std::string::npos;
  for (; i < text.size(); ++i) {
    if (text[i] == '>')
      return i + 1;
    if (text[i] == '\n' || text[i] == '<')
      return std::string::npos;
  }
  return std::string::npos;
}

inline MarkupTag ParseMarkupTag(std::string_view tag) {
  MarkupTag info;
  size_t i = 1;
  if (i < tag.size() && tag[i] == '/') {
    info.closing = true;
    ++i;
  }
  while (i < tag.size()) {
    const unsigned char c = static_cast<unsigned char>(tag[i]);
    if (!(std::isalnum(c) || c == '!' || c == '-'))
      break;
    info.name.push_back(static_cast<char>(std::tolower(c)));
    ++i;
  }
  return info;
}
