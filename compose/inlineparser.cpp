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
#include "inlineparser.h"

#include "markuptags.h"

#include <string_view>

namespace {

enum class TagEffect { None, OpenBold, CloseBold, OpenItalic, CloseItalic };

TagEffect ClassifyTag(const MarkupTag &tag) {
  if (tag.name == "strong" || tag.name == "b")
    return tag.closing ? TagEffect::CloseBold : TagEffect::OpenBold;
  if (tag.name == "em" || tag.name == "i")
    return tag.closing ? TagEffect::CloseItalic : TagEffect::OpenItalic;
  return TagEffect::None;
}

// Nesting depth per style; the visible state is depth > 0, giving the four
// states plain, bold, italic and bold+italic.
struct StyleState {
  int boldDepth = 0;
  int italicDepth = 0;

  bool Bold() const { return boldDepth > 0; }
  bool Italic() const { return italicDepth > 0; }

  void Apply(TagEffect effect) {
    switch (effect) {
    case TagEffect::OpenBold:
      ++boldDepth;
      break;
    case TagEffect::CloseBold:
      if (boldDepth > 0)
        --boldDepth;
      break;
    case TagEffect::OpenItalic:
      ++italicDepth;
      break;
    case TagEffect::CloseItalic:
      if (italicDepth > 0)
        --italicDepth;
      break;
    case TagEffect::None:
      break;
    }
  }
};

void AppendSegment(std::vector<FormattingSegment> &segments, std::string &text,
                   const StyleState &state) {
  if (text.empty())
    return;
  FormattingSegment segment{std::move(text), state.Bold(), state.Italic()};
  text.clear();
  if (!segments.empty() && segments.back().SameStyle(segment)) {
    segments.back().text += segment.text;
    return;
  }
  segments.push_back(std::move(segment));
}

} // namespace

std::vector<FormattingSegment> ParseInlineFormatting(const std::string &normalized) {
  std::vector<FormattingSegment> segments;
  StyleState state;
  std::string pending;
  bool sawFormattingTag = false;

  size_t pos = 0;
  while (pos < normalized.size()) {
    const size_t tagEnd = FindMarkupTagEnd(normalized, pos);
    if (tagEnd == std::string::npos) {
      pending.push_back(normalized[pos++]);
      continue;
    }
    const MarkupTag tag = ParseMarkupTag(
        std::string_view(normalized.data() + pos, tagEnd - pos));
    pos = tagEnd;
    const TagEffect effect = ClassifyTag(tag);
    if (effect == TagEffect::None)
      continue;
    sawFormattingTag = true;

    StyleState next = state;
    next.Apply(effect);
    if (next.Bold() != state.Bold() || next.Italic() != state.Italic())
      AppendSegment(segments, pending, state);
    state = next;
  }
  AppendSegment(segments, pending, state);

  if (!sawFormattingTag) {
    FormattingSegment plain;
    plain.text = JoinSegmentText(segments);
    return {plain};
  }
  return segments;
}

std::string StripMarkupTags(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  size_t pos = 0;
  while (pos < text.size()) {
    const size_t tagEnd = FindMarkupTagEnd(text, pos);
    if (tagEnd == std::string::npos) {
      out.push_back(text[pos++]);
      continue;
    }
    pos = tagEnd;
  }
  return out;
}

std::string JoinSegmentText(const std::vector<FormattingSegment> &segments) {
  std::string out;
  for (const auto &segment : segments)
    out += segment.text;
  return out;
}
