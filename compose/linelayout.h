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

#include "receipttypes.h"

#include <string>
#include <vector>

// Width of a piece of text in points for the face selected by the style.
class TextMeasurer {
public:
  virtual ~TextMeasurer() = default;
  virtual double Measure(const std::string &text, bool bold,
                         bool italic) const = 0;
};

struct LayoutOptions {
  double contentWidth = 0.0;
  double lineHeight = 18.0;
  double paragraphGap = 12.0; // extra space before each new paragraph
  double listIndent = 18.0;
};

// Vertical position, measured down from the top of the content box.
struct LayoutCursor {
  double y = 0.0;
};

// Breaks the segments into lines no wider than the content box.
//
// "\n\n" ends a paragraph and adds paragraphGap before the next one; "\n"
// ends a line only. A line starting with a list marker ("• ", "- ", "* ",
// "1. ", "1) ") opens its own paragraph unit and is indented by listIndent,
// wrapped continuation lines included. Words wider than a full line are split
// between characters.
//
// Throws RenderFailure when the content box is not wide enough for a single
// character or the options are not usable.
LayoutResult LayoutSegments(const std::vector<FormattingSegment> &segments,
                            const TextMeasurer &measurer,
                            const LayoutOptions &options);

// True if the text, ignoring leading blanks, begins with a list marker.
bool StartsWithListMarker(const std::string &line);
