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

// Splits normalized markup into styled segments. <strong>/<b> toggle bold and
// <em>/<i> toggle italic (case-insensitive, attributes ignored); a closing tag
// without a matching opening tag is ignored. Every other tag is removed.
// Adjacent segments with the same style are merged. When the text carries no
// formatting tag at all the result is a single plain segment.
std::vector<FormattingSegment> ParseInlineFormatting(const std::string &normalized);

// The text the segments of ParseInlineFormatting concatenate to.
std::string StripMarkupTags(const std::string &text);

// Concatenates segment texts, ignoring style.
std::string JoinSegmentText(const std::vector<FormattingSegment> &segments);
