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

#include <string>
#include <vector>

// Markers produced by the markup normalizer and consumed by line layout.
inline constexpr const char* PARAGRAPH_BREAK = "\n\n";
inline constexpr char LINE_BREAK = '\n';

// A run of text with uniform styling, in document order.
struct FormattingSegment {
    std::string text;
    bool bold = false;
    bool italic = false;

    bool SameStyle(const FormattingSegment& other) const {
        return bold == other.bold && italic == other.italic;
    }
    bool operator==(const FormattingSegment& other) const {
        return text == other.text && SameStyle(other);
    }
};

// A measured piece of a segment placed on a line.
struct LaidOutRun {
    std::string text;
    bool bold = false;
    bool italic = false;
    double width = 0.0;           // Measured width in points
};

struct LaidOutLine {
    std::vector<LaidOutRun> runs;
    double indent = 0.0;          // Left indent relative to the content box
    double offsetY = 0.0;         // Distance from the top of the content box
    bool paragraphStart = false;  // First line of a paragraph unit
    bool listItem = false;        // Line belongs to a bullet/number item

    double Width() const {
        double total = 0.0;
        for (const auto& run : runs)
            total += run.width;
        return total;
    }
    std::string Text() const {
        std::string out;
        for (const auto& run : runs)
            out += run.text;
        return out;
    }
};

struct LayoutResult {
    std::vector<LaidOutLine> lines;
    double height = 0.0;          // Total height consumed, in points
    int paragraphCount = 0;
};
