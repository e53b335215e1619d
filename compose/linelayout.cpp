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
#include "linelayout.h"

#include "receipterrors.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace {

struct StyledPiece {
  std::string text;
  bool bold = false;
  bool italic = false;
};

using HardLine = std::vector<StyledPiece>;
using Paragraph = std::vector<HardLine>;

// A word or a run of blanks, possibly made of several styled pieces.
struct Token {
  HardLine pieces;
  bool blank = false;
};

struct LayoutContext {
  const TextMeasurer &measurer;
  const LayoutOptions &options;
};

bool IsBlank(char c) { return c == ' ' || c == '\t' || c == '\r'; }

void AppendChar(HardLine &line, char c, bool bold, bool italic) {
  if (line.empty() || line.back().bold != bold || line.back().italic != italic)
    line.push_back({std::string(), bold, italic});
  line.back().text.push_back(c);
}

std::string LineText(const HardLine &line) {
  std::string text;
  for (const auto &piece : line)
    text += piece.text;
  return text;
}

bool IsBlankLine(const HardLine &line) {
  for (const auto &piece : line) {
    for (char c : piece.text) {
      if (!IsBlank(c))
        return false;
    }
  }
  return true;
}

// Splits on newlines; blank lines separate paragraphs.
std::vector<Paragraph> SplitParagraphs(const std::vector<FormattingSegment> &segments) {
  std::vector<HardLine> lines(1);
  for (const auto &segment : segments) {
    for (char c : segment.text) {
      if (c == LINE_BREAK)
        lines.emplace_back();
      else
        AppendChar(lines.back(), c, segment.bold, segment.italic);
    }
  }

  std::vector<Paragraph> paragraphs;
  Paragraph current;
  for (auto &line : lines) {
    if (IsBlankLine(line)) {
      if (!current.empty()) {
        paragraphs.push_back(std::move(current));
        current.clear();
      }
      continue;
    }
    current.push_back(std::move(line));
  }
  if (!current.empty())
    paragraphs.push_back(std::move(current));
  return paragraphs;
}

std::vector<Token> Tokenize(const HardLine &line) {
  std::vector<Token> tokens;
  for (const auto &piece : line) {
    for (char c : piece.text) {
      const bool blank = IsBlank(c);
      if (tokens.empty() || tokens.back().blank != blank)
        tokens.push_back({{}, blank});
      AppendChar(tokens.back().pieces, blank ? ' ' : c, piece.bold, piece.italic);
    }
  }
  return tokens;
}

size_t CodepointLength(const std::string &text, size_t pos) {
  const unsigned char lead = static_cast<unsigned char>(text[pos]);
  size_t length = 1;
  if (lead >= 0xF0)
    length = 4;
  else if (lead >= 0xE0)
    length = 3;
  else if (lead >= 0xC0)
    length = 2;
  return std::min(length, text.size() - pos);
}

double MeasurePiece(const StyledPiece &piece, const TextMeasurer &measurer) {
  return measurer.Measure(piece.text, piece.bold, piece.italic);
}

double MeasurePieces(const HardLine &pieces, const TextMeasurer &measurer) {
  double width = 0.0;
  for (const auto &piece : pieces)
    width += MeasurePiece(piece, measurer);
  return width;
}

void AppendRun(LaidOutLine &line, const StyledPiece &piece, double width) {
  if (!line.runs.empty() && line.runs.back().bold == piece.bold &&
      line.runs.back().italic == piece.italic) {
    line.runs.back().text += piece.text;
    line.runs.back().width += width;
    return;
  }
  line.runs.push_back({piece.text, piece.bold, piece.italic, width});
}

// Appends pieces and returns their total width.
double AppendPieces(LaidOutLine &line, const HardLine &pieces,
                    const TextMeasurer &measurer) {
  double total = 0.0;
  for (const auto &piece : pieces) {
    const double width = MeasurePiece(piece, measurer);
    AppendRun(line, piece, width);
    total += width;
  }
  return total;
}

LaidOutLine NewLine(double indent, bool listItem, bool paragraphStart) {
  LaidOutLine line;
  line.indent = indent;
  line.listItem = listItem;
  line.paragraphStart = paragraphStart;
  return line;
}

std::string FormatPoints(double value) {
  std::ostringstream ss;
  ss << value;
  return ss.str();
}

// Wraps one hard line and returns the cursor below its last output line.
LayoutCursor LayoutHardLine(const HardLine &hardLine, bool listItem,
                            bool paragraphStart, LayoutCursor cursor,
                            const LayoutContext &ctx,
                            std::vector<LaidOutLine> &out) {
  const double indent = listItem ? ctx.options.listIndent : 0.0;
  const double available = ctx.options.contentWidth - indent;

  LaidOutLine line = NewLine(indent, listItem, paragraphStart);
  double used = 0.0;
  auto finishLine = [&]() {
    line.offsetY = cursor.y;
    cursor.y += ctx.options.lineHeight;
    out.push_back(std::move(line));
    line = NewLine(indent, listItem, false);
    used = 0.0;
  };

  const std::vector<Token> tokens = Tokenize(hardLine);
  const HardLine *pendingBlank = nullptr;
  for (const Token &token : tokens) {
    if (token.blank) {
      pendingBlank = &token.pieces;
      continue;
    }

    const double wordWidth = MeasurePieces(token.pieces, ctx.measurer);
    if (!line.runs.empty()) {
      const double blankWidth =
          pendingBlank ? MeasurePieces(*pendingBlank, ctx.measurer) : 0.0;
      if (used + blankWidth + wordWidth > available)
        finishLine(); // the blank at the break is dropped
      else if (pendingBlank)
        used += AppendPieces(line, *pendingBlank, ctx.measurer);
    }
    pendingBlank = nullptr;

    if (used + wordWidth <= available) {
      used += AppendPieces(line, token.pieces, ctx.measurer);
      continue;
    }

    // Longer than a whole line: fill lines character by character.
    for (const auto &piece : token.pieces) {
      size_t pos = 0;
      while (pos < piece.text.size()) {
        const size_t length = CodepointLength(piece.text, pos);
        const StyledPiece glyph{piece.text.substr(pos, length), piece.bold,
                                piece.italic};
        const double glyphWidth = MeasurePiece(glyph, ctx.measurer);
        if (used + glyphWidth > available) {
          if (line.runs.empty())
            throw RenderFailure("Layout: content box of " +
                                FormatPoints(available) +
                                " pt cannot hold the character '" +
                                glyph.text + "'");
          finishLine();
        }
        AppendRun(line, glyph, glyphWidth);
        used += glyphWidth;
        pos += length;
      }
    }
  }
  if (!line.runs.empty())
    finishLine();
  return cursor;
}

} // namespace

bool StartsWithListMarker(const std::string &line) {
  size_t pos = 0;
  while (pos < line.size() && IsBlank(line[pos]))
    ++pos;
  const std::string rest = line.substr(pos);
  if (rest.compare(0, 4, "\xE2\x80\xA2 ") == 0 || rest.compare(0, 2, "- ") == 0 ||
      rest.compare(0, 2, "* ") == 0)
    return true;

  size_t digits = 0;
  while (digits < rest.size() &&
         std::isdigit(static_cast<unsigned char>(rest[digits])))
    ++digits;
  if (digits == 0 || digits + 1 >= rest.size())
    return false;
  return (rest[digits] == '.' || rest[digits] == ')') && rest[digits + 1] == ' ';
}

LayoutResult LayoutSegments(const std::vector<FormattingSegment> &segments,
                            const TextMeasurer &measurer,
                            const LayoutOptions &options) {
  if (!(options.contentWidth > 0.0))
    throw RenderFailure("Layout: content width must be positive, got " +
                        FormatPoints(options.contentWidth));
  if (!(options.lineHeight > 0.0))
    throw RenderFailure("Layout: line height must be positive, got " +
                        FormatPoints(options.lineHeight));

  const LayoutContext ctx{measurer, options};
  LayoutResult result;
  LayoutCursor cursor;

  const std::vector<Paragraph> paragraphs = SplitParagraphs(segments);
  for (size_t p = 0; p < paragraphs.size(); ++p) {
    if (p > 0)
      cursor.y += options.paragraphGap;
    bool previousWasList = false;
    for (size_t l = 0; l < paragraphs[p].size(); ++l) {
      const HardLine &hardLine = paragraphs[p][l];
      const bool listItem = StartsWithListMarker(LineText(hardLine));
      const bool startsUnit = l == 0 || listItem || previousWasList;
      if (startsUnit)
        ++result.paragraphCount;
      cursor = LayoutHardLine(hardLine, listItem, startsUnit, cursor, ctx,
                              result.lines);
      previousWasList = listItem;
    }
  }
  result.height = cursor.y;
  return result;
}
