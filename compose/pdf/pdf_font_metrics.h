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

#include <array>
#include <cstdint>
#include <filesystem>
#include <string>

namespace receipt_pdf_internal {

enum class PdfFontStyle { Regular, Bold, Italic, BoldItalic };

PdfFontStyle StyleFor(bool bold, bool italic);
bool IsItalicStyle(PdfFontStyle style);
bool IsBoldStyle(PdfFontStyle style);

struct TtfFontMetrics {
  int unitsPerEm = 1000;
  int ascent = 0;
  int descent = 0;
  int lineGap = 0;
  int capHeight = 0;
  int xMin = 0;
  int yMin = 0;
  int xMax = 0;
  int yMax = 0;
  int italicAngle = 0; // degrees, from the post table
  std::array<int, 256> advanceWidths{}; // indexed by WinAnsi code
  std::array<int, 256> widths1000{};
  std::string data;
  bool valid = false;
};

struct PdfFontDefinition {
  std::string key;      // resource name, e.g. "F1"
  std::string baseName; // PostScript name written to the font dictionary
  PdfFontStyle style = PdfFontStyle::Regular;
  std::filesystem::path sourcePath;
  size_t objectId = 0;
  bool embedded = false;
  TtfFontMetrics metrics;
};

// Helvetica AFM widths (1/1000 em) for the Type1 face of the style.
const std::array<uint16_t, 256> &Type1WidthTable(PdfFontStyle style);

// Width of already WinAnsi-encoded text. A font without TrueType metrics is
// drawn as Type1 Helvetica and measured with its AFM widths; without a font
// the estimate is 0.6 em per character.
double MeasureTextWidth(const std::string &winAnsi, double fontSize,
                        const PdfFontDefinition *font);
std::string EncodeWinAnsi(const std::string &utf8);

bool ReadFileToString(const std::filesystem::path &path, std::string &out);
bool FindTable(const std::string &data, uint32_t tag, uint32_t &offset,
               uint32_t &length);
bool LoadTtfFontMetrics(const std::filesystem::path &path,
                        TtfFontMetrics &metrics, std::string &error);

// First installed TrueType file for the style, or an empty path. A directory
// named by LETTERPRESS_FONT_DIR is searched before the system locations.
std::filesystem::path FindFontPath(PdfFontStyle style);
bool LoadPdfFontMetrics(PdfFontDefinition &font, std::string &error);

// Standard 14 font used when no TrueType file is available.
const char *Type1BaseFont(PdfFontStyle style);

} // namespace receipt_pdf_internal
