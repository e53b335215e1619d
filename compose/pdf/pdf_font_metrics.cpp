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
#include "pdf_font_metrics.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>

namespace receipt_pdf_internal {

namespace {

// Advance widths of the standard 14 Helvetica faces in 1/1000 em, by WinAnsi
// code, from the Adobe core font AFM files. The oblique faces share the
// upright widths.
constexpr std::array<uint16_t, 256> kHelveticaWidths = {
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    278, 278, 355, 556, 556, 889, 667, 191, 333, 333, 389, 584, 278, 333, 278, 278,
    556, 556, 556, 556, 556, 556, 556, 556, 556, 556, 278, 278, 584, 584, 584, 556,
    1015, 667, 667, 722, 722, 667, 611, 778, 722, 278, 500, 667, 556, 833, 722, 778,
    667, 778, 722, 667, 611, 722, 667, 944, 667, 667, 611, 278, 278, 278, 469, 556,
    333, 556, 556, 500, 556, 556, 278, 556, 556, 222, 222, 500, 222, 833, 556, 556,
    556, 556, 333, 500, 278, 556, 500, 722, 500, 500, 500, 334, 260, 334, 584, 0,
    556, 0, 222, 556, 333, 1000, 556, 556, 333, 1000, 667, 333, 1000, 0, 611, 0,
    0, 222, 222, 333, 333, 350, 556, 1000, 333, 1000, 500, 333, 944, 0, 500, 667,
    278, 333, 556, 556, 556, 556, 260, 556, 333, 737, 370, 556, 584, 333, 737, 333,
    400, 584, 333, 333, 333, 556, 537, 278, 333, 333, 365, 556, 834, 834, 834, 611,
    667, 667, 667, 667, 667, 667, 1000, 722, 667, 667, 667, 667, 278, 278, 278, 278,
    722, 722, 778, 778, 778, 778, 778, 584, 778, 722, 722, 722, 722, 667, 667, 611,
    556, 556, 556, 556, 556, 556, 889, 500, 556, 556, 556, 556, 278, 278, 278, 278,
    556, 556, 556, 556, 556, 556, 556, 584, 611, 556, 556, 556, 556, 500, 556, 500};

constexpr std::array<uint16_t, 256> kHelveticaBoldWidths = {
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    278, 333, 474, 556, 556, 889, 722, 238, 333, 333, 389, 584, 278, 333, 278, 278,
    556, 556, 556, 556, 556, 556, 556, 556, 556, 556, 333, 333, 584, 584, 584, 611,
    975, 722, 722, 722, 722, 667, 611, 778, 722, 278, 556, 722, 611, 833, 722, 778,
    667, 778, 722, 667, 611, 722, 667, 944, 667, 667, 611, 333, 278, 333, 584, 556,
    333, 556, 611, 556, 611, 556, 333, 611, 611, 278, 278, 556, 278, 889, 611, 611,
    611, 611, 389, 556, 333, 611, 556, 778, 556, 556, 500, 389, 280, 389, 584, 0,
    556, 0, 278, 556, 500, 1000, 556, 556, 333, 1000, 667, 333, 1000, 0, 611, 0,
    0, 278, 278, 500, 500, 350, 556, 1000, 333, 1000, 556, 333, 944, 0, 500, 667,
    278, 333, 556, 556, 556, 556, 280, 556, 333, 737, 370, 556, 584, 333, 737, 333,
    400, 584, 333, 333, 333, 611, 556, 278, 333, 333, 365, 556, 834, 834, 834, 611,
    722, 722, 722, 722, 722, 722, 1000, 722, 667, 667, 667, 667, 278, 278, 278, 278,
    722, 722, 778, 778, 778, 778, 778, 584, 778, 722, 722, 722, 722, 667, 667, 611,
    556, 556, 556, 556, 556, 556, 889, 556, 556, 556, 556, 556, 278, 278, 278, 278,
    611, 611, 611, 611, 611, 611, 611, 584, 611, 611, 611, 611, 611, 556, 611, 556};

// Unicode code points of WinAnsi 0x80..0x9F; zero marks an unused code.
constexpr std::array<uint16_t, 32> kWinAnsiHigh = {
    0x20AC, 0,      0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
    0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0,      0x017D, 0,
    0,      0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
    0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0,      0x017E, 0x0178};

uint32_t WinAnsiToUnicode(unsigned char code) {
  if (code >= 0x80 && code <= 0x9F)
    return kWinAnsiHigh[code - 0x80];
  return code;
}

unsigned char EncodeWinAnsiCodepoint(uint32_t codepoint) {
  if (codepoint <= 0x7F)
    return static_cast<unsigned char>(codepoint);
  if (codepoint >= 0xA0 && codepoint <= 0xFF)
    return static_cast<unsigned char>(codepoint);
  for (size_t i = 0; i < kWinAnsiHigh.size(); ++i) {
    if (kWinAnsiHigh[i] != 0 && kWinAnsiHigh[i] == codepoint)
      return static_cast<unsigned char>(0x80 + i);
  }
  return '?';
}

uint16_t ReadU16(const std::string &data, size_t offset) {
  return static_cast<uint16_t>(
      (static_cast<unsigned char>(data[offset]) << 8) |
      static_cast<unsigned char>(data[offset + 1]));
}

int16_t ReadS16(const std::string &data, size_t offset) {
  return static_cast<int16_t>(ReadU16(data, offset));
}

uint32_t ReadU32(const std::string &data, size_t offset) {
  return (static_cast<uint32_t>(static_cast<unsigned char>(data[offset])) << 24) |
         (static_cast<uint32_t>(static_cast<unsigned char>(data[offset + 1])) << 16) |
         (static_cast<uint32_t>(static_cast<unsigned char>(data[offset + 2])) << 8) |
         static_cast<uint32_t>(static_cast<unsigned char>(data[offset + 3]));
}

uint32_t MakeTag(char a, char b, char c, char d) {
  return (static_cast<uint32_t>(a) << 24) |
         (static_cast<uint32_t>(b) << 16) |
         (static_cast<uint32_t>(c) << 8) |
         static_cast<uint32_t>(d);
}

struct FontCandidate {
  const char *regular;
  const char *bold;
  const char *italic;
  const char *boldItalic;

  const char *For(PdfFontStyle style) const {
    switch (style) {
    case PdfFontStyle::Bold:
      return bold;
    case PdfFontStyle::Italic:
      return italic;
    case PdfFontStyle::BoldItalic:
      return boldItalic;
    case PdfFontStyle::Regular:
      break;
    }
    return regular;
  }
};

} // namespace

PdfFontStyle StyleFor(bool bold, bool italic) {
  if (bold && italic)
    return PdfFontStyle::BoldItalic;
  if (bold)
    return PdfFontStyle::Bold;
  if (italic)
    return PdfFontStyle::Italic;
  return PdfFontStyle::Regular;
}

bool IsItalicStyle(PdfFontStyle style) {
  return style == PdfFontStyle::Italic || style == PdfFontStyle::BoldItalic;
}

bool IsBoldStyle(PdfFontStyle style) {
  return style == PdfFontStyle::Bold || style == PdfFontStyle::BoldItalic;
}

const std::array<uint16_t, 256> &Type1WidthTable(PdfFontStyle style) {
  return IsBoldStyle(style) ? kHelveticaBoldWidths : kHelveticaWidths;
}

double MeasureTextWidth(const std::string &winAnsi, double fontSize,
                        const PdfFontDefinition *font) {
  if (!font)
    return static_cast<double>(winAnsi.size()) * fontSize * 0.6;
  double units = 0.0;
  if (!font->metrics.valid || font->metrics.unitsPerEm <= 0) {
    const std::array<uint16_t, 256> &widths = Type1WidthTable(font->style);
    for (unsigned char ch : winAnsi) {
      if (ch != '\n')
        units += widths[ch];
    }
    return (units / 1000.0) * fontSize;
  }
  for (unsigned char ch : winAnsi) {
    if (ch == '\n')
      continue;
    units += font->metrics.advanceWidths[ch];
  }
  return (units / font->metrics.unitsPerEm) * fontSize;
}

std::string EncodeWinAnsi(const std::string &utf8) {
  std::string out;
  out.reserve(utf8.size());
  size_t i = 0;
  while (i < utf8.size()) {
    unsigned char lead = static_cast<unsigned char>(utf8[i]);
    uint32_t codepoint = 0;
    size_t length = 0;
    if (lead < 0x80) {
      codepoint = lead;
      length = 1;
    } else if ((lead >> 5) == 0x6 && i + 1 < utf8.size()) {
      codepoint = ((lead & 0x1F) << 6) |
                  (static_cast<unsigned char>(utf8[i + 1]) & 0x3F);
      length = 2;
    } else if ((lead >> 4) == 0xE && i + 2 < utf8.size()) {
      codepoint = ((lead & 0x0F) << 12) |
                  ((static_cast<unsigned char>(utf8[i + 1]) & 0x3F) << 6) |
                  (static_cast<unsigned char>(utf8[i + 2]) & 0x3F);
      length = 3;
    } else if ((lead >> 3) == 0x1E && i + 3 < utf8.size()) {
      codepoint = ((lead & 0x07) << 18) |
                  ((static_cast<unsigned char>(utf8[i + 1]) & 0x3F) << 12) |
                  ((static_cast<unsigned char>(utf8[i + 2]) & 0x3F) << 6) |
                  (static_cast<unsigned char>(utf8[i + 3]) & 0x3F);
      length = 4;
    } else {
      out.push_back('?');
      ++i;
      continue;
    }
    // No-break spaces (from &nbsp;) keep words together in layout but print
    // as plain spaces.
    if (codepoint == 0xA0)
      codepoint = ' ';
    out.push_back(static_cast<char>(EncodeWinAnsiCodepoint(codepoint)));
    i += length;
  }
  return out;
}

bool ReadFileToString(const std::filesystem::path &path, std::string &out) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open())
    return false;
  std::ostringstream buffer;
  buffer << file.rdbuf();
  out = buffer.str();
  return true;
}

bool FindTable(const std::string &data, uint32_t tag, uint32_t &offset,
               uint32_t &length) {
  if (data.size() < 12)
    return false;
  uint16_t numTables = ReadU16(data, 4);
  size_t tableDir = 12;
  for (uint16_t i = 0; i < numTables; ++i) {
    size_t recordOffset = tableDir + i * 16;
    if (recordOffset + 16 > data.size())
      return false;
    uint32_t entryTag = ReadU32(data, recordOffset);
    uint32_t entryOffset = ReadU32(data, recordOffset + 8);
    uint32_t entryLength = ReadU32(data, recordOffset + 12);
    if (entryTag == tag) {
      offset = entryOffset;
      length = entryLength;
      return static_cast<uint64_t>(entryOffset) + entryLength <= data.size();
    }
  }
  return false;
}

bool LoadTtfFontMetrics(const std::filesystem::path &path,
                        TtfFontMetrics &metrics, std::string &error) {
  metrics = TtfFontMetrics{};
  std::string data;
  if (!ReadFileToString(path, data)) {
    error = "cannot read " + path.string();
    return false;
  }
  if (data.size() < 12) {
    error = path.string() + " is too small to be a TrueType font";
    return false;
  }

  uint32_t headOffset = 0, headLength = 0;
  uint32_t hheaOffset = 0, hheaLength = 0;
  uint32_t maxpOffset = 0, maxpLength = 0;
  uint32_t hmtxOffset = 0, hmtxLength = 0;
  uint32_t cmapOffset = 0, cmapLength = 0;
  uint32_t os2Offset = 0, os2Length = 0;
  uint32_t postOffset = 0, postLength = 0;

  const struct {
    uint32_t tag;
    uint32_t *offset;
    uint32_t *length;
    const char *name;
  } required[] = {
      {MakeTag('h', 'e', 'a', 'd'), &headOffset, &headLength, "head"},
      {MakeTag('h', 'h', 'e', 'a'), &hheaOffset, &hheaLength, "hhea"},
      {MakeTag('m', 'a', 'x', 'p'), &maxpOffset, &maxpLength, "maxp"},
      {MakeTag('h', 'm', 't', 'x'), &hmtxOffset, &hmtxLength, "hmtx"},
      {MakeTag('c', 'm', 'a', 'p'), &cmapOffset, &cmapLength, "cmap"},
  };
  for (const auto &table : required) {
    if (!FindTable(data, table.tag, *table.offset, *table.length)) {
      error = path.string() + " has no usable '" + table.name + "' table";
      return false;
    }
  }
  if (!FindTable(data, MakeTag('O', 'S', '/', '2'), os2Offset, os2Length))
    os2Offset = 0;
  if (!FindTable(data, MakeTag('p', 'o', 's', 't'), postOffset, postLength))
    postOffset = 0;

  error = path.string() + " has malformed metrics tables";
  if (headOffset + 54 > data.size())
    return false;
  metrics.unitsPerEm = ReadU16(data, headOffset + 18);
  metrics.xMin = ReadS16(data, headOffset + 36);
  metrics.yMin = ReadS16(data, headOffset + 38);
  metrics.xMax = ReadS16(data, headOffset + 40);
  metrics.yMax = ReadS16(data, headOffset + 42);

  if (hheaOffset + 36 > data.size())
    return false;
  metrics.ascent = ReadS16(data, hheaOffset + 4);
  metrics.descent = ReadS16(data, hheaOffset + 6);
  metrics.lineGap = ReadS16(data, hheaOffset + 8);
  uint16_t numHMetrics = ReadU16(data, hheaOffset + 34);

  if (maxpOffset + 6 > data.size())
    return false;
  uint16_t numGlyphs = ReadU16(data, maxpOffset + 4);
  if (numGlyphs == 0 || numHMetrics == 0)
    return false;

  if (hmtxOffset + static_cast<uint32_t>(numHMetrics) * 4 > data.size())
    return false;

  std::vector<int> advanceWidths(numGlyphs, 0);
  int lastAdvance = 0;
  for (uint16_t i = 0; i < numHMetrics && i < numGlyphs; ++i) {
    size_t entry = hmtxOffset + static_cast<size_t>(i) * 4;
    lastAdvance = ReadU16(data, entry);
    advanceWidths[i] = lastAdvance;
  }
  for (uint16_t i = numHMetrics; i < numGlyphs; ++i)
    advanceWidths[i] = lastAdvance;

  if (os2Offset != 0 && os2Length >= 90 && os2Offset + 90 <= data.size()) {
    uint16_t version = ReadU16(data, os2Offset);
    if (version >= 2)
      metrics.capHeight = ReadS16(data, os2Offset + 88);
  }
  if (metrics.capHeight == 0)
    metrics.capHeight = metrics.ascent;

  if (postOffset != 0 && postLength >= 8 && postOffset + 8 <= data.size())
    metrics.italicAngle = ReadS16(data, postOffset + 4);

  const std::string cmapData =
      data.substr(cmapOffset, std::min<size_t>(cmapLength, data.size() - cmapOffset));
  if (cmapData.size() < 4)
    return false;
  uint16_t cmapTables = ReadU16(cmapData, 2);
  size_t cmapRecordOffset = 4;
  uint32_t chosenOffset = 0;
  for (uint16_t i = 0; i < cmapTables; ++i, cmapRecordOffset += 8) {
    if (cmapRecordOffset + 8 > cmapData.size())
      return false;
    uint16_t platformId = ReadU16(cmapData, cmapRecordOffset);
    uint16_t encodingId = ReadU16(cmapData, cmapRecordOffset + 2);
    uint32_t subOffset = ReadU32(cmapData, cmapRecordOffset + 4);
    if (static_cast<size_t>(subOffset) + 2 > cmapData.size())
      continue;
    uint16_t format = ReadU16(cmapData, subOffset);
    if (format == 4 && platformId == 3 &&
        (encodingId == 1 || encodingId == 0)) {
      chosenOffset = subOffset;
      break;
    }
  }
  if (chosenOffset == 0) {
    error = path.string() + " has no Unicode BMP cmap";
    return false;
  }

  size_t subBase = chosenOffset;
  if (subBase + 14 > cmapData.size())
    return false;
  uint16_t segCount = ReadU16(cmapData, subBase + 6) / 2;
  size_t endCountOffset = subBase + 14;
  size_t startCountOffset = endCountOffset + 2 * segCount + 2;
  size_t idDeltaOffset = startCountOffset + 2 * segCount;
  size_t idRangeOffsetOffset = idDeltaOffset + 2 * segCount;
  if (idRangeOffsetOffset + 2 * segCount > cmapData.size())
    return false;

  auto glyphForCodepoint = [&](uint32_t code) -> uint16_t {
    for (uint16_t i = 0; i < segCount; ++i) {
      uint16_t endCount = ReadU16(cmapData, endCountOffset + 2 * i);
      uint16_t startCount = ReadU16(cmapData, startCountOffset + 2 * i);
      if (code < startCount || code > endCount)
        continue;
      int16_t idDelta = ReadS16(cmapData, idDeltaOffset + 2 * i);
      uint16_t idRangeOffset = ReadU16(cmapData, idRangeOffsetOffset + 2 * i);
      if (idRangeOffset == 0)
        return static_cast<uint16_t>(code + idDelta);
      size_t glyphOffset =
          idRangeOffsetOffset + 2 * i + idRangeOffset + 2 * (code - startCount);
      if (glyphOffset + 2 > cmapData.size())
        return 0;
      uint16_t glyphIndex = ReadU16(cmapData, glyphOffset);
      if (glyphIndex == 0)
        return 0;
      return static_cast<uint16_t>(glyphIndex + idDelta);
    }
    return 0;
  };

  int missingWidth = advanceWidths.empty() ? 0 : advanceWidths[0];
  for (size_t code = 0; code < metrics.advanceWidths.size(); ++code) {
    const uint32_t codepoint = WinAnsiToUnicode(static_cast<unsigned char>(code));
    uint16_t glyphIndex = codepoint ? glyphForCodepoint(codepoint) : 0;
    int advance = missingWidth;
    if (glyphIndex < advanceWidths.size())
      advance = advanceWidths[glyphIndex];
    metrics.advanceWidths[code] = advance;
    metrics.widths1000[code] =
        metrics.unitsPerEm > 0
            ? static_cast<int>(std::lround(advance * 1000.0 / metrics.unitsPerEm))
            : 0;
  }

  metrics.data = std::move(data);
  metrics.valid = metrics.unitsPerEm > 0;
  if (metrics.valid)
    error.clear();
  else
    error = path.string() + " declares zero units per em";
  return metrics.valid;
}

std::filesystem::path FindFontPath(PdfFontStyle style) {
  const std::vector<FontCandidate> candidates = {
#ifdef _WIN32
      {"C:/Windows/Fonts/arial.ttf", "C:/Windows/Fonts/arialbd.ttf",
       "C:/Windows/Fonts/ariali.ttf", "C:/Windows/Fonts/arialbi.ttf"},
#elif defined(__APPLE__)
      {"/Library/Fonts/Arial.ttf", "/Library/Fonts/Arial Bold.ttf",
       "/Library/Fonts/Arial Italic.ttf", "/Library/Fonts/Arial Bold Italic.ttf"},
      {"/System/Library/Fonts/Supplemental/Arial.ttf",
       "/System/Library/Fonts/Supplemental/Arial Bold.ttf",
       "/System/Library/Fonts/Supplemental/Arial Italic.ttf",
       "/System/Library/Fonts/Supplemental/Arial Bold Italic.ttf"},
#else
      {"/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
       "/usr/share/fonts/truetype/dejavu/DejaVuSans-Bold.ttf",
       "/usr/share/fonts/truetype/dejavu/DejaVuSans-Oblique.ttf",
       "/usr/share/fonts/truetype/dejavu/DejaVuSans-BoldOblique.ttf"},
      {"/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
       "/usr/share/fonts/truetype/liberation/LiberationSans-Bold.ttf",
       "/usr/share/fonts/truetype/liberation/LiberationSans-Italic.ttf",
       "/usr/share/fonts/truetype/liberation/LiberationSans-BoldItalic.ttf"},
      {"/usr/share/fonts/TTF/DejaVuSans.ttf",
       "/usr/share/fonts/TTF/DejaVuSans-Bold.ttf",
       "/usr/share/fonts/TTF/DejaVuSans-Oblique.ttf",
       "/usr/share/fonts/TTF/DejaVuSans-BoldOblique.ttf"},
#endif
  };

  if (const char *dir = std::getenv("LETTERPRESS_FONT_DIR"); dir && *dir) {
    const FontCandidate local = {"Sans-Regular.ttf", "Sans-Bold.ttf",
                                 "Sans-Italic.ttf", "Sans-BoldItalic.ttf"};
    std::filesystem::path path = std::filesystem::path(dir) / local.For(style);
    std::error_code ec;
    if (std::filesystem::exists(path, ec))
      return path;
  }
  for (const auto &candidate : candidates) {
    const char *path = candidate.For(style);
    std::error_code ec;
    if (path && std::filesystem::exists(path, ec))
      return std::filesystem::path(path);
  }
  return {};
}

bool LoadPdfFontMetrics(PdfFontDefinition &font, std::string &error) {
  std::filesystem::path path = FindFontPath(font.style);
  if (path.empty()) {
    error = "no TrueType file installed";
    return false;
  }
  font.sourcePath = path;
  return LoadTtfFontMetrics(path, font.metrics, error);
}

const char *Type1BaseFont(PdfFontStyle style) {
  switch (style) {
  case PdfFontStyle::Bold:
    return "Helvetica-Bold";
  case PdfFontStyle::Italic:
    return "Helvetica-Oblique";
  case PdfFontStyle::BoldItalic:
    return "Helvetica-BoldOblique";
  case PdfFontStyle::Regular:
    break;
  }
  return "Helvetica";
}

} // namespace receipt_pdf_internal
