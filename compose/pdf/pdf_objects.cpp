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
#include "pdf_objects.h"

#include "logger.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

#include <zlib.h>

namespace receipt_pdf_internal {

FloatFormatter::FloatFormatter(int precision)
    : precision_(std::clamp(precision, 0, 6)) {}

std::string FloatFormatter::Format(double value) const {
  // Avoid "-0.00" for values that round to zero.
  if (std::abs(value) < 0.5 * std::pow(10.0, -precision_))
    value = 0.0;
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(precision_) << value;
  return ss.str();
}

bool PdfDeflater::Compress(const std::string &input, std::string &output,
                           std::string &error) {
  if (input.empty()) {
    output.clear();
    return true;
  }
  uLongf bound = compressBound(input.size());
  std::string compressed;
  compressed.resize(bound);

  int zres = compress2(reinterpret_cast<Bytef *>(compressed.data()), &bound,
                       reinterpret_cast<const Bytef *>(input.data()),
                       input.size(), Z_BEST_SPEED);
  if (zres != Z_OK) {
    error = "compress2 failed with code " + std::to_string(zres);
    return false;
  }

  compressed.resize(bound);
  output.swap(compressed);
  return true;
}

bool AppendEmbeddedFontObjects(std::vector<PdfObject> &objects,
                               PdfFontDefinition &font) {
  if (!font.metrics.valid || font.metrics.data.empty())
    return false;
  const double scale = font.metrics.unitsPerEm > 0 ? 1000.0 / font.metrics.unitsPerEm : 1.0;
  int ascent = static_cast<int>(std::lround(font.metrics.ascent * scale));
  int descent = -static_cast<int>(std::lround(std::abs(font.metrics.descent) * scale));
  int capHeight = static_cast<int>(std::lround(font.metrics.capHeight * scale));
  int xMin = static_cast<int>(std::lround(font.metrics.xMin * scale));
  int yMin = static_cast<int>(std::lround(font.metrics.yMin * scale));
  int xMax = static_cast<int>(std::lround(font.metrics.xMax * scale));
  int yMax = static_cast<int>(std::lround(font.metrics.yMax * scale));

  // Nonsymbolic, plus Italic for slanted faces.
  int flags = 32;
  if (IsItalicStyle(font.style) && font.metrics.italicAngle != 0)
    flags |= 64;
  const int stemV = IsBoldStyle(font.style) ? 120 : 80;

  size_t fontFileIndex = objects.size() + 1;
  std::ostringstream fontFileStream;
  const bool needsNewline = font.metrics.data.back() != '\n';
  const size_t streamLength = font.metrics.data.size() + (needsNewline ? 1u : 0u);
  fontFileStream << "<< /Length " << streamLength << " /Length1 " << font.metrics.data.size()
                 << " >>\nstream\n" << font.metrics.data;
  if (needsNewline)
    fontFileStream << '\n';
  fontFileStream << "endstream";
  objects.push_back({fontFileStream.str()});

  size_t descriptorIndex = objects.size() + 1;
  std::ostringstream descriptor;
  descriptor << "<< /Type /FontDescriptor /FontName /" << font.baseName
             << " /Flags " << flags << " /FontBBox [" << xMin << ' ' << yMin << ' ' << xMax
             << ' ' << yMax << "] /Ascent " << ascent << " /Descent " << descent
             << " /CapHeight " << capHeight << " /ItalicAngle " << font.metrics.italicAngle
             << " /StemV " << stemV << " /FontFile2 " << fontFileIndex << " 0 R >>";
  objects.push_back({descriptor.str()});

  size_t fontIndex = objects.size() + 1;
  std::ostringstream fontObject;
  fontObject << "<< /Type /Font /Subtype /TrueType /BaseFont /" << font.baseName
             << " /FirstChar 32 /LastChar 255 /Widths [";
  for (int code = 32; code <= 255; ++code) {
    fontObject << font.metrics.widths1000[static_cast<unsigned char>(code)];
    if (code != 255)
      fontObject << ' ';
  }
  fontObject << "] /FontDescriptor " << descriptorIndex << " 0 R /Encoding /WinAnsiEncoding >>";
  objects.push_back({fontObject.str()});

  font.objectId = fontIndex;
  font.embedded = true;
  return true;
}

void AppendFallbackType1Font(std::vector<PdfObject> &objects,
                             PdfFontDefinition &font,
                             const std::string &baseFont) {
  objects.push_back({"<< /Type /Font /Subtype /Type1 /BaseFont /" + baseFont +
                     " /Encoding /WinAnsiEncoding >>"});
  font.objectId = objects.size();
  font.embedded = false;
  font.baseName = baseFont;
}

size_t AppendContentStreamObject(std::vector<PdfObject> &objects,
                                 const std::string &content, bool compress) {
  std::string compressedContent;
  bool useCompression = false;
  if (compress) {
    std::string error;
    if (PdfDeflater::Compress(content, compressedContent, error))
      useCompression = true;
    else
      Logger::Instance().Log("PDF: writing uncompressed content stream (" + error + ")");
  }

  std::ostringstream contentObj;
  const std::string &streamData = useCompression ? compressedContent : content;
  contentObj << "<< /Length " << streamData.size();
  if (useCompression)
    contentObj << " /Filter /FlateDecode";
  contentObj << " >>\nstream\n" << streamData << "\nendstream";
  objects.push_back({contentObj.str()});
  return objects.size();
}

size_t AppendSinglePageObjects(std::vector<PdfObject> &objects,
                               const FloatFormatter &formatter, double width,
                               double height, size_t contentObject,
                               const std::string &resources) {
  const size_t pageIndex = objects.size() + 1;
  const size_t pagesIndex = pageIndex + 1;
  const size_t catalogIndex = pagesIndex + 1;

  std::ostringstream pageObj;
  pageObj << "<< /Type /Page /Parent " << pagesIndex
          << " 0 R /MediaBox [0 0 " << formatter.Format(width) << ' '
          << formatter.Format(height) << "] /Contents " << contentObject
          << " 0 R /Resources " << resources << " >>";
  objects.push_back({pageObj.str()});
  objects.push_back({"<< /Type /Pages /Kids [" + std::to_string(pageIndex) +
                     " 0 R] /Count 1 >>"});
  objects.push_back({"<< /Type /Catalog /Pages " +
                     std::to_string(pagesIndex) + " 0 R >>"});
  return catalogIndex;
}

} // namespace receipt_pdf_internal
