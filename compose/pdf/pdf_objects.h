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

#include "pdf_font_metrics.h"
#include "pdf_writer.h"

#include <string>
#include <vector>

namespace receipt_pdf_internal {

class FloatFormatter {
public:
  explicit FloatFormatter(int precision);
  std::string Format(double value) const;

private:
  int precision_;
};

class PdfDeflater {
public:
  static bool Compress(const std::string &input, std::string &output,
                       std::string &error);
};

bool AppendEmbeddedFontObjects(std::vector<PdfObject> &objects,
                               PdfFontDefinition &font);
void AppendFallbackType1Font(std::vector<PdfObject> &objects,
                             PdfFontDefinition &font,
                             const std::string &baseFont);

// Appends a content stream, Flate-compressed when `compress` is set and zlib
// succeeds. Returns the object number.
size_t AppendContentStreamObject(std::vector<PdfObject> &objects,
                                 const std::string &content, bool compress);

// Appends page, page tree and catalog for a single page and returns the
// catalog object number.
size_t AppendSinglePageObjects(std::vector<PdfObject> &objects,
                               const FloatFormatter &formatter, double width,
                               double height, size_t contentObject,
                               const std::string &resources);

} // namespace receipt_pdf_internal
