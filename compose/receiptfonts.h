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

#include "linelayout.h"
#include "pdf_font_metrics.h"
#include "pdf_writer.h"

#include <array>
#include <memory>
#include <string>
#include <vector>

enum class FontBackend {
  EmbeddedTrueType, // installed TrueType faces, Type1 where none is found
  Type1,            // standard Helvetica faces with their AFM widths
};

struct ResolvedFace {
  const receipt_pdf_internal::PdfFontDefinition *font = nullptr;
  bool skew = false; // italic drawn by shearing the upright face
};

// The four faces a receipt draws with, at one size. Serves as the layout's
// text measurer so that wrapping and drawing agree on every width.
class ReceiptFontSet : public TextMeasurer {
public:
  static std::unique_ptr<ReceiptFontSet> Load(FontBackend backend,
                                              double fontSize);

  double Measure(const std::string &text, bool bold,
                 bool italic) const override;
  ResolvedFace Resolve(bool bold, bool italic) const;

  double FontSize() const { return fontSize_; }
  FontBackend Backend() const { return backend_; }
  bool HasEmbeddedFaces() const;

  // Appends the font objects of every face in use and returns the page
  // /Resources dictionary referencing them.
  std::string AppendFontObjects(std::vector<receipt_pdf_internal::PdfObject> &objects);

private:
  ReceiptFontSet(FontBackend backend, double fontSize);
  void LoadEmbeddedFaces();
  void UseType1Faces();

  FontBackend backend_;
  double fontSize_;
  std::array<receipt_pdf_internal::PdfFontDefinition, 4> faces_;
  std::array<size_t, 4> faceFor_{{0, 1, 2, 3}};
  std::array<bool, 4> skew_{};
};
