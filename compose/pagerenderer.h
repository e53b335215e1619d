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

#include "composersettings.h"
#include "pdf_writer.h"
#include "receipttypes.h"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

class ReceiptFontSet;

// A finished single-page drawing: the PDF objects of one page holding the
// receipt body on an otherwise blank canvas. Immutable once built.
class ContentSurface {
public:
  ContentSurface(double width, double height, std::string contentStream,
                 std::vector<receipt_pdf_internal::PdfObject> objects,
                 size_t catalogIndex, size_t lineCount);

  double Width() const { return width_; }
  double Height() const { return height_; }
  // Uncompressed page content, as drawn.
  const std::string &ContentStream() const { return contentStream_; }
  size_t LineCount() const { return lineCount_; }

  std::string Serialize() const;
  bool WriteTo(const std::filesystem::path &path, std::string &error) const;

private:
  double width_;
  double height_;
  std::string contentStream_;
  std::vector<receipt_pdf_internal::PdfObject> objects_;
  size_t catalogIndex_;
  size_t lineCount_;
};

// Pen position in PDF page space (origin bottom-left), threaded through the
// drawing of each line.
struct DrawCursor {
  double x = 0.0;
  double y = 0.0;
};

struct RenderOptions {
  PageGeometry page;
  double fontSize = 12.0;
  bool compressStreams = true;
};

// Draws the laid-out lines from the top-left corner of the content box. The
// first baseline sits one font size below the top margin. Throws
// RenderFailure when the page geometry leaves no content box.
std::unique_ptr<const ContentSurface> RenderContentSurface(
    const LayoutResult &layout, ReceiptFontSet &fonts,
    const RenderOptions &options);
