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
#include "pagerenderer.h"

#include "logger.h"
#include "pdf_objects.h"
#include "pdf_text_commands.h"
#include "receipterrors.h"
#include "receiptfonts.h"

#include <sstream>

using namespace receipt_pdf_internal;

ContentSurface::ContentSurface(double width, double height,
                               std::string contentStream,
                               std::vector<PdfObject> objects,
                               size_t catalogIndex, size_t lineCount)
    : width_(width), height_(height), contentStream_(std::move(contentStream)),
      objects_(std::move(objects)), catalogIndex_(catalogIndex),
      lineCount_(lineCount) {}

std::string ContentSurface::Serialize() const {
  return SerializePdfDocument(objects_, catalogIndex_);
}

bool ContentSurface::WriteTo(const std::filesystem::path &path,
                             std::string &error) const {
  return WritePdfDocument(path, objects_, catalogIndex_, error);
}

namespace {

DrawCursor DrawLine(std::ostringstream &content, const FloatFormatter &formatter,
                    const LaidOutLine &line, const ReceiptFontSet &fonts,
                    DrawCursor cursor) {
  for (const auto &run : line.runs) {
    const ResolvedFace face = fonts.Resolve(run.bold, run.italic);
    if (!face.font)
      throw RenderFailure("PDF: no font face for run '" + run.text + "'");
    TextRun textRun;
    textRun.x = cursor.x;
    textRun.y = cursor.y;
    textRun.winAnsi = EncodeWinAnsi(run.text);
    textRun.fontKey = face.font->key;
    textRun.fontSize = fonts.FontSize();
    textRun.skew = face.skew;
    AppendTextRun(content, formatter, textRun);
    cursor.x += run.width;
  }
  return cursor;
}

} // namespace

std::unique_ptr<const ContentSurface> RenderContentSurface(
    const LayoutResult &layout, ReceiptFontSet &fonts,
    const RenderOptions &options) {
  const PageGeometry &page = options.page;
  if (!(page.ContentWidth() > 0.0) || !(page.ContentHeight() > 0.0))
    throw RenderFailure("PDF: page geometry leaves no content box");
  if (!(fonts.FontSize() > 0.0))
    throw RenderFailure("PDF: font size must be positive");

  FloatFormatter formatter(2);
  std::ostringstream content;
  const double top = page.pageHeight - page.marginTop;
  for (const auto &line : layout.lines) {
    DrawCursor cursor{page.marginLeft + line.indent,
                      top - line.offsetY - fonts.FontSize()};
    DrawLine(content, formatter, line, fonts, cursor);
  }

  // Receipts are single pages; text past the bottom margin is still drawn.
  if (layout.height > page.ContentHeight()) {
    Logger::Instance().Log("PDF: receipt body overflows the bottom margin by " +
                           formatter.Format(layout.height - page.ContentHeight()) +
                           " pt");
  }

  std::vector<PdfObject> objects;
  const std::string resources = fonts.AppendFontObjects(objects);
  std::string contentStr = content.str();
  const size_t contentIndex =
      AppendContentStreamObject(objects, contentStr, options.compressStreams);
  const size_t catalogIndex =
      AppendSinglePageObjects(objects, formatter, page.pageWidth,
                              page.pageHeight, contentIndex, resources);
  return std::make_unique<const ContentSurface>(
      page.pageWidth, page.pageHeight, std::move(contentStr),
      std::move(objects), catalogIndex, layout.lines.size());
}
