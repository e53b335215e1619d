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
#include "receiptfonts.h"

#include "logger.h"
#include "pdf_objects.h"

#include <sstream>

using namespace receipt_pdf_internal;

namespace {

constexpr std::array<const char *, 4> kEmbeddedNames = {
    "LetterpressSans", "LetterpressSans-Bold", "LetterpressSans-Italic",
    "LetterpressSans-BoldItalic"};

constexpr std::array<const char *, 4> kStyleNames = {"regular", "bold", "italic",
                                                     "bold italic"};

size_t Index(PdfFontStyle style) { return static_cast<size_t>(style); }

} // namespace

ReceiptFontSet::ReceiptFontSet(FontBackend backend, double fontSize)
    : backend_(backend), fontSize_(fontSize) {
  for (size_t i = 0; i < faces_.size(); ++i) {
    faces_[i].key = "F" + std::to_string(i + 1);
    faces_[i].style = static_cast<PdfFontStyle>(i);
  }
}

std::unique_ptr<ReceiptFontSet> ReceiptFontSet::Load(FontBackend backend,
                                                     double fontSize) {
  std::unique_ptr<ReceiptFontSet> fonts(new ReceiptFontSet(backend, fontSize));
  if (backend == FontBackend::EmbeddedTrueType)
    fonts->LoadEmbeddedFaces();
  else
    fonts->UseType1Faces();
  return fonts;
}

void ReceiptFontSet::LoadEmbeddedFaces() {
  std::array<bool, 4> loaded{};
  for (size_t i = 0; i < faces_.size(); ++i) {
    std::string error;
    loaded[i] = LoadPdfFontMetrics(faces_[i], error);
    if (loaded[i])
      faces_[i].baseName = kEmbeddedNames[i];
    else
      Logger::Instance().Log(std::string("PDF: no embeddable ") + kStyleNames[i] +
                             " face (" + error + ")");
  }

  if (!loaded[Index(PdfFontStyle::Regular)]) {
    Logger::Instance().Log(
        "PDF: falling back to Type1 Helvetica (embedded font not found)");
    UseType1Faces();
    return;
  }
  if (!loaded[Index(PdfFontStyle::Bold)])
    faceFor_[Index(PdfFontStyle::Bold)] = Index(PdfFontStyle::Regular);
  if (!loaded[Index(PdfFontStyle::Italic)]) {
    faceFor_[Index(PdfFontStyle::Italic)] = Index(PdfFontStyle::Regular);
    skew_[Index(PdfFontStyle::Italic)] = true;
  }
  if (!loaded[Index(PdfFontStyle::BoldItalic)]) {
    faceFor_[Index(PdfFontStyle::BoldItalic)] = faceFor_[Index(PdfFontStyle::Bold)];
    skew_[Index(PdfFontStyle::BoldItalic)] = true;
  }
}

void ReceiptFontSet::UseType1Faces() {
  backend_ = FontBackend::Type1;
  for (size_t i = 0; i < faces_.size(); ++i) {
    faces_[i].metrics = TtfFontMetrics{};
    faces_[i].sourcePath.clear();
    faces_[i].baseName = Type1BaseFont(faces_[i].style);
    faceFor_[i] = i;
    skew_[i] = false;
  }
}

ResolvedFace ReceiptFontSet::Resolve(bool bold, bool italic) const {
  const size_t index = Index(StyleFor(bold, italic));
  return {&faces_[faceFor_[index]], skew_[index]};
}

double ReceiptFontSet::Measure(const std::string &text, bool bold,
                               bool italic) const {
  return MeasureTextWidth(EncodeWinAnsi(text), fontSize_,
                          Resolve(bold, italic).font);
}

bool ReceiptFontSet::HasEmbeddedFaces() const {
  return faces_[Index(PdfFontStyle::Regular)].metrics.valid;
}

std::string ReceiptFontSet::AppendFontObjects(std::vector<PdfObject> &objects) {
  std::array<bool, 4> used{};
  for (size_t index : faceFor_)
    used[index] = true;

  std::ostringstream resources;
  resources << "<< /Font <<";
  for (size_t i = 0; i < faces_.size(); ++i) {
    if (!used[i])
      continue;
    PdfFontDefinition &face = faces_[i];
    if (!face.metrics.valid || !AppendEmbeddedFontObjects(objects, face))
      AppendFallbackType1Font(objects, face, Type1BaseFont(face.style));
    resources << " /" << face.key << ' ' << face.objectId << " 0 R";
  }
  resources << " >> >>";
  return resources.str();
}
