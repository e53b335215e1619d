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
#include "letterheadcompositor.h"
#include "pagerenderer.h"
#include "pdf_objects.h"
#include "receipterrors.h"
#include "receiptfonts.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

#include <podofo/podofo.h>

namespace fs = std::filesystem;

namespace {

void WriteFile(const fs::path &path, const std::string &data) {
  std::ofstream out(path, std::ios::binary);
  out << data;
}

std::string ReadFile(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(in)),
                     std::istreambuf_iterator<char>());
}

// Two-page letterhead with a grey masthead band on the first page.
void WriteLetterhead(const fs::path &path) {
  using namespace receipt_pdf_internal;
  std::vector<PdfObject> objects;
  FloatFormatter fmt(2);
  const size_t masthead = AppendContentStreamObject(
      objects, "0.8 0.8 0.8 rg\n0 712 612 80 re\nf\n", false);
  const size_t blank = AppendContentStreamObject(objects, "", false);
  objects.push_back({"<< /Type /Page /Parent 5 0 R /MediaBox [0 0 612 792] "
                     "/Contents " + std::to_string(masthead) +
                     " 0 R /Resources << >> >>"});
  objects.push_back({"<< /Type /Page /Parent 5 0 R /MediaBox [0 0 612 792] "
                     "/Contents " + std::to_string(blank) +
                     " 0 R /Resources << >> >>"});
  objects.push_back({"<< /Type /Pages /Kids [3 0 R 4 0 R] /Count 2 >>"});
  objects.push_back({"<< /Type /Catalog /Pages 5 0 R >>"});
  std::string error;
  if (!WritePdfDocument(path, objects, 6, error))
    std::cerr << error << std::endl;
}

std::unique_ptr<const ContentSurface> SampleSurface() {
  auto fonts = ReceiptFontSet::Load(FontBackend::Type1, 12.0);
  FormattingSegment segment;
  segment.text = "Thank you for your generous gift.";
  LayoutOptions layoutOptions;
  layoutOptions.contentWidth = 396.0;
  RenderOptions options;
  return RenderContentSurface(LayoutSegments({segment}, *fonts, layoutOptions),
                              *fonts, options);
}

} // namespace

int main() {
  const fs::path dir = fs::temp_directory_path() / "letterpress_letterhead_test";
  fs::remove_all(dir);
  fs::create_directories(dir / "data");
  setenv("LETTERPRESS_DATA_DIR", (dir / "data").string().c_str(), 1);
  setenv("LETTERPRESS_LETTERHEAD", (dir / "env.pdf").string().c_str(), 1);

  // Search order.
  {
    auto candidates = BuildLetterheadCandidates(dir / "configured.pdf");
    if (candidates.size() < 3 || candidates[0].origin != "settings" ||
        candidates[0].path != dir / "configured.pdf" ||
        candidates[1].origin != "LETTERPRESS_LETTERHEAD" ||
        candidates[1].path != dir / "env.pdf" ||
        candidates.back().origin != "user data" ||
        candidates.back().path != dir / "data" / "letterhead.pdf") {
      std::cerr << "Unexpected letterhead search order" << std::endl;
      return 1;
    }
    if (BuildLetterheadCandidates(std::nullopt)[0].origin != "LETTERPRESS_LETTERHEAD") {
      std::cerr << "Unset configured path still listed" << std::endl;
      return 1;
    }
  }

  // Usability checks and the first usable candidate wins.
  {
    std::string reason;
    if (IsUsableLetterhead(dir / "missing.pdf", reason) || reason != "not found") {
      std::cerr << "Missing letterhead accepted" << std::endl;
      return 1;
    }
    WriteFile(dir / "notes.pdf", "plain text, not a PDF");
    if (IsUsableLetterhead(dir / "notes.pdf", reason) || reason != "not a PDF file") {
      std::cerr << "Non-PDF letterhead accepted" << std::endl;
      return 1;
    }
    if (IsUsableLetterhead(dir, reason) || reason != "not a regular file") {
      std::cerr << "Directory accepted as letterhead" << std::endl;
      return 1;
    }
    WriteLetterhead(dir / "data" / "letterhead.pdf");
    const std::vector<LetterheadCandidate> candidates = {
        {dir / "notes.pdf", "settings"},
        {dir / "env.pdf", "LETTERPRESS_LETTERHEAD"},
        {dir / "data" / "letterhead.pdf", "user data"}};
    auto found = LocateLetterhead(candidates);
    if (!found || *found != dir / "data" / "letterhead.pdf") {
      std::cerr << "Usable user-data letterhead not found" << std::endl;
      return 1;
    }
    if (LocateLetterhead({candidates[1]})) {
      std::cerr << "Missing candidate located" << std::endl;
      return 1;
    }
  }

  // Output names.
  {
    if (SanitizeNameFragment("O'Brien Jr./x") != "O_Brien_Jr__x" ||
        SanitizeNameFragment("Zoë-Ann") != "Zoë-Ann") {
      std::cerr << "Unexpected sanitized name" << std::endl;
      return 1;
    }
    const auto when = std::chrono::system_clock::now();
    const std::string stamp = FormatFileTimestamp(when);
    if (stamp.size() != 15 || stamp[8] != '_') {
      std::cerr << "Unexpected timestamp " << stamp << std::endl;
      return 1;
    }
    const fs::path first = MakeReceiptPath(dir, "receipt", "Jane", "Doe", when);
    if (first.filename().string() != "receipt_Jane_Doe_" + stamp + ".pdf") {
      std::cerr << "Unexpected receipt name " << first << std::endl;
      return 1;
    }
    WriteFile(first, "%PDF-");
    const fs::path second = MakeReceiptPath(dir, "receipt", "Jane", "Doe", when);
    if (second.filename().string() != "receipt_Jane_Doe_" + stamp + "_2.pdf") {
      std::cerr << "Existing receipt not avoided: " << second << std::endl;
      return 1;
    }
    const fs::path anonymous = MakeReceiptPath(dir, "receipt", "", "", when);
    if (anonymous.filename().string() != "receipt_" + stamp + ".pdf") {
      std::cerr << "Empty name fragments kept: " << anonymous << std::endl;
      return 1;
    }
  }

  // Without a letterhead the surface is written as is.
  {
    auto surface = SampleSurface();
    const std::string expected = surface->Serialize();
    LetterheadCompositor compositor(std::nullopt);
    compositor.Compose(std::move(surface), dir / "bare.pdf");
    if (ReadFile(dir / "bare.pdf") != expected) {
      std::cerr << "Surface-only output differs from the surface" << std::endl;
      return 1;
    }
  }

  // Merged onto the first letterhead page; the second page is dropped.
  {
    LetterheadCompositor compositor(dir / "data" / "letterhead.pdf");
    compositor.Compose(SampleSurface(), dir / "merged.pdf");
    PoDoFo::PdfMemDocument merged;
    merged.Load((dir / "merged.pdf").string());
    if (merged.GetPages().GetCount() != 1) {
      std::cerr << "Merged receipt should have one page" << std::endl;
      return 1;
    }
  }

  // A damaged letterhead is a compositing failure.
  {
    WriteFile(dir / "broken.pdf", "%PDF-1.4\nthis is not a PDF body\n");
    LetterheadCompositor compositor(dir / "broken.pdf");
    bool threw = false;
    try {
      compositor.Compose(SampleSurface(), dir / "broken_out.pdf");
    } catch (const CompositeFailure &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "Damaged letterhead was merged" << std::endl;
      return 1;
    }
  }

  // Unwritable output is reported.
  {
    LetterheadCompositor compositor(std::nullopt);
    bool threw = false;
    try {
      compositor.Compose(SampleSurface(), dir / "missing" / "out.pdf");
    } catch (const ReceiptError &e) {
      threw = std::string(e.what()).rfind("PDF: ", 0) == 0;
    }
    if (!threw) {
      std::cerr << "Unwritable output not reported" << std::endl;
      return 1;
    }
  }

  fs::remove_all(dir);
  return 0;
}
