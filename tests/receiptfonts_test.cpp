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
#include "markupnormalizer.h"
#include "receiptfonts.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>

using namespace receipt_pdf_internal;

namespace {

// Width of a line as drawn in Helvetica, independent of the font set.
double AfmWidth(const std::string &text, bool bold, double fontSize) {
  const std::array<uint16_t, 256> &widths =
      Type1WidthTable(bold ? PdfFontStyle::Bold : PdfFontStyle::Regular);
  double units = 0.0;
  for (unsigned char ch : EncodeWinAnsi(text))
    units += widths[ch];
  return units / 1000.0 * fontSize;
}

bool Near(double a, double b) { return std::abs(a - b) < 1e-6; }

} // namespace

int main() {
  auto fonts = ReceiptFontSet::Load(FontBackend::Type1, 12.0);
  assert(fonts->Backend() == FontBackend::Type1);

  // Type1 faces are measured with the Helvetica widths they are drawn with.
  assert(Near(fonts->Measure("WWWWWWWWWW", true, false), 113.28));
  assert(Near(fonts->Measure("M", false, false), 9.996));
  assert(Near(fonts->Measure("Thanks", false, true), fonts->Measure("Thanks", false, false)));
  assert(Near(fonts->Measure("Thanks", true, true), fonts->Measure("Thanks", true, false)));
  assert(fonts->Measure("iiii", false, false) < fonts->Measure("iiii", true, false));

  // A bold all-caps paragraph, as the keyword heuristic produces it, stays
  // inside the default content box when drawn. At 0.6 em per character the
  // first sentence would seem to fit on one line.
  const std::string caps = "MEMBERSHIP DONATION WE WARMLY THANK YOU FOR YOUR GIFT";
  assert(caps.size() * 0.6 * 12.0 <= 396.0);
  assert(AfmWidth(caps, true, 12.0) > 396.0);

  FormattingSegment paragraph{caps + " AND APPRECIATE YOUR SUPPORT OF OUR WORK", true,
                              false};
  LayoutOptions options;
  options.contentWidth = 396.0;
  const LayoutResult layout = LayoutSegments({paragraph}, *fonts, options);
  assert(layout.lines.size() >= 2);
  for (const auto &line : layout.lines) {
    const double drawn = AfmWidth(line.Text(), true, 12.0);
    assert(Near(line.Width(), drawn));
    assert(line.indent + drawn <= options.contentWidth + 1e-9);
  }

  // A no-break space keeps the name on one line.
  {
    const std::string text = NormalizeMarkup("Dear Jane&nbsp;Doe");
    LayoutOptions narrow;
    narrow.contentWidth = 60.0;
    const LayoutResult wrapped =
        LayoutSegments({FormattingSegment{text, false, false}}, *fonts, narrow);
    assert(wrapped.lines.size() == 2);
    assert(wrapped.lines[0].Text() == "Dear");
    assert(wrapped.lines[1].Text() == "Jane\xC2\xA0" "Doe");
    assert(wrapped.lines[1].Width() <= narrow.contentWidth);
  }

  std::cout << "receipt fonts passed" << std::endl;
  return 0;
}
