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
#include "inlineparser.h"
#include "letterheadcompositor.h"
#include "linelayout.h"
#include "markupnormalizer.h"
#include "receiptfonts.h"
#include "receiptstrategies.h"
#include "substitution.h"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

int main() {
  const DonorRecord donor{{"First Name", "Jane"},
                          {"Last Name", "Doe"},
                          {"Donation Amount", "250.00"}};
  const std::string templateText =
      "Dear {First Name} {Last Name},\n\n**Thank you** for ${Donation Amount}.";

  // Template through substitution, normalization and parsing.
  const SubstitutionResult substituted = SubstituteVariables(
      templateText, donor, SystemValues::FromTime(std::chrono::system_clock::now()));
  assert(substituted.unresolved.empty());
  assert(substituted.text == "Dear Jane Doe,\n\n**Thank you** for $250.00.");

  const std::string normalized = NormalizeMarkup(substituted.text);
  const std::vector<FormattingSegment> segments = ParseInlineFormatting(normalized);
  assert(segments.size() == 3);
  assert((segments[0] == FormattingSegment{"Dear Jane Doe,\n\n", false, false}));
  assert((segments[1] == FormattingSegment{"Thank you", true, false}));
  assert((segments[2] == FormattingSegment{" for $250.00.", false, false}));

  auto fonts = ReceiptFontSet::Load(FontBackend::Type1, 12.0);
  LayoutOptions options;
  options.contentWidth = PageGeometry{}.ContentWidth();
  const LayoutResult layout = LayoutSegments(segments, *fonts, options);
  assert(layout.paragraphCount == 2);
  assert(layout.lines.size() == 2);
  assert(layout.lines[0].Text() == "Dear Jane Doe,");
  assert(layout.lines[1].Text() == "Thank you for $250.00.");
  assert(layout.lines[1].runs.front().bold);
  assert(layout.lines[1].offsetY == options.lineHeight + options.paragraphGap);

  // An unmatched closing tag is dropped without disturbing the text.
  {
    const std::string text = NormalizeMarkup("Thanks</strong> for <b>all</b>");
    const std::vector<FormattingSegment> parsed = ParseInlineFormatting(text);
    assert(JoinSegmentText(parsed) == StripMarkupTags(text));
    assert(parsed.front().text == "Thanks for " && !parsed.front().bold);
    assert(parsed.back().text == "all" && parsed.back().bold);
  }

  // The secondary tier bolds whole paragraphs that mention a keyword.
  {
    const std::vector<FormattingSegment> emphasized = ApplyKeywordEmphasis(
        NormalizeMarkup("<p>Dear Jane,</p><p>Thanks for <b>all</b>.</p>"
                        "<p>DONATION AMOUNT: $5</p>"),
        {"dear", "donation amount"});
    assert(emphasized.size() == 3);
    assert((emphasized[0] == FormattingSegment{"Dear Jane,", true, false}));
    assert((emphasized[1] == FormattingSegment{"\n\nThanks for all.\n\n", false, false}));
    assert((emphasized[2] == FormattingSegment{"DONATION AMOUNT: $5", true, false}));
    assert(BareFilePrefix("  Hope Shelter ") == "Hope Shelter_Receipt");
    assert(BareFilePrefix("") == "receipt");
  }

  // The whole request through the primary strategy, without a letterhead.
  {
    const fs::path dir = fs::temp_directory_path() / "letterpress_scenario_test";
    fs::remove_all(dir);
    fs::create_directories(dir);
    ReceiptRequest request;
    request.donor = donor;
    request.templateText = templateText;
    request.outputDir = dir;
    PrimaryStrategy primary{ComposerSettings()};
    const fs::path written = primary.Generate(request, LetterheadCompositor(std::nullopt));
    assert(fs::exists(written));
    assert(written.parent_path() == dir);
    assert(written.filename().string().rfind("receipt_Jane_Doe_", 0) == 0);
    assert(written.extension() == ".pdf");
    fs::remove_all(dir);
  }

  std::cout << "receipt scenario passed" << std::endl;
  return 0;
}
