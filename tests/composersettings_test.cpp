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
#include "composersettings.h"

#include <cassert>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>

int main() {
  ComposerSettings settings;

  // Defaults describe US Letter with a 2 in left/top margin.
  PageGeometry page = settings.GetPageGeometry();
  assert(page.pageWidth == 612.0 && page.pageHeight == 792.0);
  assert(page.marginLeft == 144.0 && page.marginTop == 144.0);
  assert(page.ContentWidth() == 612.0 - 144.0 - 72.0);
  assert(settings.GetTextMetrics().fontSize == 12.0);
  assert(settings.CompressStreams());
  assert(!settings.GetLetterheadOverride());

  // Registered floats are clamped on the way in and on the way out.
  settings.SetValue("font_size", "96");
  assert(settings.GetFloat("font_size") == 24.0f);
  settings.SetFloat("line_height_pt", 2.0f);
  assert(settings.GetFloat("line_height_pt") == 8.0f);
  settings.SetValue("paragraph_gap_pt", "not a number");
  assert(settings.GetFloat("paragraph_gap_pt") == 12.0f);

  auto keywords = settings.GetBoldKeywords();
  assert(keywords.size() == 3 && keywords[0] == "dear");
  settings.SetBoldKeywords({"thank you"});
  assert(settings.GetBoldKeywords().size() == 1);
  auto amounts = settings.GetAmountFields();
  assert(amounts.size() == 3 && amounts[0] == "Donation Amount");

  settings.SetValue("compress_streams", "no");
  assert(!settings.CompressStreams());
  settings.SetValue("letterhead_path", "  /tmp/head.pdf ");
  assert(settings.GetLetterheadOverride() &&
         settings.GetLetterheadOverride()->string() == "/tmp/head.pdf");
  settings.SetValue("org_name", "NSNA Atlanta");

  const std::filesystem::path out = std::filesystem::temp_directory_path() /
                                    "letterpress_composersettings_test.json";
  assert(settings.SaveToFile(out.string()));

  ComposerSettings loaded;
  assert(loaded.LoadFromFile(out.string()));
  assert(loaded.GetFloat("font_size") == 24.0f);
  assert(loaded.GetOrgName() == "NSNA Atlanta");
  assert(!loaded.CompressStreams());
  assert(loaded.GetBoldKeywords().size() == 1);

  // Malformed files are rejected and leave the settings untouched.
  {
    std::ofstream bad(out);
    bad << "{ not json";
  }
  ComposerSettings untouched;
  assert(!untouched.LoadFromFile(out.string()));
  assert(untouched.GetFloat("font_size") == 12.0f);
  assert(!untouched.LoadFromFile((out.parent_path() / "missing_letterpress.json").string()));

  // The user config lives under LETTERPRESS_DATA_DIR.
  const std::filesystem::path dataDir =
      std::filesystem::temp_directory_path() / "letterpress_settings_data";
  setenv("LETTERPRESS_DATA_DIR", dataDir.string().c_str(), 1);
  assert(ComposerSettings::GetUserConfigFile() == (dataDir / "settings.json").string());

  std::error_code ec;
  std::filesystem::remove(out, ec);
  return 0;
}
