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
#include "stringutils.h"
#include <cassert>
#include <string>

int main() {
  using namespace StringUtils;

  assert(ToLowerCopy("Donation Amount") == "donation amount");
  assert(Trim("  Jane \t") == "Jane");
  assert(Trim("   ").empty());

  std::string text = "{Name} and {Name}";
  assert(ReplaceAll(text, "{Name}", "Jane") == 2);
  assert(text == "Jane and Jane");
  assert(ReplaceAll(text, "", "x") == 0);

  // Replacement containing the pattern must not loop.
  std::string nested = "aa";
  assert(ReplaceAll(nested, "a", "aa") == 2);
  assert(nested == "aaaa");

  auto items = SplitCSV(" dear, donation amount ,, donation(s) year ");
  assert(items.size() == 3);
  assert(items[1] == "donation amount");
  assert(JoinCSV(items) == "dear,donation amount,donation(s) year");

  return 0;
}
