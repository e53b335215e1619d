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

#include "donorrecord.h"

#include <chrono>
#include <string>
#include <vector>

// Values supplied by the compositor rather than the donor row.
struct SystemValues {
  std::string date; // e.g. "October 17, 2026"
  std::string year; // e.g. "2026"

  static SystemValues FromTime(std::chrono::system_clock::time_point now);
};

struct SubstitutionOptions {
  // Fields whose numeric values are printed with two decimals.
  std::vector<std::string> amountFields;
};

struct SubstitutionResult {
  std::string text;
  // Placeholder names still present after substitution, in order of first
  // appearance.
  std::vector<std::string> unresolved;
};

// Replaces {Field} and {{Field}} placeholders with donor values, then with
// system values ({Date}, {Year}, {Current Year}) for names the donor row does
// not define. Unknown placeholders are left in place.
SubstitutionResult SubstituteVariables(const std::string &templateText,
                                       const DonorRecord &donor,
                                       const SystemValues &system,
                                       const SubstitutionOptions &options = {});

std::vector<std::string> FindUnresolvedPlaceholders(const std::string &text);

// "250" -> "250.00". Values that are not plain numbers are returned as-is.
std::string FormatAmount(const std::string &value);
