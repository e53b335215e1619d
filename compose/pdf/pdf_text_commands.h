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

#include "pdf_objects.h"

#include <sstream>
#include <string>

namespace receipt_pdf_internal {

// Horizontal shear applied to upright faces drawn as italic.
inline constexpr double kItalicSkew = 0.2;

// Escapes WinAnsi bytes for a literal string operand; bytes outside
// printable ASCII are written as octal escapes.
std::string EscapePdfString(const std::string &winAnsi);

struct TextRun {
  double x = 0.0; // baseline origin in page space
  double y = 0.0;
  std::string winAnsi;
  std::string fontKey;
  double fontSize = 12.0;
  bool skew = false; // synthesize italic from an upright face
};

void AppendTextRun(std::ostringstream &out, const FloatFormatter &fmt,
                   const TextRun &run);

} // namespace receipt_pdf_internal
