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
#include "pdf_text_commands.h"

#include <cstdio>

namespace receipt_pdf_internal {

std::string EscapePdfString(const std::string &winAnsi) {
  std::string escaped;
  escaped.reserve(winAnsi.size());
  for (unsigned char ch : winAnsi) {
    switch (ch) {
    case '(':
    case ')':
    case '\\':
      escaped.push_back('\\');
      escaped.push_back(static_cast<char>(ch));
      break;
    case '\n':
      escaped.append("\\n");
      break;
    case '\r':
      escaped.append("\\r");
      break;
    case '\t':
      escaped.append("\\t");
      break;
    default:
      if (ch < 0x20 || ch > 0x7e) {
        char buffer[5] = {};
        std::snprintf(buffer, sizeof(buffer), "\\%03o", ch);
        escaped.append(buffer);
      } else {
        escaped.push_back(static_cast<char>(ch));
      }
      break;
    }
  }
  return escaped;
}

void AppendTextRun(std::ostringstream &out, const FloatFormatter &fmt,
                   const TextRun &run) {
  out << "BT\n/" << run.fontKey << ' ' << fmt.Format(run.fontSize)
      << " Tf\n0 0 0 rg\n";
  if (run.skew) {
    out << "1 0 " << fmt.Format(kItalicSkew) << " 1 " << fmt.Format(run.x)
        << ' ' << fmt.Format(run.y) << " Tm\n";
  } else {
    out << fmt.Format(run.x) << ' ' << fmt.Format(run.y) << " Td\n";
  }
  out << '(' << EscapePdfString(run.winAnsi) << ") Tj\nET\n";
}

} // namespace receipt_pdf_internal
