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

#include <string>

// Rewrites the emphasis notations accepted in receipt templates into the
// canonical <strong>/<em> tag pairs and flattens block structure into
// paragraph ("\n\n") and line ("\n") markers.
//
// Supported input:
//   **text** and __text__            -> <strong>text</strong>
//   *text*                           -> <em>text</em>
//   <b>, <strong attr="..">          -> <strong>
//   <i>, <em attr="..">              -> <em>
//   <p>, <div>, <ul>, <ol>, <hr>     -> paragraph break
//   <br>, <br/>                      -> line break
//   <li>                             -> new line prefixed with "• " or "N. "
//   <h1>..<h6>                       -> bold paragraph
// Document scaffolding (doctype, html, head, style, body, comments) is
// dropped. Double delimiters are converted before single ones.
std::string NormalizeMarkup(const std::string &input);

// Individual passes, exposed for testing.
std::string ConvertStrongDelimiters(const std::string &text);
std::string ConvertEmphasisDelimiters(const std::string &text);
std::string CanonicalizeTags(const std::string &text);
std::string DecodeEntities(const std::string &text);
std::string CollapseBreaks(const std::string &text);
