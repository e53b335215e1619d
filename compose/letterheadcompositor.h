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

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class ContentSurface;

struct LetterheadCandidate {
  std::filesystem::path path;
  std::string origin; // where the candidate came from, for log messages
};

// Letterhead search order: configured path, LETTERPRESS_LETTERHEAD,
// <resources>/letterhead.pdf, <resources>/templates/letterhead_template.pdf,
// <user data>/letterhead.pdf.
std::vector<LetterheadCandidate> BuildLetterheadCandidates(
    const std::optional<std::filesystem::path> &configured);

// A usable letterhead is a readable regular file starting with "%PDF-".
bool IsUsableLetterhead(const std::filesystem::path &path, std::string &reason);

// First usable candidate, or nothing when the receipt must go without one.
std::optional<std::filesystem::path> LocateLetterhead(
    const std::vector<LetterheadCandidate> &candidates);

// Keeps ASCII letters, digits, '-' and UTF-8 bytes; everything else becomes
// '_'.
std::string SanitizeNameFragment(const std::string &fragment);

std::string FormatFileTimestamp(std::chrono::system_clock::time_point when);

// <dir>/<prefix>_<first>_<last>_<YYYYMMDD_HHMMSS>.pdf, with _2, _3, ...
// appended when the name is taken. Empty name fragments are left out.
std::filesystem::path MakeReceiptPath(const std::filesystem::path &dir,
                                      const std::string &prefix,
                                      const std::string &firstName,
                                      const std::string &lastName,
                                      std::chrono::system_clock::time_point when);

// Writes a content surface either merged onto the first page of a letterhead
// PDF or, without a letterhead, on its own.
class LetterheadCompositor {
public:
  explicit LetterheadCompositor(std::optional<std::filesystem::path> letterhead);

  const std::optional<std::filesystem::path> &Letterhead() const {
    return letterhead_;
  }

  // Throws CompositeFailure when the letterhead cannot be read or merged and
  // ReceiptError when the output cannot be written.
  void Compose(std::unique_ptr<const ContentSurface> surface,
               const std::filesystem::path &output) const;

private:
  void MergeOntoLetterhead(const ContentSurface &surface,
                           const std::filesystem::path &output) const;

  std::optional<std::filesystem::path> letterhead_;
};
