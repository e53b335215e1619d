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

#include "logger.h"
#include "pagerenderer.h"
#include "receipterrors.h"
#include "resourcepaths.h"

#include <cctype>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

#include <podofo/podofo.h>

namespace fs = std::filesystem;
using namespace PoDoFo;

std::vector<LetterheadCandidate> BuildLetterheadCandidates(
    const std::optional<fs::path> &configured) {
  std::vector<LetterheadCandidate> candidates;
  if (configured && !configured->empty())
    candidates.push_back({*configured, "settings"});
  if (const char *env = std::getenv("LETTERPRESS_LETTERHEAD")) {
    if (*env != '\0')
      candidates.push_back({fs::u8path(env), "LETTERPRESS_LETTERHEAD"});
  }
  const fs::path resources = ResourcePaths::GetResourceRoot();
  if (!resources.empty()) {
    candidates.push_back({resources / ResourcePaths::LETTERHEAD_FILE, "resources"});
    candidates.push_back(
        {resources / ResourcePaths::PACKAGED_LETTERHEAD, "packaged template"});
  }
  const fs::path userData = ResourcePaths::GetUserDataDir();
  if (!userData.empty())
    candidates.push_back({userData / ResourcePaths::LETTERHEAD_FILE, "user data"});
  return candidates;
}

bool IsUsableLetterhead(const fs::path &path, std::string &reason) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    reason = "not found";
    return false;
  }
  if (!fs::is_regular_file(path, ec)) {
    reason = "not a regular file";
    return false;
  }
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    reason = "not readable";
    return false;
  }
  char header[5] = {};
  file.read(header, sizeof(header));
  if (file.gcount() != static_cast<std::streamsize>(sizeof(header)) ||
      std::string(header, sizeof(header)) != "%PDF-") {
    reason = "not a PDF file";
    return false;
  }
  return true;
}

std::optional<fs::path> LocateLetterhead(
    const std::vector<LetterheadCandidate> &candidates) {
  for (const auto &candidate : candidates) {
    std::string reason;
    if (IsUsableLetterhead(candidate.path, reason)) {
      Logger::Instance().Log("Letterhead: using " + candidate.path.string() +
                             " (" + candidate.origin + ")");
      return candidate.path;
    }
    // Missing defaults are expected; only explicit choices are worth a line.
    if (reason != "not found" || candidate.origin == "settings" ||
        candidate.origin == "LETTERPRESS_LETTERHEAD")
      Logger::Instance().Log("Letterhead: skipping " + candidate.path.string() +
                             " (" + candidate.origin + ": " + reason + ")");
  }
  Logger::Instance().Log("Letterhead: none found, receipts are written without one");
  return std::nullopt;
}

std::string SanitizeNameFragment(const std::string &fragment) {
  std::string out;
  out.reserve(fragment.size());
  for (unsigned char c : fragment) {
    if (c >= 0x80 || std::isalnum(c) || c == '-')
      out.push_back(static_cast<char>(c));
    else
      out.push_back('_');
  }
  return out;
}

std::string FormatFileTimestamp(std::chrono::system_clock::time_point when) {
  const std::time_t t = std::chrono::system_clock::to_time_t(when);
  std::tm local{};
#ifdef _WIN32
  localtime_s(&local, &t);
#else
  localtime_r(&t, &local);
#endif
  std::ostringstream ss;
  ss << std::put_time(&local, "%Y%m%d_%H%M%S");
  return ss.str();
}

fs::path MakeReceiptPath(const fs::path &dir, const std::string &prefix,
                         const std::string &firstName,
                         const std::string &lastName,
                         std::chrono::system_clock::time_point when) {
  std::string stem = SanitizeNameFragment(prefix);
  for (const std::string *fragment : {&firstName, &lastName}) {
    if (!fragment->empty())
      stem += "_" + SanitizeNameFragment(*fragment);
  }
  stem += "_" + FormatFileTimestamp(when);

  std::error_code ec;
  fs::path candidate = dir / (stem + ".pdf");
  for (int suffix = 2; fs::exists(candidate, ec); ++suffix)
    candidate = dir / (stem + "_" + std::to_string(suffix) + ".pdf");
  return candidate;
}

LetterheadCompositor::LetterheadCompositor(std::optional<fs::path> letterhead)
    : letterhead_(std::move(letterhead)) {}

void LetterheadCompositor::Compose(std::unique_ptr<const ContentSurface> surface,
                                   const fs::path &output) const {
  if (!surface)
    throw ReceiptError("Letterhead: no content surface to compose");
  if (letterhead_) {
    MergeOntoLetterhead(*surface, output);
    return;
  }
  std::string error;
  if (!surface->WriteTo(output, error))
    throw ReceiptError("PDF: " + error);
}

void LetterheadCompositor::MergeOntoLetterhead(const ContentSurface &surface,
                                               const fs::path &output) const {
  const std::string letterheadName = letterhead_->string();
  try {
    PdfMemDocument document;
    document.Load(letterheadName);
    auto &pages = document.GetPages();
    if (pages.GetCount() == 0)
      throw CompositeFailure("Letterhead: " + letterheadName + " has no pages");
    while (pages.GetCount() > 1)
      pages.RemovePageAt(pages.GetCount() - 1);

    // Bring the overlay page into the letterhead document, wrap it in a form
    // XObject and paint that over the background page.
    const std::string overlayBytes = surface.Serialize();
    PdfMemDocument overlay;
    overlay.LoadFromBuffer(bufferview(overlayBytes.data(), overlayBytes.size()));
    pages.AppendDocumentPages(overlay, 0, 1);

    auto &background = pages.GetPageAt(0);
    auto &overlayPage = pages.GetPageAt(1);
    auto form = document.CreateXObjectForm(overlayPage.GetMediaBox());
    form->FillFromPage(overlayPage);

    const Rect box = background.GetMediaBox();
    PdfPainter painter;
    painter.SetCanvas(background);
    painter.DrawXObject(*form, box.GetLeft(), box.GetBottom());
    painter.FinishDrawing();

    pages.RemovePageAt(1);
    document.Save(output.string());
  } catch (const PdfError &e) {
    throw CompositeFailure("Letterhead: merging onto " + letterheadName +
                           " failed: " + e.what());
  }
}
