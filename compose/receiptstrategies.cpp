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
#include "receiptstrategies.h"

#include "inlineparser.h"
#include "letterheadcompositor.h"
#include "linelayout.h"
#include "logger.h"
#include "markupnormalizer.h"
#include "pagerenderer.h"
#include "receiptfonts.h"
#include "stringutils.h"
#include "substitution.h"

namespace fs = std::filesystem;

namespace {

constexpr const char *kReceiptPrefix = "receipt";

LayoutOptions LayoutOptionsFrom(const ComposerSettings &settings) {
  const PageGeometry page = settings.GetPageGeometry();
  const TextMetricsSettings text = settings.GetTextMetrics();
  LayoutOptions options;
  options.contentWidth = page.ContentWidth();
  options.lineHeight = text.lineHeight;
  options.paragraphGap = text.paragraphGap;
  options.listIndent = text.listIndent;
  return options;
}

// Shared tail of every tier: measure, lay out, draw and compose.
fs::path RenderAndCompose(const std::vector<FormattingSegment> &segments,
                          FontBackend backend, const std::string &prefix,
                          const ComposerSettings &settings,
                          const ReceiptRequest &request,
                          const LetterheadCompositor &compositor) {
  const TextMetricsSettings text = settings.GetTextMetrics();
  std::unique_ptr<ReceiptFontSet> fonts = ReceiptFontSet::Load(backend, text.fontSize);
  const LayoutResult layout =
      LayoutSegments(segments, *fonts, LayoutOptionsFrom(settings));

  RenderOptions renderOptions;
  renderOptions.page = settings.GetPageGeometry();
  renderOptions.fontSize = text.fontSize;
  renderOptions.compressStreams = settings.CompressStreams();
  std::unique_ptr<const ContentSurface> surface =
      RenderContentSurface(layout, *fonts, renderOptions);

  const fs::path output =
      MakeReceiptPath(request.outputDir, prefix, request.donor.FirstName(),
                      request.donor.LastName(), request.when);
  compositor.Compose(std::move(surface), output);
  return output;
}

} // namespace

const char *TierName(ReceiptTier tier) {
  switch (tier) {
  case ReceiptTier::Primary:
    return "Primary";
  case ReceiptTier::Secondary:
    return "Secondary";
  case ReceiptTier::Bare:
    return "Bare";
  }
  return "Unknown";
}

std::string SubstituteRequest(const ReceiptRequest &request,
                              const ComposerSettings &settings) {
  SubstitutionOptions options;
  options.amountFields = settings.GetAmountFields();
  SubstitutionResult result =
      SubstituteVariables(request.templateText, request.donor,
                          SystemValues::FromTime(request.when), options);
  for (const auto &name : result.unresolved) {
    Logger::Instance().Log("Receipt: unresolved placeholder {" + name + "} for " +
                           request.donor.DisplayName());
  }
  return std::move(result.text);
}

std::vector<FormattingSegment> ApplyKeywordEmphasis(
    const std::string &normalized, const std::vector<std::string> &keywords) {
  const std::string text = StripMarkupTags(normalized);
  std::vector<std::string> lowered;
  for (const auto &keyword : keywords)
    lowered.push_back(StringUtils::ToLowerCopy(keyword));

  std::vector<FormattingSegment> segments;
  auto append = [&](const std::string &piece, bool bold) {
    if (piece.empty())
      return;
    if (!segments.empty() && segments.back().bold == bold) {
      segments.back().text += piece;
      return;
    }
    segments.push_back({piece, bold, false});
  };

  const std::string breakMarker = PARAGRAPH_BREAK;
  size_t start = 0;
  while (start <= text.size()) {
    size_t end = text.find(breakMarker, start);
    if (end == std::string::npos)
      end = text.size();
    const std::string paragraph = text.substr(start, end - start);
    const std::string lower = StringUtils::ToLowerCopy(paragraph);
    bool bold = false;
    for (const auto &keyword : lowered) {
      if (!keyword.empty() && lower.find(keyword) != std::string::npos) {
        bold = true;
        break;
      }
    }
    if (start > 0)
      append(breakMarker, false);
    append(paragraph, bold);
    if (end == text.size())
      break;
    start = end + breakMarker.size();
  }
  return segments;
}

std::string BareFilePrefix(const std::string &orgName) {
  const std::string org = StringUtils::Trim(orgName);
  if (org.empty())
    return kReceiptPrefix;
  return org + "_Receipt";
}

PrimaryStrategy::PrimaryStrategy(ComposerSettings settings)
    : settings_(std::move(settings)) {}

fs::path PrimaryStrategy::Generate(const ReceiptRequest &request,
                                   const LetterheadCompositor &compositor) const {
  const std::string normalized = NormalizeMarkup(SubstituteRequest(request, settings_));
  const std::vector<FormattingSegment> segments = ParseInlineFormatting(normalized);
  return RenderAndCompose(segments, FontBackend::EmbeddedTrueType, kReceiptPrefix,
                          settings_, request, compositor);
}

SecondaryStrategy::SecondaryStrategy(ComposerSettings settings)
    : settings_(std::move(settings)) {}

fs::path SecondaryStrategy::Generate(const ReceiptRequest &request,
                                     const LetterheadCompositor &compositor) const {
  const std::string normalized = NormalizeMarkup(SubstituteRequest(request, settings_));
  const std::vector<FormattingSegment> segments =
      ApplyKeywordEmphasis(normalized, settings_.GetBoldKeywords());
  return RenderAndCompose(segments, FontBackend::Type1, kReceiptPrefix, settings_,
                          request, compositor);
}

BareStrategy::BareStrategy(ComposerSettings settings)
    : settings_(std::move(settings)) {}

fs::path BareStrategy::Generate(const ReceiptRequest &request,
                                const LetterheadCompositor &compositor) const {
  const std::string normalized = NormalizeMarkup(SubstituteRequest(request, settings_));
  FormattingSegment plain;
  plain.text = StripMarkupTags(normalized);
  return RenderAndCompose({plain}, FontBackend::Type1,
                          BareFilePrefix(settings_.GetOrgName()), settings_,
                          request, compositor);
}
