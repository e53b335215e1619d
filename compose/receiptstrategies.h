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

#include "composersettings.h"
#include "donorrecord.h"
#include "receipttypes.h"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

class LetterheadCompositor;

enum class ReceiptTier { Primary, Secondary, Bare };

const char *TierName(ReceiptTier tier);

struct ReceiptRequest {
  DonorRecord donor;
  std::string templateText;
  std::filesystem::path outputDir;
  std::chrono::system_clock::time_point when = std::chrono::system_clock::now();
};

// One way of turning a request into a receipt file. Implementations throw
// RenderFailure when they cannot lay out or draw the receipt and
// CompositeFailure when the letterhead merge fails.
class ReceiptStrategy {
public:
  virtual ~ReceiptStrategy() = default;

  virtual ReceiptTier Tier() const = 0;

  // Writes the receipt and returns its path.
  virtual std::filesystem::path Generate(const ReceiptRequest &request,
                                         const LetterheadCompositor &compositor) const = 0;
};

// Full markup: emphasis, lists and embedded TrueType metrics.
class PrimaryStrategy : public ReceiptStrategy {
public:
  explicit PrimaryStrategy(ComposerSettings settings);
  ReceiptTier Tier() const override { return ReceiptTier::Primary; }
  std::filesystem::path Generate(const ReceiptRequest &request,
                                 const LetterheadCompositor &compositor) const override;

private:
  ComposerSettings settings_;
};

// Helvetica measured with its AFM widths. Markup is discarded and a paragraph is set
// in bold when it mentions one of the configured keywords, which only
// approximates the template's own emphasis.
class SecondaryStrategy : public ReceiptStrategy {
public:
  explicit SecondaryStrategy(ComposerSettings settings);
  ReceiptTier Tier() const override { return ReceiptTier::Secondary; }
  std::filesystem::path Generate(const ReceiptRequest &request,
                                 const LetterheadCompositor &compositor) const override;

private:
  ComposerSettings settings_;
};

// Plain Helvetica text, named after the organization.
class BareStrategy : public ReceiptStrategy {
public:
  explicit BareStrategy(ComposerSettings settings);
  ReceiptTier Tier() const override { return ReceiptTier::Bare; }
  std::filesystem::path Generate(const ReceiptRequest &request,
                                 const LetterheadCompositor &compositor) const override;

private:
  ComposerSettings settings_;
};

// Substitutes the request's placeholders and logs the ones left unresolved.
std::string SubstituteRequest(const ReceiptRequest &request,
                              const ComposerSettings &settings);

// Paragraph-level emphasis used by the Secondary tier: tags are removed and
// every paragraph containing a keyword (case-insensitive) becomes bold.
std::vector<FormattingSegment> ApplyKeywordEmphasis(
    const std::string &normalized, const std::vector<std::string> &keywords);

// "<Org>_Receipt", or "receipt" when no organization is configured.
std::string BareFilePrefix(const std::string &orgName);
