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
#include "fallbackchain.h"

#include "letterheadcompositor.h"
#include "logger.h"
#include "receipterrors.h"

#include <system_error>

namespace fs = std::filesystem;

FallbackChain::FallbackChain(std::vector<std::unique_ptr<ReceiptStrategy>> strategies,
                             LetterheadLocator locator)
    : strategies_(std::move(strategies)), locator_(std::move(locator)) {}

FallbackChain FallbackChain::CreateDefault(const ComposerSettings &settings) {
  std::vector<std::unique_ptr<ReceiptStrategy>> strategies;
  strategies.push_back(std::make_unique<PrimaryStrategy>(settings));
  strategies.push_back(std::make_unique<SecondaryStrategy>(settings));
  strategies.push_back(std::make_unique<BareStrategy>(settings));
  const std::optional<fs::path> configured = settings.GetLetterheadOverride();
  return FallbackChain(std::move(strategies), [configured]() {
    return LocateLetterhead(BuildLetterheadCandidates(configured));
  });
}

size_t FallbackChain::NextBareIndex(size_t from) const {
  for (size_t i = from; i < strategies_.size(); ++i) {
    if (strategies_[i]->Tier() == ReceiptTier::Bare)
      return i;
  }
  return strategies_.size();
}

ReceiptResult FallbackChain::Generate(const ReceiptRequest &request) const {
  const std::string donor = request.donor.DisplayName();
  const LetterheadCompositor withLetterhead(locator_ ? locator_() : std::nullopt);
  const LetterheadCompositor withoutLetterhead(std::nullopt);

  std::error_code ec;
  if (!request.outputDir.empty())
    fs::create_directories(request.outputDir, ec);

  std::vector<std::string> failures;
  bool compositingDisabled = false;
  size_t index = 0;
  while (index < strategies_.size()) {
    const ReceiptStrategy &strategy = *strategies_[index];
    const char *tier = TierName(strategy.Tier());
    const LetterheadCompositor &compositor =
        compositingDisabled ? withoutLetterhead : withLetterhead;
    try {
      ReceiptResult result;
      result.path = strategy.Generate(request, compositor);
      result.tier = strategy.Tier();
      result.letterheadUsed = compositor.Letterhead().has_value();
      result.failures = std::move(failures);
      Logger::Instance().Log("Receipt: generated " + result.path.string() + " for " +
                             donor + " (" + tier + " tier)");
      return result;
    } catch (const CompositeFailure &e) {
      failures.push_back(std::string(tier) + ": " + e.what());
      Logger::Instance().Log("Receipt: " + std::string(tier) + " tier failed for " +
                             donor + ": " + e.what());
      if (compositingDisabled)
        break;
      compositingDisabled = true;
      index = NextBareIndex(index);
      continue;
    } catch (const std::exception &e) {
      failures.push_back(std::string(tier) + ": " + e.what());
      Logger::Instance().Log("Receipt: " + std::string(tier) + " tier failed for " +
                             donor + ": " + e.what());
    }
    ++index;
  }

  Logger::Instance().Log("Receipt: every strategy failed for " + donor);
  throw TotalFailure(std::move(failures));
}
