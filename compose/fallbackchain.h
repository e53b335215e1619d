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
#include "receiptstrategies.h"

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct ReceiptResult {
  std::filesystem::path path;
  ReceiptTier tier = ReceiptTier::Primary;
  bool letterheadUsed = false;
  // "<tier>: <message>" for every attempt that failed before this one.
  std::vector<std::string> failures;
};

// Runs strategies in order until one produces a file. Any error moves on to
// the next strategy, except a CompositeFailure, which jumps straight to the
// Bare strategy with the letterhead switched off. When nothing succeeds a
// TotalFailure carrying every message is thrown.
class FallbackChain {
public:
  using LetterheadLocator = std::function<std::optional<std::filesystem::path>()>;

  FallbackChain(std::vector<std::unique_ptr<ReceiptStrategy>> strategies,
                LetterheadLocator locator);

  // Primary, Secondary and Bare strategies with the letterhead search driven
  // by the settings.
  static FallbackChain CreateDefault(const ComposerSettings &settings);

  // The letterhead is located again on every call.
  ReceiptResult Generate(const ReceiptRequest &request) const;

  size_t StrategyCount() const { return strategies_.size(); }

private:
  size_t NextBareIndex(size_t from) const;

  std::vector<std::unique_ptr<ReceiptStrategy>> strategies_;
  LetterheadLocator locator_;
};
