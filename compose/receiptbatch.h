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
#include "fallbackchain.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

struct BatchEntry {
  std::string donorName;
  std::optional<std::filesystem::path> path; // set when a receipt was written
  ReceiptTier tier = ReceiptTier::Primary;
  std::string error;                         // set when every tier failed
};

struct BatchSummary {
  size_t generated = 0;
  size_t failed = 0;
  std::vector<BatchEntry> entries; // one per donor, in input order
};

// Generates one receipt per donor, in order. A donor whose receipt could not
// be produced is counted as failed and the batch carries on.
BatchSummary RunReceiptBatch(const FallbackChain &chain,
                             const std::vector<DonorRecord> &donors,
                             const std::string &templateText,
                             const std::filesystem::path &outputDir);

// Reads a JSON array of objects; each object becomes a donor with its keys in
// file order. Values that are not strings are written in JSON form, except
// null which becomes an empty string.
bool LoadDonorsFromJson(const std::string &path, std::vector<DonorRecord> &donors,
                        std::string &error);
