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
#include "receiptbatch.h"

#include "logger.h"
#include "receipterrors.h"

#include <chrono>
#include <fstream>

#include <nlohmann/json.hpp>

BatchSummary RunReceiptBatch(const FallbackChain &chain,
                             const std::vector<DonorRecord> &donors,
                             const std::string &templateText,
                             const std::filesystem::path &outputDir) {
  BatchSummary summary;
  for (const auto &donor : donors) {
    BatchEntry entry;
    entry.donorName = donor.DisplayName();

    ReceiptRequest request;
    request.donor = donor;
    request.templateText = templateText;
    request.outputDir = outputDir;
    request.when = std::chrono::system_clock::now();
    try {
      ReceiptResult result = chain.Generate(request);
      entry.path = result.path;
      entry.tier = result.tier;
      ++summary.generated;
    } catch (const TotalFailure &e) {
      entry.error = e.what();
      ++summary.failed;
    }
    summary.entries.push_back(std::move(entry));
  }
  Logger::Instance().Log("Receipt: batch finished, " +
                         std::to_string(summary.generated) + " generated, " +
                         std::to_string(summary.failed) + " failed");
  return summary;
}

bool LoadDonorsFromJson(const std::string &path, std::vector<DonorRecord> &donors,
                        std::string &error) {
  std::ifstream file(path);
  if (!file.is_open()) {
    error = "Unable to open donor file '" + path + "'";
    return false;
  }
  nlohmann::ordered_json json;
  try {
    file >> json;
  } catch (const nlohmann::json::exception &e) {
    error = "Invalid donor file '" + path + "': " + e.what();
    return false;
  }
  if (!json.is_array()) {
    error = "Donor file '" + path + "' must contain a JSON array";
    return false;
  }

  std::vector<DonorRecord> loaded;
  for (size_t i = 0; i < json.size(); ++i) {
    const auto &row = json[i];
    if (!row.is_object()) {
      error = "Donor entry " + std::to_string(i + 1) + " is not an object";
      return false;
    }
    DonorRecord donor;
    for (const auto &item : row.items()) {
      const std::string &key = item.key();
      const auto &value = item.value();
      if (value.is_string())
        donor.Set(key, value.get<std::string>());
      else if (value.is_null())
        donor.Set(key, std::string());
      else
        donor.Set(key, value.dump());
    }
    loaded.push_back(std::move(donor));
  }
  donors = std::move(loaded);
  return true;
}
