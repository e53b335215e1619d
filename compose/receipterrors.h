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

#include <stdexcept>
#include <string>
#include <vector>

// Failures raised by the receipt pipeline. Only TotalFailure is expected to
// reach callers of the fallback chain.
class ReceiptError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Layout or drawing could not produce a content surface.
class RenderFailure : public ReceiptError {
public:
  using ReceiptError::ReceiptError;
};

// The content surface could not be merged onto the letterhead or the merged
// document could not be saved.
class CompositeFailure : public ReceiptError {
public:
  using ReceiptError::ReceiptError;
};

// Every strategy failed. Carries one "<tier>: <message>" entry per attempt.
class TotalFailure : public ReceiptError {
public:
  explicit TotalFailure(std::vector<std::string> failures)
      : ReceiptError(Describe(failures)), failures_(std::move(failures)) {}

  const std::vector<std::string> &Failures() const { return failures_; }

private:
  static std::string Describe(const std::vector<std::string> &failures) {
    std::string message = "All receipt strategies failed";
    for (const auto &failure : failures)
      message += "; " + failure;
    return message;
  }

  std::vector<std::string> failures_;
};
