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
#include "receipterrors.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>

namespace fs = std::filesystem;

namespace {

enum class Outcome { Succeed, RenderFail, CompositeFail, CompositeFailWithLetterhead };

struct Call {
  ReceiptTier tier;
  bool letterhead;
};

class ScriptedStrategy : public ReceiptStrategy {
public:
  ScriptedStrategy(ReceiptTier tier, Outcome outcome, std::vector<Call> &calls)
      : tier_(tier), outcome_(outcome), calls_(calls) {}

  ReceiptTier Tier() const override { return tier_; }

  fs::path Generate(const ReceiptRequest &request,
                    const LetterheadCompositor &compositor) const override {
    const bool letterhead = compositor.Letterhead().has_value();
    calls_.push_back({tier_, letterhead});
    switch (outcome_) {
    case Outcome::RenderFail:
      throw RenderFailure(std::string(TierName(tier_)) + " could not lay out");
    case Outcome::CompositeFail:
      throw CompositeFailure("merge failed");
    case Outcome::CompositeFailWithLetterhead:
      if (letterhead)
        throw CompositeFailure("merge failed");
      break;
    case Outcome::Succeed:
      break;
    }
    return request.outputDir / (std::string(TierName(tier_)) + ".pdf");
  }

private:
  ReceiptTier tier_;
  Outcome outcome_;
  std::vector<Call> &calls_;
};

FallbackChain ScriptedChain(Outcome primary, Outcome secondary, Outcome bare,
                            std::vector<Call> &calls, int *locatorCalls = nullptr) {
  std::vector<std::unique_ptr<ReceiptStrategy>> strategies;
  strategies.push_back(
      std::make_unique<ScriptedStrategy>(ReceiptTier::Primary, primary, calls));
  strategies.push_back(
      std::make_unique<ScriptedStrategy>(ReceiptTier::Secondary, secondary, calls));
  strategies.push_back(std::make_unique<ScriptedStrategy>(ReceiptTier::Bare, bare, calls));
  return FallbackChain(std::move(strategies), [locatorCalls]() {
    if (locatorCalls)
      ++*locatorCalls;
    return std::optional<fs::path>("letterhead.pdf");
  });
}

ReceiptRequest SampleRequest(const fs::path &outputDir) {
  ReceiptRequest request;
  request.donor = DonorRecord{{"First Name", "Jane"},
                              {"Last Name", "Doe"},
                              {"Donation Amount", "250"}};
  request.templateText =
      "<p><strong>Dear {First Name}</strong>,</p>"
      "<p>Thank you for your gift of ${Donation Amount} on {Date}.</p>"
      "<ul><li>Receipt year {Year}</li></ul>";
  request.outputDir = outputDir;
  return request;
}

bool StartsWithPdfHeader(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  char header[5] = {};
  in.read(header, sizeof(header));
  return in.gcount() == 5 && std::string(header, 5) == "%PDF-";
}

} // namespace

int main() {
  const fs::path dir = fs::temp_directory_path() / "letterpress_fallback_test";
  fs::remove_all(dir);
  fs::create_directories(dir / "data");
  setenv("LETTERPRESS_DATA_DIR", (dir / "data").string().c_str(), 1);
  unsetenv("LETTERPRESS_LETTERHEAD");

  // The first strategy that succeeds wins.
  {
    std::vector<Call> calls;
    int located = 0;
    FallbackChain chain = ScriptedChain(Outcome::Succeed, Outcome::Succeed,
                                        Outcome::Succeed, calls, &located);
    ReceiptResult result = chain.Generate(SampleRequest(dir));
    if (result.tier != ReceiptTier::Primary || !result.letterheadUsed ||
        !result.failures.empty() || calls.size() != 1 ||
        result.path != dir / "Primary.pdf") {
      std::cerr << "Primary success not reported" << std::endl;
      return 1;
    }
    chain.Generate(SampleRequest(dir));
    if (located != 2 || chain.StrategyCount() != 3) {
      std::cerr << "Letterhead not located for every receipt" << std::endl;
      return 1;
    }
  }

  // A rendering failure falls through to the next tier.
  {
    std::vector<Call> calls;
    FallbackChain chain = ScriptedChain(Outcome::RenderFail, Outcome::Succeed,
                                        Outcome::Succeed, calls);
    ReceiptResult result = chain.Generate(SampleRequest(dir));
    if (result.tier != ReceiptTier::Secondary || !result.letterheadUsed ||
        result.failures.size() != 1 ||
        result.failures[0] != "Primary: Primary could not lay out") {
      std::cerr << "Secondary fallback not reported" << std::endl;
      return 1;
    }
  }

  // A compositing failure skips to Bare without the letterhead.
  {
    std::vector<Call> calls;
    FallbackChain chain = ScriptedChain(Outcome::CompositeFailWithLetterhead,
                                        Outcome::Succeed, Outcome::Succeed, calls);
    ReceiptResult result = chain.Generate(SampleRequest(dir));
    if (result.tier != ReceiptTier::Bare || result.letterheadUsed ||
        calls.size() != 2 || calls[1].tier != ReceiptTier::Bare ||
        calls[1].letterhead || result.failures.size() != 1 ||
        result.failures[0] != "Primary: merge failed") {
      std::cerr << "Compositing failure did not skip to Bare" << std::endl;
      return 1;
    }
  }

  // A compositing failure at Bare retries Bare without the letterhead.
  {
    std::vector<Call> calls;
    FallbackChain chain = ScriptedChain(Outcome::RenderFail, Outcome::RenderFail,
                                        Outcome::CompositeFailWithLetterhead, calls);
    ReceiptResult result = chain.Generate(SampleRequest(dir));
    if (result.tier != ReceiptTier::Bare || result.letterheadUsed ||
        calls.size() != 4 || result.failures.size() != 3) {
      std::cerr << "Bare was not retried without the letterhead" << std::endl;
      return 1;
    }
  }

  // Nothing works: every message is carried by the final error.
  {
    std::vector<Call> calls;
    FallbackChain chain = ScriptedChain(Outcome::RenderFail, Outcome::RenderFail,
                                        Outcome::RenderFail, calls);
    bool threw = false;
    try {
      chain.Generate(SampleRequest(dir));
    } catch (const TotalFailure &e) {
      threw = e.Failures().size() == 3 &&
              e.Failures()[0].rfind("Primary: ", 0) == 0 &&
              e.Failures()[1].rfind("Secondary: ", 0) == 0 &&
              e.Failures()[2].rfind("Bare: ", 0) == 0 &&
              std::string(e.what()).find("Bare could not lay out") != std::string::npos;
    }
    if (!threw) {
      std::cerr << "TotalFailure not raised with every message" << std::endl;
      return 1;
    }
  }

  // Compositing fails even without a letterhead.
  {
    std::vector<Call> calls;
    FallbackChain chain = ScriptedChain(Outcome::CompositeFail, Outcome::Succeed,
                                        Outcome::CompositeFail, calls);
    bool threw = false;
    try {
      chain.Generate(SampleRequest(dir));
    } catch (const TotalFailure &e) {
      threw = e.Failures().size() == 2 && calls.size() == 2;
    }
    if (!threw) {
      std::cerr << "Repeated compositing failure not fatal" << std::endl;
      return 1;
    }
  }

  // The default chain writes a receipt when no letterhead can be found.
  {
    ComposerSettings settings;
    settings.SetValue("letterhead_path", (dir / "absent.pdf").string());
    FallbackChain chain = FallbackChain::CreateDefault(settings);
    const fs::path out = dir / "receipts";
    ReceiptResult result = chain.Generate(SampleRequest(out));
    if (result.tier != ReceiptTier::Primary || result.letterheadUsed ||
        !fs::exists(result.path) || !StartsWithPdfHeader(result.path) ||
        result.path.parent_path() != out ||
        result.path.filename().string().rfind("receipt_Jane_Doe_", 0) != 0) {
      std::cerr << "Default chain did not write a bare receipt" << std::endl;
      return 1;
    }
  }

  // A damaged letterhead sends the default chain to the Bare tier.
  {
    {
      std::ofstream broken(dir / "broken.pdf", std::ios::binary);
      broken << "%PDF-1.4\ntruncated\n";
    }
    ComposerSettings settings;
    settings.SetValue("letterhead_path", (dir / "broken.pdf").string());
    settings.SetValue("org_name", "Hope Shelter");
    FallbackChain chain = FallbackChain::CreateDefault(settings);
    ReceiptResult result = chain.Generate(SampleRequest(dir / "receipts"));
    if (result.tier != ReceiptTier::Bare || result.letterheadUsed ||
        result.failures.size() != 1 || !StartsWithPdfHeader(result.path) ||
        result.path.filename().string().rfind("Hope_Shelter_Receipt_Jane_Doe_", 0) != 0) {
      std::cerr << "Damaged letterhead did not fall back to Bare" << std::endl;
      return 1;
    }
  }

  fs::remove_all(dir);
  return 0;
}
