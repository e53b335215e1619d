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
#include "composersettings.h"
#include "fallbackchain.h"
#include "logger.h"
#include "receiptbatch.h"

#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace {

struct CommandLine {
  std::string templatePath;
  std::string donorsPath;
  std::string configPath;
  std::string outputDir;
  std::string letterheadPath;
  std::string orgName;
};

void PrintUsage(const char *program) {
  std::cout << "Usage: " << program
            << " --template FILE --donors FILE [options]\n"
               "\n"
               "  --template FILE    receipt template ({Field} placeholders, markup)\n"
               "  --donors FILE      JSON array of donor objects\n"
               "  --config FILE      settings file (defaults to the user settings)\n"
               "  --output DIR       directory receipts are written to\n"
               "  --letterhead FILE  letterhead PDF placed behind each receipt\n"
               "  --org NAME         organization name used for plain receipts\n"
               "  --help             show this message\n";
}

// Returns false on malformed arguments.
bool ParseCommandLine(int argc, char **argv, CommandLine &cmd, bool &help) {
  struct Option {
    const char *name;
    std::string *target;
  } options[] = {
      {"--template", &cmd.templatePath}, {"--donors", &cmd.donorsPath},
      {"--config", &cmd.configPath},     {"--output", &cmd.outputDir},
      {"--letterhead", &cmd.letterheadPath}, {"--org", &cmd.orgName},
  };
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
      help = true;
      return true;
    }
    bool matched = false;
    for (auto &option : options) {
      if (std::strcmp(argv[i], option.name) != 0)
        continue;
      if (i + 1 >= argc) {
        std::cerr << option.name << " needs a value\n";
        return false;
      }
      *option.target = argv[++i];
      matched = true;
      break;
    }
    if (!matched) {
      std::cerr << "Unknown argument: " << argv[i] << "\n";
      return false;
    }
  }
  if (cmd.templatePath.empty() || cmd.donorsPath.empty()) {
    std::cerr << "--template and --donors are required\n";
    return false;
  }
  return true;
}

bool ReadTextFile(const std::string &path, std::string &out) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open())
    return false;
  std::ostringstream buffer;
  buffer << file.rdbuf();
  out = buffer.str();
  return true;
}

} // namespace

int main(int argc, char **argv) {
  CommandLine cmd;
  bool help = false;
  if (!ParseCommandLine(argc, argv, cmd, help)) {
    PrintUsage(argv[0]);
    return 2;
  }
  if (help) {
    PrintUsage(argv[0]);
    return 0;
  }

  ComposerSettings settings;
  if (!cmd.configPath.empty()) {
    if (!settings.LoadFromFile(cmd.configPath)) {
      std::cerr << "Unable to load settings from " << cmd.configPath << "\n";
      return 2;
    }
  } else if (!settings.LoadUserConfig()) {
    Logger::Instance().Log("Receipt: no user settings at " +
                           ComposerSettings::GetUserConfigFile() +
                           ", using defaults");
  }
  if (!cmd.outputDir.empty())
    settings.SetValue("output_dir", cmd.outputDir);
  if (!cmd.letterheadPath.empty())
    settings.SetValue("letterhead_path", cmd.letterheadPath);
  if (!cmd.orgName.empty())
    settings.SetValue("org_name", cmd.orgName);

  std::string templateText;
  if (!ReadTextFile(cmd.templatePath, templateText)) {
    std::cerr << "Unable to read template " << cmd.templatePath << "\n";
    return 2;
  }
  std::vector<DonorRecord> donors;
  std::string error;
  if (!LoadDonorsFromJson(cmd.donorsPath, donors, error)) {
    std::cerr << error << "\n";
    return 2;
  }

  Logger::Instance().Log("Receipt: generating " + std::to_string(donors.size()) +
                         " receipt(s) from " + cmd.templatePath);
  const FallbackChain chain = FallbackChain::CreateDefault(settings);
  const BatchSummary summary =
      RunReceiptBatch(chain, donors, templateText, settings.GetOutputDir());

  for (const auto &entry : summary.entries) {
    if (entry.path)
      std::cout << "OK    " << entry.donorName << " -> " << entry.path->string()
                << " (" << TierName(entry.tier) << ")\n";
    else
      std::cout << "FAIL  " << entry.donorName << ": " << entry.error << "\n";
  }
  std::cout << summary.generated << " generated, " << summary.failed
            << " failed\n";

  Logger::Instance().Flush();
  return summary.failed == 0 ? 0 : 1;
}
