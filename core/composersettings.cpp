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

#include "resourcepaths.h"
#include "stringutils.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace {
bool TryParseFloat(const std::string &text, float &out) {
  const std::string trimmed = StringUtils::Trim(text);
  if (trimmed.empty())
    return false;
  const char *begin = trimmed.data();
  const char *end = begin + trimmed.size();
  auto [ptr, ec] = std::from_chars(begin, end, out);
  return ec == std::errc() && ptr == end;
}
} // namespace

ComposerSettings::ComposerSettings() {
  RegisterVariable("font_size", "float", 12.0f, 6.0f, 24.0f);
  RegisterVariable("line_height_pt", "float", 18.0f, 8.0f, 48.0f);
  RegisterVariable("paragraph_gap_pt", "float", 12.0f, 0.0f, 72.0f);
  RegisterVariable("list_indent_pt", "float", 18.0f, 0.0f, 72.0f);
  RegisterVariable("margin_left_pt", "float", 144.0f, 0.0f, 400.0f);
  RegisterVariable("margin_right_pt", "float", 72.0f, 0.0f, 400.0f);
  RegisterVariable("margin_top_pt", "float", 144.0f, 0.0f, 600.0f);
  RegisterVariable("margin_bottom_pt", "float", 72.0f, 0.0f, 600.0f);
  RegisterVariable("page_width_pt", "float", 612.0f, 144.0f, 2000.0f);
  RegisterVariable("page_height_pt", "float", 792.0f, 144.0f, 2000.0f);
  ApplyStringDefaults();
  ApplyDefaults();
}

void ComposerSettings::SetValue(const std::string &key,
                                const std::string &value) {
  std::string newValue = value;

  auto var = variables.find(key);
  if (var != variables.end() && var->second.type == "float") {
    float parsed = 0.0f;
    if (TryParseFloat(value, parsed)) {
      parsed = std::clamp(parsed, var->second.minValue, var->second.maxValue);
      var->second.value = parsed;
      newValue = std::to_string(parsed);
    }
  }

  configData[key] = newValue;
}

std::optional<std::string>
ComposerSettings::GetValue(const std::string &key) const {
  auto it = configData.find(key);
  if (it != configData.end())
    return it->second;
  return std::nullopt;
}

bool ComposerSettings::HasKey(const std::string &key) const {
  return configData.find(key) != configData.end();
}

void ComposerSettings::RegisterVariable(const std::string &name,
                                        const std::string &type, float defVal,
                                        float minVal, float maxVal) {
  VariableInfo info;
  info.type = type;
  info.defaultValue = defVal;
  info.value = defVal;
  info.minValue = minVal;
  info.maxValue = maxVal;
  variables[name] = info;
}

float ComposerSettings::GetFloat(const std::string &name) const {
  auto it = variables.find(name);
  float defVal = 0.0f;
  if (it != variables.end())
    defVal = it->second.defaultValue;

  auto valStr = GetValue(name);
  if (valStr) {
    float parsed = 0.0f;
    if (TryParseFloat(*valStr, parsed)) {
      if (it != variables.end())
        parsed = std::clamp(parsed, it->second.minValue, it->second.maxValue);
      return parsed;
    }
  }
  return defVal;
}

void ComposerSettings::SetFloat(const std::string &name, float v) {
  auto it = variables.find(name);
  if (it != variables.end()) {
    v = std::clamp(v, it->second.minValue, it->second.maxValue);
    it->second.value = v;
  }
  SetValue(name, std::to_string(v));
}

void ComposerSettings::ApplyDefaults() {
  for (const auto &[name, info] : variables) {
    float value = info.defaultValue;
    auto raw = GetValue(name);
    if (raw) {
      float parsed = 0.0f;
      if (TryParseFloat(*raw, parsed))
        value = std::clamp(parsed, info.minValue, info.maxValue);
    }
    SetValue(name, std::to_string(value));
  }
}

void ComposerSettings::ApplyStringDefaults() {
  if (!HasKey("bold_keywords"))
    SetValue("bold_keywords", "dear,donation amount,donation(s) year");
  if (!HasKey("amount_fields"))
    SetValue("amount_fields", "Donation Amount,Amount,Value of Item");
  if (!HasKey("compress_streams"))
    SetValue("compress_streams", "1");
}

std::optional<std::filesystem::path>
ComposerSettings::GetLetterheadOverride() const {
  auto val = GetValue("letterhead_path");
  if (!val || StringUtils::Trim(*val).empty())
    return std::nullopt;
  return std::filesystem::u8path(StringUtils::Trim(*val));
}

std::filesystem::path ComposerSettings::GetOutputDir() const {
  auto val = GetValue("output_dir");
  if (!val || StringUtils::Trim(*val).empty())
    return ResourcePaths::GetDefaultReceiptsDir();
  return std::filesystem::u8path(StringUtils::Trim(*val));
}

std::string ComposerSettings::GetOrgName() const {
  auto val = GetValue("org_name");
  return val ? StringUtils::Trim(*val) : std::string();
}

std::vector<std::string> ComposerSettings::GetBoldKeywords() const {
  auto val = GetValue("bold_keywords");
  if (val)
    return StringUtils::SplitCSV(*val);
  return {};
}

void ComposerSettings::SetBoldKeywords(
    const std::vector<std::string> &keywords) {
  SetValue("bold_keywords", StringUtils::JoinCSV(keywords));
}

std::vector<std::string> ComposerSettings::GetAmountFields() const {
  auto val = GetValue("amount_fields");
  if (val)
    return StringUtils::SplitCSV(*val);
  return {};
}

void ComposerSettings::SetAmountFields(const std::vector<std::string> &fields) {
  SetValue("amount_fields", StringUtils::JoinCSV(fields));
}

bool ComposerSettings::CompressStreams() const {
  auto val = GetValue("compress_streams");
  if (!val)
    return true;
  const std::string lower = StringUtils::ToLowerCopy(StringUtils::Trim(*val));
  return !(lower == "0" || lower == "false" || lower == "no");
}

PageGeometry ComposerSettings::GetPageGeometry() const {
  PageGeometry geometry;
  geometry.pageWidth = GetFloat("page_width_pt");
  geometry.pageHeight = GetFloat("page_height_pt");
  geometry.marginLeft = GetFloat("margin_left_pt");
  geometry.marginRight = GetFloat("margin_right_pt");
  geometry.marginTop = GetFloat("margin_top_pt");
  geometry.marginBottom = GetFloat("margin_bottom_pt");
  return geometry;
}

TextMetricsSettings ComposerSettings::GetTextMetrics() const {
  TextMetricsSettings metrics;
  metrics.fontSize = GetFloat("font_size");
  metrics.lineHeight = GetFloat("line_height_pt");
  metrics.paragraphGap = GetFloat("paragraph_gap_pt");
  metrics.listIndent = GetFloat("list_indent_pt");
  return metrics;
}

bool ComposerSettings::LoadFromFile(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open())
    return false;

  nlohmann::json j;
  try {
    file >> j;
  } catch (const nlohmann::json::exception &) {
    return false;
  }
  if (!j.is_object())
    return false;

  std::unordered_map<std::string, std::string> loaded;
  for (auto it = j.begin(); it != j.end(); ++it) {
    if (it.value().is_string())
      loaded[it.key()] = it.value().get<std::string>();
    else if (it.value().is_number() || it.value().is_boolean())
      loaded[it.key()] = it.value().dump();
  }
  configData = std::move(loaded);
  ApplyStringDefaults();
  ApplyDefaults();
  return true;
}

bool ComposerSettings::SaveToFile(const std::string &path) const {
  std::ofstream file(path, std::ios::binary);
  if (!file.is_open())
    return false;

  nlohmann::json j(configData);
  file << j.dump(4);
  return true;
}

std::string ComposerSettings::GetUserConfigFile() {
  std::filesystem::path p = ResourcePaths::GetUserDataDir();
  std::error_code ec;
  std::filesystem::create_directories(p, ec);
  p /= "settings.json";
  return p.string();
}

bool ComposerSettings::LoadUserConfig() {
  return LoadFromFile(GetUserConfigFile());
}
