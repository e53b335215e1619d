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

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Page geometry in PDF points. The top and left margins place the content
// box below and to the right of the printed letterhead masthead.
struct PageGeometry {
  double pageWidth = 612.0;  // US Letter
  double pageHeight = 792.0;
  double marginLeft = 144.0; // 2 in
  double marginRight = 72.0;
  double marginTop = 144.0;
  double marginBottom = 72.0;

  double ContentWidth() const { return pageWidth - marginLeft - marginRight; }
  double ContentHeight() const { return pageHeight - marginTop - marginBottom; }
};

// Typographic constants shared by layout and rendering.
struct TextMetricsSettings {
  double fontSize = 12.0;
  double lineHeight = 18.0;
  double paragraphGap = 12.0;
  double listIndent = 18.0;
};

// Key/value settings for the compositor, persisted as a JSON object.
// Numeric settings are registered with a default and a clamping range.
class ComposerSettings {
public:
  struct VariableInfo {
    std::string type;
    float defaultValue = 0.0f;
    float value = 0.0f;
    float minValue = 0.0f;
    float maxValue = 0.0f;
  };

  ComposerSettings();

  void SetValue(const std::string &key, const std::string &value);
  std::optional<std::string> GetValue(const std::string &key) const;
  bool HasKey(const std::string &key) const;

  bool LoadFromFile(const std::string &path);
  bool SaveToFile(const std::string &path) const;
  static std::string GetUserConfigFile();
  bool LoadUserConfig();

  void RegisterVariable(const std::string &name, const std::string &type,
                        float defVal, float minVal, float maxVal);
  float GetFloat(const std::string &name) const;
  void SetFloat(const std::string &name, float v);
  void ApplyDefaults();

  std::optional<std::filesystem::path> GetLetterheadOverride() const;
  std::filesystem::path GetOutputDir() const;
  std::string GetOrgName() const;
  std::vector<std::string> GetBoldKeywords() const;
  void SetBoldKeywords(const std::vector<std::string> &keywords);
  std::vector<std::string> GetAmountFields() const;
  void SetAmountFields(const std::vector<std::string> &fields);
  bool CompressStreams() const;

  PageGeometry GetPageGeometry() const;
  TextMetricsSettings GetTextMetrics() const;

private:
  void ApplyStringDefaults();

  std::unordered_map<std::string, std::string> configData;
  std::unordered_map<std::string, VariableInfo> variables;
};
