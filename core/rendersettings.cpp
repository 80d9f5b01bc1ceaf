/*
 * This file is part of InspectDoc.
 * Copyright (C) 2025 Luisma Peramato
 *
 * InspectDoc is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * InspectDoc is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with InspectDoc. If not, see <https://www.gnu.org/licenses/>.
 */
#include "rendersettings.h"

#include <algorithm>
#include <cstdlib>
#include <fstream>

#include <nlohmann/json.hpp>

#include "logger.h"

namespace inspectdoc {
namespace {

void ReadString(const nlohmann::json &j, const char *key, std::string &target) {
  const auto it = j.find(key);
  if (it != j.end() && it->is_string())
    target = it->get<std::string>();
}

void ReadInt(const nlohmann::json &j, const char *key, int &target, int minValue,
             int maxValue) {
  const auto it = j.find(key);
  if (it != j.end() && it->is_number_integer())
    target = std::clamp(it->get<int>(), minValue, maxValue);
}

bool EnvInt(const char *name, int &target, int minValue, int maxValue) {
  const char *value = std::getenv(name);
  if (!value || !*value)
    return false;
  char *end = nullptr;
  const long parsed = std::strtol(value, &end, 10);
  if (end == value || *end != '\0') {
    Logger::Instance().Warn(std::string("PDF render: ignoring non-numeric ") + name);
    return false;
  }
  target = static_cast<int>(std::clamp<long>(parsed, minValue, maxValue));
  return true;
}

void EnvString(const char *name, std::string &target) {
  const char *value = std::getenv(name);
  if (value && *value)
    target = value;
}

} // namespace

bool LoadRenderSettingsFile(const std::string &path, RenderSettings &settings,
                            std::string &error) {
  std::ifstream file(path);
  if (!file.is_open()) {
    error = "Unable to open settings file " + path;
    return false;
  }
  nlohmann::json j;
  try {
    file >> j;
  } catch (const nlohmann::json::exception &ex) {
    error = std::string("Invalid settings JSON: ") + ex.what();
    return false;
  }
  if (!j.is_object()) {
    error = "Settings JSON must be an object";
    return false;
  }
  ReadString(j, "storage_public_url", settings.storagePublicUrl);
  ReadString(j, "uploads_dir", settings.uploadsDir);
  ReadInt(j, "fetch_retries", settings.fetchRetries, 1, 10);
  ReadInt(j, "backoff_base_ms", settings.backoffBaseMs, 0, 60000);
  ReadInt(j, "fetch_timeout_seconds", settings.fetchTimeoutSeconds, 1, 300);
  ReadString(j, "user_agent", settings.userAgent);
  ReadString(j, "font_regular", settings.regularFontPath);
  ReadString(j, "font_bold", settings.boldFontPath);
  return true;
}

void ApplyEnvironmentOverrides(RenderSettings &settings) {
  EnvString("INSPECTDOC_STORAGE_PUBLIC_URL", settings.storagePublicUrl);
  EnvString("INSPECTDOC_UPLOADS_DIR", settings.uploadsDir);
  EnvInt("INSPECTDOC_FETCH_RETRIES", settings.fetchRetries, 1, 10);
  EnvInt("INSPECTDOC_FETCH_TIMEOUT", settings.fetchTimeoutSeconds, 1, 300);
  EnvString("INSPECTDOC_FONT_REGULAR", settings.regularFontPath);
  EnvString("INSPECTDOC_FONT_BOLD", settings.boldFontPath);
}

RenderSettings LoadRenderSettings(const std::string &path) {
  RenderSettings settings;
  if (!path.empty()) {
    std::string error;
    if (!LoadRenderSettingsFile(path, settings, error))
      Logger::Instance().Warn("PDF render: " + error + ", using defaults");
  }
  ApplyEnvironmentOverrides(settings);
  while (!settings.storagePublicUrl.empty() &&
         settings.storagePublicUrl.back() == '/')
    settings.storagePublicUrl.pop_back();
  return settings;
}

} // namespace inspectdoc
