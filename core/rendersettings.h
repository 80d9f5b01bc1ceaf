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
#pragma once

#include <string>

namespace inspectdoc {

// Engine level settings shared by every render.
struct RenderSettings {
  std::string storagePublicUrl;       // Public base URL of object storage
  std::string uploadsDir = "uploads"; // Local upload directory
  int fetchRetries = 3;
  int backoffBaseMs = 500;
  int fetchTimeoutSeconds = 15;
  std::string userAgent = "Mozilla/5.0";
  std::string regularFontPath;
  std::string boldFontPath;
};

// Reads the keys present in a JSON settings file over settings.
bool LoadRenderSettingsFile(const std::string &path, RenderSettings &settings,
                            std::string &error);

// Applies INSPECTDOC_* environment overrides.
void ApplyEnvironmentOverrides(RenderSettings &settings);

// Defaults, then the optional settings file, then the environment.
RenderSettings LoadRenderSettings(const std::string &path = {});

} // namespace inspectdoc
