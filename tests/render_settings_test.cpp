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
#include "../core/rendersettings.h"
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using namespace inspectdoc;

int main() {
  const std::filesystem::path path =
      std::filesystem::temp_directory_path() / "inspectdoc_settings_test.json";
  {
    std::ofstream out(path);
    out << R"({"storage_public_url": "https://cdn.example.com/",
               "fetch_retries": 50, "backoff_base_ms": 250,
               "user_agent": 7})";
  }

  RenderSettings settings;
  std::string error;
  assert(LoadRenderSettingsFile(path.string(), settings, error));
  assert(settings.storagePublicUrl == "https://cdn.example.com/");
  assert(settings.fetchRetries == 10);
  assert(settings.backoffBaseMs == 250);
  assert(settings.userAgent == "Mozilla/5.0");

  RenderSettings untouched;
  assert(!LoadRenderSettingsFile(path.string() + ".missing", untouched, error));
  assert(!error.empty());
  assert(untouched.fetchRetries == 3);

  setenv("INSPECTDOC_FETCH_RETRIES", "2", 1);
  setenv("INSPECTDOC_UPLOADS_DIR", "/srv/uploads", 1);
  setenv("INSPECTDOC_FETCH_TIMEOUT", "soon", 1);
  RenderSettings loaded = LoadRenderSettings(path.string());
  assert(loaded.storagePublicUrl == "https://cdn.example.com");
  assert(loaded.fetchRetries == 2);
  assert(loaded.uploadsDir == "/srv/uploads");
  assert(loaded.fetchTimeoutSeconds == 15);

  // A missing file leaves the defaults in place.
  unsetenv("INSPECTDOC_FETCH_RETRIES");
  RenderSettings defaults = LoadRenderSettings(path.string() + ".missing");
  assert(defaults.fetchRetries == 3);
  assert(defaults.backoffBaseMs == 500);

  std::filesystem::remove(path);
  return 0;
}
