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
#include "../core/layoutconfig.h"
#include <cassert>
#include <string>

using namespace inspectdoc;

int main() {
  // Null, empty and malformed input resolve to the defaults.
  {
    LayoutConfig c = ResolveLayoutConfig(nullptr);
    assert(c.style == "default");
    assert(!c.coverPage.enabled);
    assert(c.fonts.baseSize == 9);
    assert(c.margins.bottom == 20);
    assert(c.photos.columns == 2);
    assert(c.photos.maxPerSection == 6);
    assert(c.checklist.showAllItems);
    assert(c.certificates.showTable);
    assert(c.signatures.columns == 3);
    assert(c.textFit.mode == TextFitMode::Measured);
    assert(!c.IsProtocolStyle());

    assert(ResolveLayoutConfig(std::string()).style == "default");
    assert(ResolveLayoutConfig(std::string("{not json")).fonts.headerSize == 14);
    assert(ResolveLayoutConfig(std::string("[1, 2]")).photos.widthMm == 80);
  }

  // A partial document only overrides what it names.
  {
    const nlohmann::json partial = {
        {"cover_page", {{"enabled", true}}},
        {"photos", {{"columns", 3}}},
        {"fonts", {{"base_size", "big"}}},
        {"unknown", 1}};
    LayoutConfig c = ResolveLayoutConfig(&partial);
    assert(c.coverPage.enabled);
    assert(c.photos.columns == 3);
    assert(c.photos.maxPerSection == 6);
    assert(c.fonts.baseSize == 9);
    assert(c.margins.left == 10);
  }

  // Out of range numbers are clamped.
  {
    const nlohmann::json partial = {{"photos", {{"columns", 40}}},
                                    {"margins", {{"top", -5}}},
                                    {"signatures", {{"columns", 0}}}};
    LayoutConfig c = ResolveLayoutConfig(&partial);
    assert(c.photos.columns == 6);
    assert(c.margins.top == 0);
    assert(c.signatures.columns == 1);
  }

  // Protocol style and its legacy name.
  {
    LayoutConfig c = ResolveLayoutConfig(std::string(
        "{\"style\":\"gensep\",\"text_fit\":{\"mode\":\"estimate\"},"
        "\"protocol\":{\"title\":\"MV CABLE TEST\"}}"));
    assert(c.IsProtocolStyle());
    assert(c.textFit.mode == TextFitMode::Estimate);
    assert(c.protocol.title == "MV CABLE TEST");
    assert(ResolveLayoutConfig(std::string("{\"style\":\"Protocol\"}"))
               .IsProtocolStyle());
  }
  return 0;
}
