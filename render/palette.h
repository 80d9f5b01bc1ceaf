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

#include <optional>
#include <string>

#include "../models/tenant.h"
#include "../pdf/canvas_commands.h"

namespace inspectdoc {

// Resolved tenant colors. Secondary and accent stay unset when the tenant
// did not configure them.
struct BrandPalette {
  CanvasColor primary{37, 99, 235};
  std::optional<CanvasColor> secondary;
  std::optional<CanvasColor> accent;
};

namespace Colors {
constexpr CanvasColor kBlack{0, 0, 0};
constexpr CanvasColor kWhite{255, 255, 255};
constexpr CanvasColor kGray{100, 100, 100};
constexpr CanvasColor kMuted{107, 114, 128};
constexpr CanvasColor kSuccess{5, 150, 105};
constexpr CanvasColor kWarning{217, 119, 6};
constexpr CanvasColor kDanger{220, 38, 38};
constexpr CanvasColor kZebraLight{249, 250, 251};
constexpr CanvasColor kZebraDark{243, 244, 246};
constexpr CanvasColor kProtocolZebra{245, 247, 250};
constexpr CanvasColor kProtocolLabel{230, 235, 245};
} // namespace Colors

// Parses "#rrggbb" (the '#' is optional). Returns false for anything else.
bool ParseHexColor(const std::string &hex, CanvasColor &out);
CanvasColor HexToColor(const std::string &hex, const CanvasColor &fallback);

// Adds amount to every channel, saturating at 255.
CanvasColor Lighten(const CanvasColor &color, int amount);

// Generic pipeline: primary defaults to #2563eb, the others are optional.
BrandPalette ComponentPalette(const TenantBranding &tenant);
// Protocol pipeline: #003B7A / #005BAA / #00A651 when unset.
BrandPalette ProtocolPalette(const TenantBranding &tenant);

} // namespace inspectdoc
