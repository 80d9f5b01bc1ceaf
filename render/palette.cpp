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
#include "palette.h"

#include <algorithm>
#include <cctype>

namespace inspectdoc {
namespace {

constexpr CanvasColor kComponentFallback{37, 99, 235};
constexpr CanvasColor kProtocolFallback{0, 59, 122};

int HexDigit(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  return -1;
}

} // namespace

bool ParseHexColor(const std::string &hex, CanvasColor &out) {
  std::string digits = hex;
  if (!digits.empty() && digits[0] == '#')
    digits.erase(0, 1);
  if (digits.size() != 6)
    return false;
  int channels[3];
  for (int i = 0; i < 3; ++i) {
    const int hi = HexDigit(digits[i * 2]);
    const int lo = HexDigit(digits[i * 2 + 1]);
    if (hi < 0 || lo < 0)
      return false;
    channels[i] = hi * 16 + lo;
  }
  out = CanvasColor{channels[0], channels[1], channels[2]};
  return true;
}

CanvasColor HexToColor(const std::string &hex, const CanvasColor &fallback) {
  CanvasColor color;
  return ParseHexColor(hex, color) ? color : fallback;
}

CanvasColor Lighten(const CanvasColor &color, int amount) {
  return {std::min(255, color.r + amount), std::min(255, color.g + amount),
          std::min(255, color.b + amount)};
}

BrandPalette ComponentPalette(const TenantBranding &tenant) {
  BrandPalette palette;
  palette.primary = HexToColor(
      tenant.primaryColor.empty() ? "#2563eb" : tenant.primaryColor,
      kComponentFallback);
  if (!tenant.secondaryColor.empty())
    palette.secondary = HexToColor(tenant.secondaryColor, kComponentFallback);
  if (!tenant.accentColor.empty())
    palette.accent = HexToColor(tenant.accentColor, kComponentFallback);
  return palette;
}

BrandPalette ProtocolPalette(const TenantBranding &tenant) {
  auto pick = [](const std::string &value, const char *fallback) {
    return HexToColor(value.empty() ? fallback : value, kProtocolFallback);
  };
  BrandPalette palette;
  palette.primary = pick(tenant.primaryColor, "#003B7A");
  palette.secondary = pick(tenant.secondaryColor, "#005BAA");
  palette.accent = pick(tenant.accentColor, "#00A651");
  return palette;
}

} // namespace inspectdoc
