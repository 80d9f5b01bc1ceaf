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

#include <array>
#include <cstdint>
#include <filesystem>
#include <string>

namespace inspectdoc {
namespace pdf {

struct TtfFontMetrics {
  int unitsPerEm = 1000;
  int ascent = 0;
  int descent = 0;
  int lineGap = 0;
  int capHeight = 0;
  int xMin = 0;
  int yMin = 0;
  int xMax = 0;
  int yMax = 0;
  // Indexed by WinAnsi code.
  std::array<int, 256> advanceWidths{};
  std::array<int, 256> widths1000{};
  std::string data;
  bool valid = false;
};

// A font as referenced from page resources. Embedded fonts carry TrueType
// metrics; otherwise the font falls back to a standard Type1 face.
struct PdfFontDefinition {
  std::string key;      // Resource name, e.g. "F1"
  std::string baseName; // /BaseFont value
  size_t objectId = 0;
  bool embedded = false;
  TtfFontMetrics metrics;
};

struct PdfFontCatalog {
  const PdfFontDefinition *regular = nullptr;
  const PdfFontDefinition *bold = nullptr;

  const PdfFontDefinition *Resolve(bool wantBold) const;
};

// Converts UTF-8 text to single byte WinAnsi codes. Unmappable code points
// become '?'.
std::string EncodeWinAnsi(const std::string &utf8);

// Width in points of WinAnsi encoded text. Without embedded metrics the
// width is estimated from the character count.
double MeasureTextWidth(const std::string &winAnsi, double fontSize,
                        const PdfFontDefinition *font);

bool ReadFileToString(const std::filesystem::path &path, std::string &out);
bool LoadTtfFontMetrics(const std::filesystem::path &path,
                        TtfFontMetrics &metrics);

// First installed system sans font (DejaVu Sans, Liberation Sans).
std::filesystem::path FindFontPath(bool bold);

// Loads metrics from overridePath when given, else from FindFontPath.
bool LoadPdfFontMetrics(PdfFontDefinition &font, bool bold,
                        const std::filesystem::path &overridePath = {});

} // namespace pdf
} // namespace inspectdoc
