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
#include "../pdf/pdf_font_metrics.h"

#include <iostream>

using namespace inspectdoc::pdf;

int main() {
  const std::string input = "Euro € — test";
  const std::string encoded = EncodeWinAnsi(input);
  if (encoded.empty()) {
    std::cerr << "Encoding returned empty output" << std::endl;
    return 1;
  }
  if (static_cast<unsigned char>(encoded[5]) != 0x80) {
    std::cerr << "Euro sign was not mapped to WinAnsi 0x80" << std::endl;
    return 1;
  }
  if (static_cast<unsigned char>(encoded[7]) != 0x97) {
    std::cerr << "Em dash was not mapped to WinAnsi 0x97" << std::endl;
    return 1;
  }
  if (EncodeWinAnsi("Ω=5") != "?=5") {
    std::cerr << "Unmappable code point was not replaced" << std::endl;
    return 1;
  }
  if (EncodeWinAnsi("Größe") != std::string("Gr\xF6\xDF" "e")) {
    std::cerr << "Latin-1 letters were not kept" << std::endl;
    return 1;
  }

  // Without metrics the width is estimated from the character count.
  const double estimated = MeasureTextWidth("abcd", 10.0, nullptr);
  if (estimated < 23.99 || estimated > 24.01) {
    std::cerr << "Unexpected estimated width " << estimated << std::endl;
    return 1;
  }

  PdfFontDefinition regular;
  regular.key = "F1";
  PdfFontCatalog catalog;
  catalog.regular = &regular;
  if (catalog.Resolve(true) != &regular) {
    std::cerr << "Bold request did not fall back to the regular font"
              << std::endl;
    return 1;
  }

  TtfFontMetrics metrics;
  if (LoadTtfFontMetrics("/nonexistent/inspectdoc-font.ttf", metrics) ||
      metrics.valid) {
    std::cerr << "Missing font file was reported as loaded" << std::endl;
    return 1;
  }

  // When a system font is installed, measured widths follow its metrics.
  PdfFontDefinition measured;
  if (LoadPdfFontMetrics(measured, false)) {
    measured.embedded = true;
    const double narrow = MeasureTextWidth("iiii", 10.0, &measured);
    const double wide = MeasureTextWidth("WWWW", 10.0, &measured);
    if (!(narrow < wide)) {
      std::cerr << "Measured widths ignore glyph advances" << std::endl;
      return 1;
    }
  }
  return 0;
}
