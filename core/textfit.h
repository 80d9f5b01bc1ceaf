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
#include <vector>

#include "../pdf/pdf_font_metrics.h"

namespace inspectdoc {

enum class TextFitMode {
  Measured, // Greedy word wrap with font metrics
  Estimate  // Character-count heuristic
};

struct TextFitResult {
  bool fits = true;
  int lines = 1;
  double height = 0.0;
  std::vector<std::string> wrappedLines;
};

// Decides how WinAnsi encoded text fits a box of width millimetres at the
// given font size (points). A text whose measured width fits is a single
// line of lineHeight; otherwise it is wrapped according to mode. Explicit
// newlines always start a new line. Deterministic for equal inputs.
TextFitResult FitText(const std::string &winAnsi,
                      const pdf::PdfFontDefinition *font, double fontSize,
                      double width, double lineHeight, TextFitMode mode);

// Width of WinAnsi encoded text in millimetres.
double TextWidthMm(const std::string &winAnsi,
                   const pdf::PdfFontDefinition *font, double fontSize);

} // namespace inspectdoc
