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

#include "pdf_font_metrics.h"

#include <string>
#include <vector>

namespace inspectdoc {
namespace pdf {

struct PdfObject {
  std::string body;
};

class FloatFormatter {
public:
  explicit FloatFormatter(int precision);
  std::string Format(double value) const;

private:
  int precision_;
};

class PdfDeflater {
public:
  static bool Compress(const std::string &input, std::string &output,
                       std::string &error);
};

// Escapes '(', ')' and '\' for use inside a PDF literal string.
std::string EscapePdfString(const std::string &raw);

// "<< dictEntries /Length n >>\nstream\n...\nendstream".
std::string MakeStreamObject(const std::string &dictEntries,
                             const std::string &data);

bool AppendEmbeddedFontObjects(std::vector<PdfObject> &objects,
                               PdfFontDefinition &font);
void AppendFallbackType1Font(std::vector<PdfObject> &objects,
                             PdfFontDefinition &font,
                             const std::string &baseFont);

} // namespace pdf
} // namespace inspectdoc
