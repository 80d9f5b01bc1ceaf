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
#include "pdf_objects.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <locale>
#include <sstream>

#include <zlib.h>

namespace inspectdoc {
namespace pdf {

FloatFormatter::FloatFormatter(int precision)
    : precision_(std::clamp(precision, 0, 6)) {}

std::string FloatFormatter::Format(double value) const {
  std::ostringstream ss;
  ss.imbue(std::locale::classic());
  if (std::abs(value) < 0.5 * std::pow(10.0, -precision_))
    value = 0.0;
  ss << std::fixed << std::setprecision(precision_) << value;
  return ss.str();
}

bool PdfDeflater::Compress(const std::string &input, std::string &output,
                           std::string &error) {
  if (input.empty()) {
    output.clear();
    return true;
  }
  uLongf bound = compressBound(static_cast<uLong>(input.size()));
  std::string compressed;
  compressed.resize(bound);

  int zres = compress2(reinterpret_cast<Bytef *>(&compressed[0]), &bound,
                       reinterpret_cast<const Bytef *>(input.data()),
                       static_cast<uLong>(input.size()), Z_BEST_SPEED);
  if (zres != Z_OK) {
    error = "compress2 failed with code " + std::to_string(zres);
    return false;
  }

  compressed.resize(bound);
  output.swap(compressed);
  return true;
}

std::string EscapePdfString(const std::string &raw) {
  std::string out;
  out.reserve(raw.size() + 8);
  for (char ch : raw) {
    if (ch == '(' || ch == ')' || ch == '\\')
      out.push_back('\\');
    if (ch == '\r') {
      out += "\\r";
      continue;
    }
    out.push_back(ch);
  }
  return out;
}

std::string MakeStreamObject(const std::string &dictEntries,
                             const std::string &data) {
  std::string body = "<< ";
  if (!dictEntries.empty())
    body += dictEntries + " ";
  body += "/Length " + std::to_string(data.size()) + " >>\nstream\n";
  body += data;
  body += "\nendstream";
  return body;
}

bool AppendEmbeddedFontObjects(std::vector<PdfObject> &objects,
                               PdfFontDefinition &font) {
  const TtfFontMetrics &m = font.metrics;
  if (!m.valid || m.data.empty())
    return false;
  const double scale = m.unitsPerEm > 0 ? 1000.0 / m.unitsPerEm : 1.0;
  auto scaled = [scale](int value) {
    return static_cast<int>(std::lround(value * scale));
  };

  const size_t fontFileIndex = objects.size() + 1;
  objects.push_back({MakeStreamObject(
      "/Length1 " + std::to_string(m.data.size()), m.data)});

  const size_t descriptorIndex = objects.size() + 1;
  std::ostringstream descriptor;
  descriptor << "<< /Type /FontDescriptor /FontName /" << font.baseName
             << " /Flags 32 /FontBBox [" << scaled(m.xMin) << ' '
             << scaled(m.yMin) << ' ' << scaled(m.xMax) << ' '
             << scaled(m.yMax) << "] /Ascent " << scaled(m.ascent)
             << " /Descent " << -scaled(std::abs(m.descent))
             << " /CapHeight " << scaled(m.capHeight)
             << " /ItalicAngle 0 /StemV 80 /FontFile2 " << fontFileIndex
             << " 0 R >>";
  objects.push_back({descriptor.str()});

  std::ostringstream fontObject;
  fontObject << "<< /Type /Font /Subtype /TrueType /BaseFont /"
             << font.baseName << " /FirstChar 32 /LastChar 255 /Widths [";
  for (int code = 32; code <= 255; ++code) {
    fontObject << m.widths1000[static_cast<unsigned char>(code)];
    if (code != 255)
      fontObject << ' ';
  }
  fontObject << "] /FontDescriptor " << descriptorIndex
             << " 0 R /Encoding /WinAnsiEncoding >>";
  objects.push_back({fontObject.str()});

  font.objectId = objects.size();
  font.embedded = true;
  return true;
}

void AppendFallbackType1Font(std::vector<PdfObject> &objects,
                             PdfFontDefinition &font,
                             const std::string &baseFont) {
  objects.push_back({"<< /Type /Font /Subtype /Type1 /BaseFont /" + baseFont +
                     " /Encoding /WinAnsiEncoding >>"});
  font.objectId = objects.size();
  font.embedded = false;
  font.baseName = baseFont;
}

} // namespace pdf
} // namespace inspectdoc
