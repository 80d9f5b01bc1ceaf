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
#include "textfit.h"

#include <algorithm>
#include <cmath>

namespace inspectdoc {
namespace {

constexpr double kPointsPerMm = 72.0 / 25.4;

std::vector<std::string> SplitParagraphs(const std::string &text) {
  std::vector<std::string> paragraphs;
  size_t start = 0;
  while (true) {
    const size_t end = text.find('\n', start);
    std::string part = text.substr(start, end == std::string::npos
                                              ? std::string::npos
                                              : end - start);
    if (!part.empty() && part.back() == '\r')
      part.pop_back();
    paragraphs.push_back(std::move(part));
    if (end == std::string::npos)
      break;
    start = end + 1;
  }
  return paragraphs;
}

// Splits text into equal character chunks, the estimate-mode line shape.
void AppendEstimatedLines(const std::string &paragraph, double fontSize,
                          double width, std::vector<std::string> &out) {
  const int perLine = std::max(
      1, static_cast<int>(std::floor(width * kPointsPerMm / (fontSize * 0.5))));
  const int count = static_cast<int>(paragraph.size());
  const int lines = std::max(2, (count + perLine - 1) / perLine);
  const int chunk = std::max(1, (count + lines - 1) / lines);
  for (int i = 0; i < lines; ++i) {
    const size_t begin = static_cast<size_t>(i) * chunk;
    out.push_back(begin < paragraph.size() ? paragraph.substr(begin, chunk)
                                           : std::string());
  }
}

void AppendMeasuredLines(const std::string &paragraph,
                         const pdf::PdfFontDefinition *font, double fontSize,
                         double width, std::vector<std::string> &out) {
  auto fitsWidth = [&](const std::string &candidate) {
    return TextWidthMm(candidate, font, fontSize) <= width;
  };

  std::string current;
  size_t pos = 0;
  while (pos <= paragraph.size()) {
    size_t space = paragraph.find(' ', pos);
    if (space == std::string::npos)
      space = paragraph.size();
    std::string word = paragraph.substr(pos, space - pos);
    pos = space + 1;

    std::string candidate = current.empty() ? word : current + " " + word;
    if (fitsWidth(candidate)) {
      current = std::move(candidate);
      continue;
    }
    if (!current.empty()) {
      out.push_back(current);
      current.clear();
    }
    // Words wider than the box are broken between characters.
    while (!word.empty() && !fitsWidth(word)) {
      size_t take = 1;
      while (take < word.size() && fitsWidth(word.substr(0, take + 1)))
        ++take;
      out.push_back(word.substr(0, take));
      word.erase(0, take);
    }
    current = std::move(word);
  }
  out.push_back(current);
}

} // namespace

double TextWidthMm(const std::string &winAnsi,
                   const pdf::PdfFontDefinition *font, double fontSize) {
  return pdf::MeasureTextWidth(winAnsi, fontSize, font) / kPointsPerMm;
}

TextFitResult FitText(const std::string &winAnsi,
                      const pdf::PdfFontDefinition *font, double fontSize,
                      double width, double lineHeight, TextFitMode mode) {
  TextFitResult result;
  const std::vector<std::string> paragraphs = SplitParagraphs(winAnsi);
  for (const auto &paragraph : paragraphs) {
    if (width <= 0.0 || TextWidthMm(paragraph, font, fontSize) <= width) {
      result.wrappedLines.push_back(paragraph);
      continue;
    }
    if (mode == TextFitMode::Estimate)
      AppendEstimatedLines(paragraph, fontSize, width, result.wrappedLines);
    else
      AppendMeasuredLines(paragraph, font, fontSize, width,
                          result.wrappedLines);
  }
  result.lines = static_cast<int>(result.wrappedLines.size());
  result.fits = result.lines == 1 && paragraphs.size() == 1;
  result.height = result.lines * lineHeight;
  return result;
}

} // namespace inspectdoc
