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

#include "canvas_commands.h"
#include "pdf_font_metrics.h"
#include "pdf_objects.h"

#include <set>
#include <sstream>
#include <string>

namespace inspectdoc {
namespace pdf {

constexpr double kMmToPoints = 72.0 / 25.4;
// Token replaced by the total page count when pages are encoded.
constexpr const char *kPageCountToken = "{nb}";

struct Point {
  double x = 0.0;
  double y = 0.0;
};

// Maps top-down millimetre coordinates into bottom-up PDF points.
struct PageMapping {
  double pageHeightMm = 297.0;

  Point Map(double xMm, double yMm) const {
    return {xMm * kMmToPoints, (pageHeightMm - yMm) * kMmToPoints};
  }
};

class GraphicsStateCache {
public:
  void SetStroke(std::ostringstream &out, const CanvasStroke &stroke,
                 const FloatFormatter &fmt);
  void SetFill(std::ostringstream &out, const CanvasColor &color,
               const FloatFormatter &fmt);

private:
  CanvasColor strokeColor_{};
  CanvasColor fillColor_{};
  double lineWidth_ = -1.0;
  bool hasStrokeColor_ = false;
  bool hasFillColor_ = false;
};

void AppendLine(std::ostringstream &out, GraphicsStateCache &cache,
                const FloatFormatter &fmt, const Point &a, const Point &b,
                const CanvasStroke &stroke);
void AppendRectangle(std::ostringstream &out, GraphicsStateCache &cache,
                     const FloatFormatter &fmt, const Point &origin, double w,
                     double h, const CanvasStroke *stroke,
                     const CanvasFill *fill);
void AppendText(std::ostringstream &out, GraphicsStateCache &cache,
                const FloatFormatter &fmt, const Point &baseline,
                const std::string &winAnsi, const CanvasTextStyle &style,
                const PdfFontDefinition *font);
void AppendImage(std::ostringstream &out, const FloatFormatter &fmt,
                 const std::string &name, const Point &origin, double w,
                 double h);

std::string ImageResourceName(size_t imageIndex);

// Replaces every page-count token in WinAnsi text.
std::string SubstitutePageCount(const std::string &text, size_t pageCount);

// Encodes one recorded page into a content stream. The page-count token is
// substituted in text commands flagged expandPageCount. usedImages receives
// the indices of the images the page draws.
std::string EncodePageContent(const CommandBuffer &page,
                              const PageMapping &mapping,
                              const PdfFontCatalog &fonts, size_t pageCount,
                              std::set<size_t> &usedImages);

} // namespace pdf
} // namespace inspectdoc
