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
#include "pdf_draw_commands.h"

#include <cmath>
#include <type_traits>

namespace inspectdoc {
namespace pdf {
namespace {

constexpr double kItalicSkew = 0.2;

std::string ColorComponents(const CanvasColor &color, const FloatFormatter &fmt) {
  return fmt.Format(color.r / 255.0) + ' ' + fmt.Format(color.g / 255.0) + ' ' +
         fmt.Format(color.b / 255.0);
}

} // namespace

void GraphicsStateCache::SetStroke(std::ostringstream &out,
                                   const CanvasStroke &stroke,
                                   const FloatFormatter &fmt) {
  if (!hasStrokeColor_ || stroke.color != strokeColor_) {
    out << ColorComponents(stroke.color, fmt) << " RG\n";
    strokeColor_ = stroke.color;
    hasStrokeColor_ = true;
  }
  const double width = stroke.width * kMmToPoints;
  if (std::abs(width - lineWidth_) > 1e-6) {
    out << fmt.Format(width) << " w\n";
    lineWidth_ = width;
  }
}

void GraphicsStateCache::SetFill(std::ostringstream &out,
                                 const CanvasColor &color,
                                 const FloatFormatter &fmt) {
  if (!hasFillColor_ || color != fillColor_) {
    out << ColorComponents(color, fmt) << " rg\n";
    fillColor_ = color;
    hasFillColor_ = true;
  }
}

void AppendLine(std::ostringstream &out, GraphicsStateCache &cache,
                const FloatFormatter &fmt, const Point &a, const Point &b,
                const CanvasStroke &stroke) {
  cache.SetStroke(out, stroke, fmt);
  out << fmt.Format(a.x) << ' ' << fmt.Format(a.y) << " m\n"
      << fmt.Format(b.x) << ' ' << fmt.Format(b.y) << " l\nS\n";
}

void AppendRectangle(std::ostringstream &out, GraphicsStateCache &cache,
                     const FloatFormatter &fmt, const Point &origin, double w,
                     double h, const CanvasStroke *stroke,
                     const CanvasFill *fill) {
  if (!stroke && !fill)
    return;
  if (stroke)
    cache.SetStroke(out, *stroke, fmt);
  if (fill)
    cache.SetFill(out, fill->color, fmt);
  out << fmt.Format(origin.x) << ' ' << fmt.Format(origin.y) << ' '
      << fmt.Format(w) << ' ' << fmt.Format(h) << " re\n";
  if (stroke && fill)
    out << "B\n";
  else if (fill)
    out << "f\n";
  else
    out << "S\n";
}

void AppendText(std::ostringstream &out, GraphicsStateCache &cache,
                const FloatFormatter &fmt, const Point &baseline,
                const std::string &winAnsi, const CanvasTextStyle &style,
                const PdfFontDefinition *font) {
  if (winAnsi.empty())
    return;
  cache.SetFill(out, style.color, fmt);
  const char *fontKey = font ? font->key.c_str() : "F1";
  out << "BT\n/" << fontKey << ' ' << fmt.Format(style.fontSize) << " Tf\n";
  if (style.italic) {
    out << "1 0 " << fmt.Format(kItalicSkew) << " 1 " << fmt.Format(baseline.x)
        << ' ' << fmt.Format(baseline.y) << " Tm\n";
  } else {
    out << fmt.Format(baseline.x) << ' ' << fmt.Format(baseline.y) << " Td\n";
  }
  out << '(' << EscapePdfString(winAnsi) << ") Tj\nET\n";
}

void AppendImage(std::ostringstream &out, const FloatFormatter &fmt,
                 const std::string &name, const Point &origin, double w,
                 double h) {
  out << "q\n" << fmt.Format(w) << " 0 0 " << fmt.Format(h) << ' '
      << fmt.Format(origin.x) << ' ' << fmt.Format(origin.y) << " cm\n/"
      << name << " Do\nQ\n";
}

std::string ImageResourceName(size_t imageIndex) {
  return "Im" + std::to_string(imageIndex + 1);
}

std::string SubstitutePageCount(const std::string &text, size_t pageCount) {
  const std::string token = kPageCountToken;
  const std::string count = std::to_string(pageCount);
  std::string out = text;
  size_t pos = 0;
  while ((pos = out.find(token, pos)) != std::string::npos) {
    out.replace(pos, token.size(), count);
    pos += count.size();
  }
  return out;
}

std::string EncodePageContent(const CommandBuffer &page,
                              const PageMapping &mapping,
                              const PdfFontCatalog &fonts, size_t pageCount,
                              std::set<size_t> &usedImages) {
  std::ostringstream content;
  GraphicsStateCache cache;
  const FloatFormatter fmt(3);

  for (const auto &command : page.commands) {
    std::visit(
        [&](const auto &cmd) {
          using T = std::decay_t<decltype(cmd)>;
          if constexpr (std::is_same_v<T, LineCommand>) {
            AppendLine(content, cache, fmt, mapping.Map(cmd.x0, cmd.y0),
                       mapping.Map(cmd.x1, cmd.y1), cmd.stroke);
          } else if constexpr (std::is_same_v<T, RectangleCommand>) {
            const Point origin = mapping.Map(cmd.x, cmd.y + cmd.h);
            AppendRectangle(content, cache, fmt, origin, cmd.w * kMmToPoints,
                            cmd.h * kMmToPoints,
                            cmd.stroked ? &cmd.stroke : nullptr,
                            cmd.filled ? &cmd.fill : nullptr);
          } else if constexpr (std::is_same_v<T, TextCommand>) {
            const std::string text =
                cmd.expandPageCount ? SubstitutePageCount(cmd.text, pageCount)
                                    : cmd.text;
            const PdfFontDefinition *font = fonts.Resolve(cmd.style.bold);
            const double widthMm =
                MeasureTextWidth(text, cmd.style.fontSize, font) / kMmToPoints;
            double x = cmd.x + cmd.padding;
            if (cmd.style.hAlign == CanvasTextStyle::HorizontalAlign::Center)
              x = cmd.x + (cmd.boxWidth - widthMm) / 2.0;
            else if (cmd.style.hAlign ==
                     CanvasTextStyle::HorizontalAlign::Right)
              x = cmd.x + cmd.boxWidth - cmd.padding - widthMm;
            AppendText(content, cache, fmt, mapping.Map(x, cmd.baseline), text,
                       cmd.style, font);
          } else if constexpr (std::is_same_v<T, ImageCommand>) {
            usedImages.insert(cmd.imageIndex);
            AppendImage(content, fmt, ImageResourceName(cmd.imageIndex),
                        mapping.Map(cmd.x, cmd.y + cmd.h), cmd.w * kMmToPoints,
                        cmd.h * kMmToPoints);
          }
        },
        command);
  }
  return content.str();
}

} // namespace pdf
} // namespace inspectdoc
