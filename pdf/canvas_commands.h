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

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace inspectdoc {

// 8-bit RGB color.
struct CanvasColor {
  int r = 0;
  int g = 0;
  int b = 0;

  bool operator==(const CanvasColor &o) const {
    return r == o.r && g == o.g && b == o.b;
  }
  bool operator!=(const CanvasColor &o) const { return !(*this == o); }
};

struct CanvasStroke {
  CanvasColor color{};
  double width = 0.2; // mm
};

struct CanvasFill {
  CanvasColor color{};
};

struct CanvasTextStyle {
  bool bold = false;
  bool italic = false;
  double fontSize = 9.0; // points
  CanvasColor color{};
  enum class HorizontalAlign { Left, Center, Right } hAlign =
      HorizontalAlign::Left;
};

// Recorded page commands. Coordinates are millimetres from the top-left
// corner of the page; the encoder flips them into PDF user space.
struct LineCommand {
  double x0 = 0.0;
  double y0 = 0.0;
  double x1 = 0.0;
  double y1 = 0.0;
  CanvasStroke stroke{};
};

struct RectangleCommand {
  double x = 0.0;
  double y = 0.0;
  double w = 0.0;
  double h = 0.0;
  bool stroked = true;
  CanvasStroke stroke{};
  bool filled = false;
  CanvasFill fill{};
};

// Text is stored WinAnsi encoded. The final position is resolved when the
// page is encoded: the text is aligned inside [x, x + boxWidth] after the
// page-count token has been substituted. Only page furniture (headers,
// footers, page numbers) carries the token; body text is written as is.
struct TextCommand {
  double x = 0.0;
  double baseline = 0.0;
  double boxWidth = 0.0;
  double padding = 0.0;
  std::string text;
  bool expandPageCount = false;
  CanvasTextStyle style{};
};

struct ImageCommand {
  size_t imageIndex = 0;
  double x = 0.0;
  double y = 0.0;
  double w = 0.0;
  double h = 0.0;
};

using CanvasCommand =
    std::variant<LineCommand, RectangleCommand, TextCommand, ImageCommand>;

struct CommandBuffer {
  std::vector<CanvasCommand> commands;
};

} // namespace inspectdoc
