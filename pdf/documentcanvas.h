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

#include <map>
#include <set>
#include <string>
#include <vector>

#include "../core/imageloader.h"
#include "../core/textfit.h"
#include "canvas_commands.h"
#include "pdf_font_metrics.h"
#include "pdf_image.h"

namespace inspectdoc {

class DocumentCanvas;

// Draws page furniture (headers, footers). Invoked by the canvas whenever a
// decorated page is opened or closed.
class PageDecorator {
public:
  virtual ~PageDecorator() = default;
  virtual void Decorate(DocumentCanvas &canvas) = 0;
};

enum class FontStyle { Regular, Bold, Italic, BoldItalic };
enum class CellBorder { None, Frame, Left };
enum class CellAlign { Left, Center, Right };
// Cursor position after a cell: to its right, at the start of the next line
// or below it at the same x.
enum class NextPosition { Right, NextLine, Below };

struct CellOptions {
  CellBorder border = CellBorder::None;
  bool fill = false;
  CellAlign align = CellAlign::Left;
  NextPosition next = NextPosition::Right;
  // The text carries the page-count token. Implied for decorator output.
  bool expandPageCount = false;
};

struct CanvasServices {
  const ImageUrlResolver *resolver = nullptr;
  ImageLoader *loader = nullptr;
  std::string regularFontPath;
  std::string boldFontPath;
};

// A4 portrait document built page by page. Coordinates are millimetres from
// the top-left corner; font sizes are points. Pages are recorded as command
// lists and serialized by Finish().
class DocumentCanvas {
public:
  static constexpr double kPageWidth = 210.0;
  static constexpr double kPageHeight = 297.0;
  static constexpr double kCellPadding = 1.0;

  explicit DocumentCanvas(const CanvasServices &services,
                          TextFitMode fitMode = TextFitMode::Measured);

  DocumentCanvas(const DocumentCanvas &) = delete;
  DocumentCanvas &operator=(const DocumentCanvas &) = delete;

  void SetDecorators(PageDecorator *header, PageDecorator *footer);
  void SetMargins(double left, double top, double right);
  void SetAutoPageBreak(bool enabled, double margin);
  void SetTitle(const std::string &title);
  // Replaces symbols outside the font encoding before text is recorded.
  void SetSymbolNormalization(bool enabled);

  // Closes the current page (footer) and opens a new one (header). An
  // undecorated page gets neither.
  void AddPage(bool decorated = true);
  size_t PageNumber() const { return pages_.size(); }
  size_t PageCount() const { return pages_.size(); }
  const CommandBuffer &PageCommands(size_t index) const;

  double GetX() const { return x_; }
  double GetY() const { return y_; }
  void SetX(double x);
  // Negative values are measured from the bottom edge. Resets x to the
  // left margin.
  void SetY(double y);
  void SetXY(double x, double y);
  void Ln(double h);
  double LeftMargin() const { return leftMargin_; }
  double TopMargin() const { return topMargin_; }
  double RightEdge() const { return kPageWidth - rightMargin_; }
  double ContentWidth() const { return RightEdge() - leftMargin_; }
  double PageBreakY() const { return kPageHeight - breakMargin_; }

  void SetFont(FontStyle style, double size);
  void SetFontStyle(FontStyle style);
  double FontSize() const { return fontSize_; }
  void SetTextColor(const CanvasColor &color) { textColor_ = color; }
  void SetFillColor(const CanvasColor &color) { fillColor_ = color; }
  void SetDrawColor(const CanvasColor &color) { drawColor_ = color; }
  void SetLineWidth(double width) { lineWidth_ = width; }

  double StringWidth(const std::string &utf8) const;
  TextFitResult Fit(const std::string &utf8, double width,
                    double lineHeight) const;

  // Single line cell. A width of 0 extends to the right margin.
  void Cell(double w, double h, const std::string &text,
            const CellOptions &options = {});
  // Cell that falls back to wrapped placement when the text is wider than
  // the cell. Returns the height used, never less than h.
  double PlaceCell(double w, double h, const std::string &text,
                   const CellOptions &options = {});
  // Wrapped text block; returns the height used.
  double PlaceMultiCell(double w, double lineHeight, const std::string &text,
                        const CellOptions &options = {});
  // Fixed-size box holding lines already wrapped by Fit(), vertically
  // centered. Used for table row slices whose height was computed
  // beforehand; never breaks the page.
  void TextBoxLines(double w, double h, double lineHeight,
                    const std::vector<std::string> &lines,
                    const CellOptions &options = {});
  // Starts a new page when neededHeight does not fit above the break line.
  bool EnsureSpace(double neededHeight);

  // Embeds an image scaled to width w; returns the placed height or 0 when
  // the image could not be loaded.
  double PlaceImage(const std::string &keyOrUrl, double x, double y, double w);
  size_t ImageCount() const { return images_.size(); }

  void DrawLine(double x0, double y0, double x1, double y1);
  void DrawRect(double x, double y, double w, double h, bool stroke = true,
                bool fill = false);
  // Text with its baseline at y, aligned inside [x, x + boxWidth].
  void DrawText(double x, double y, const std::string &text,
                CellAlign align = CellAlign::Left, double boxWidth = 0.0);

  // Closes the last page and serializes the document. Throws RenderError
  // when no document can be produced.
  std::string Finish();

private:
  struct Page {
    CommandBuffer buffer;
    bool decorated = true;
  };
  struct GraphicsState {
    FontStyle fontStyle;
    double fontSize;
    CanvasColor textColor;
    CanvasColor fillColor;
    CanvasColor drawColor;
    double lineWidth;
  };

  enum BorderEdge { kEdgeLeft = 1, kEdgeTop = 2, kEdgeRight = 4, kEdgeBottom = 8 };

  GraphicsState SaveState() const;
  void RestoreState(const GraphicsState &state);
  void RunDecorator(PageDecorator *decorator);
  void ClosePage();
  void Record(CanvasCommand command);
  std::string Encode(const std::string &utf8) const;
  const pdf::PdfFontDefinition *CurrentFont() const;
  bool IsBold() const;
  bool IsItalic() const;
  bool BreakIfNeeded(double h);
  void DrawCellBox(double x, double y, double w, double h, int edges,
                   bool fill);
  void RecordText(double x, double baseline, double boxWidth, double padding,
                  const std::string &encoded, CellAlign align,
                  bool expandPageCount = false);
  void Advance(double w, double h, NextPosition next);
  double Baseline(double top, double h) const;

  CanvasServices services_;
  TextFitMode fitMode_;
  pdf::PdfFontDefinition regularFont_;
  pdf::PdfFontDefinition boldFont_;
  PageDecorator *header_ = nullptr;
  PageDecorator *footer_ = nullptr;
  std::vector<Page> pages_;
  std::vector<pdf::PdfImage> images_;
  std::map<std::string, size_t> imageIndexByRef_;
  std::set<std::string> failedImageRefs_;
  std::string title_;
  std::string output_;
  bool finished_ = false;
  bool inDecorator_ = false;
  bool normalizeSymbols_ = false;
  bool autoPageBreak_ = true;
  double lastBlockTop_ = 0.0;

  double leftMargin_ = 10.0;
  double topMargin_ = 10.0;
  double rightMargin_ = 10.0;
  double breakMargin_ = 20.0;
  double x_ = 10.0;
  double y_ = 10.0;
  FontStyle fontStyle_ = FontStyle::Regular;
  double fontSize_ = 9.0;
  CanvasColor textColor_{};
  CanvasColor fillColor_{255, 255, 255};
  CanvasColor drawColor_{};
  double lineWidth_ = 0.2;
};

} // namespace inspectdoc
