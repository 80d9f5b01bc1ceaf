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
#include "documentcanvas.h"

#include <algorithm>
#include <ctime>
#include <sstream>

#include "../core/errors.h"
#include "../core/logger.h"
#include "../core/stringutils.h"
#include "pdf_draw_commands.h"
#include "pdf_objects.h"
#include "pdf_writer.h"

namespace inspectdoc {
namespace {

CanvasTextStyle::HorizontalAlign ToTextAlign(CellAlign align) {
  switch (align) {
  case CellAlign::Center:
    return CanvasTextStyle::HorizontalAlign::Center;
  case CellAlign::Right:
    return CanvasTextStyle::HorizontalAlign::Right;
  default:
    return CanvasTextStyle::HorizontalAlign::Left;
  }
}

std::string PdfDateString() {
  const std::time_t now = std::time(nullptr);
  std::tm utc{};
#ifdef _WIN32
  gmtime_s(&utc, &now);
#else
  gmtime_r(&now, &utc);
#endif
  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "D:%Y%m%d%H%M%SZ", &utc);
  return buffer;
}

// Clears the decorator flag even when a decorator throws.
class DecoratorScope {
public:
  explicit DecoratorScope(bool &flag) : flag_(flag) { flag_ = true; }
  ~DecoratorScope() { flag_ = false; }

private:
  bool &flag_;
};

} // namespace

DocumentCanvas::DocumentCanvas(const CanvasServices &services,
                               TextFitMode fitMode)
    : services_(services), fitMode_(fitMode) {
  regularFont_.key = "F1";
  regularFont_.baseName = "InspectDocSans";
  boldFont_.key = "F2";
  boldFont_.baseName = "InspectDocSansBold";

  const bool regularLoaded = pdf::LoadPdfFontMetrics(
      regularFont_, false, services_.regularFontPath);
  bool boldLoaded =
      pdf::LoadPdfFontMetrics(boldFont_, true, services_.boldFontPath);
  if (!boldLoaded && regularLoaded) {
    boldFont_.metrics = regularFont_.metrics;
    boldLoaded = true;
  }
  // Measurement uses the loaded metrics; Finish() decides what is embedded.
  regularFont_.embedded = regularLoaded;
  boldFont_.embedded = boldLoaded;
  if (!regularLoaded)
    Logger::Instance().Log(
        "PDF render: no TrueType font found, measuring text by estimate");
}

void DocumentCanvas::SetDecorators(PageDecorator *header,
                                   PageDecorator *footer) {
  header_ = header;
  footer_ = footer;
}

void DocumentCanvas::SetMargins(double left, double top, double right) {
  leftMargin_ = left;
  topMargin_ = top;
  rightMargin_ = right;
}

void DocumentCanvas::SetAutoPageBreak(bool enabled, double margin) {
  autoPageBreak_ = enabled;
  breakMargin_ = margin;
}

void DocumentCanvas::SetTitle(const std::string &title) { title_ = title; }

void DocumentCanvas::SetSymbolNormalization(bool enabled) {
  normalizeSymbols_ = enabled;
}

const CommandBuffer &DocumentCanvas::PageCommands(size_t index) const {
  return pages_.at(index).buffer;
}

DocumentCanvas::GraphicsState DocumentCanvas::SaveState() const {
  return {fontStyle_, fontSize_, textColor_, fillColor_, drawColor_,
          lineWidth_};
}

void DocumentCanvas::RestoreState(const GraphicsState &state) {
  fontStyle_ = state.fontStyle;
  fontSize_ = state.fontSize;
  textColor_ = state.textColor;
  fillColor_ = state.fillColor;
  drawColor_ = state.drawColor;
  lineWidth_ = state.lineWidth;
}

void DocumentCanvas::RunDecorator(PageDecorator *decorator) {
  if (!decorator || inDecorator_)
    return;
  const GraphicsState state = SaveState();
  {
    DecoratorScope scope(inDecorator_);
    decorator->Decorate(*this);
  }
  RestoreState(state);
}

void DocumentCanvas::ClosePage() {
  if (pages_.empty())
    return;
  if (pages_.back().decorated)
    RunDecorator(footer_);
}

void DocumentCanvas::AddPage(bool decorated) {
  if (finished_)
    throw RenderError("cannot add a page to a finished document");
  ClosePage();
  pages_.push_back(Page{CommandBuffer{}, decorated});
  x_ = leftMargin_;
  y_ = topMargin_;
  if (decorated)
    RunDecorator(header_);
}

void DocumentCanvas::SetX(double x) { x_ = x >= 0.0 ? x : kPageWidth + x; }

void DocumentCanvas::SetY(double y) {
  x_ = leftMargin_;
  y_ = y >= 0.0 ? y : kPageHeight + y;
}

void DocumentCanvas::SetXY(double x, double y) {
  SetY(y);
  SetX(x);
}

void DocumentCanvas::Ln(double h) {
  x_ = leftMargin_;
  y_ += h;
}

void DocumentCanvas::SetFont(FontStyle style, double size) {
  fontStyle_ = style;
  fontSize_ = size;
}

void DocumentCanvas::SetFontStyle(FontStyle style) { fontStyle_ = style; }

bool DocumentCanvas::IsBold() const {
  return fontStyle_ == FontStyle::Bold || fontStyle_ == FontStyle::BoldItalic;
}

bool DocumentCanvas::IsItalic() const {
  return fontStyle_ == FontStyle::Italic ||
         fontStyle_ == FontStyle::BoldItalic;
}

const pdf::PdfFontDefinition *DocumentCanvas::CurrentFont() const {
  return IsBold() ? &boldFont_ : &regularFont_;
}

std::string DocumentCanvas::Encode(const std::string &utf8) const {
  if (normalizeSymbols_)
    return pdf::EncodeWinAnsi(StringUtils::NormalizeSymbols(utf8));
  return pdf::EncodeWinAnsi(utf8);
}

double DocumentCanvas::StringWidth(const std::string &utf8) const {
  return TextWidthMm(Encode(utf8), CurrentFont(), fontSize_);
}

TextFitResult DocumentCanvas::Fit(const std::string &utf8, double width,
                                  double lineHeight) const {
  return FitText(Encode(utf8), CurrentFont(), fontSize_, width, lineHeight,
                 fitMode_);
}

double DocumentCanvas::Baseline(double top, double h) const {
  return top + h / 2.0 + 0.3 * fontSize_ / pdf::kMmToPoints;
}

void DocumentCanvas::Record(CanvasCommand command) {
  if (pages_.empty())
    AddPage();
  pages_.back().buffer.commands.push_back(std::move(command));
}

bool DocumentCanvas::BreakIfNeeded(double h) {
  if (!autoPageBreak_ || inDecorator_ || pages_.empty())
    return false;
  if (y_ + h <= PageBreakY())
    return false;
  const double x = x_;
  AddPage(true);
  x_ = x;
  return true;
}

bool DocumentCanvas::EnsureSpace(double neededHeight) {
  if (pages_.empty()) {
    AddPage(true);
    return true;
  }
  if (y_ + neededHeight <= PageBreakY())
    return false;
  AddPage(true);
  return true;
}

void DocumentCanvas::DrawCellBox(double x, double y, double w, double h,
                                 int edges, bool fill) {
  const int allEdges = kEdgeLeft | kEdgeTop | kEdgeRight | kEdgeBottom;
  const CanvasStroke stroke{drawColor_, lineWidth_};
  if (fill || edges == allEdges) {
    RectangleCommand rect;
    rect.x = x;
    rect.y = y;
    rect.w = w;
    rect.h = h;
    rect.stroked = edges == allEdges;
    rect.stroke = stroke;
    rect.filled = fill;
    rect.fill = CanvasFill{fillColor_};
    Record(rect);
    if (edges == allEdges)
      return;
  }
  if (edges & kEdgeLeft)
    Record(LineCommand{x, y, x, y + h, stroke});
  if (edges & kEdgeTop)
    Record(LineCommand{x, y, x + w, y, stroke});
  if (edges & kEdgeRight)
    Record(LineCommand{x + w, y, x + w, y + h, stroke});
  if (edges & kEdgeBottom)
    Record(LineCommand{x, y + h, x + w, y + h, stroke});
}

void DocumentCanvas::RecordText(double x, double baseline, double boxWidth,
                                double padding, const std::string &encoded,
                                CellAlign align, bool expandPageCount) {
  if (encoded.empty())
    return;
  TextCommand text;
  text.x = x;
  text.baseline = baseline;
  text.boxWidth = boxWidth;
  text.padding = padding;
  text.text = encoded;
  text.expandPageCount = expandPageCount || inDecorator_;
  text.style.bold = IsBold();
  text.style.italic = IsItalic();
  text.style.fontSize = fontSize_;
  text.style.color = textColor_;
  text.style.hAlign = ToTextAlign(align);
  Record(std::move(text));
}

void DocumentCanvas::Advance(double w, double h, NextPosition next) {
  switch (next) {
  case NextPosition::Right:
    x_ += w;
    break;
  case NextPosition::NextLine:
    x_ = leftMargin_;
    y_ += h;
    break;
  case NextPosition::Below:
    y_ += h;
    break;
  }
}

void DocumentCanvas::Cell(double w, double h, const std::string &text,
                          const CellOptions &options) {
  BreakIfNeeded(h);
  if (w <= 0.0)
    w = RightEdge() - x_;
  int edges = 0;
  if (options.border == CellBorder::Frame)
    edges = kEdgeLeft | kEdgeTop | kEdgeRight | kEdgeBottom;
  else if (options.border == CellBorder::Left)
    edges = kEdgeLeft;
  if (options.fill || edges != 0)
    DrawCellBox(x_, y_, w, h, edges, options.fill);
  RecordText(x_, Baseline(y_, h), w, kCellPadding, Encode(text), options.align,
             options.expandPageCount);
  Advance(w, h, options.next);
}

double DocumentCanvas::PlaceMultiCell(double w, double lineHeight,
                                      const std::string &text,
                                      const CellOptions &options) {
  if (w <= 0.0)
    w = RightEdge() - x_;
  const double x0 = x_;
  std::vector<std::string> lines =
      FitText(Encode(text), CurrentFont(), fontSize_, w - 2.0 * kCellPadding,
              lineHeight, fitMode_)
          .wrappedLines;
  if (lines.empty())
    lines.emplace_back();

  lastBlockTop_ = y_;
  double used = 0.0;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (BreakIfNeeded(lineHeight))
      lastBlockTop_ = y_;
    x_ = x0;
    int edges = 0;
    if (options.border == CellBorder::Frame) {
      edges = kEdgeLeft | kEdgeRight;
      if (i == 0)
        edges |= kEdgeTop;
      if (i + 1 == lines.size())
        edges |= kEdgeBottom;
    } else if (options.border == CellBorder::Left) {
      edges = kEdgeLeft;
    }
    if (options.fill || edges != 0)
      DrawCellBox(x0, y_, w, lineHeight, edges, options.fill);
    RecordText(x0, Baseline(y_, lineHeight), w, kCellPadding, lines[i],
               options.align);
    y_ += lineHeight;
    used += lineHeight;
  }

  switch (options.next) {
  case NextPosition::Right:
    x_ = x0 + w;
    y_ = lastBlockTop_;
    break;
  case NextPosition::NextLine:
    x_ = leftMargin_;
    break;
  case NextPosition::Below:
    x_ = x0;
    break;
  }
  return used;
}

double DocumentCanvas::PlaceCell(double w, double h, const std::string &text,
                                 const CellOptions &options) {
  if (w <= 0.0)
    w = RightEdge() - x_;
  if (StringUtils::Trim(text).empty() || StringWidth(text) <= w - 2.0) {
    Cell(w, h, text, options);
    return h;
  }

  const double x0 = x_;
  const double lineHeight = h > 5.0 ? h * 0.7 : 3.5;
  CellOptions inner = options;
  inner.next = NextPosition::Below;
  double used = PlaceMultiCell(w, lineHeight, text, inner);
  const double bottom = std::max(y_, lastBlockTop_ + h);
  used = std::max(used, h);

  switch (options.next) {
  case NextPosition::Right:
    x_ = x0 + w;
    y_ = lastBlockTop_;
    break;
  case NextPosition::NextLine:
    x_ = leftMargin_;
    y_ = bottom;
    break;
  case NextPosition::Below:
    x_ = x0;
    y_ = bottom;
    break;
  }
  return used;
}

void DocumentCanvas::TextBoxLines(double w, double h, double lineHeight,
                                  const std::vector<std::string> &lines,
                                  const CellOptions &options) {
  if (w <= 0.0)
    w = RightEdge() - x_;
  int edges = 0;
  if (options.border == CellBorder::Frame)
    edges = kEdgeLeft | kEdgeTop | kEdgeRight | kEdgeBottom;
  else if (options.border == CellBorder::Left)
    edges = kEdgeLeft;
  if (options.fill || edges != 0)
    DrawCellBox(x_, y_, w, h, edges, options.fill);

  const double block = lineHeight * static_cast<double>(lines.size());
  double top = y_ + std::max(0.0, (h - block) / 2.0);
  for (const auto &line : lines) {
    RecordText(x_, Baseline(top, lineHeight), w, kCellPadding, line,
               options.align, options.expandPageCount);
    top += lineHeight;
  }
  Advance(w, h, options.next);
}

double DocumentCanvas::PlaceImage(const std::string &keyOrUrl, double x,
                                  double y, double w) {
  if (keyOrUrl.empty() || !services_.resolver || !services_.loader)
    return 0.0;
  const std::string resolved = services_.resolver->Resolve(keyOrUrl);
  if (resolved.empty() || failedImageRefs_.count(resolved))
    return 0.0;

  size_t index = 0;
  auto it = imageIndexByRef_.find(resolved);
  if (it != imageIndexByRef_.end()) {
    index = it->second;
  } else {
    std::string bytes;
    std::string error;
    pdf::PdfImage image;
    try {
      if (!services_.loader->Load(resolved, bytes, error) ||
          !pdf::DecodeImage(bytes, image, error)) {
        Logger::Instance().Warn("PDF image: skipping " + resolved + ": " +
                               error);
        failedImageRefs_.insert(resolved);
        return 0.0;
      }
    } catch (const std::exception &ex) {
      Logger::Instance().Warn("PDF image: skipping " + resolved + ": " +
                             ex.what());
      failedImageRefs_.insert(resolved);
      return 0.0;
    }
    if (image.width <= 0 || image.height <= 0) {
      Logger::Instance().Warn("PDF image: skipping " + resolved +
                             ": empty image");
      failedImageRefs_.insert(resolved);
      return 0.0;
    }
    index = images_.size();
    images_.push_back(std::move(image));
    imageIndexByRef_.emplace(resolved, index);
  }

  const pdf::PdfImage &image = images_[index];
  const double h = w * image.height / image.width;
  Record(ImageCommand{index, x, y, w, h});
  return h;
}

void DocumentCanvas::DrawLine(double x0, double y0, double x1, double y1) {
  Record(LineCommand{x0, y0, x1, y1, CanvasStroke{drawColor_, lineWidth_}});
}

void DocumentCanvas::DrawRect(double x, double y, double w, double h,
                              bool stroke, bool fill) {
  RectangleCommand rect;
  rect.x = x;
  rect.y = y;
  rect.w = w;
  rect.h = h;
  rect.stroked = stroke;
  rect.stroke = CanvasStroke{drawColor_, lineWidth_};
  rect.filled = fill;
  rect.fill = CanvasFill{fillColor_};
  Record(rect);
}

void DocumentCanvas::DrawText(double x, double y, const std::string &text,
                              CellAlign align, double boxWidth) {
  RecordText(x, y, boxWidth, 0.0, Encode(text), align);
}

std::string DocumentCanvas::Finish() {
  if (finished_)
    return output_;
  if (pages_.empty())
    throw RenderError("document has no pages");
  ClosePage();
  finished_ = true;

  std::vector<pdf::PdfObject> objects;
  if (!(regularFont_.embedded &&
        pdf::AppendEmbeddedFontObjects(objects, regularFont_))) {
    Logger::Instance().Log(
        "PDF render: falling back to Type1 Helvetica (embedded font not found)");
    pdf::AppendFallbackType1Font(objects, regularFont_, "Helvetica");
  }
  if (!(boldFont_.embedded &&
        pdf::AppendEmbeddedFontObjects(objects, boldFont_)))
    pdf::AppendFallbackType1Font(objects, boldFont_, "Helvetica-Bold");

  std::vector<size_t> imageObjectIds(images_.size(), 0);
  for (size_t i = 0; i < images_.size(); ++i) {
    std::string error;
    if (!pdf::AppendImageObjects(objects, images_[i], imageObjectIds[i],
                                 error))
      throw RenderError("failed to write image: " + error);
  }

  const pdf::PdfFontCatalog fonts{&regularFont_, &boldFont_};
  const pdf::PageMapping mapping{kPageHeight};
  const pdf::FloatFormatter formatter(3);
  const size_t pageCount = pages_.size();
  const size_t pagesIndex = objects.size() + 2 * pageCount + 1;
  std::vector<size_t> pageIndices;
  pageIndices.reserve(pageCount);

  for (const auto &page : pages_) {
    std::set<size_t> usedImages;
    const std::string content = pdf::EncodePageContent(
        page.buffer, mapping, fonts, pageCount, usedImages);
    std::string compressed;
    std::string error;
    if (pdf::PdfDeflater::Compress(content, compressed, error))
      objects.push_back(
          {pdf::MakeStreamObject("/Filter /FlateDecode", compressed)});
    else
      objects.push_back({pdf::MakeStreamObject("", content)});
    const size_t contentIndex = objects.size();

    std::ostringstream resources;
    resources << "<< /Font << /F1 " << regularFont_.objectId << " 0 R /F2 "
              << boldFont_.objectId << " 0 R >>";
    if (!usedImages.empty()) {
      resources << " /XObject << ";
      for (size_t image : usedImages)
        resources << '/' << pdf::ImageResourceName(image) << ' '
                  << imageObjectIds[image] << " 0 R ";
      resources << ">>";
    }
    resources << " >>";

    std::ostringstream pageObj;
    pageObj << "<< /Type /Page /Parent " << pagesIndex
            << " 0 R /MediaBox [0 0 "
            << formatter.Format(kPageWidth * pdf::kMmToPoints) << ' '
            << formatter.Format(kPageHeight * pdf::kMmToPoints)
            << "] /Contents " << contentIndex << " 0 R /Resources "
            << resources.str() << " >>";
    objects.push_back({pageObj.str()});
    pageIndices.push_back(objects.size());
  }

  std::ostringstream kids;
  for (size_t i = 0; i < pageIndices.size(); ++i) {
    if (i)
      kids << ' ';
    kids << pageIndices[i] << " 0 R";
  }
  objects.push_back({"<< /Type /Pages /Kids [" + kids.str() + "] /Count " +
                     std::to_string(pageCount) + " >>"});
  objects.push_back({"<< /Type /Catalog /Pages " +
                     std::to_string(pagesIndex) + " 0 R >>"});
  const size_t catalogIndex = objects.size();
  objects.push_back(
      {"<< /Producer (InspectDoc) /Title (" +
       pdf::EscapePdfString(Encode(title_)) + ") /CreationDate (" +
       PdfDateString() + ") >>"});
  const size_t infoIndex = objects.size();

  std::string error;
  if (!pdf::WritePdfDocument(output_, objects, catalogIndex, infoIndex, error))
    throw RenderError("failed to serialize document: " + error);
  return output_;
}

} // namespace inspectdoc
