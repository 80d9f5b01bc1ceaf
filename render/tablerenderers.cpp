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
#include "tablerenderers.h"

#include <algorithm>
#include <cmath>
#include <functional>
#include <initializer_list>

#include "../core/stringutils.h"
#include "../pdf/documentcanvas.h"

namespace inspectdoc {
namespace {

constexpr double kLabelWidth = 95;
constexpr double kValueWidth = 30;

bool IsOneOf(const std::string &value, std::initializer_list<const char *> set) {
  for (const char *candidate : set)
    if (value == candidate)
      return true;
  return false;
}

CellOptions FramedCell(bool fill, CellAlign align = CellAlign::Left,
                       NextPosition next = NextPosition::Right) {
  CellOptions options;
  options.border = CellBorder::Frame;
  options.fill = fill;
  options.align = align;
  options.next = next;
  return options;
}

// One cell of a table row. Columns with a line height wrap and may continue
// on the next page; the others are single line cells drawn in the first
// slice of the row.
struct RowColumn {
  double width = 0;
  std::string text;
  FontStyle style = FontStyle::Regular;
  double fontSize = 9;
  CanvasColor color{};
  CellAlign align = CellAlign::Left;
  double lineHeight = 0;
  std::vector<std::string> lines;
};

void FitColumns(DocumentCanvas &canvas, std::vector<RowColumn> &columns) {
  for (auto &column : columns) {
    if (column.lineHeight <= 0)
      continue;
    canvas.SetFont(column.style, column.fontSize);
    column.lines =
        canvas.Fit(column.text, column.width - 2, column.lineHeight)
            .wrappedLines;
  }
}

double RowHeight(const std::vector<RowColumn> &columns, double minHeight) {
  double height = minHeight;
  for (const auto &column : columns)
    height = std::max(height, column.lineHeight *
                                  static_cast<double>(column.lines.size()));
  return height;
}

// Draws a fitted row. A row that does not fit below the cursor starts on a
// new page; a row taller than a page starts where it is and is cut into
// page-sized slices that keep every column side by side, with the table
// header repeated on each page.
void DrawRow(DocumentCanvas &canvas, const std::vector<RowColumn> &columns,
             double minHeight, const CanvasColor &fill,
             const std::function<void()> &header) {
  const double rowHeight = RowHeight(columns, minHeight);
  const double bottom = canvas.PageBreakY();
  if (canvas.GetY() + rowHeight > bottom &&
      (rowHeight <= bottom - canvas.TopMargin() ||
       canvas.GetY() + minHeight > bottom)) {
    canvas.AddPage(true);
    if (header)
      header();
  }

  std::vector<size_t> drawn(columns.size(), 0);
  for (bool first = true;; first = false) {
    const double available = canvas.PageBreakY() - canvas.GetY();
    std::vector<size_t> counts(columns.size(), 0);
    double slice = minHeight;
    bool more = false;
    for (size_t i = 0; i < columns.size(); ++i) {
      const RowColumn &column = columns[i];
      if (column.lineHeight <= 0)
        continue;
      // Slices never exceed the space left, or the cells would break again.
      size_t fits = static_cast<size_t>(
          std::max(0.0, std::floor(available / column.lineHeight)));
      while (fits > 1 &&
             column.lineHeight * static_cast<double>(fits) > available)
        --fits;
      fits = std::max<size_t>(fits, 1);
      counts[i] = std::min(fits, column.lines.size() - drawn[i]);
      slice = std::max(slice,
                       column.lineHeight * static_cast<double>(counts[i]));
      more = more || drawn[i] + counts[i] < column.lines.size();
    }

    for (size_t i = 0; i < columns.size(); ++i) {
      const RowColumn &column = columns[i];
      canvas.SetFillColor(fill);
      canvas.SetTextColor(column.color);
      canvas.SetFont(column.style, column.fontSize);
      const CellOptions options =
          FramedCell(true, column.align,
                     i + 1 == columns.size() ? NextPosition::NextLine
                                             : NextPosition::Right);
      if (column.lineHeight > 0) {
        const auto begin = column.lines.begin() + drawn[i];
        canvas.TextBoxLines(column.width, slice, column.lineHeight,
                            std::vector<std::string>(begin, begin + counts[i]),
                            options);
        drawn[i] += counts[i];
      } else {
        canvas.Cell(column.width, slice, first ? column.text : std::string(),
                    options);
      }
    }
    if (!more)
      break;
    canvas.AddPage(true);
    if (header)
      header();
  }
}

} // namespace

CanvasColor ChecklistValueColor(const std::string &value,
                                const BrandPalette &palette, bool highlight) {
  if (!highlight)
    return Colors::kBlack;
  if (IsOneOf(value, {"Sim", "OK", "Conforme"}))
    return palette.accent ? *palette.accent : Colors::kSuccess;
  if (IsOneOf(value, {"Nao", "N\xC3\xA3o", "NOK", "Nao Conforme",
                      "N\xC3\xA3o Conforme"}))
    return Colors::kDanger;
  if (value == "N/A")
    return Colors::kMuted;
  return Colors::kBlack;
}

std::string CertificateStatusLabel(CertificateStatus status,
                                   CanvasColor &color) {
  switch (status) {
  case CertificateStatus::Valid:
    color = Colors::kSuccess;
    return "Valido";
  case CertificateStatus::Expiring:
    color = Colors::kWarning;
    return "Vencendo";
  default:
    color = Colors::kDanger;
    return "Vencido";
  }
}

void ReportTitleRenderer::Render(const ReportSnapshot &report) {
  CellOptions line;
  line.next = NextPosition::NextLine;

  canvas_.SetFont(FontStyle::Bold, context_.config.fonts.headerSize - 2);
  canvas_.SetTextColor(Colors::kBlack);
  canvas_.PlaceCell(0, 8, report.title, line);

  canvas_.SetFont(FontStyle::Regular, context_.config.fonts.baseSize);
  canvas_.SetTextColor(Colors::kGray);
  canvas_.Cell(0, 5,
               "Data: " + StringUtils::FormatIsoDate(report.createdAt) +
                   " | Status: " + report.status,
               line);
  canvas_.Ln(5);
}

void SectionTitleRenderer::Render(const std::string &title) {
  const BrandPalette &palette = context_.palette;
  canvas_.EnsureSpace(8 + 2 + 7);
  canvas_.SetFillColor(palette.secondary ? Lighten(*palette.secondary, 180)
                                         : CanvasColor{240, 244, 255});
  canvas_.SetDrawColor(palette.primary);
  canvas_.SetTextColor(palette.primary);
  canvas_.SetFont(FontStyle::Bold, context_.config.fonts.sectionSize);

  CellOptions bar;
  bar.border = CellBorder::Left;
  bar.fill = true;
  bar.next = NextPosition::NextLine;
  canvas_.Cell(0, 8, "  " + title, bar);
  canvas_.Ln(2);
}

void InfoTableRenderer::Render(const std::vector<InfoValue> &values) {
  const double fontSize = context_.config.fonts.baseSize;
  const double labelWidth = 60;
  const double valueWidth = canvas_.ContentWidth() - labelWidth;
  const double lineHeight = 5;

  for (size_t i = 0; i < values.size(); ++i) {
    const InfoValue &info = values[i];
    std::vector<RowColumn> columns(2);
    columns[0].width = labelWidth;
    columns[0].text = info.fieldLabel;
    columns[0].style = FontStyle::Bold;
    columns[0].fontSize = fontSize;
    columns[0].color = CanvasColor{55, 65, 81};
    columns[0].lineHeight = lineHeight;
    columns[1].width = valueWidth;
    columns[1].text = info.value.empty() ? "-" : info.value;
    columns[1].fontSize = fontSize;
    columns[1].color = Colors::kBlack;
    columns[1].lineHeight = lineHeight;

    FitColumns(canvas_, columns);
    DrawRow(canvas_, columns, 7,
            i % 2 == 0 ? Colors::kZebraLight : Colors::kZebraDark, nullptr);
  }
  canvas_.Ln(3);
}

double ChecklistTableRenderer::CommentWidth() const {
  return canvas_.ContentWidth() - kLabelWidth - kValueWidth;
}

void ChecklistTableRenderer::RenderHeader() {
  const double fontSize = context_.config.fonts.baseSize;
  canvas_.SetFillColor(context_.palette.primary);
  canvas_.SetTextColor(Colors::kWhite);
  canvas_.SetFont(FontStyle::Bold, fontSize);
  canvas_.Cell(kLabelWidth, 7, "Item de Verificacao", FramedCell(true));
  canvas_.Cell(kValueWidth, 7, "Resultado",
               FramedCell(true, CellAlign::Center));
  canvas_.Cell(CommentWidth(), 7, "Observacoes",
               FramedCell(true, CellAlign::Left, NextPosition::NextLine));
}

void ChecklistTableRenderer::Render(const std::vector<SectionField> &fields) {
  const ChecklistConfig &options = context_.config.checklist;
  const double fontSize = context_.config.fonts.baseSize;

  canvas_.EnsureSpace(7 + 7);
  RenderHeader();

  size_t row = 0;
  for (const auto &field : fields) {
    std::string value = StringUtils::CleanValue(field.responseValue);
    if (value.empty()) {
      if (!options.showAllItems)
        continue;
      value = "-";
    }

    std::vector<RowColumn> columns(3);
    columns[0].width = kLabelWidth;
    columns[0].text = field.label;
    columns[0].fontSize = fontSize;
    columns[0].color = Colors::kBlack;
    columns[0].lineHeight = 5;
    columns[1].width = kValueWidth;
    columns[1].text = value;
    columns[1].style = FontStyle::Bold;
    columns[1].fontSize = fontSize;
    columns[1].color = ChecklistValueColor(value, context_.palette,
                                           options.highlightNonConforming);
    columns[1].align = CellAlign::Center;
    columns[2].width = CommentWidth();
    columns[2].text = field.comment;
    columns[2].style = FontStyle::Italic;
    columns[2].fontSize = fontSize - 1;
    columns[2].color = Colors::kGray;
    columns[2].lineHeight = 4;

    FitColumns(canvas_, columns);
    DrawRow(canvas_, columns, 7,
            row % 2 == 0 ? Colors::kZebraLight : Colors::kWhite,
            [this] { RenderHeader(); });
    ++row;
  }
  canvas_.SetFont(FontStyle::Regular, fontSize);
}

void CertificateTableRenderer::RenderHeader(double fontSize) {
  canvas_.SetFillColor(context_.palette.primary);
  canvas_.SetTextColor(Colors::kWhite);
  canvas_.SetFont(FontStyle::Bold, fontSize);
  canvas_.Cell(50, 7, "Equipamento", FramedCell(true));
  canvas_.Cell(35, 7, "Certificado", FramedCell(true));
  canvas_.Cell(45, 7, "Laboratorio", FramedCell(true));
  canvas_.Cell(25, 7, "Calibracao", FramedCell(true, CellAlign::Center));
  canvas_.Cell(25, 7, "Validade", FramedCell(true, CellAlign::Center));
  canvas_.Cell(0, 7, "Status",
               FramedCell(true, CellAlign::Center, NextPosition::NextLine));
}

void CertificateTableRenderer::Render(
    const std::vector<CertificateRecord> &certificates) {
  if (certificates.empty() || !context_.config.certificates.showTable)
    return;

  const double fontSize = context_.config.fonts.baseSize - 1;
  const double lineHeight = 4;
  canvas_.EnsureSpace(7 + 6);
  RenderHeader(fontSize);

  for (size_t i = 0; i < certificates.size(); ++i) {
    const CertificateRecord &cert = certificates[i];
    std::vector<RowColumn> columns(6);
    columns[0].width = 50;
    columns[0].text = cert.equipmentName;
    columns[1].width = 35;
    columns[1].text = cert.certificateNumber;
    columns[2].width = 45;
    columns[2].text = cert.laboratory.empty() ? "-" : cert.laboratory;
    for (size_t c = 0; c < 3; ++c)
      columns[c].lineHeight = lineHeight;
    columns[3].width = 25;
    columns[3].text = StringUtils::FormatIsoDate(cert.calibrationDate);
    columns[4].width = 25;
    columns[4].text = StringUtils::FormatIsoDate(cert.expiryDate);
    columns[5].width = canvas_.ContentWidth() - 180;
    columns[5].text = CertificateStatusLabel(cert.status, columns[5].color);
    columns[5].style = FontStyle::Bold;
    for (size_t c = 0; c < columns.size(); ++c) {
      columns[c].fontSize = fontSize;
      if (c >= 3)
        columns[c].align = CellAlign::Center;
    }

    FitColumns(canvas_, columns);
    DrawRow(canvas_, columns, 6,
            i % 2 == 0 ? Colors::kZebraLight : Colors::kWhite,
            [&] { RenderHeader(fontSize); });
  }
  canvas_.Ln(3);
}

} // namespace inspectdoc
