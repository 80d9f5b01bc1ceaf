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
#include "coverrenderer.h"

#include <algorithm>
#include <string>

#include "../core/stringutils.h"
#include "../pdf/documentcanvas.h"

namespace inspectdoc {
namespace {

constexpr size_t kMaxCoverInfoFields = 8;
constexpr size_t kMaxCoverSignatures = 3;

} // namespace

void CoverRenderer::Render(const ReportSnapshot &report) {
  if (!context_.config.coverPage.enabled)
    return;

  const CanvasColor primary = context_.palette.primary;
  canvas_.SetAutoPageBreak(false, 0);
  canvas_.AddPage(false);

  canvas_.SetFillColor(primary);
  canvas_.DrawRect(0, 0, 210, 6, false, true);

  double y = 25;
  if (!context_.tenant.logoPrimaryKey.empty()) {
    if (canvas_.PlaceImage(context_.tenant.logoPrimaryKey, 75, y, 60) > 0)
      y += 30;
    else
      y += 5;
  }

  CellOptions centered;
  centered.align = CellAlign::Center;
  centered.next = NextPosition::NextLine;

  canvas_.SetXY(10, y);
  canvas_.SetFont(FontStyle::Bold, 16);
  canvas_.SetTextColor(CanvasColor{50, 50, 50});
  const std::string name =
      context_.tenant.name.empty() ? "EMPRESA" : context_.tenant.name;
  canvas_.Cell(190, 10, StringUtils::ToUpper(name), centered);
  y = canvas_.GetY() + 5;

  canvas_.SetDrawColor(CanvasColor{200, 200, 200});
  canvas_.SetLineWidth(0.3);
  canvas_.DrawLine(40, y, 170, y);
  y += 10;

  canvas_.SetXY(20, y);
  canvas_.SetFont(FontStyle::Bold, 18);
  canvas_.SetTextColor(primary);
  const std::string title =
      report.title.empty() ? context_.templateInfo.name : report.title;
  canvas_.PlaceMultiCell(170, 9, title, centered);
  y = canvas_.GetY() + 3;

  canvas_.SetXY(10, y);
  canvas_.SetFont(FontStyle::Regular, 10);
  canvas_.SetTextColor(CanvasColor{150, 150, 150});
  canvas_.Cell(190, 6,
               context_.templateInfo.code + " - v" +
                   context_.templateInfo.version,
               centered);
  y = canvas_.GetY() + 10;

  RenderInfoFieldLines(report.templateSnapshot, y);
  RenderSignatureRoles(report.templateSnapshot, y);

  canvas_.SetFillColor(primary);
  canvas_.DrawRect(0, 293, 210, 4, false, true);
}

void CoverRenderer::RenderInfoFieldLines(const TemplateSnapshot &snapshot,
                                         double &y) {
  if (snapshot.infoFields.empty())
    return;
  canvas_.SetXY(30, y);
  const size_t count = std::min(snapshot.infoFields.size(), kMaxCoverInfoFields);
  for (size_t i = 0; i < count; ++i) {
    if (canvas_.GetY() > 220)
      break;
    const std::string &label = snapshot.infoFields[i].label;
    canvas_.SetFont(FontStyle::Regular, 10);
    canvas_.SetTextColor(Colors::kGray);
    const double labelWidth = canvas_.StringWidth(label + ": ");
    canvas_.Cell(labelWidth + 2, 8, label + ":");

    const double lineY = canvas_.GetY() + 7;
    canvas_.SetDrawColor(CanvasColor{180, 180, 180});
    canvas_.SetLineWidth(0.2);
    for (double x = canvas_.GetX() + 2; x < 175; x += 3)
      canvas_.DrawLine(x, lineY, x + 1.5, lineY);
    canvas_.SetXY(30, canvas_.GetY() + 10);
  }
  y = canvas_.GetY() + 5;
}

void CoverRenderer::RenderSignatureRoles(const TemplateSnapshot &snapshot,
                                         double y) {
  if (snapshot.signatureFields.empty())
    return;
  double sigY = std::max(y, 240.0);
  if (sigY > 265)
    sigY = 240;
  const size_t count =
      std::min(snapshot.signatureFields.size(), kMaxCoverSignatures);
  const double width = 50;
  const double gap = 10;
  const double total = count * width + (count - 1) * gap;
  const double startX = (210 - total) / 2;

  CellOptions centered;
  centered.align = CellAlign::Center;
  for (size_t i = 0; i < count; ++i) {
    const double x = startX + i * (width + gap);
    canvas_.SetDrawColor(Colors::kGray);
    canvas_.SetLineWidth(0.3);
    canvas_.DrawLine(x, sigY, x + width, sigY);
    canvas_.SetXY(x, sigY + 1);
    canvas_.SetFont(FontStyle::Regular, 8);
    canvas_.SetTextColor(Colors::kGray);
    canvas_.Cell(width, 4, snapshot.signatureFields[i].roleName, centered);
  }
}

void ProtocolCoverRenderer::Render() {
  const CanvasColor primary = context_.palette.primary;
  const TenantBranding &tenant = context_.tenant;
  canvas_.SetAutoPageBreak(false, 0);
  canvas_.AddPage(false);

  canvas_.PlaceImage(tenant.logoPrimaryKey, 10, 10, 40);

  CellOptions right;
  right.align = CellAlign::Right;
  canvas_.SetFont(FontStyle::Bold, 9);
  canvas_.SetTextColor(primary);
  canvas_.SetXY(60, 12);
  canvas_.Cell(140, 5, context_.config.protocol.title, right);

  canvas_.SetDrawColor(primary);
  canvas_.SetLineWidth(0.4);
  canvas_.DrawLine(10, 25, 200, 25);

  const double boxY = 100;
  const double boxH = 50;
  canvas_.SetDrawColor(Colors::kBlack);
  canvas_.SetLineWidth(0.5);
  canvas_.DrawRect(30, boxY, 150, boxH);

  CellOptions centered;
  centered.align = CellAlign::Center;
  canvas_.SetFont(FontStyle::Bold, 16);
  canvas_.SetTextColor(Colors::kBlack);
  canvas_.SetXY(35, boxY + 10);
  const std::string name = context_.templateInfo.name.empty()
                               ? "ELECTRICAL TESTS"
                               : context_.templateInfo.name;
  canvas_.PlaceMultiCell(140, 8, StringUtils::ToUpper(name), centered);

  if (!context_.templateInfo.code.empty()) {
    canvas_.SetFont(FontStyle::Regular, 10);
    canvas_.SetTextColor(CanvasColor{80, 80, 80});
    canvas_.SetXY(35, boxY + boxH - 15);
    canvas_.Cell(140, 6,
                 context_.templateInfo.code + " - v" +
                     context_.templateInfo.version,
                 centered);
  }

  canvas_.SetY(-30);
  canvas_.SetDrawColor(CanvasColor{180, 180, 180});
  canvas_.SetLineWidth(0.2);
  canvas_.DrawLine(10, canvas_.GetY(), 200, canvas_.GetY());
  canvas_.Ln(2);

  canvas_.SetFont(FontStyle::Regular, 7);
  canvas_.SetTextColor(Colors::kGray);
  centered.next = NextPosition::NextLine;
  if (!tenant.address.empty())
    canvas_.Cell(0, 3, tenant.address, centered);
  const std::string contact =
      StringUtils::JoinNonEmpty({tenant.phone, tenant.website}, " | ");
  if (!contact.empty())
    canvas_.Cell(0, 3, contact, centered);
  right.expandPageCount = true;
  canvas_.Cell(0, 3, std::to_string(canvas_.PageNumber()) + "/{nb}", right);
}

} // namespace inspectdoc
