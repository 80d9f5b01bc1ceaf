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
#include "pagedecorators.h"

#include <string>

#include "../core/stringutils.h"

namespace inspectdoc {

void ComponentHeader::Decorate(DocumentCanvas &canvas) {
  const BrandPalette &palette = context_.palette;
  const TemplateInfo &info = context_.templateInfo;

  canvas.PlaceImage(context_.tenant.logoPrimaryKey, 10, 8, 40);

  canvas.SetFont(FontStyle::Bold, context_.config.fonts.headerSize);
  canvas.SetTextColor(palette.primary);
  canvas.SetXY(60, 10);
  CellOptions centered;
  centered.align = CellAlign::Center;
  canvas.Cell(90, 8, info.name, centered);

  canvas.PlaceImage(context_.tenant.logoSecondaryKey, 160, 8, 40);

  canvas.SetFont(FontStyle::Regular, 10);
  canvas.SetTextColor(Colors::kGray);
  canvas.SetXY(60, 20);
  std::string subtitle = "Codigo: " + info.code + " | Versao: " + info.version;
  if (info.revisionNumber > 0)
    subtitle += " | Rev. " + std::to_string(info.revisionNumber);
  canvas.Cell(90, 6, subtitle, centered);

  canvas.SetDrawColor(palette.primary);
  canvas.SetLineWidth(0.5);
  canvas.DrawLine(10, 30, 200, 30);
  canvas.Ln(30);
}

void ComponentFooter::Decorate(DocumentCanvas &canvas) {
  const TenantBranding &tenant = context_.tenant;
  const BrandPalette &palette = context_.palette;

  canvas.SetY(-22);
  canvas.SetDrawColor(palette.secondary ? *palette.secondary : palette.primary);
  canvas.SetLineWidth(0.3);
  canvas.DrawLine(10, canvas.GetY(), 200, canvas.GetY());
  canvas.Ln(1);

  canvas.SetFont(FontStyle::Regular, 7);
  canvas.SetTextColor(CanvasColor{128, 128, 128});
  CellOptions centered;
  centered.align = CellAlign::Center;

  canvas.Cell(0, 4, StringUtils::JoinNonEmpty({tenant.name, tenant.address}, " | "),
              centered);
  canvas.Ln(3.5);

  const std::string contact = StringUtils::JoinNonEmpty(
      {tenant.phone, tenant.email, tenant.website}, " | ");
  if (!contact.empty()) {
    canvas.Cell(0, 4, contact, centered);
    canvas.Ln(3.5);
  }

  canvas.Cell(0, 4,
              "Pagina " + std::to_string(canvas.PageNumber()) + "/{nb}",
              centered);
}

void ProtocolHeader::Decorate(DocumentCanvas &canvas) {
  const BrandPalette &palette = context_.palette;

  canvas.PlaceImage(context_.tenant.logoPrimaryKey, 10, 5, 30);

  CellOptions right;
  right.align = CellAlign::Right;
  canvas.SetFont(FontStyle::Bold, 8);
  canvas.SetTextColor(palette.primary);
  canvas.SetXY(45, 8);
  canvas.Cell(155, 4, context_.config.protocol.title, right);
  canvas.SetXY(45, 13);
  canvas.SetFont(FontStyle::Regular, 7);
  canvas.Cell(155, 4, context_.templateInfo.name, right);

  canvas.SetDrawColor(palette.primary);
  canvas.SetLineWidth(0.3);
  canvas.DrawLine(10, 20, 200, 20);
  canvas.SetY(22);
}

void ProtocolFooter::Decorate(DocumentCanvas &canvas) {
  const TenantBranding &tenant = context_.tenant;

  canvas.SetY(-15);
  canvas.SetDrawColor(CanvasColor{180, 180, 180});
  canvas.SetLineWidth(0.2);
  canvas.DrawLine(10, canvas.GetY(), 200, canvas.GetY());
  canvas.Ln(1);

  canvas.SetFont(FontStyle::Regular, 6);
  canvas.SetTextColor(Colors::kGray);
  canvas.Cell(170, 3,
              StringUtils::JoinNonEmpty(
                  {tenant.address, tenant.phone, tenant.website}, " | "));
  CellOptions right;
  right.align = CellAlign::Right;
  canvas.Cell(0, 3, std::to_string(canvas.PageNumber()) + "/{nb}", right);
}

} // namespace inspectdoc
