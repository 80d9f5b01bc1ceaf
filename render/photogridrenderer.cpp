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
#include "photogridrenderer.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

#include "../core/stringutils.h"
#include "../pdf/documentcanvas.h"

namespace inspectdoc {

std::string PhotoCaption(const PhotoReference &photo) {
  std::string caption = photo.fieldLabel;
  if (!photo.capturedAt.empty())
    caption += "\n" + StringUtils::FormatCaptureTimestamp(photo.capturedAt);
  if (!photo.address.empty()) {
    caption += "\n" + photo.address;
  } else if (photo.gps) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.5f, %.5f", photo.gps->latitude,
                  photo.gps->longitude);
    caption += "\n";
    caption += buffer;
  }
  return caption;
}

void PhotoGridRenderer::Render(const std::vector<PhotoReference> &photos) {
  if (photos.empty())
    return;
  const PhotosConfig &config = context_.config.photos;

  canvas_.Ln(2);
  canvas_.SetFont(FontStyle::Bold, context_.config.fonts.baseSize);
  canvas_.SetTextColor(Colors::kBlack);
  CellOptions line;
  line.next = NextPosition::NextLine;
  canvas_.Cell(0, 6, "Registro Fotografico:", line);

  // Photos shrink when the configured columns do not fit the content width.
  const int columns = std::max(1, config.columns);
  const double available = canvas_.ContentWidth();
  const double width =
      std::min(config.widthMm, (available - 5.0 * (columns - 1)) / columns);
  const double height = config.heightMm;
  const double rowStep = height + 15;
  const double gutter =
      columns > 1 ? std::max(5.0, std::floor((available - columns * width) /
                                             (columns - 1)))
                  : 0.0;
  const double xStart = canvas_.LeftMargin();
  const size_t count =
      std::min(photos.size(), static_cast<size_t>(std::max(0, config.maxPerSection)));
  if (count == 0)
    return;

  CellOptions caption;
  caption.align = CellAlign::Center;
  double yStart = canvas_.GetY();
  for (size_t i = 0; i < count; ++i) {
    const int column = static_cast<int>(i % columns);
    const int row = static_cast<int>(i / columns);
    const double x = xStart + column * (width + gutter);
    double y = yStart + row * rowStep;
    if (y + rowStep > canvas_.PageBreakY()) {
      canvas_.AddPage(true);
      y = canvas_.GetY();
      yStart = y - row * rowStep;
    }

    canvas_.PlaceImage(photos[i].url, x, y, width);

    canvas_.SetXY(x, y + height);
    canvas_.SetFont(FontStyle::Regular, 7);
    canvas_.SetTextColor(Colors::kGray);
    canvas_.PlaceMultiCell(width, 3, PhotoCaption(photos[i]), caption);
  }

  const int lastRow = static_cast<int>((count - 1) / columns);
  canvas_.SetY(yStart + (lastRow + 1) * (height + 18));
}

void SignatureGridRenderer::Render(
    const std::vector<SignatureRecord> &signatures) {
  if (signatures.empty())
    return;
  const SignaturesConfig &config = context_.config.signatures;

  canvas_.Ln(2);
  const int columns = std::max(1, config.columns);
  const double width = config.boxWidthMm;
  const double height = config.boxHeightMm;
  const double rowStep = height + 25;
  const double gap = 5;
  const double xStart = context_.config.margins.left;

  CellOptions centered;
  centered.align = CellAlign::Center;
  double yStart = canvas_.GetY();
  for (size_t i = 0; i < signatures.size(); ++i) {
    const SignatureRecord &signature = signatures[i];
    const int column = static_cast<int>(i % columns);
    const int row = static_cast<int>(i / columns);
    const double x = xStart + column * (width + gap);
    double y = yStart + row * rowStep;
    if (y + rowStep > canvas_.PageBreakY()) {
      canvas_.AddPage(true);
      y = canvas_.GetY();
      yStart = y - row * rowStep;
    }

    canvas_.SetDrawColor(CanvasColor{200, 200, 200});
    canvas_.DrawRect(x, y, width, height);
    canvas_.PlaceImage(signature.fileKey, x + 2, y + 2, width - 4);

    canvas_.SetXY(x, y + height + 1);
    canvas_.SetFont(FontStyle::Bold, 8);
    canvas_.SetTextColor(Colors::kBlack);
    canvas_.PlaceMultiCell(width, 3.5, signature.roleName, centered);

    if (!signature.signerName.empty()) {
      canvas_.SetXY(x, y + height + 6);
      canvas_.SetFont(FontStyle::Regular, 7);
      canvas_.SetTextColor(Colors::kGray);
      canvas_.PlaceMultiCell(width, 3, signature.signerName, centered);
    }

    canvas_.SetXY(x, y + height + 11);
    canvas_.SetFont(FontStyle::Regular, 7);
    canvas_.SetTextColor(Colors::kGray);
    canvas_.Cell(width, 4, StringUtils::FormatIsoDateTime(signature.signedAt),
                 centered);
  }

  const int lastRow = static_cast<int>((signatures.size() - 1) / columns);
  canvas_.SetY(yStart + (lastRow + 1) * (height + 28));
}

} // namespace inspectdoc
