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

#include "pdf_objects.h"

#include <string>
#include <vector>

namespace inspectdoc {
namespace pdf {

// Image ready to be written as an XObject.
struct PdfImage {
  int width = 0;
  int height = 0;
  int components = 3;    // 1 gray, 3 RGB, 4 CMYK
  bool jpeg = false;     // data is a DCTDecode stream
  std::string data;      // JPEG file or raw samples
  std::string alpha;     // Optional 8-bit soft mask samples
};

// Reads the frame header of a JPEG file. Returns false when the bytes are
// not a baseline or progressive JPEG.
bool ReadJpegHeader(const std::string &bytes, int &width, int &height,
                    int &components);

// JPEG data is kept as is; PNG, GIF and BMP are decoded with wxImage.
bool DecodeImage(const std::string &bytes, PdfImage &image, std::string &error);

// Appends the image (and its soft mask) and returns the XObject number.
bool AppendImageObjects(std::vector<PdfObject> &objects, const PdfImage &image,
                        size_t &objectId, std::string &error);

} // namespace pdf
} // namespace inspectdoc
