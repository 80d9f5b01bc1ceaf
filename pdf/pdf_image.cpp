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
#include "pdf_image.h"

#include <mutex>

#include <wx/image.h>
#include <wx/log.h>
#include <wx/mstream.h>

namespace inspectdoc {
namespace pdf {
namespace {

void EnsureImageHandlers() {
  static std::once_flag once;
  std::call_once(once, [] { wxInitAllImageHandlers(); });
}

const char *ColorSpaceName(int components) {
  switch (components) {
  case 1:
    return "/DeviceGray";
  case 4:
    return "/DeviceCMYK";
  default:
    return "/DeviceRGB";
  }
}

} // namespace

bool ReadJpegHeader(const std::string &bytes, int &width, int &height,
                    int &components) {
  auto byteAt = [&bytes](size_t i) {
    return static_cast<unsigned char>(bytes[i]);
  };
  if (bytes.size() < 4 || byteAt(0) != 0xFF || byteAt(1) != 0xD8)
    return false;
  size_t pos = 2;
  while (pos + 4 <= bytes.size()) {
    if (byteAt(pos) != 0xFF)
      return false;
    const unsigned char marker = byteAt(pos + 1);
    if (marker == 0xFF) {
      ++pos;
      continue;
    }
    if (marker == 0xD8 || marker == 0x01 || (marker >= 0xD0 && marker <= 0xD7)) {
      pos += 2;
      continue;
    }
    const size_t length = (static_cast<size_t>(byteAt(pos + 2)) << 8) | byteAt(pos + 3);
    if (length < 2)
      return false;
    // SOF0..SOF15 except DHT (C4), JPG (C8) and DAC (CC).
    if (marker >= 0xC0 && marker <= 0xCF && marker != 0xC4 && marker != 0xC8 &&
        marker != 0xCC) {
      if (pos + 10 > bytes.size())
        return false;
      height = (byteAt(pos + 5) << 8) | byteAt(pos + 6);
      width = (byteAt(pos + 7) << 8) | byteAt(pos + 8);
      components = byteAt(pos + 9);
      return width > 0 && height > 0 &&
             (components == 1 || components == 3 || components == 4);
    }
    if (marker == 0xDA || marker == 0xD9)
      return false;
    pos += 2 + length;
  }
  return false;
}

bool DecodeImage(const std::string &bytes, PdfImage &image, std::string &error) {
  image = PdfImage{};
  if (bytes.empty()) {
    error = "empty image data";
    return false;
  }
  if (ReadJpegHeader(bytes, image.width, image.height, image.components)) {
    image.jpeg = true;
    image.data = bytes;
    return true;
  }

  EnsureImageHandlers();
  wxLogNull silence;
  wxMemoryInputStream stream(bytes.data(), bytes.size());
  wxImage decoded;
  if (!decoded.LoadFile(stream, wxBITMAP_TYPE_ANY) || !decoded.IsOk()) {
    error = "unsupported or corrupt image data";
    return false;
  }

  image.width = decoded.GetWidth();
  image.height = decoded.GetHeight();
  image.components = 3;
  const size_t pixels =
      static_cast<size_t>(image.width) * static_cast<size_t>(image.height);
  image.data.assign(reinterpret_cast<const char *>(decoded.GetData()),
                    pixels * 3);
  if (decoded.HasAlpha()) {
    image.alpha.assign(reinterpret_cast<const char *>(decoded.GetAlpha()),
                       pixels);
  } else if (decoded.HasMask()) {
    const unsigned char mr = decoded.GetMaskRed();
    const unsigned char mg = decoded.GetMaskGreen();
    const unsigned char mb = decoded.GetMaskBlue();
    image.alpha.resize(pixels);
    const unsigned char *rgb = decoded.GetData();
    for (size_t i = 0; i < pixels; ++i) {
      const bool masked =
          rgb[i * 3] == mr && rgb[i * 3 + 1] == mg && rgb[i * 3 + 2] == mb;
      image.alpha[i] = static_cast<char>(masked ? 0 : 255);
    }
  }
  return image.width > 0 && image.height > 0;
}

bool AppendImageObjects(std::vector<PdfObject> &objects, const PdfImage &image,
                        size_t &objectId, std::string &error) {
  const std::string size = " /Width " + std::to_string(image.width) +
                           " /Height " + std::to_string(image.height);
  if (image.jpeg) {
    std::string dict = "/Type /XObject /Subtype /Image" + size +
                       " /ColorSpace " + ColorSpaceName(image.components) +
                       " /BitsPerComponent 8 /Filter /DCTDecode";
    if (image.components == 4)
      dict += " /Decode [1 0 1 0 1 0 1 0]";
    objects.push_back({MakeStreamObject(dict, image.data)});
    objectId = objects.size();
    return true;
  }

  size_t maskId = 0;
  if (!image.alpha.empty()) {
    std::string compressedMask;
    if (!PdfDeflater::Compress(image.alpha, compressedMask, error))
      return false;
    objects.push_back({MakeStreamObject(
        "/Type /XObject /Subtype /Image" + size +
            " /ColorSpace /DeviceGray /BitsPerComponent 8 /Filter /FlateDecode",
        compressedMask)});
    maskId = objects.size();
  }

  std::string compressed;
  if (!PdfDeflater::Compress(image.data, compressed, error))
    return false;
  std::string dict = "/Type /XObject /Subtype /Image" + size +
                     " /ColorSpace " + ColorSpaceName(image.components) +
                     " /BitsPerComponent 8 /Filter /FlateDecode";
  if (maskId != 0)
    dict += " /SMask " + std::to_string(maskId) + " 0 R";
  objects.push_back({MakeStreamObject(dict, compressed)});
  objectId = objects.size();
  return true;
}

} // namespace pdf
} // namespace inspectdoc
