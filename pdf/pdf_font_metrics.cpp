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
#include "pdf_font_metrics.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <map>
#include <sstream>
#include <vector>

namespace inspectdoc {
namespace pdf {
namespace {

// Unicode code points of WinAnsi codes 0x80-0x9F (0 for unused codes).
constexpr uint32_t kWinAnsiHighCodes[32] = {
    0x20AC, 0,      0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
    0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0,      0x017D, 0,
    0,      0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
    0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0,      0x017E, 0x0178};

uint32_t WinAnsiToUnicode(unsigned code) {
  if (code >= 0x80 && code <= 0x9F)
    return kWinAnsiHighCodes[code - 0x80];
  return code;
}

unsigned char EncodeWinAnsiCodepoint(uint32_t codepoint) {
  if (codepoint <= 0x7F || (codepoint >= 0xA0 && codepoint <= 0xFF))
    return static_cast<unsigned char>(codepoint);
  for (unsigned i = 0; i < 32; ++i) {
    if (kWinAnsiHighCodes[i] != 0 && kWinAnsiHighCodes[i] == codepoint)
      return static_cast<unsigned char>(0x80 + i);
  }
  return '?';
}

// Big-endian reader over the raw bytes of a TrueType file.
class TtfReader {
public:
  explicit TtfReader(const std::string &data) : data_(data) {}

  bool Has(size_t offset, size_t count) const {
    return offset + count <= data_.size();
  }
  uint16_t U16(size_t offset) const {
    return static_cast<uint16_t>(
        (static_cast<unsigned char>(data_[offset]) << 8) |
        static_cast<unsigned char>(data_[offset + 1]));
  }
  int16_t S16(size_t offset) const { return static_cast<int16_t>(U16(offset)); }
  uint32_t U32(size_t offset) const {
    return (static_cast<uint32_t>(U16(offset)) << 16) | U16(offset + 2);
  }

  // Reads the table directory. Returns false for truncated files.
  bool ReadDirectory() {
    if (!Has(0, 12))
      return false;
    const uint16_t numTables = U16(4);
    for (uint16_t i = 0; i < numTables; ++i) {
      const size_t record = 12 + static_cast<size_t>(i) * 16;
      if (!Has(record, 16))
        return false;
      const uint32_t offset = U32(record + 8);
      const uint32_t length = U32(record + 12);
      if (!Has(offset, length))
        continue;
      tables_[U32(record)] = {offset, length};
    }
    return true;
  }

  bool Table(const char tag[5], uint32_t &offset, uint32_t &length) const {
    const uint32_t key = (static_cast<uint32_t>(tag[0]) << 24) |
                         (static_cast<uint32_t>(tag[1]) << 16) |
                         (static_cast<uint32_t>(tag[2]) << 8) |
                         static_cast<uint32_t>(tag[3]);
    auto it = tables_.find(key);
    if (it == tables_.end())
      return false;
    offset = it->second.first;
    length = it->second.second;
    return true;
  }

private:
  const std::string &data_;
  std::map<uint32_t, std::pair<uint32_t, uint32_t>> tables_;
};

// Glyph lookup through a format 4 (Windows Unicode BMP) cmap subtable.
class CmapFormat4 {
public:
  CmapFormat4(const TtfReader &reader, size_t base) : reader_(reader) {
    segCount_ = reader.U16(base + 6) / 2;
    endCodes_ = base + 14;
    startCodes_ = endCodes_ + 2 * segCount_ + 2;
    idDeltas_ = startCodes_ + 2 * segCount_;
    idRangeOffsets_ = idDeltas_ + 2 * segCount_;
    valid_ = reader.Has(idRangeOffsets_, 2 * segCount_);
  }

  bool Valid() const { return valid_; }

  uint16_t Glyph(uint32_t code) const {
    if (code > 0xFFFF)
      return 0;
    for (uint16_t i = 0; i < segCount_; ++i) {
      const uint16_t endCode = reader_.U16(endCodes_ + 2 * i);
      const uint16_t startCode = reader_.U16(startCodes_ + 2 * i);
      if (code < startCode || code > endCode)
        continue;
      const int16_t idDelta = reader_.S16(idDeltas_ + 2 * i);
      const uint16_t idRangeOffset = reader_.U16(idRangeOffsets_ + 2 * i);
      if (idRangeOffset == 0)
        return static_cast<uint16_t>(code + idDelta);
      const size_t glyphOffset =
          idRangeOffsets_ + 2 * i + idRangeOffset + 2 * (code - startCode);
      if (!reader_.Has(glyphOffset, 2))
        return 0;
      const uint16_t glyph = reader_.U16(glyphOffset);
      return glyph == 0 ? 0 : static_cast<uint16_t>(glyph + idDelta);
    }
    return 0;
  }

private:
  const TtfReader &reader_;
  uint16_t segCount_ = 0;
  size_t endCodes_ = 0;
  size_t startCodes_ = 0;
  size_t idDeltas_ = 0;
  size_t idRangeOffsets_ = 0;
  bool valid_ = false;
};

} // namespace

const PdfFontDefinition *PdfFontCatalog::Resolve(bool wantBold) const {
  if (wantBold && bold)
    return bold;
  return regular ? regular : bold;
}

std::string EncodeWinAnsi(const std::string &utf8) {
  std::string out;
  out.reserve(utf8.size());
  size_t i = 0;
  while (i < utf8.size()) {
    const unsigned char lead = static_cast<unsigned char>(utf8[i]);
    size_t length = 0;
    uint32_t codepoint = 0;
    if (lead < 0x80) {
      codepoint = lead;
      length = 1;
    } else if ((lead >> 5) == 0x6) {
      codepoint = lead & 0x1F;
      length = 2;
    } else if ((lead >> 4) == 0xE) {
      codepoint = lead & 0x0F;
      length = 3;
    } else if ((lead >> 3) == 0x1E) {
      codepoint = lead & 0x07;
      length = 4;
    }
    if (length == 0 || i + length > utf8.size()) {
      out.push_back('?');
      ++i;
      continue;
    }
    for (size_t k = 1; k < length; ++k)
      codepoint = (codepoint << 6) |
                  (static_cast<unsigned char>(utf8[i + k]) & 0x3F);
    out.push_back(static_cast<char>(EncodeWinAnsiCodepoint(codepoint)));
    i += length;
  }
  return out;
}

double MeasureTextWidth(const std::string &winAnsi, double fontSize,
                        const PdfFontDefinition *font) {
  if (!font || !font->embedded || font->metrics.unitsPerEm <= 0)
    return static_cast<double>(winAnsi.size()) * fontSize * 0.6;
  double units = 0.0;
  for (unsigned char ch : winAnsi) {
    if (ch == '\n')
      continue;
    units += font->metrics.advanceWidths[ch];
  }
  return (units / font->metrics.unitsPerEm) * fontSize;
}

bool ReadFileToString(const std::filesystem::path &path, std::string &out) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open())
    return false;
  std::ostringstream buffer;
  buffer << file.rdbuf();
  out = buffer.str();
  return true;
}

bool LoadTtfFontMetrics(const std::filesystem::path &path,
                        TtfFontMetrics &metrics) {
  metrics = TtfFontMetrics{};
  std::string data;
  if (!ReadFileToString(path, data))
    return false;

  TtfReader reader(data);
  if (!reader.ReadDirectory())
    return false;

  uint32_t head = 0, hhea = 0, maxp = 0, hmtx = 0, cmap = 0, os2 = 0;
  uint32_t headLen = 0, hheaLen = 0, maxpLen = 0, hmtxLen = 0, cmapLen = 0,
           os2Len = 0;
  if (!reader.Table("head", head, headLen) || headLen < 54 ||
      !reader.Table("hhea", hhea, hheaLen) || hheaLen < 36 ||
      !reader.Table("maxp", maxp, maxpLen) || maxpLen < 6 ||
      !reader.Table("hmtx", hmtx, hmtxLen) ||
      !reader.Table("cmap", cmap, cmapLen) || cmapLen < 4)
    return false;

  metrics.unitsPerEm = reader.U16(head + 18);
  metrics.xMin = reader.S16(head + 36);
  metrics.yMin = reader.S16(head + 38);
  metrics.xMax = reader.S16(head + 40);
  metrics.yMax = reader.S16(head + 42);
  metrics.ascent = reader.S16(hhea + 4);
  metrics.descent = reader.S16(hhea + 6);
  metrics.lineGap = reader.S16(hhea + 8);

  const uint16_t numHMetrics = reader.U16(hhea + 34);
  const uint16_t numGlyphs = reader.U16(maxp + 4);
  if (numGlyphs == 0 || numHMetrics == 0 ||
      static_cast<uint32_t>(numHMetrics) * 4 > hmtxLen)
    return false;

  // Glyphs past numHMetrics repeat the last advance.
  std::vector<int> glyphAdvances(numGlyphs, 0);
  for (uint16_t i = 0; i < numGlyphs; ++i) {
    const uint16_t entry = std::min<uint16_t>(i, numHMetrics - 1);
    glyphAdvances[i] = reader.U16(hmtx + static_cast<size_t>(entry) * 4);
  }

  if (reader.Table("OS/2", os2, os2Len) && os2Len >= 90 &&
      reader.U16(os2) >= 2)
    metrics.capHeight = reader.S16(os2 + 88);
  if (metrics.capHeight == 0)
    metrics.capHeight = metrics.ascent;

  size_t subtable = 0;
  const uint16_t encodings = reader.U16(cmap + 2);
  for (uint16_t i = 0; i < encodings; ++i) {
    const size_t record = cmap + 4 + static_cast<size_t>(i) * 8;
    if (!reader.Has(record, 8))
      return false;
    const uint16_t platformId = reader.U16(record);
    const uint16_t encodingId = reader.U16(record + 2);
    const size_t offset = cmap + reader.U32(record + 4);
    if (!reader.Has(offset, 14))
      continue;
    if (platformId == 3 && (encodingId == 1 || encodingId == 0) &&
        reader.U16(offset) == 4) {
      subtable = offset;
      break;
    }
  }
  if (subtable == 0)
    return false;
  CmapFormat4 glyphs(reader, subtable);
  if (!glyphs.Valid())
    return false;

  const int missingWidth = glyphAdvances[0];
  for (unsigned code = 0; code < 256; ++code) {
    const uint16_t glyph = glyphs.Glyph(WinAnsiToUnicode(code));
    const int advance =
        glyph < glyphAdvances.size() ? glyphAdvances[glyph] : missingWidth;
    metrics.advanceWidths[code] = advance;
    metrics.widths1000[code] =
        metrics.unitsPerEm > 0
            ? static_cast<int>(std::lround(advance * 1000.0 / metrics.unitsPerEm))
            : 0;
  }

  metrics.data = std::move(data);
  metrics.valid = metrics.unitsPerEm > 0;
  return metrics.valid;
}

std::filesystem::path FindFontPath(bool bold) {
  struct FontCandidate {
    const char *regularPath;
    const char *boldPath;
  };
  static const FontCandidate candidates[] = {
#ifdef _WIN32
      {"C:/Windows/Fonts/arial.ttf", "C:/Windows/Fonts/arialbd.ttf"},
#elif defined(__APPLE__)
      {"/Library/Fonts/Arial.ttf", "/Library/Fonts/Arial Bold.ttf"},
#else
      {"/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
       "/usr/share/fonts/truetype/dejavu/DejaVuSans-Bold.ttf"},
      {"/usr/share/fonts/dejavu/DejaVuSans.ttf",
       "/usr/share/fonts/dejavu/DejaVuSans-Bold.ttf"},
      {"/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
       "/usr/share/fonts/truetype/liberation/LiberationSans-Bold.ttf"},
#endif
  };
  std::error_code ec;
  for (const auto &candidate : candidates) {
    const char *path = bold ? candidate.boldPath : candidate.regularPath;
    if (std::filesystem::exists(path, ec))
      return std::filesystem::path(path);
  }
  return {};
}

bool LoadPdfFontMetrics(PdfFontDefinition &font, bool bold,
                        const std::filesystem::path &overridePath) {
  const std::filesystem::path path =
      overridePath.empty() ? FindFontPath(bold) : overridePath;
  if (path.empty())
    return false;
  return LoadTtfFontMetrics(path, font.metrics);
}

} // namespace pdf
} // namespace inspectdoc
