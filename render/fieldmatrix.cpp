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
#include "fieldmatrix.h"

#include <algorithm>

#include "../core/stringutils.h"

namespace inspectdoc {
namespace {

constexpr const char *kSeparator = " - ";

size_t IndexOf(std::vector<std::string> &values, const std::string &value) {
  auto it = std::find(values.begin(), values.end(), value);
  if (it != values.end())
    return static_cast<size_t>(it - values.begin());
  values.push_back(value);
  return values.size() - 1;
}

bool IsContinuationByte(unsigned char c) { return (c & 0xC0) == 0x80; }

} // namespace

bool SplitRowColumnLabel(const std::string &label, std::string &row,
                         std::string &column) {
  const size_t pos = label.rfind(kSeparator);
  if (pos == std::string::npos)
    return false;
  row = label.substr(0, pos);
  column = label.substr(pos + 3);
  return true;
}

FieldMatrix InferFieldMatrix(const std::vector<SectionField> &fields) {
  FieldMatrix matrix;
  struct Entry {
    size_t row;
    size_t column;
    std::string value;
  };
  std::vector<Entry> entries;

  for (const auto &field : fields) {
    std::string row;
    std::string column;
    if (!SplitRowColumnLabel(field.label, row, column)) {
      matrix.ungrouped.push_back(field);
      continue;
    }
    const size_t rowIndex = IndexOf(matrix.rows, row);
    const size_t columnIndex = IndexOf(matrix.columns, column);
    entries.push_back(
        {rowIndex, columnIndex, StringUtils::CleanValue(field.responseValue)});
  }

  matrix.cells.assign(matrix.rows.size(),
                      std::vector<std::string>(matrix.columns.size()));
  for (const auto &entry : entries)
    matrix.cells[entry.row][entry.column] = entry.value;
  return matrix;
}

std::string AbbreviateLabel(const std::string &text, size_t maxChars) {
  if (maxChars == 0)
    return {};
  size_t count = 0;
  size_t cut = std::string::npos;
  for (size_t i = 0; i < text.size(); ++i) {
    if (IsContinuationByte(static_cast<unsigned char>(text[i])))
      continue;
    if (count == maxChars - 1)
      cut = i;
    ++count;
  }
  if (count <= maxChars)
    return text;
  return text.substr(0, cut) + ".";
}

} // namespace inspectdoc
