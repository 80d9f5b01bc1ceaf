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

#include <string>
#include <vector>

#include "sectiongrouping.h"

namespace inspectdoc {

// Table inferred from labels of the form "{ROW} - {COLUMN}". Rows and
// columns keep first-seen order; cells[row][column] is blank when no field
// provides it. Fields without the pattern are kept aside in ungrouped.
struct FieldMatrix {
  std::vector<std::string> rows;
  std::vector<std::string> columns;
  std::vector<std::vector<std::string>> cells;
  std::vector<SectionField> ungrouped;

  bool HasPattern() const { return !columns.empty(); }
  const std::string &Cell(size_t row, size_t column) const {
    return cells[row][column];
  }
};

// Splits on the last " - ". Returns false when the separator is absent.
bool SplitRowColumnLabel(const std::string &label, std::string &row,
                         std::string &column);

// Values are cleaned of array-literal punctuation. A later field for the
// same (row, column) replaces an earlier one.
FieldMatrix InferFieldMatrix(const std::vector<SectionField> &fields);

// Keeps at most maxChars characters, replacing the last kept one with '.'
// when the text is longer. Counts UTF-8 code points.
std::string AbbreviateLabel(const std::string &text, size_t maxChars);

} // namespace inspectdoc
