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

// Serializes numbered objects (object n is objects[n - 1]) with an xref
// table and trailer. infoObjectIndex may be 0 when there is no Info dict.
bool WritePdfDocument(std::string &out, const std::vector<PdfObject> &objects,
                      size_t catalogObjectIndex, size_t infoObjectIndex,
                      std::string &error);

} // namespace pdf
} // namespace inspectdoc
