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
#include "pdf_writer.h"

#include <iomanip>
#include <sstream>

namespace inspectdoc {
namespace pdf {

bool WritePdfDocument(std::string &out, const std::vector<PdfObject> &objects,
                      size_t catalogObjectIndex, size_t infoObjectIndex,
                      std::string &error) {
  if (catalogObjectIndex == 0 || catalogObjectIndex > objects.size()) {
    error = "Catalog object index out of range.";
    return false;
  }
  try {
    std::ostringstream file;
    // Binary comment marks the file as carrying 8-bit data.
    file << "%PDF-1.4\n%\xE2\xE3\xCF\xD3\n";
    std::vector<long> offsets;
    offsets.reserve(objects.size());
    for (size_t i = 0; i < objects.size(); ++i) {
      offsets.push_back(static_cast<long>(file.tellp()));
      file << (i + 1) << " 0 obj\n" << objects[i].body << "\nendobj\n";
    }

    long xrefPos = static_cast<long>(file.tellp());
    file << "xref\n0 " << (objects.size() + 1) << "\n0000000000 65535 f \n";
    for (long off : offsets)
      file << std::setw(10) << std::setfill('0') << off << " 00000 n \n";

    file << "trailer\n<< /Size " << (objects.size() + 1) << " /Root "
         << catalogObjectIndex << " 0 R";
    if (infoObjectIndex != 0)
      file << " /Info " << infoObjectIndex << " 0 R";
    file << " >>\nstartxref\n" << xrefPos << "\n%%EOF\n";
    out = file.str();
    return true;
  } catch (const std::exception &ex) {
    error = std::string("Failed to generate PDF content: ") + ex.what();
    return false;
  }
}

} // namespace pdf
} // namespace inspectdoc
