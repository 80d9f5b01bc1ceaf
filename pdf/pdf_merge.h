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

namespace inspectdoc {

// Appends the pages of each attachment that parses, in order, after the
// pages of primary. Returns primary unchanged when the list is empty or no
// attachment parses. Throws RenderError when primary itself cannot be read.
std::string MergeWithCertificateAttachments(
    const std::string &primary, const std::vector<std::string> &attachments);

} // namespace inspectdoc
