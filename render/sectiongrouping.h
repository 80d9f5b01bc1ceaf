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

#include "../models/report.h"

namespace inspectdoc {

// A template field joined with its response, if any.
struct SectionField {
  std::string label;
  std::string fieldType;
  bool answered = false;
  std::string responseValue;
  std::string comment;
  std::vector<PhotoReference> photos;
};

struct SectionGroup {
  std::string name;
  std::vector<SectionField> fields;
};

// Walks the template snapshot in order and attaches the response matching
// (section name, field label). Responses without a template field are
// dropped; template fields without a response stay unanswered.
std::vector<SectionGroup> GroupResponsesBySection(const ReportSnapshot &report);

// Photos of every field in the section, with fieldLabel filled in.
std::vector<PhotoReference> CollectSectionPhotos(const SectionGroup &section);

} // namespace inspectdoc
