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
#include "sectiongrouping.h"

#include <map>
#include <utility>

namespace inspectdoc {

std::vector<SectionGroup> GroupResponsesBySection(const ReportSnapshot &report) {
  std::map<std::pair<std::string, std::string>, const ChecklistResponse *>
      responses;
  for (const auto &response : report.checklistResponses)
    responses[{response.sectionName, response.fieldLabel}] = &response;

  std::vector<SectionGroup> groups;
  for (const auto &section : report.templateSnapshot.sections) {
    SectionGroup group;
    group.name = section.name;
    for (const auto &templateField : section.fields) {
      SectionField field;
      field.label = templateField.label;
      field.fieldType = templateField.fieldType;
      auto it = responses.find({section.name, templateField.label});
      if (it != responses.end()) {
        field.answered = true;
        field.responseValue = it->second->responseValue;
        field.comment = it->second->comment;
        field.photos = it->second->photos;
      }
      group.fields.push_back(std::move(field));
    }
    groups.push_back(std::move(group));
  }
  return groups;
}

std::vector<PhotoReference> CollectSectionPhotos(const SectionGroup &section) {
  std::vector<PhotoReference> photos;
  for (const auto &field : section.fields) {
    for (const auto &photo : field.photos) {
      PhotoReference copy = photo;
      copy.fieldLabel = field.label;
      photos.push_back(std::move(copy));
    }
  }
  return photos;
}

} // namespace inspectdoc
