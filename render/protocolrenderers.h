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

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "rendercontext.h"
#include "sectiongrouping.h"

namespace inspectdoc {

using LabelValue = std::pair<std::string, std::string>;

// Layout picked for a protocol section from its upper-cased name.
enum class ProtocolBlock {
  PairedFields,
  InstrumentTriples,
  MeasuredValues,
  GeneralCondition,
  Photos
};

ProtocolBlock ClassifyProtocolSection(const std::string &upperName);

// Rows of the general condition table that are pulled out of the grid.
enum class ConditionRow { Item, Status, Notes, TestCondition };
enum class ConditionMark { None, Ok, Nok, NotApplicable };

ConditionRow ClassifyConditionLabel(const std::string &label);
ConditionMark ClassifyConditionValue(const std::string &value);

// Photos of one section with the instrument-data section they belong to.
struct EquipmentPhotoGroup {
  std::string sectionName;
  std::vector<PhotoReference> photos;
  std::optional<SectionGroup> instrument;
};

// One group per section with photos, in section order. Photo and equipment
// sections are matched to an earlier ambient temperature or ohmic section
// when one of the first two words of its name occurs in their name.
std::vector<EquipmentPhotoGroup>
CollectEquipmentPhotoGroups(const std::vector<SectionGroup> &sections);

// Dense fixed layout tables of the commissioning protocol.
class ProtocolTableRenderer : public SectionRenderer {
public:
  using SectionRenderer::SectionRenderer;

  void RenderTitleBar(const std::string &title);
  void RenderInfoPairs(const std::vector<InfoValue> &values);
  void RenderSection(const SectionGroup &section, size_t index);
  void RenderPairedFields(const std::vector<SectionField> &fields);
  void RenderInstrumentTriples(const std::vector<SectionField> &fields);
  void RenderMeasuredValues(const std::vector<SectionField> &fields);
  void RenderGeneralCondition(const std::vector<SectionField> &fields);
  void RenderSignatures(const ReportSnapshot &report);
  void RenderPhotoPages(const std::vector<SectionGroup> &sections);

private:
  void BreakBeforeRow(double rowHeight);
  void RenderPairs(const std::vector<LabelValue> &pairs);
  void RenderTriples(const std::vector<LabelValue> &triples);
  void RenderSignaturePair(const SignatureRecord &left,
                           const SignatureRecord *right);
  void RenderSingleSignature(const SignatureRecord &signature);
  void RenderPhotoGroup(const EquipmentPhotoGroup &group);
};

} // namespace inspectdoc
