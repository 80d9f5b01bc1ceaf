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
#include "../pdf/documentcanvas.h"
#include "../render/fieldmatrix.h"
#include "../render/protocolrenderers.h"
#include <cassert>
#include <map>
#include <string>

using namespace inspectdoc;

namespace {

SectionField Answered(const std::string &label, const std::string &value) {
  SectionField field;
  field.label = label;
  field.answered = true;
  field.responseValue = value;
  return field;
}

} // namespace

int main() {
  {
    std::string row;
    std::string column;
    assert(SplitRowColumnLabel("Fase A - R-S - 1 min", row, column));
    assert(row == "Fase A - R-S");
    assert(column == "1 min");
    assert(!SplitRowColumnLabel("Observaciones", row, column));
  }

  // Missing combinations stay blank, rows and columns keep first-seen order.
  {
    FieldMatrix m = InferFieldMatrix({Answered("A - X", "[\"1\"]"),
                                      Answered("A - Y", "2"),
                                      Answered("B - X", "3"),
                                      Answered("Notes", "free text")});
    assert(m.HasPattern());
    assert(m.rows.size() == 2 && m.rows[0] == "A" && m.rows[1] == "B");
    assert(m.columns.size() == 2 && m.columns[0] == "X" && m.columns[1] == "Y");
    assert(m.Cell(0, 0) == "1");
    assert(m.Cell(0, 1) == "2");
    assert(m.Cell(1, 0) == "3");
    assert(m.Cell(1, 1).empty());
    assert(m.ungrouped.size() == 1);
    assert(m.ungrouped[0].label == "Notes");
  }

  // A later field for the same cell wins.
  {
    FieldMatrix m = InferFieldMatrix({Answered("A - X", "old"),
                                      Answered("A - X", "new")});
    assert(m.rows.size() == 1 && m.columns.size() == 1);
    assert(m.Cell(0, 0) == "new");
  }

  {
    FieldMatrix m = InferFieldMatrix({Answered("Tension", "1000 V")});
    assert(!m.HasPattern());
    assert(m.ungrouped.size() == 1);
  }

  assert(AbbreviateLabel("Resistencia", 20) == "Resistencia");
  assert(AbbreviateLabel("Resistencia de aislamiento", 10) == "Resistenc.");
  assert(AbbreviateLabel("Medici\xC3\xB3n final", 8) == "Medici\xC3\xB3.");
  assert(AbbreviateLabel("abc", 0).empty());

  assert(ClassifyProtocolSection("TECHNICAL CHARACTERISTICS OF CABLE") ==
         ProtocolBlock::PairedFields);
  assert(ClassifyProtocolSection("AMBIENT TEMPERATURE") ==
         ProtocolBlock::InstrumentTriples);
  assert(ClassifyProtocolSection("MEASURED VALUES") ==
         ProtocolBlock::MeasuredValues);
  assert(ClassifyProtocolSection("GENERAL CONDITION") ==
         ProtocolBlock::GeneralCondition);
  assert(ClassifyProtocolSection("EQUIPMENT PHOTOS") == ProtocolBlock::Photos);
  assert(ClassifyProtocolSection("SOMETHING ELSE") ==
         ProtocolBlock::InstrumentTriples);

  assert(ClassifyConditionLabel("Item status") == ConditionRow::Status);
  assert(ClassifyConditionLabel("General status") == ConditionRow::Item);
  assert(ClassifyConditionLabel("Notes") == ConditionRow::Notes);
  assert(ClassifyConditionLabel("Obser vations") == ConditionRow::Notes);
  assert(ClassifyConditionLabel("Cable notes") == ConditionRow::Item);
  assert(ClassifyConditionLabel("Test condition") ==
         ConditionRow::TestCondition);

  assert(ClassifyConditionValue(" ok ") == ConditionMark::Ok);
  assert(ClassifyConditionValue("Nao conforme") == ConditionMark::Nok);
  assert(ClassifyConditionValue("N/A") == ConditionMark::NotApplicable);
  assert(ClassifyConditionValue("pending") == ConditionMark::None);

  // Photo sections are linked to an earlier instrument section.
  {
    SectionGroup ohmic;
    ohmic.name = "Ohmic Resistance";
    ohmic.fields.push_back(Answered("Instrument", "Megger"));
    SectionGroup photos;
    photos.name = "Ohmic equipment photos";
    SectionField photoField = Answered("Instrument photo", "");
    PhotoReference photo;
    photo.url = "reports/1/p.jpg";
    photoField.photos.push_back(photo);
    photos.fields.push_back(photoField);
    SectionGroup empty;
    empty.name = "Measured values";

    std::vector<EquipmentPhotoGroup> groups =
        CollectEquipmentPhotoGroups({ohmic, empty, photos});
    assert(groups.size() == 1);
    assert(groups[0].sectionName == "Ohmic equipment photos");
    assert(groups[0].photos.size() == 1);
    assert(groups[0].photos[0].fieldLabel == "Instrument photo");
    assert(groups[0].instrument.has_value());
    assert(groups[0].instrument->name == "Ohmic Resistance");
  }

  // Measured values without ROW - COLUMN labels fall back to the
  // three-per-row instrument layout.
  {
    RenderContext context;
    context.palette = ProtocolPalette(TenantBranding{});
    DocumentCanvas canvas{CanvasServices{}};
    canvas.AddPage(true);
    SectionGroup measured;
    measured.name = "Measured values";
    measured.fields = {Answered("Instrument", "Megger MIT525"),
                       Answered("Serial number", "101"),
                       Answered("Range", "5 kV"),
                       Answered("Test voltage", "1 kV")};
    ProtocolTableRenderer(canvas, context).RenderSection(measured, 0);

    std::map<std::string, double> baselines;
    for (const auto &command : canvas.PageCommands(0).commands)
      if (const auto *text = std::get_if<TextCommand>(&command))
        baselines[text->text] = text->baseline;
    assert(baselines.count("  MEASURED VALUES") == 1);
    assert(baselines.count(" Instrument:") == 1);
    assert(baselines.count(" Test voltage:") == 1);
    assert(baselines[" Serial number:"] == baselines[" Instrument:"]);
    assert(baselines[" Range:"] == baselines[" Instrument:"]);
    assert(baselines[" Test voltage:"] > baselines[" Instrument:"]);
    assert(baselines.count("Connection") == 0);
  }
  return 0;
}
