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
#include "protocolrenderers.h"

#include <algorithm>
#include <initializer_list>
#include <sstream>

#include "../core/stringutils.h"
#include "../pdf/documentcanvas.h"
#include "fieldmatrix.h"

namespace inspectdoc {
namespace {

constexpr double kTableWidth = 190;
constexpr double kRowHeight = 5;
constexpr double kBottomReserve = 20;
constexpr CanvasColor kConditionFill{240, 240, 240};

bool ContainsAny(const std::string &text,
                 std::initializer_list<const char *> needles) {
  for (const char *needle : needles)
    if (StringUtils::Contains(text, needle))
      return true;
  return false;
}

bool IsOneOf(const std::string &value,
             std::initializer_list<const char *> set) {
  for (const char *candidate : set)
    if (value == candidate)
      return true;
  return false;
}

std::vector<LabelValue> ToLabelValues(const std::vector<SectionField> &fields) {
  std::vector<LabelValue> pairs;
  pairs.reserve(fields.size());
  for (const auto &field : fields)
    pairs.emplace_back(field.label,
                       StringUtils::CleanValue(field.responseValue));
  return pairs;
}

std::vector<std::string> SplitWords(const std::string &text) {
  std::istringstream stream(text);
  std::vector<std::string> words;
  std::string word;
  while (stream >> word)
    words.push_back(word);
  return words;
}

CellOptions Framed(bool fill, CellAlign align = CellAlign::Left,
                   NextPosition next = NextPosition::Right) {
  CellOptions options;
  options.border = CellBorder::Frame;
  options.fill = fill;
  options.align = align;
  options.next = next;
  return options;
}

} // namespace

ProtocolBlock ClassifyProtocolSection(const std::string &upperName) {
  if (StringUtils::Contains(upperName, "TECHNICAL CHARACTERISTICS"))
    return ProtocolBlock::PairedFields;
  if (ContainsAny(upperName, {"AMBIENT TEMPERATURE", "OHMIC", "INSTRUMENT"}))
    return ProtocolBlock::InstrumentTriples;
  if (StringUtils::Contains(upperName, "MEASURED VALUES"))
    return ProtocolBlock::MeasuredValues;
  if (StringUtils::Contains(upperName, "GENERAL CONDITION"))
    return ProtocolBlock::GeneralCondition;
  if (ContainsAny(upperName, {"PHOTO", "EQUIPMENT"}))
    return ProtocolBlock::Photos;
  return ProtocolBlock::InstrumentTriples;
}

ConditionRow ClassifyConditionLabel(const std::string &label) {
  const std::string upper = StringUtils::ToUpper(label);
  if (StringUtils::Contains(upper, "STATUS") &&
      !StringUtils::Contains(upper, "GENERAL"))
    return ConditionRow::Status;

  std::string compact = upper;
  compact.erase(std::remove(compact.begin(), compact.end(), ' '),
                compact.end());
  if ((StringUtils::Contains(upper, "NOTE") ||
       StringUtils::Contains(compact, "OBSERVATION")) &&
      !ContainsAny(upper, {"ITEM", "CABLE"}))
    return ConditionRow::Notes;

  if (ContainsAny(upper, {"TEST CONDITION", "CONDITION OF TEST"}))
    return ConditionRow::TestCondition;
  return ConditionRow::Item;
}

ConditionMark ClassifyConditionValue(const std::string &value) {
  const std::string upper = StringUtils::ToUpper(StringUtils::Trim(value));
  if (IsOneOf(upper, {"OK", "SIM", "CONFORME", "YES"}))
    return ConditionMark::Ok;
  if (IsOneOf(upper, {"NOK", "NAO", "NAO CONFORME", "NO"}))
    return ConditionMark::Nok;
  if (IsOneOf(upper, {"N/A", "NA", "N.A."}))
    return ConditionMark::NotApplicable;
  return ConditionMark::None;
}

std::vector<EquipmentPhotoGroup>
CollectEquipmentPhotoGroups(const std::vector<SectionGroup> &sections) {
  std::vector<EquipmentPhotoGroup> groups;
  std::vector<const SectionGroup *> instruments;

  for (const auto &section : sections) {
    const std::string upper = StringUtils::ToUpper(section.name);
    if (ContainsAny(upper, {"AMBIENT TEMPERATURE", "OHMIC"}))
      instruments.push_back(&section);

    EquipmentPhotoGroup group;
    group.sectionName = section.name;
    group.photos = CollectSectionPhotos(section);
    if (group.photos.empty())
      continue;

    if (ContainsAny(upper, {"PHOTO", "EQUIPMENT"})) {
      for (const SectionGroup *instrument : instruments) {
        std::vector<std::string> words =
            SplitWords(StringUtils::ToUpper(instrument->name));
        if (words.size() > 2)
          words.resize(2);
        const bool matches =
            std::any_of(words.begin(), words.end(), [&](const std::string &w) {
              return StringUtils::Contains(upper, w);
            });
        if (matches) {
          group.instrument = *instrument;
          break;
        }
      }
    }
    groups.push_back(std::move(group));
  }
  return groups;
}

void ProtocolTableRenderer::BreakBeforeRow(double rowHeight) {
  if (canvas_.GetY() + rowHeight > DocumentCanvas::kPageHeight - kBottomReserve)
    canvas_.AddPage(true);
}

void ProtocolTableRenderer::RenderTitleBar(const std::string &title) {
  if (canvas_.GetY() > DocumentCanvas::kPageHeight - 30)
    canvas_.AddPage(true);
  canvas_.SetFillColor(context_.palette.primary);
  canvas_.SetTextColor(Colors::kWhite);
  canvas_.SetFont(FontStyle::Bold, 7);
  CellOptions bar;
  bar.fill = true;
  bar.next = NextPosition::NextLine;
  canvas_.Cell(0, 5, "  " + title, bar);
  canvas_.SetTextColor(Colors::kBlack);
}

void ProtocolTableRenderer::RenderInfoPairs(
    const std::vector<InfoValue> &values) {
  if (values.empty())
    return;

  struct Slot {
    const char *label;
    double fraction;
  };
  static const std::vector<std::vector<Slot>> kRows = {
      {{"Customer", 0.5}, {"O.S.", 0.25}, {"Date", 0.25}},
      {{"Plant", 0.5}, {"City-State", 0.5}},
      {{"Location", 0.5}, {"Circuit", 0.5}},
      {{"Source", 0.5}, {"Load", 0.5}},
  };

  auto lookup = [&values](const std::string &label) {
    std::string exact;
    std::string folded;
    for (const auto &info : values) {
      if (info.fieldLabel == label)
        exact = info.value;
      else if (folded.empty() &&
               StringUtils::EqualsIgnoreCase(info.fieldLabel, label))
        folded = info.value;
    }
    return exact.empty() ? folded : exact;
  };

  for (const auto &row : kRows) {
    BreakBeforeRow(kRowHeight);
    const double y = canvas_.GetY();
    double x = 10;
    for (const auto &slot : row) {
      const double width = kTableWidth * slot.fraction;
      const double labelWidth = std::min(width * 0.4, 35.0);
      canvas_.SetXY(x, y);
      canvas_.SetFont(FontStyle::Bold, 7);
      canvas_.SetFillColor(Colors::kProtocolLabel);
      canvas_.Cell(labelWidth, kRowHeight, std::string(" ") + slot.label + ":",
                   Framed(true));
      canvas_.SetFont(FontStyle::Regular, 7);
      canvas_.Cell(width - labelWidth, kRowHeight, " " + lookup(slot.label),
                   Framed(false));
      x += width;
    }
    canvas_.SetY(y + kRowHeight);
  }

  std::vector<LabelValue> remaining;
  for (const auto &info : values) {
    bool fixed = false;
    for (const auto &row : kRows)
      for (const auto &slot : row)
        fixed = fixed || StringUtils::EqualsIgnoreCase(info.fieldLabel,
                                                       slot.label);
    if (!fixed)
      remaining.emplace_back(info.fieldLabel, info.value);
  }
  if (!remaining.empty())
    RenderPairs(remaining);
  else
    canvas_.Ln(1);
}

void ProtocolTableRenderer::RenderSection(const SectionGroup &section,
                                          size_t index) {
  const std::string name = section.name.empty()
                               ? "SECTION " + std::to_string(index + 1)
                               : StringUtils::ToUpper(section.name);
  const ProtocolBlock block = ClassifyProtocolSection(name);
  if (block == ProtocolBlock::Photos)
    return;

  RenderTitleBar(name);
  switch (block) {
  case ProtocolBlock::PairedFields:
    RenderPairedFields(section.fields);
    break;
  case ProtocolBlock::MeasuredValues:
    RenderMeasuredValues(section.fields);
    break;
  case ProtocolBlock::GeneralCondition:
    RenderGeneralCondition(section.fields);
    break;
  default:
    RenderInstrumentTriples(section.fields);
    break;
  }
}

void ProtocolTableRenderer::RenderPairedFields(
    const std::vector<SectionField> &fields) {
  RenderPairs(ToLabelValues(fields));
}

void ProtocolTableRenderer::RenderPairs(const std::vector<LabelValue> &pairs) {
  const double columnWidth = kTableWidth / 2;
  const double labelWidth = 40;
  const double valueWidth = columnWidth - labelWidth;

  for (size_t i = 0; i < pairs.size(); i += 2) {
    BreakBeforeRow(kRowHeight);
    const double y = canvas_.GetY();
    canvas_.SetXY(10, y);
    canvas_.SetFillColor((i / 2) % 2 == 0 ? Colors::kProtocolZebra
                                          : Colors::kWhite);
    for (size_t j = i; j < i + 2; ++j) {
      if (j >= pairs.size()) {
        canvas_.Cell(columnWidth, kRowHeight, "", Framed(true));
        break;
      }
      canvas_.SetFont(FontStyle::Bold, 7);
      canvas_.Cell(labelWidth, kRowHeight, " " + pairs[j].first + ":",
                   Framed(true));
      canvas_.SetFont(FontStyle::Regular, 7);
      canvas_.Cell(valueWidth, kRowHeight, " " + pairs[j].second,
                   Framed(true));
    }
    canvas_.SetY(y + kRowHeight);
  }
  canvas_.Ln(1);
}

void ProtocolTableRenderer::RenderInstrumentTriples(
    const std::vector<SectionField> &fields) {
  RenderTriples(ToLabelValues(fields));
}

void ProtocolTableRenderer::RenderTriples(
    const std::vector<LabelValue> &triples) {
  const double columnWidth = kTableWidth / 3;
  const double labelWidth = std::min(columnWidth * 0.45, 30.0);
  const double valueWidth = columnWidth - labelWidth;

  for (size_t i = 0; i < triples.size(); i += 3) {
    BreakBeforeRow(kRowHeight);
    const double y = canvas_.GetY();
    double x = 10;
    for (size_t j = i; j < i + 3; ++j) {
      canvas_.SetXY(x, y);
      if (j < triples.size()) {
        canvas_.SetFillColor((i / 3) % 2 == 0 ? Colors::kProtocolZebra
                                              : Colors::kWhite);
        canvas_.SetFont(FontStyle::Bold, 6.5);
        canvas_.Cell(labelWidth, kRowHeight, " " + triples[j].first + ":",
                     Framed(true));
        canvas_.SetFont(FontStyle::Regular, 6.5);
        canvas_.Cell(valueWidth, kRowHeight, " " + triples[j].second,
                     Framed(true));
      } else {
        canvas_.Cell(columnWidth, kRowHeight, "", Framed(false));
      }
      x += columnWidth;
    }
    canvas_.SetY(y + kRowHeight);
  }
  canvas_.Ln(1);
}

void ProtocolTableRenderer::RenderMeasuredValues(
    const std::vector<SectionField> &fields) {
  if (fields.empty())
    return;
  const FieldMatrix matrix = InferFieldMatrix(fields);
  if (!matrix.HasPattern()) {
    RenderInstrumentTriples(fields);
    return;
  }

  const double fontSize = 6.5;
  const double connectionWidth = 50;
  const double columnWidth = 140.0 / matrix.columns.size();
  const CanvasColor accent =
      context_.palette.accent ? *context_.palette.accent : Colors::kSuccess;

  BreakBeforeRow(kRowHeight * 2);
  canvas_.SetFillColor(context_.palette.primary);
  canvas_.SetTextColor(Colors::kWhite);
  canvas_.SetFont(FontStyle::Bold, fontSize);
  canvas_.SetX(10);
  canvas_.Cell(connectionWidth, kRowHeight, "Connection",
               Framed(true, CellAlign::Center));
  for (const auto &column : matrix.columns)
    canvas_.Cell(columnWidth, kRowHeight, AbbreviateLabel(column, 10),
                 Framed(true, CellAlign::Center));
  canvas_.Ln(kRowHeight);

  for (size_t row = 0; row < matrix.rows.size(); ++row) {
    BreakBeforeRow(kRowHeight);
    const double y = canvas_.GetY();
    canvas_.SetXY(10, y);
    canvas_.SetFillColor(row % 2 == 0 ? Colors::kProtocolZebra
                                      : Colors::kWhite);
    canvas_.SetTextColor(Colors::kBlack);
    canvas_.SetFont(FontStyle::Bold, fontSize);
    canvas_.Cell(connectionWidth, kRowHeight,
                 AbbreviateLabel(matrix.rows[row], 25), Framed(true));

    for (size_t column = 0; column < matrix.columns.size(); ++column) {
      const std::string &value = matrix.Cell(row, column);
      canvas_.SetTextColor(Colors::kBlack);
      canvas_.SetFont(FontStyle::Regular, fontSize);
      if (!value.empty() &&
          StringUtils::EqualsIgnoreCase(matrix.columns[column], "status")) {
        const std::string upper = StringUtils::ToUpper(value);
        if (IsOneOf(upper, {"OK", "APPROVED", "PASS", "CONFORME"})) {
          canvas_.SetTextColor(accent);
          canvas_.SetFont(FontStyle::Bold, fontSize);
        } else if (IsOneOf(upper, {"NOK", "REPROVED", "FAIL", "REJECTED",
                                   "NAO CONFORME"})) {
          canvas_.SetTextColor(Colors::kDanger);
          canvas_.SetFont(FontStyle::Bold, fontSize);
        }
      }
      canvas_.Cell(columnWidth, kRowHeight, value,
                   Framed(true, CellAlign::Center));
    }
    canvas_.SetY(y + kRowHeight);
  }
  canvas_.SetTextColor(Colors::kBlack);

  if (!matrix.ungrouped.empty())
    RenderInstrumentTriples(matrix.ungrouped);
  canvas_.Ln(1);
}

void ProtocolTableRenderer::RenderGeneralCondition(
    const std::vector<SectionField> &fields) {
  const double itemWidth = 80;
  const double markWidth = 15;
  const double observationWidth = kTableWidth - itemWidth - 3 * markWidth;
  const double labelWidth = 50;
  const CanvasColor accent =
      context_.palette.accent ? *context_.palette.accent : Colors::kSuccess;

  BreakBeforeRow(kRowHeight * 2);
  canvas_.SetFillColor(context_.palette.primary);
  canvas_.SetTextColor(Colors::kWhite);
  canvas_.SetFont(FontStyle::Bold, 6.5);
  canvas_.SetX(10);
  canvas_.Cell(itemWidth, kRowHeight, "  ITEM", Framed(true));
  canvas_.Cell(markWidth, kRowHeight, "OK", Framed(true, CellAlign::Center));
  canvas_.Cell(markWidth, kRowHeight, "NOK", Framed(true, CellAlign::Center));
  canvas_.Cell(markWidth, kRowHeight, "N/A", Framed(true, CellAlign::Center));
  canvas_.Cell(observationWidth, kRowHeight, "  OBSERVATION",
               Framed(true, CellAlign::Left, NextPosition::NextLine));
  canvas_.SetTextColor(Colors::kBlack);

  std::string status;
  std::string notes;
  std::string testCondition;

  for (size_t i = 0; i < fields.size(); ++i) {
    const SectionField &field = fields[i];
    const std::string value =
        StringUtils::Trim(StringUtils::CleanValue(field.responseValue));
    const std::string comment = StringUtils::Trim(field.comment);

    switch (ClassifyConditionLabel(field.label)) {
    case ConditionRow::Status:
      status = value;
      continue;
    case ConditionRow::Notes:
      notes = value.empty() ? comment : value;
      continue;
    case ConditionRow::TestCondition:
      testCondition = value;
      continue;
    case ConditionRow::Item:
      break;
    }

    BreakBeforeRow(kRowHeight);
    canvas_.SetX(10);
    canvas_.SetFillColor(i % 2 == 0 ? Colors::kProtocolZebra : Colors::kWhite);
    canvas_.SetFont(FontStyle::Regular, 6.5);
    canvas_.SetTextColor(Colors::kBlack);
    canvas_.Cell(itemWidth, kRowHeight, "  " + field.label, Framed(true));

    const ConditionMark mark = ClassifyConditionValue(value);
    canvas_.SetFont(FontStyle::Bold, 7);
    canvas_.SetTextColor(accent);
    canvas_.Cell(markWidth, kRowHeight, mark == ConditionMark::Ok ? "X" : "",
                 Framed(true, CellAlign::Center));
    canvas_.SetTextColor(Colors::kDanger);
    canvas_.Cell(markWidth, kRowHeight, mark == ConditionMark::Nok ? "X" : "",
                 Framed(true, CellAlign::Center));
    canvas_.SetTextColor(Colors::kMuted);
    canvas_.Cell(markWidth, kRowHeight,
                 mark == ConditionMark::NotApplicable ? "X" : "",
                 Framed(true, CellAlign::Center));

    canvas_.SetTextColor(Colors::kBlack);
    canvas_.SetFont(FontStyle::Regular, 6.5);
    canvas_.Cell(observationWidth, kRowHeight, "  " + comment,
                 Framed(true, CellAlign::Left, NextPosition::NextLine));
  }

  if (!testCondition.empty()) {
    canvas_.SetX(10);
    canvas_.SetFillColor(kConditionFill);
    canvas_.SetFont(FontStyle::Bold, 6.5);
    canvas_.Cell(labelWidth, kRowHeight, "  Test Condition:", Framed(true));
    canvas_.SetFont(FontStyle::Regular, 6.5);
    canvas_.Cell(kTableWidth - labelWidth, kRowHeight, "  " + testCondition,
                 Framed(true, CellAlign::Left, NextPosition::NextLine));
  }

  if (!status.empty()) {
    const std::string upper = StringUtils::ToUpper(status);
    if (IsOneOf(upper, {"APPROVED", "OK", "PASS", "APROVADO"})) {
      canvas_.SetFillColor(CanvasColor{200, 240, 200});
      canvas_.SetTextColor(CanvasColor{0, 128, 0});
    } else if (IsOneOf(upper, {"REJECTED", "NOK", "FAIL", "REPROVADO"})) {
      canvas_.SetFillColor(CanvasColor{255, 220, 220});
      canvas_.SetTextColor(CanvasColor{200, 0, 0});
    } else {
      canvas_.SetFillColor(CanvasColor{255, 255, 200});
      canvas_.SetTextColor(Colors::kBlack);
    }
    canvas_.SetX(10);
    canvas_.SetFont(FontStyle::Bold, 7);
    canvas_.Cell(labelWidth, kRowHeight + 1, "  STATUS:", Framed(true));
    canvas_.Cell(kTableWidth - labelWidth, kRowHeight + 1, "  " + status,
                 Framed(true, CellAlign::Left, NextPosition::NextLine));
    canvas_.SetTextColor(Colors::kBlack);
  }

  if (!notes.empty()) {
    canvas_.SetX(10);
    canvas_.SetFillColor(CanvasColor{255, 255, 240});
    canvas_.SetFont(FontStyle::Bold, 6.5);
    canvas_.Cell(labelWidth, kRowHeight, "  Notes:", Framed(true));
    canvas_.SetFont(FontStyle::Italic, 6.5);
    canvas_.Cell(kTableWidth - labelWidth, kRowHeight, "  " + notes,
                 Framed(true, CellAlign::Left, NextPosition::NextLine));
  }
  canvas_.Ln(1);
}

void ProtocolTableRenderer::RenderSignatures(const ReportSnapshot &report) {
  const std::vector<SignatureRecord> &signatures = report.signatures;
  if (signatures.empty())
    return;
  if (canvas_.GetY() > DocumentCanvas::kPageHeight - 35)
    canvas_.AddPage(true);

  RenderTitleBar("SIGNATURES");

  const double rowHeight = 6;
  canvas_.SetFont(FontStyle::Bold, 7);
  canvas_.SetFillColor(kConditionFill);
  canvas_.SetX(10);
  canvas_.Cell(40, rowHeight, "  Execution Date:", Framed(true));
  canvas_.SetFont(FontStyle::Regular, 7);
  canvas_.Cell(kTableWidth - 40, rowHeight,
               "  " + StringUtils::FormatIsoDate(report.createdAt),
               Framed(true, CellAlign::Left, NextPosition::NextLine));

  if (signatures.size() >= 2) {
    for (size_t i = 0; i < signatures.size(); i += 2)
      RenderSignaturePair(signatures[i],
                          i + 1 < signatures.size() ? &signatures[i + 1]
                                                    : nullptr);
  } else {
    RenderSingleSignature(signatures.front());
  }
  canvas_.Ln(2);
}

void ProtocolTableRenderer::RenderSignaturePair(const SignatureRecord &left,
                                                const SignatureRecord *right) {
  const double rowHeight = 6;
  const double halfWidth = kTableWidth / 2;
  const double roleWidth = 25;
  const double boxWidth = 30;
  const double boxHeight = 15;

  BreakBeforeRow(rowHeight + boxHeight + 2);
  const double y = canvas_.GetY();

  auto drawRow = [&](const SignatureRecord &signature, double x) {
    canvas_.SetXY(x, y);
    canvas_.SetFont(FontStyle::Bold, 7);
    canvas_.SetFillColor(Colors::kProtocolLabel);
    canvas_.Cell(roleWidth, rowHeight, "  " + signature.roleName + ":",
                 Framed(true));
    canvas_.SetFont(FontStyle::Regular, 7);
    canvas_.Cell(halfWidth - roleWidth - boxWidth, rowHeight,
                 "  " + signature.signerName, Framed(false));
    canvas_.Cell(boxWidth, rowHeight, "  SIGN:", Framed(true));
  };
  drawRow(left, 10);
  if (right)
    drawRow(*right, 10 + halfWidth);

  const double imageY = y + rowHeight;
  canvas_.SetDrawColor(CanvasColor{180, 180, 180});
  const double leftBox = 10 + halfWidth - boxWidth;
  canvas_.DrawRect(leftBox, imageY, boxWidth, boxHeight);
  canvas_.PlaceImage(left.fileKey, leftBox + 2, imageY + 1, boxWidth - 4);
  if (right) {
    const double rightBox = 10 + kTableWidth - boxWidth;
    canvas_.DrawRect(rightBox, imageY, boxWidth, boxHeight);
    canvas_.PlaceImage(right->fileKey, rightBox + 2, imageY + 1, boxWidth - 4);
  }
  canvas_.SetDrawColor(Colors::kBlack);
  canvas_.SetY(imageY + boxHeight + 2);
}

void ProtocolTableRenderer::RenderSingleSignature(
    const SignatureRecord &signature) {
  const double rowHeight = 6;
  BreakBeforeRow(rowHeight + 17);
  canvas_.SetX(10);
  canvas_.SetFont(FontStyle::Bold, 7);
  canvas_.SetFillColor(Colors::kProtocolLabel);
  canvas_.Cell(30, rowHeight, "  " + signature.roleName + ":", Framed(true));
  canvas_.SetFont(FontStyle::Regular, 7);
  canvas_.Cell(kTableWidth - 30, rowHeight, "  " + signature.signerName,
               Framed(false, CellAlign::Left, NextPosition::NextLine));

  if (!signature.fileKey.empty()) {
    const double imageY = canvas_.GetY();
    canvas_.SetDrawColor(CanvasColor{180, 180, 180});
    canvas_.DrawRect(10, imageY, 50, 15);
    canvas_.PlaceImage(signature.fileKey, 12, imageY + 1, 46);
    canvas_.SetDrawColor(Colors::kBlack);
    canvas_.SetY(imageY + 17);
  }
}

void ProtocolTableRenderer::RenderPhotoPages(
    const std::vector<SectionGroup> &sections) {
  for (const auto &group : CollectEquipmentPhotoGroups(sections))
    RenderPhotoGroup(group);
}

void ProtocolTableRenderer::RenderPhotoGroup(const EquipmentPhotoGroup &group) {
  canvas_.AddPage(true);
  RenderTitleBar("EQUIPMENT USED IN THIS MEASUREMENT");
  canvas_.Ln(1);

  CellOptions line;
  line.next = NextPosition::NextLine;
  canvas_.SetFont(FontStyle::Bold, 8);
  canvas_.SetTextColor(context_.palette.primary);
  canvas_.Cell(0, 5, StringUtils::ToUpper(group.sectionName), line);
  canvas_.SetTextColor(Colors::kBlack);
  canvas_.Ln(1);

  if (group.instrument) {
    canvas_.SetFont(FontStyle::Bold, 7);
    canvas_.SetFillColor(context_.palette.secondary
                             ? *context_.palette.secondary
                             : context_.palette.primary);
    canvas_.SetTextColor(Colors::kWhite);
    CellOptions bar = line;
    bar.fill = true;
    canvas_.Cell(0, 4, "  " + group.instrument->name, bar);
    canvas_.SetTextColor(Colors::kBlack);
    RenderInstrumentTriples(group.instrument->fields);
    canvas_.Ln(1);
  }

  const double photoWidth = 85;
  const double photoHeight = 65;
  const double gap = 10;
  const double rowStep = photoHeight + 18;
  const size_t columns = 2;

  CellOptions caption;
  caption.align = CellAlign::Center;
  double yStart = canvas_.GetY();
  for (size_t i = 0; i < group.photos.size(); ++i) {
    const PhotoReference &photo = group.photos[i];
    const size_t row = i / columns;
    const double x = 10 + (i % columns) * (photoWidth + gap);
    double y = yStart + row * rowStep;
    if (y + rowStep > DocumentCanvas::kPageHeight - kBottomReserve) {
      canvas_.AddPage(true);
      y = canvas_.GetY();
      yStart = y - row * rowStep;
    }

    canvas_.PlaceImage(photo.url, x, y, photoWidth);

    std::string text = photo.fieldLabel;
    if (!photo.capturedAt.empty())
      text += " - " + StringUtils::FormatCaptureTimestamp(photo.capturedAt);
    canvas_.SetXY(x, y + photoHeight);
    canvas_.SetFont(FontStyle::Regular, 6);
    canvas_.SetTextColor(Colors::kGray);
    canvas_.PlaceMultiCell(photoWidth, 3, text, caption);
    canvas_.SetTextColor(Colors::kBlack);
  }

  if (!group.photos.empty()) {
    const size_t lastRow = (group.photos.size() - 1) / columns;
    const double next = yStart + (lastRow + 1) * rowStep;
    if (next < DocumentCanvas::kPageHeight)
      canvas_.SetY(next);
  }
}

} // namespace inspectdoc
