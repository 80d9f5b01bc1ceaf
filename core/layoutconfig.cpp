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
#include "layoutconfig.h"

#include <algorithm>

#include "logger.h"
#include "stringutils.h"

namespace inspectdoc {
namespace {

const nlohmann::json *Group(const nlohmann::json &root, const char *key) {
  const auto it = root.find(key);
  if (it == root.end() || !it->is_object())
    return nullptr;
  return &*it;
}

void ReadBool(const nlohmann::json *group, const char *key, bool &target) {
  if (!group)
    return;
  const auto it = group->find(key);
  if (it != group->end() && it->is_boolean())
    target = it->get<bool>();
}

// Accepts numbers only; values outside [minValue, maxValue] are clamped.
void ReadNumber(const nlohmann::json *group, const char *key, double &target,
                double minValue, double maxValue) {
  if (!group)
    return;
  const auto it = group->find(key);
  if (it == group->end() || !it->is_number())
    return;
  target = std::clamp(it->get<double>(), minValue, maxValue);
}

void ReadCount(const nlohmann::json *group, const char *key, int &target,
               int minValue, int maxValue) {
  double value = target;
  ReadNumber(group, key, value, minValue, maxValue);
  target = static_cast<int>(value);
}

void ReadString(const nlohmann::json &group, const char *key,
                std::string &target) {
  const auto it = group.find(key);
  if (it != group.end() && it->is_string())
    target = it->get<std::string>();
}

} // namespace

bool LayoutConfig::IsProtocolStyle() const {
  const std::string lower = StringUtils::ToLower(style);
  return lower == "protocol" || lower == "gensep";
}

LayoutConfig ResolveLayoutConfig(const nlohmann::json *partial) {
  LayoutConfig config;
  if (!partial || !partial->is_object())
    return config;
  const nlohmann::json &root = *partial;

  ReadString(root, "style", config.style);
  if (config.style.empty())
    config.style = "default";

  ReadBool(Group(root, "cover_page"), "enabled", config.coverPage.enabled);

  const auto *fonts = Group(root, "fonts");
  ReadNumber(fonts, "base_size", config.fonts.baseSize, 4, 72);
  ReadNumber(fonts, "header_size", config.fonts.headerSize, 4, 72);
  ReadNumber(fonts, "section_size", config.fonts.sectionSize, 4, 72);

  const auto *margins = Group(root, "margins");
  ReadNumber(margins, "top", config.margins.top, 0, 100);
  ReadNumber(margins, "right", config.margins.right, 0, 100);
  ReadNumber(margins, "bottom", config.margins.bottom, 0, 100);
  ReadNumber(margins, "left", config.margins.left, 0, 100);

  const auto *photos = Group(root, "photos");
  ReadCount(photos, "columns", config.photos.columns, 1, 6);
  ReadCount(photos, "max_per_section", config.photos.maxPerSection, 0, 200);
  ReadNumber(photos, "width_mm", config.photos.widthMm, 10, 190);
  ReadNumber(photos, "height_mm", config.photos.heightMm, 10, 250);

  const auto *checklist = Group(root, "checklist");
  ReadBool(checklist, "show_all_items", config.checklist.showAllItems);
  ReadBool(checklist, "highlight_non_conforming",
           config.checklist.highlightNonConforming);

  ReadBool(Group(root, "certificates"), "show_table",
           config.certificates.showTable);

  const auto *signatures = Group(root, "signatures");
  ReadCount(signatures, "columns", config.signatures.columns, 1, 6);
  ReadNumber(signatures, "box_width_mm", config.signatures.boxWidthMm, 10, 190);
  ReadNumber(signatures, "box_height_mm", config.signatures.boxHeightMm, 5, 150);

  if (const auto *textFit = Group(root, "text_fit")) {
    std::string mode;
    ReadString(*textFit, "mode", mode);
    if (StringUtils::ToLower(mode) == "estimate")
      config.textFit.mode = TextFitMode::Estimate;
  }

  if (const auto *protocol = Group(root, "protocol")) {
    ReadString(*protocol, "title", config.protocol.title);
  }
  return config;
}

LayoutConfig ResolveLayoutConfig(const std::string &jsonText) {
  if (StringUtils::Trim(jsonText).empty())
    return LayoutConfig{};
  nlohmann::json parsed = nlohmann::json::parse(jsonText, nullptr, false);
  if (parsed.is_discarded()) {
    Logger::Instance().Warn("PDF render: layout config is not valid JSON, "
                           "using defaults");
    return LayoutConfig{};
  }
  return ResolveLayoutConfig(&parsed);
}

} // namespace inspectdoc
