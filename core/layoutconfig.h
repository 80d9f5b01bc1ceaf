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

#include <nlohmann/json.hpp>

#include "textfit.h"

namespace inspectdoc {

struct CoverPageConfig {
  bool enabled = false;
};

struct FontsConfig {
  double baseSize = 9;
  double headerSize = 14;
  double sectionSize = 11;
};

// Millimetres.
struct MarginsConfig {
  double top = 10;
  double right = 10;
  double bottom = 20;
  double left = 10;
};

struct PhotosConfig {
  int columns = 2;
  int maxPerSection = 6;
  double widthMm = 80;
  double heightMm = 60;
};

struct ChecklistConfig {
  bool showAllItems = true;
  bool highlightNonConforming = true;
};

struct CertificatesConfig {
  bool showTable = true;
};

struct SignaturesConfig {
  int columns = 3;
  double boxWidthMm = 60;
  double boxHeightMm = 30;
};

struct TextFitConfig {
  TextFitMode mode = TextFitMode::Measured;
};

struct ProtocolConfig {
  std::string title = "COMMISSIONING TEST PROTOCOL - LOW VOLTAGE CABLES";
};

// Complete per-tenant layout description; every member has a default.
struct LayoutConfig {
  std::string style = "default";
  CoverPageConfig coverPage;
  FontsConfig fonts;
  MarginsConfig margins;
  PhotosConfig photos;
  ChecklistConfig checklist;
  CertificatesConfig certificates;
  SignaturesConfig signatures;
  TextFitConfig textFit;
  ProtocolConfig protocol;

  // True for "protocol" and its legacy name "gensep".
  bool IsProtocolStyle() const;
};

// Total: null, non-object and partially filled documents resolve to a
// complete configuration; unknown keys and mistyped values are ignored.
LayoutConfig ResolveLayoutConfig(const nlohmann::json *partial);
LayoutConfig ResolveLayoutConfig(const std::string &jsonText);

} // namespace inspectdoc
