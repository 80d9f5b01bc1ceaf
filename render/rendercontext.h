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

#include "../core/layoutconfig.h"
#include "../models/report.h"
#include "../models/tenant.h"
#include "palette.h"

namespace inspectdoc {

class DocumentCanvas;

struct TemplateInfo {
  std::string name;
  std::string code;
  std::string version;
  int revisionNumber = 0;
};

// Everything a section renderer may read. Built once per document.
struct RenderContext {
  LayoutConfig config;
  TenantBranding tenant;
  BrandPalette palette;
  TemplateInfo templateInfo;
};

TemplateInfo MakeTemplateInfo(const ReportSnapshot &report,
                              const std::string &defaultName);

// Common state of the renderers that draw one part of a document.
class SectionRenderer {
public:
  SectionRenderer(DocumentCanvas &canvas, const RenderContext &context)
      : canvas_(canvas), context_(context) {}
  virtual ~SectionRenderer() = default;

protected:
  DocumentCanvas &canvas_;
  const RenderContext &context_;
};

} // namespace inspectdoc
