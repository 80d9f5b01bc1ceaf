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

#include "../models/tenant.h"
#include "rendercontext.h"
#include "sectiongrouping.h"

namespace inspectdoc {

// Report title and "Data: dd/mm/yyyy | Status: s".
class ReportTitleRenderer : public SectionRenderer {
public:
  using SectionRenderer::SectionRenderer;
  void Render(const ReportSnapshot &report);
};

// Left-bordered bar tinted from the secondary color.
class SectionTitleRenderer : public SectionRenderer {
public:
  using SectionRenderer::SectionRenderer;
  void Render(const std::string &title);
};

class InfoTableRenderer : public SectionRenderer {
public:
  using SectionRenderer::SectionRenderer;
  void Render(const std::vector<InfoValue> &values);
};

class ChecklistTableRenderer : public SectionRenderer {
public:
  using SectionRenderer::SectionRenderer;
  void Render(const std::vector<SectionField> &fields);

private:
  // Observations column; takes the width left by the fixed columns.
  double CommentWidth() const;
  void RenderHeader();
};

class CertificateTableRenderer : public SectionRenderer {
public:
  using SectionRenderer::SectionRenderer;
  void Render(const std::vector<CertificateRecord> &certificates);

private:
  void RenderHeader(double fontSize);
};

// Text color of a checklist answer: conforming answers use the accent color
// (green without one), non-conforming red, N/A gray. Black when highlighting
// is off or the answer is free text.
CanvasColor ChecklistValueColor(const std::string &value,
                                const BrandPalette &palette, bool highlight);

// "Valido", "Vencendo" or "Vencido" and the matching color.
std::string CertificateStatusLabel(CertificateStatus status,
                                   CanvasColor &color);

} // namespace inspectdoc
