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

#include "rendercontext.h"

namespace inspectdoc {

// Undecorated first page of the generic pipeline. Does nothing unless
// cover_page.enabled is set.
class CoverRenderer : public SectionRenderer {
public:
  using SectionRenderer::SectionRenderer;
  void Render(const ReportSnapshot &report);

private:
  void RenderInfoFieldLines(const TemplateSnapshot &snapshot, double &y);
  void RenderSignatureRoles(const TemplateSnapshot &snapshot, double y);
};

// Cover of the protocol pipeline: logo, title, framed template name and the
// contact footer.
class ProtocolCoverRenderer : public SectionRenderer {
public:
  using SectionRenderer::SectionRenderer;
  void Render();
};

} // namespace inspectdoc
