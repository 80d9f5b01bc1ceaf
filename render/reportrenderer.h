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

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../core/imageloader.h"
#include "../core/layoutconfig.h"
#include "../core/rendersettings.h"
#include "../models/report.h"
#include "../models/tenant.h"
#include "../pdf/documentcanvas.h"

namespace inspectdoc {

// Collaborators of a render. Null resolver or fetcher pointers select the
// defaults built from settings (storage URL resolver, libcurl fetcher).
struct RenderServices {
  RenderSettings settings;
  const ImageUrlResolver *resolver = nullptr;
  ByteFetcher *fetcher = nullptr;
  ImageLoader::Sleeper sleeper;
};

// Produces a whole document from one report snapshot.
class DocumentRenderer {
public:
  virtual ~DocumentRenderer() = default;
  virtual std::string Render(const ReportSnapshot &report,
                             const TenantBranding &tenant,
                             const std::vector<CertificateRecord> &certificates) = 0;
};

// Cover, decorated content pages with info, checklist, photo, certificate
// and signature sections.
class ComponentDocumentRenderer : public DocumentRenderer {
public:
  ComponentDocumentRenderer(LayoutConfig config, CanvasServices services);
  std::string Render(const ReportSnapshot &report, const TenantBranding &tenant,
                     const std::vector<CertificateRecord> &certificates) override;

private:
  LayoutConfig config_;
  CanvasServices services_;
};

// Commissioning protocol: cover, dense data pages and equipment photo pages.
class ProtocolDocumentRenderer : public DocumentRenderer {
public:
  ProtocolDocumentRenderer(LayoutConfig config, CanvasServices services);
  std::string Render(const ReportSnapshot &report, const TenantBranding &tenant,
                     const std::vector<CertificateRecord> &certificates) override;

private:
  LayoutConfig config_;
  CanvasServices services_;
};

std::unique_ptr<DocumentRenderer>
MakeDocumentRenderer(const LayoutConfig &config, const CanvasServices &services);

// Runs body; an exception is logged with the section name and swallowed so
// the rest of the document still renders. Returns false when body threw.
bool RenderGuardedSection(const std::string &name,
                          const std::function<void()> &body);

// Resolves layoutConfig, renders and returns the PDF bytes. Throws
// RenderError when no document can be produced.
std::string RenderReportDocument(const ReportSnapshot &report,
                                 const TenantBranding &tenant,
                                 const std::vector<CertificateRecord> &certificates,
                                 const nlohmann::json *layoutConfig,
                                 const RenderServices &services);

} // namespace inspectdoc
