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
#include "reportrenderer.h"

#include <algorithm>
#include <utility>

#include "../core/logger.h"
#include "coverrenderer.h"
#include "pagedecorators.h"
#include "photogridrenderer.h"
#include "protocolrenderers.h"
#include "rendercontext.h"
#include "sectiongrouping.h"
#include "tablerenderers.h"

namespace inspectdoc {
namespace {

constexpr double kComponentBreakMargin = 25;
constexpr double kProtocolBreakMargin = 18;

} // namespace

bool RenderGuardedSection(const std::string &name,
                          const std::function<void()> &body) {
  try {
    body();
    return true;
  } catch (const std::exception &ex) {
    Logger::Instance().Warn("PDF render: section '" + name +
                           "' failed: " + ex.what());
    return false;
  }
}

ComponentDocumentRenderer::ComponentDocumentRenderer(LayoutConfig config,
                                                     CanvasServices services)
    : config_(std::move(config)), services_(std::move(services)) {}

std::string ComponentDocumentRenderer::Render(
    const ReportSnapshot &report, const TenantBranding &tenant,
    const std::vector<CertificateRecord> &certificates) {
  RenderContext context{config_, tenant, ComponentPalette(tenant),
                        MakeTemplateInfo(report, "Relatorio")};

  DocumentCanvas canvas(services_, config_.textFit.mode);
  ComponentHeader header(context);
  ComponentFooter footer(context);
  canvas.SetDecorators(&header, &footer);
  canvas.SetMargins(config_.margins.left, config_.margins.top,
                    config_.margins.right);
  canvas.SetTitle(report.title.empty() ? context.templateInfo.name
                                       : report.title);

  RenderGuardedSection("cover", [&] {
    CoverRenderer(canvas, context).Render(report);
  });

  canvas.AddPage(true);
  canvas.SetAutoPageBreak(
      true, std::max(kComponentBreakMargin, config_.margins.bottom));

  SectionTitleRenderer sectionTitle(canvas, context);
  RenderGuardedSection("title", [&] {
    ReportTitleRenderer(canvas, context).Render(report);
  });

  if (!report.infoValues.empty()) {
    RenderGuardedSection("Informacoes do Projeto", [&] {
      sectionTitle.Render("Informacoes do Projeto");
      InfoTableRenderer(canvas, context).Render(report.infoValues);
    });
  }

  ChecklistTableRenderer checklist(canvas, context);
  PhotoGridRenderer photos(canvas, context);
  for (const auto &section : GroupResponsesBySection(report)) {
    RenderGuardedSection(section.name, [&] {
      sectionTitle.Render(section.name);
      checklist.Render(section.fields);
      photos.Render(CollectSectionPhotos(section));
      canvas.Ln(3);
    });
  }

  if (!certificates.empty() && config_.certificates.showTable) {
    RenderGuardedSection("Certificados de Calibracao", [&] {
      sectionTitle.Render("Certificados de Calibracao");
      CertificateTableRenderer(canvas, context).Render(certificates);
    });
  }

  if (!report.signatures.empty()) {
    RenderGuardedSection("Assinaturas", [&] {
      sectionTitle.Render("Assinaturas");
      SignatureGridRenderer(canvas, context).Render(report.signatures);
    });
  }

  return canvas.Finish();
}

ProtocolDocumentRenderer::ProtocolDocumentRenderer(LayoutConfig config,
                                                   CanvasServices services)
    : config_(std::move(config)), services_(std::move(services)) {}

std::string ProtocolDocumentRenderer::Render(
    const ReportSnapshot &report, const TenantBranding &tenant,
    const std::vector<CertificateRecord> &) {
  RenderContext context{config_, tenant, ProtocolPalette(tenant),
                        MakeTemplateInfo(report, "Report")};

  DocumentCanvas canvas(services_, config_.textFit.mode);
  ProtocolHeader header(context);
  ProtocolFooter footer(context);
  canvas.SetDecorators(&header, &footer);
  canvas.SetMargins(10, 10, 10);
  canvas.SetSymbolNormalization(true);
  canvas.SetTitle(report.title.empty() ? context.templateInfo.name
                                       : report.title);

  RenderGuardedSection("cover", [&] {
    ProtocolCoverRenderer(canvas, context).Render();
  });

  canvas.AddPage(true);
  canvas.SetAutoPageBreak(true, kProtocolBreakMargin);

  ProtocolTableRenderer tables(canvas, context);
  RenderGuardedSection("info", [&] {
    tables.RenderTitleBar(config_.protocol.title);
    tables.RenderInfoPairs(report.infoValues);
  });

  const std::vector<SectionGroup> sections = GroupResponsesBySection(report);
  for (size_t i = 0; i < sections.size(); ++i) {
    RenderGuardedSection(sections[i].name,
                         [&] { tables.RenderSection(sections[i], i); });
  }

  RenderGuardedSection("signatures", [&] { tables.RenderSignatures(report); });
  RenderGuardedSection("photos", [&] { tables.RenderPhotoPages(sections); });

  return canvas.Finish();
}

std::unique_ptr<DocumentRenderer>
MakeDocumentRenderer(const LayoutConfig &config,
                     const CanvasServices &services) {
  if (config.IsProtocolStyle())
    return std::make_unique<ProtocolDocumentRenderer>(config, services);
  return std::make_unique<ComponentDocumentRenderer>(config, services);
}

std::string RenderReportDocument(const ReportSnapshot &report,
                                 const TenantBranding &tenant,
                                 const std::vector<CertificateRecord> &certificates,
                                 const nlohmann::json *layoutConfig,
                                 const RenderServices &services) {
  const LayoutConfig config = ResolveLayoutConfig(layoutConfig);
  const RenderSettings &settings = services.settings;

  StorageImageUrlResolver defaultResolver(settings.storagePublicUrl,
                                          settings.uploadsDir);
  std::unique_ptr<CurlByteFetcher> defaultFetcher;
  ByteFetcher *fetcher = services.fetcher;
  if (!fetcher) {
    defaultFetcher = std::make_unique<CurlByteFetcher>(
        settings.fetchTimeoutSeconds, settings.userAgent);
    fetcher = defaultFetcher.get();
  }
  ImageLoader loader(*fetcher, settings.fetchRetries, settings.backoffBaseMs,
                     services.sleeper);

  CanvasServices canvasServices;
  canvasServices.resolver =
      services.resolver ? services.resolver : &defaultResolver;
  canvasServices.loader = &loader;
  canvasServices.regularFontPath = settings.regularFontPath;
  canvasServices.boldFontPath = settings.boldFontPath;

  Logger::Instance().Log("PDF render: rendering '" + report.title + "' (" +
                         (config.IsProtocolStyle() ? "protocol" : "default") +
                         " style)");
  return MakeDocumentRenderer(config, canvasServices)
      ->Render(report, tenant, certificates);
}

} // namespace inspectdoc
