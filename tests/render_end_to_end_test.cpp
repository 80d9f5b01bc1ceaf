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
#include "../core/errors.h"
#include "../render/reportrenderer.h"
#include <cassert>
#include <map>
#include <string>

#include <wx/init.h>

using namespace inspectdoc;

namespace {

// 32x16 baseline JPEG frame header; enough to be embedded as DCTDecode.
const std::string kTinyJpeg("\xFF\xD8\xFF\xC0\x00\x11\x08\x00\x10\x00\x20\x03"
                            "\x01\x22\x00\x02\x11\x01\x03\x11\x01\xFF\xD9",
                            23);

class FakeFetcher : public ByteFetcher {
public:
  std::string Fetch(const std::string &url) override {
    ++calls[url];
    if (url.find("broken") != std::string::npos)
      throw FetchError("HTTP 404");
    if (url.find("corrupt") != std::string::npos)
      return "definitely not an image";
    return kTinyJpeg;
  }
  std::map<std::string, int> calls;
};

int PageCountOf(const std::string &pdf) {
  const size_t pages = pdf.find("/Type /Pages");
  assert(pages != std::string::npos);
  const size_t count = pdf.find("/Count ", pages);
  assert(count != std::string::npos);
  return std::stoi(pdf.substr(count + 7));
}

PhotoReference Photo(const std::string &url) {
  PhotoReference photo;
  photo.url = url;
  photo.capturedAt = "2025-03-07T14:05:00Z";
  return photo;
}

ReportSnapshot ComponentReport() {
  ReportSnapshot report;
  report.title = "Inspecao Tablero TG-01";
  report.status = "completed";
  report.createdAt = "2025-03-07T14:05:00Z";
  report.location = "Subestacao Norte";
  report.templateSnapshot.name = "Tableros";
  report.templateSnapshot.code = "TB-01";

  report.infoValues = {{"Cliente", "text", "ACME"},
                       {"Observacoes", "text",
                        std::string(300, 'x') + " fim"}};

  TemplateSection section;
  section.name = "Inspecao visual";
  for (int i = 0; i < 30; ++i) {
    TemplateField field;
    field.label = "Item " + std::to_string(i);
    section.fields.push_back(field);

    ChecklistResponse response;
    response.sectionName = section.name;
    response.fieldLabel = field.label;
    response.responseValue = i % 3 == 0 ? "[\"NOK\"]" : "OK";
    response.comment = i % 5 == 0 ? "Comentario longo " + std::string(80, 'c')
                                  : std::string();
    if (i < 3) {
      response.photos.push_back(Photo("reports/1/ok.jpg"));
      response.photos.push_back(Photo("reports/1/broken.jpg"));
      response.photos.push_back(Photo("reports/1/corrupt.png"));
    }
    report.checklistResponses.push_back(response);
  }
  report.templateSnapshot.sections.push_back(section);

  report.templateSnapshot.signatureFields = {{"Tecnico", true, 1},
                                             {"Supervisor", true, 2}};
  report.signatures = {{"Tecnico", "R. Quispe", "signatures/1.jpg",
                        "2025-03-07T15:00:00Z"}};
  return report;
}

ReportSnapshot ProtocolReport(bool gridMeasurements = true) {
  ReportSnapshot report;
  report.title = "Commissioning LV cables";
  report.infoValues = {{"Client", "text", "ACME"},
                       {"Project", "text", "North substation"},
                       {"Extra", "text", "Leftover value"}};

  auto addSection = [&](const std::string &name,
                        const std::vector<std::pair<std::string, std::string>>
                            &fields) {
    TemplateSection section;
    section.name = name;
    for (const auto &field : fields) {
      TemplateField templateField;
      templateField.label = field.first;
      section.fields.push_back(templateField);
      ChecklistResponse response;
      response.sectionName = name;
      response.fieldLabel = field.first;
      response.responseValue = field.second;
      if (name == "Equipment photos")
        response.photos.push_back(Photo("reports/2/ok.jpg"));
      report.checklistResponses.push_back(response);
    }
    report.templateSnapshot.sections.push_back(section);
  };

  addSection("Technical characteristics",
             {{"Cable type", "XLPE"}, {"Section", "240 mm2"}});
  addSection("Ambient temperature",
             {{"Instrument", "Fluke"}, {"Serial", "123"}, {"Temp", "25 \xE2\x84\x83"}});
  if (gridMeasurements)
    addSection("Measured values",
               {{"R-S - 1 min", "[\"12 G\xCE\xA9\"]"},
                {"R-S - 10 min", "15 G\xCE\xA9"},
                {"S-T - 1 min", "11 G\xCE\xA9"}});
  else
    addSection("Measured values",
               {{"Insulation", "12 G\xCE\xA9"},
                {"Continuity", "OK"},
                {"Test voltage", "1 kV"},
                {"Duration", "10 min"}});
  addSection("General condition",
             {{"Terminations", "OK"}, {"Item status", "NOK"},
              {"Notes", "Minor damage on sheath"}});
  addSection("Equipment photos", {{"Megger", ""}});
  return report;
}

} // namespace

int main() {
  wxInitializer initializer;
  assert(initializer.IsOk());

  const StorageImageUrlResolver resolver("https://storage.test", "uploads");
  RenderServices services;
  services.resolver = &resolver;
  services.sleeper = [](std::chrono::milliseconds) {};
  services.settings.fetchRetries = 3;

  TenantBranding tenant;
  tenant.name = "ACME Ingenieria";
  tenant.primaryColor = "#0f766e";
  tenant.logoPrimaryKey = "tenants/1/logo.jpg";

  std::vector<CertificateRecord> certificates(2);
  certificates[0].equipmentName = "Megger MIT525";
  certificates[0].calibrationDate = "2024-06-01";
  certificates[1].equipmentName = "Fluke 1587";
  certificates[1].status = CertificateStatus::Expiring;

  // One info field and one section with an answered and an unanswered
  // field produce more than a bare one-page document.
  {
    ReportSnapshot small;
    small.title = "Checklist";
    small.infoValues = {{"Cliente", "text", "ACME"}};
    TemplateSection section;
    section.name = "Seguranca";
    section.fields.resize(2);
    section.fields[0].label = "EPI em uso";
    section.fields[1].label = "Sinalizacao";
    small.templateSnapshot.sections.push_back(section);
    ChecklistResponse answer;
    answer.sectionName = "Seguranca";
    answer.fieldLabel = "EPI em uso";
    answer.responseValue = "Sim";
    small.checklistResponses.push_back(answer);

    FakeFetcher smallFetcher;
    services.fetcher = &smallFetcher;
    const std::string filled =
        RenderReportDocument(small, TenantBranding{}, {}, nullptr, services);
    const std::string bare = RenderReportDocument(
        ReportSnapshot{}, TenantBranding{}, {}, nullptr, services);
    assert(filled.compare(0, 5, "%PDF-") == 0);
    assert(filled.size() > bare.size());
    assert(PageCountOf(filled) == 1);
  }

  const ReportSnapshot report = ComponentReport();

  FakeFetcher fetcher;
  services.fetcher = &fetcher;
  const std::string first =
      RenderReportDocument(report, tenant, certificates, nullptr, services);
  assert(first.compare(0, 5, "%PDF-") == 0);
  assert(first.find("%%EOF") != std::string::npos);
  assert(first.find("/DCTDecode") != std::string::npos);

  // Each reference is fetched once; failed ones are not retried per use.
  assert(fetcher.calls["https://storage.test/reports/1/ok.jpg"] == 1);
  assert(fetcher.calls["https://storage.test/reports/1/broken.jpg"] == 3);
  assert(fetcher.calls["https://storage.test/reports/1/corrupt.png"] == 1);

  // Same input, same pagination.
  FakeFetcher secondFetcher;
  services.fetcher = &secondFetcher;
  const std::string second =
      RenderReportDocument(report, tenant, certificates, nullptr, services);
  const int pages = PageCountOf(first);
  assert(pages >= 2);
  assert(PageCountOf(second) == pages);

  // The cover page adds exactly one page.
  const nlohmann::json withCover = {{"cover_page", {{"enabled", true}}}};
  FakeFetcher coverFetcher;
  services.fetcher = &coverFetcher;
  const std::string covered =
      RenderReportDocument(report, tenant, certificates, &withCover, services);
  assert(PageCountOf(covered) == pages + 1);

  // Protocol pipeline.
  const nlohmann::json protocolLayout = {{"style", "protocol"}};
  FakeFetcher protocolFetcher;
  services.fetcher = &protocolFetcher;
  const std::string protocol = RenderReportDocument(
      ProtocolReport(), tenant, {}, &protocolLayout, services);
  assert(protocol.compare(0, 5, "%PDF-") == 0);
  assert(PageCountOf(protocol) >= 3);
  assert(protocolFetcher.calls["https://storage.test/reports/2/ok.jpg"] == 1);

  // Measured values without a ROW - COLUMN pattern still render.
  FakeFetcher plainFetcher;
  services.fetcher = &plainFetcher;
  const std::string plain = RenderReportDocument(
      ProtocolReport(false), tenant, {}, &protocolLayout, services);
  assert(plain.compare(0, 5, "%PDF-") == 0);
  assert(plain.find("%%EOF") != std::string::npos);
  assert(PageCountOf(plain) >= 2);

  // Legacy style name selects the same pipeline.
  const nlohmann::json legacyLayout = {{"style", "gensep"}};
  FakeFetcher legacyFetcher;
  services.fetcher = &legacyFetcher;
  const std::string legacy = RenderReportDocument(
      ProtocolReport(), tenant, {}, &legacyLayout, services);
  assert(PageCountOf(legacy) == PageCountOf(protocol));
  return 0;
}
