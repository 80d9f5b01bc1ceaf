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
#include "../models/snapshotjson.h"
#include <cassert>
#include <string>

using namespace inspectdoc;

int main() {
  const std::string text = R"({
    "title": "Inspeccion tablero TG-01",
    "status": "completed",
    "created_at": "2025-03-07T14:05:00Z",
    "revision_number": "2",
    "template_snapshot": {
      "name": "Tableros",
      "code": "TB-01",
      "version": 3,
      "info_fields": [{"label": "Cliente", "field_type": "text", "required": true}],
      "sections": [
        {"name": "Inspeccion visual", "order": 1, "fields": [
          {"label": "Estado general", "field_type": "dropdown",
           "options": ["OK", "NOK", "N/A"],
           "photo_config": {"required": true, "max_count": 4}},
          "not a field"
        ]}
      ],
      "signature_fields": [{"role_name": "Supervisor", "required": true}]
    },
    "info_values": [{"field_label": "Cliente", "value": "ACME"}],
    "checklist_responses": [
      {"section_name": "Inspeccion visual", "field_label": "Estado general",
       "response_value": "[\"OK\"]", "comment": 12,
       "photos": [
         {"url": "reports/1/a.jpg", "gps": {"latitude": -12.05, "longitude": -77.04}},
         {"original_filename": "missing-url.jpg"}
       ]}
    ],
    "signatures": [{"role_name": "Supervisor", "signer_name": "R. Quispe"}]
  })";

  ReportSnapshot report;
  std::string error;
  assert(ParseReportSnapshotText(text, report, error));
  assert(report.title == "Inspeccion tablero TG-01");
  assert(report.revisionNumber == 2);
  assert(report.templateSnapshot.version == "3");
  assert(report.templateSnapshot.infoFields.size() == 1);
  assert(report.templateSnapshot.infoFields[0].required);
  assert(report.templateSnapshot.sections.size() == 1);
  const TemplateSection &section = report.templateSnapshot.sections[0];
  assert(section.fields.size() == 1);
  assert(section.fields[0].options == "OK,NOK,N/A");
  assert(section.fields[0].photoConfig.required);
  assert(section.fields[0].photoConfig.maxCount == 4);
  assert(section.fields[0].commentConfig.enabled);

  assert(report.checklistResponses.size() == 1);
  const ChecklistResponse &response = report.checklistResponses[0];
  assert(response.responseValue == "[\"OK\"]");
  assert(response.comment == "12");
  // Photos without a url are dropped.
  assert(response.photos.size() == 1);
  assert(response.photos[0].gps.has_value());
  assert(response.photos[0].gps->latitude == -12.05);
  assert(report.signatures.size() == 1);
  assert(report.signatures[0].signerName == "R. Quispe");

  ReportSnapshot ignored;
  assert(!ParseReportSnapshotText("{broken", ignored, error));
  assert(!error.empty());
  assert(!ParseReportSnapshotText("[]", ignored, error));

  TenantBranding tenant;
  assert(ParseTenantBranding(nlohmann::json{{"name", "ACME"},
                                            {"brand_color_primary", "#003B7A"}},
                             tenant));
  assert(tenant.name == "ACME");
  assert(tenant.primaryColor == "#003B7A");
  assert(tenant.secondaryColor.empty());
  assert(!ParseTenantBranding(nlohmann::json("ACME"), tenant));

  std::vector<CertificateRecord> certificates;
  assert(ParseCertificateList(
      nlohmann::json::parse(R"([
        {"equipment_name": "Megger MIT525", "status": "valid"},
        {"equipment_name": "Fluke 1587", "status": "expiring"},
        {"equipment_name": "Old meter", "status": "unknown"},
        7
      ])"),
      certificates));
  assert(certificates.size() == 3);
  assert(certificates[0].status == CertificateStatus::Valid);
  assert(certificates[1].status == CertificateStatus::Expiring);
  assert(certificates[2].status == CertificateStatus::Expired);
  assert(!ParseCertificateList(nlohmann::json::object(), certificates));
  return 0;
}
