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
#include "../core/logger.h"
#include "../pdf/documentcanvas.h"
#include "../render/reportrenderer.h"
#include "../render/sectiongrouping.h"
#include <cassert>
#include <stdexcept>
#include <string>

using namespace inspectdoc;

namespace {

ChecklistResponse Response(const std::string &section, const std::string &label,
                           const std::string &value) {
  ChecklistResponse response;
  response.sectionName = section;
  response.fieldLabel = label;
  response.responseValue = value;
  return response;
}

} // namespace

int main() {
  ReportSnapshot report;
  TemplateSection visual;
  visual.name = "Inspecao visual";
  TemplateField first;
  first.label = "Estado geral";
  TemplateField second;
  second.label = "Identificacao";
  visual.fields = {first, second};
  report.templateSnapshot.sections.push_back(visual);

  ChecklistResponse withPhoto = Response("Inspecao visual", "Estado geral", "NOK");
  PhotoReference photo;
  photo.url = "reports/1/a.jpg";
  withPhoto.photos.push_back(photo);
  report.checklistResponses.push_back(Response("Inspecao visual", "Estado geral", "OK"));
  // The later response for the same field wins.
  report.checklistResponses.push_back(withPhoto);
  // No template field: left out of the document.
  report.checklistResponses.push_back(Response("Inspecao visual", "Campo removido", "OK"));
  report.checklistResponses.push_back(Response("Secao antiga", "Estado geral", "OK"));

  const std::vector<SectionGroup> groups = GroupResponsesBySection(report);
  assert(groups.size() == 1);
  assert(groups[0].name == "Inspecao visual");
  assert(groups[0].fields.size() == 2);
  assert(groups[0].fields[0].answered);
  assert(groups[0].fields[0].responseValue == "NOK");
  assert(!groups[0].fields[1].answered);
  assert(groups[0].fields[1].responseValue.empty());

  const std::vector<PhotoReference> photos = CollectSectionPhotos(groups[0]);
  assert(photos.size() == 1);
  assert(photos[0].fieldLabel == "Estado geral");

  // A failing section is contained; the rest of the document still renders.
  DocumentCanvas canvas{CanvasServices{}};
  canvas.AddPage();
  int completed = 0;
  const size_t logged = Logger::Instance().MessageCount();
  assert(!RenderGuardedSection("broken", [&] {
    canvas.Cell(0, 10, "partial");
    throw std::runtime_error("bad data");
  }));
  assert(RenderGuardedSection("next", [&] {
    canvas.Cell(0, 10, "after");
    ++completed;
  }));
  assert(completed == 1);
  assert(Logger::Instance().MessageCount() == logged + 1);
  const std::string pdf = canvas.Finish();
  assert(pdf.compare(0, 5, "%PDF-") == 0);

  // A render with no data at all still yields a document.
  RenderServices services;
  services.sleeper = [](std::chrono::milliseconds) {};
  ReportSnapshot empty;
  const std::string minimal =
      RenderReportDocument(empty, TenantBranding{}, {}, nullptr, services);
  assert(minimal.compare(0, 5, "%PDF-") == 0);
  return 0;
}
