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
#include "../render/palette.h"
#include "../render/photogridrenderer.h"
#include "../render/rendercontext.h"
#include "../render/tablerenderers.h"
#include <cassert>
#include <string>

using namespace inspectdoc;

int main() {
  {
    CanvasColor c;
    assert(ParseHexColor("#003B7A", c));
    assert(c == (CanvasColor{0, 59, 122}));
    assert(ParseHexColor("2563eb", c));
    assert(c == (CanvasColor{37, 99, 235}));
    assert(!ParseHexColor("#12345", c));
    assert(!ParseHexColor("#gg0000", c));
    assert(HexToColor("blue", Colors::kBlack) == Colors::kBlack);
    assert(Lighten(CanvasColor{250, 10, 0}, 20) == (CanvasColor{255, 30, 20}));
  }

  {
    TenantBranding tenant;
    BrandPalette generic = ComponentPalette(tenant);
    assert(generic.primary == (CanvasColor{37, 99, 235}));
    assert(!generic.secondary && !generic.accent);

    tenant.primaryColor = "not-a-color";
    tenant.accentColor = "#00a651";
    generic = ComponentPalette(tenant);
    assert(generic.primary == (CanvasColor{37, 99, 235}));
    assert(generic.accent && *generic.accent == (CanvasColor{0, 166, 81}));

    BrandPalette protocol = ProtocolPalette(TenantBranding{});
    assert(protocol.primary == (CanvasColor{0, 59, 122}));
    assert(protocol.secondary && *protocol.secondary == (CanvasColor{0, 91, 170}));
    assert(protocol.accent && *protocol.accent == (CanvasColor{0, 166, 81}));
  }

  {
    BrandPalette palette;
    assert(ChecklistValueColor("OK", palette, true) == Colors::kSuccess);
    assert(ChecklistValueColor("N\xC3\xA3o", palette, true) == Colors::kDanger);
    assert(ChecklistValueColor("N/A", palette, true) == Colors::kMuted);
    assert(ChecklistValueColor("NOK", palette, false) == Colors::kBlack);
    palette.accent = CanvasColor{1, 2, 3};
    assert(ChecklistValueColor("Sim", palette, true) == (CanvasColor{1, 2, 3}));

    CanvasColor color;
    assert(CertificateStatusLabel(CertificateStatus::Valid, color) == "Valido");
    assert(color == Colors::kSuccess);
    assert(CertificateStatusLabel(CertificateStatus::Expiring, color) ==
           "Vencendo");
    assert(color == Colors::kWarning);
    assert(CertificateStatusLabel(CertificateStatus::Expired, color) ==
           "Vencido");
    assert(color == Colors::kDanger);
  }

  {
    PhotoReference photo;
    photo.fieldLabel = "Tablero";
    photo.capturedAt = "2025-03-07T14:05:33Z";
    photo.gps = GpsPosition{-12.0464, -77.0428};
    assert(PhotoCaption(photo) ==
           "Tablero\n2025-03-07 14:05\n-12.04640, -77.04280");
    photo.address = "Av. Arequipa 100";
    assert(PhotoCaption(photo) == "Tablero\n2025-03-07 14:05\nAv. Arequipa 100");
  }

  {
    ReportSnapshot report;
    report.revisionNumber = 4;
    report.templateSnapshot.version.clear();
    TemplateInfo info = MakeTemplateInfo(report, "Checklist");
    assert(info.name == "Checklist");
    assert(info.version == "1");
    assert(info.revisionNumber == 4);
  }
  return 0;
}
