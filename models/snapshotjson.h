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

#include <nlohmann/json.hpp>

#include "report.h"
#include "tenant.h"

namespace inspectdoc {

// Lenient readers for the JSON documents stored by the inspection service.
// Missing keys keep their defaults and values of the wrong type are skipped;
// only a top level of the wrong kind makes a reader return false.

bool ParseTemplateSnapshot(const nlohmann::json &value, TemplateSnapshot &out);
bool ParsePhotoReference(const nlohmann::json &value, PhotoReference &out);
bool ParseReportSnapshot(const nlohmann::json &value, ReportSnapshot &out);
bool ParseTenantBranding(const nlohmann::json &value, TenantBranding &out);
bool ParseCertificateList(const nlohmann::json &value,
                          std::vector<CertificateRecord> &out);

CertificateStatus CertificateStatusFromString(const std::string &value);

// Parses a whole report document from text; error receives the reason when
// the text is not JSON or not an object.
bool ParseReportSnapshotText(const std::string &text, ReportSnapshot &out,
                             std::string &error);

} // namespace inspectdoc
