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

#include <optional>
#include <string>
#include <vector>

#include "template.h"

namespace inspectdoc {

struct GpsPosition {
    double latitude = 0.0;
    double longitude = 0.0;
};

// Photo attached to a checklist response. The url may be a full http(s)
// address, a local path or an object storage key.
struct PhotoReference {
    std::string url;
    std::string originalFilename;
    std::string capturedAt; // ISO-8601 text as stored by the service
    std::optional<GpsPosition> gps;
    std::string address;
    std::string fieldLabel; // Filled when photos are grouped per section
};

struct InfoValue {
    std::string fieldLabel;
    std::string fieldType;
    std::string value;
};

struct ChecklistResponse {
    std::string sectionName;
    int sectionOrder = 0;
    std::string fieldLabel;
    int fieldOrder = 0;
    std::string fieldType;
    std::string responseValue;
    std::string comment;
    std::vector<PhotoReference> photos;
};

struct SignatureRecord {
    std::string roleName;
    std::string signerName;
    std::string fileKey;
    std::string signedAt;
};

// Immutable description of a report at render time. The template snapshot
// decides the document shape, the responses only fill it.
struct ReportSnapshot {
    std::string title;
    std::string status;
    std::string createdAt;
    std::string completedAt;
    std::string location;
    int revisionNumber = 0;

    TemplateSnapshot templateSnapshot;
    std::vector<InfoValue> infoValues;
    std::vector<ChecklistResponse> checklistResponses;
    std::vector<SignatureRecord> signatures;
};

} // namespace inspectdoc
