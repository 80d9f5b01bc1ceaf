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

namespace inspectdoc {

// Branding of the tenant that owns the report. Colors are "#rrggbb" text
// and may be empty.
struct TenantBranding {
    std::string name;
    std::string logoPrimaryKey;
    std::string logoSecondaryKey;
    std::string primaryColor;
    std::string secondaryColor;
    std::string accentColor;
    std::string address;
    std::string phone;
    std::string email;
    std::string website;
};

enum class CertificateStatus { Valid, Expiring, Expired };

struct CertificateRecord {
    std::string equipmentName;
    std::string certificateNumber;
    std::string laboratory;
    std::string calibrationDate; // yyyy-mm-dd
    std::string expiryDate;      // yyyy-mm-dd
    CertificateStatus status = CertificateStatus::Valid;
};

} // namespace inspectdoc
