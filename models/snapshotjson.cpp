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
#include "snapshotjson.h"

#include <cmath>

namespace inspectdoc {
namespace {

std::string ReadString(const nlohmann::json &value, const char *key,
                       const std::string &fallback = {}) {
  const auto it = value.find(key);
  if (it == value.end())
    return fallback;
  if (it->is_string())
    return it->get<std::string>();
  if (it->is_number_integer())
    return std::to_string(it->get<long long>());
  if (it->is_number_float()) {
    const double number = it->get<double>();
    if (std::floor(number) == number)
      return std::to_string(static_cast<long long>(number));
    return std::to_string(number);
  }
  return fallback;
}

int ReadInt(const nlohmann::json &value, const char *key, int fallback) {
  const auto it = value.find(key);
  if (it == value.end())
    return fallback;
  if (it->is_number())
    return static_cast<int>(it->get<double>());
  if (it->is_string()) {
    try {
      return std::stoi(it->get<std::string>());
    } catch (const std::exception &) {
      return fallback;
    }
  }
  return fallback;
}

bool ReadBool(const nlohmann::json &value, const char *key, bool fallback) {
  const auto it = value.find(key);
  if (it == value.end() || !it->is_boolean())
    return fallback;
  return it->get<bool>();
}

const nlohmann::json *FindArray(const nlohmann::json &value, const char *key) {
  const auto it = value.find(key);
  if (it == value.end() || !it->is_array())
    return nullptr;
  return &*it;
}

std::string ReadOptions(const nlohmann::json &field) {
  const auto it = field.find("options");
  if (it == field.end())
    return {};
  if (it->is_string())
    return it->get<std::string>();
  if (!it->is_array())
    return {};
  std::string joined;
  for (const auto &option : *it) {
    if (!option.is_string())
      continue;
    if (!joined.empty())
      joined += ',';
    joined += option.get<std::string>();
  }
  return joined;
}

void ParseTemplateField(const nlohmann::json &value, TemplateField &field) {
  field.label = ReadString(value, "label");
  field.fieldType = ReadString(value, "field_type");
  field.options = ReadOptions(value);
  field.order = ReadInt(value, "order", 0);

  const auto photoIt = value.find("photo_config");
  if (photoIt != value.end() && photoIt->is_object()) {
    field.photoConfig.required = ReadBool(*photoIt, "required", false);
    field.photoConfig.minCount = ReadInt(*photoIt, "min_count", 0);
    field.photoConfig.maxCount = ReadInt(*photoIt, "max_count", 10);
  }
  const auto commentIt = value.find("comment_config");
  if (commentIt != value.end() && commentIt->is_object()) {
    field.commentConfig.enabled = ReadBool(*commentIt, "enabled", true);
    field.commentConfig.required = ReadBool(*commentIt, "required", false);
  }
}

} // namespace

CertificateStatus CertificateStatusFromString(const std::string &value) {
  if (value == "valid")
    return CertificateStatus::Valid;
  if (value == "expiring")
    return CertificateStatus::Expiring;
  return CertificateStatus::Expired;
}

bool ParseTemplateSnapshot(const nlohmann::json &value, TemplateSnapshot &out) {
  if (!value.is_object())
    return false;
  out = TemplateSnapshot{};
  out.name = ReadString(value, "name");
  out.code = ReadString(value, "code");
  out.version = ReadString(value, "version", "1");

  if (const auto *infoFields = FindArray(value, "info_fields")) {
    for (const auto &item : *infoFields) {
      if (!item.is_object())
        continue;
      TemplateInfoField field;
      field.label = ReadString(item, "label");
      field.fieldType = ReadString(item, "field_type");
      field.required = ReadBool(item, "required", false);
      out.infoFields.push_back(std::move(field));
    }
  }

  if (const auto *sections = FindArray(value, "sections")) {
    for (const auto &item : *sections) {
      if (!item.is_object())
        continue;
      TemplateSection section;
      section.name = ReadString(item, "name");
      section.order = ReadInt(item, "order", 0);
      if (const auto *fields = FindArray(item, "fields")) {
        for (const auto &fieldValue : *fields) {
          if (!fieldValue.is_object())
            continue;
          TemplateField field;
          ParseTemplateField(fieldValue, field);
          section.fields.push_back(std::move(field));
        }
      }
      out.sections.push_back(std::move(section));
    }
  }

  if (const auto *signatures = FindArray(value, "signature_fields")) {
    for (const auto &item : *signatures) {
      if (!item.is_object())
        continue;
      TemplateSignatureField field;
      field.roleName = ReadString(item, "role_name");
      field.required = ReadBool(item, "required", false);
      field.order = ReadInt(item, "order", 0);
      out.signatureFields.push_back(std::move(field));
    }
  }
  return true;
}

bool ParsePhotoReference(const nlohmann::json &value, PhotoReference &out) {
  if (!value.is_object())
    return false;
  out = PhotoReference{};
  out.url = ReadString(value, "url");
  out.originalFilename = ReadString(value, "original_filename");
  out.capturedAt = ReadString(value, "captured_at");
  out.address = ReadString(value, "address");
  const auto gpsIt = value.find("gps");
  if (gpsIt != value.end() && gpsIt->is_object()) {
    const auto lat = gpsIt->find("latitude");
    const auto lon = gpsIt->find("longitude");
    if (lat != gpsIt->end() && lat->is_number() && lon != gpsIt->end() &&
        lon->is_number())
      out.gps = GpsPosition{lat->get<double>(), lon->get<double>()};
  }
  return !out.url.empty();
}

bool ParseReportSnapshot(const nlohmann::json &value, ReportSnapshot &out) {
  if (!value.is_object())
    return false;
  out = ReportSnapshot{};
  out.title = ReadString(value, "title");
  out.status = ReadString(value, "status");
  out.createdAt = ReadString(value, "created_at");
  out.completedAt = ReadString(value, "completed_at");
  out.location = ReadString(value, "location");
  out.revisionNumber = ReadInt(value, "revision_number", 0);

  const auto snapshotIt = value.find("template_snapshot");
  if (snapshotIt != value.end())
    ParseTemplateSnapshot(*snapshotIt, out.templateSnapshot);

  if (const auto *infoValues = FindArray(value, "info_values")) {
    for (const auto &item : *infoValues) {
      if (!item.is_object())
        continue;
      InfoValue info;
      info.fieldLabel = ReadString(item, "field_label");
      info.fieldType = ReadString(item, "field_type");
      info.value = ReadString(item, "value");
      out.infoValues.push_back(std::move(info));
    }
  }

  if (const auto *responses = FindArray(value, "checklist_responses")) {
    for (const auto &item : *responses) {
      if (!item.is_object())
        continue;
      ChecklistResponse response;
      response.sectionName = ReadString(item, "section_name");
      response.sectionOrder = ReadInt(item, "section_order", 0);
      response.fieldLabel = ReadString(item, "field_label");
      response.fieldOrder = ReadInt(item, "field_order", 0);
      response.fieldType = ReadString(item, "field_type");
      response.responseValue = ReadString(item, "response_value");
      response.comment = ReadString(item, "comment");
      if (const auto *photos = FindArray(item, "photos")) {
        for (const auto &photoValue : *photos) {
          PhotoReference photo;
          if (ParsePhotoReference(photoValue, photo))
            response.photos.push_back(std::move(photo));
        }
      }
      out.checklistResponses.push_back(std::move(response));
    }
  }

  if (const auto *signatures = FindArray(value, "signatures")) {
    for (const auto &item : *signatures) {
      if (!item.is_object())
        continue;
      SignatureRecord signature;
      signature.roleName = ReadString(item, "role_name");
      signature.signerName = ReadString(item, "signer_name");
      signature.fileKey = ReadString(item, "file_key");
      signature.signedAt = ReadString(item, "signed_at");
      out.signatures.push_back(std::move(signature));
    }
  }
  return true;
}

bool ParseTenantBranding(const nlohmann::json &value, TenantBranding &out) {
  if (!value.is_object())
    return false;
  out = TenantBranding{};
  out.name = ReadString(value, "name");
  out.logoPrimaryKey = ReadString(value, "logo_primary_key");
  out.logoSecondaryKey = ReadString(value, "logo_secondary_key");
  out.primaryColor = ReadString(value, "brand_color_primary");
  out.secondaryColor = ReadString(value, "brand_color_secondary");
  out.accentColor = ReadString(value, "brand_color_accent");
  out.address = ReadString(value, "contact_address");
  out.phone = ReadString(value, "contact_phone");
  out.email = ReadString(value, "contact_email");
  out.website = ReadString(value, "contact_website");
  return true;
}

bool ParseCertificateList(const nlohmann::json &value,
                          std::vector<CertificateRecord> &out) {
  if (!value.is_array())
    return false;
  out.clear();
  for (const auto &item : value) {
    if (!item.is_object())
      continue;
    CertificateRecord record;
    record.equipmentName = ReadString(item, "equipment_name");
    record.certificateNumber = ReadString(item, "certificate_number");
    record.laboratory = ReadString(item, "laboratory");
    record.calibrationDate = ReadString(item, "calibration_date");
    record.expiryDate = ReadString(item, "expiry_date");
    record.status = CertificateStatusFromString(ReadString(item, "status"));
    out.push_back(std::move(record));
  }
  return true;
}

bool ParseReportSnapshotText(const std::string &text, ReportSnapshot &out,
                             std::string &error) {
  nlohmann::json parsed;
  try {
    parsed = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error &ex) {
    error = std::string("Invalid report JSON: ") + ex.what();
    return false;
  }
  if (!ParseReportSnapshot(parsed, out)) {
    error = "Report JSON must be an object";
    return false;
  }
  return true;
}

} // namespace inspectdoc
