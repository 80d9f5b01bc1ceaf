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

namespace inspectdoc {

struct PhotoFieldConfig {
    bool required = false;
    int minCount = 0;
    int maxCount = 10;
};

struct CommentFieldConfig {
    bool enabled = true;
    bool required = false;
};

struct TemplateField {
    std::string label;
    std::string fieldType;
    std::string options; // Dropdown choices, joined with ','
    int order = 0;
    PhotoFieldConfig photoConfig;
    CommentFieldConfig commentConfig;
};

struct TemplateSection {
    std::string name;
    int order = 0;
    std::vector<TemplateField> fields;
};

struct TemplateInfoField {
    std::string label;
    std::string fieldType;
    bool required = false;
};

struct TemplateSignatureField {
    std::string roleName;
    bool required = false;
    int order = 0;
};

// Frozen copy of the checklist template captured when the report was
// created. Documents are always rendered from this copy.
struct TemplateSnapshot {
    std::string name;
    std::string code;
    std::string version = "1";
    std::vector<TemplateInfoField> infoFields;
    std::vector<TemplateSection> sections;
    std::vector<TemplateSignatureField> signatureFields;
};

} // namespace inspectdoc
