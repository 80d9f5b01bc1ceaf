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

#include "rendercontext.h"

namespace inspectdoc {

// "Registro Fotografico:" grid sized by the photos config.
class PhotoGridRenderer : public SectionRenderer {
public:
  using SectionRenderer::SectionRenderer;
  void Render(const std::vector<PhotoReference> &photos);
};

// Field label, capture time and, when known, the address or coordinates.
std::string PhotoCaption(const PhotoReference &photo);

// Boxed signatures with role, signer and date beneath.
class SignatureGridRenderer : public SectionRenderer {
public:
  using SectionRenderer::SectionRenderer;
  void Render(const std::vector<SignatureRecord> &signatures);
};

} // namespace inspectdoc
