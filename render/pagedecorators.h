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

#include "../pdf/documentcanvas.h"
#include "rendercontext.h"

namespace inspectdoc {

// Logos, centered template name, code/version subtitle and a divider.
class ComponentHeader : public PageDecorator {
public:
  explicit ComponentHeader(const RenderContext &context) : context_(context) {}
  void Decorate(DocumentCanvas &canvas) override;

private:
  const RenderContext &context_;
};

// Divider, tenant contact lines and "Pagina N/{nb}".
class ComponentFooter : public PageDecorator {
public:
  explicit ComponentFooter(const RenderContext &context) : context_(context) {}
  void Decorate(DocumentCanvas &canvas) override;

private:
  const RenderContext &context_;
};

class ProtocolHeader : public PageDecorator {
public:
  explicit ProtocolHeader(const RenderContext &context) : context_(context) {}
  void Decorate(DocumentCanvas &canvas) override;

private:
  const RenderContext &context_;
};

class ProtocolFooter : public PageDecorator {
public:
  explicit ProtocolFooter(const RenderContext &context) : context_(context) {}
  void Decorate(DocumentCanvas &canvas) override;

private:
  const RenderContext &context_;
};

} // namespace inspectdoc
