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
#include "rendercontext.h"

namespace inspectdoc {

TemplateInfo MakeTemplateInfo(const ReportSnapshot &report,
                              const std::string &defaultName) {
  const TemplateSnapshot &snapshot = report.templateSnapshot;
  TemplateInfo info;
  info.name = snapshot.name.empty() ? defaultName : snapshot.name;
  info.code = snapshot.code;
  info.version = snapshot.version.empty() ? "1" : snapshot.version;
  info.revisionNumber = report.revisionNumber;
  return info;
}

} // namespace inspectdoc
