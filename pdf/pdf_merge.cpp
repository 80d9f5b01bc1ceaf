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
#include "pdf_merge.h"

#include <memory>

#include <podofo/podofo.h>

#include "../core/errors.h"
#include "../core/logger.h"

using namespace PoDoFo;

namespace inspectdoc {
namespace {

void LoadDocument(PdfMemDocument &doc, const std::string &data) {
#if PODOFO_VERSION >= PODOFO_MAKE_VERSION(0, 10, 0)
  doc.LoadFromBuffer(bufferview(data.data(), data.size()));
#else
  doc.LoadFromBuffer(data.data(), static_cast<long>(data.size()));
#endif
}

void AppendPages(PdfMemDocument &target, const PdfMemDocument &source) {
#if PODOFO_VERSION >= PODOFO_MAKE_VERSION(0, 10, 0)
  target.GetPages().AppendDocumentPages(source);
#else
  target.Append(source, true);
#endif
}

std::string SaveDocument(PdfMemDocument &doc) {
#if PODOFO_VERSION >= PODOFO_MAKE_VERSION(0, 10, 0)
  std::string out;
  StringStreamDevice device(out);
  doc.Save(device);
  return out;
#else
  PdfRefCountedBuffer buffer;
  PdfOutputDevice device(&buffer);
  doc.Write(&device);
  return std::string(buffer.GetBuffer(), device.GetLength());
#endif
}

} // namespace

std::string MergeWithCertificateAttachments(
    const std::string &primary, const std::vector<std::string> &attachments) {
  if (attachments.empty())
    return primary;

  std::vector<std::unique_ptr<PdfMemDocument>> parsed;
  for (size_t i = 0; i < attachments.size(); ++i) {
    if (attachments[i].empty()) {
      Logger::Instance().Warn("PDF merge: skipping empty attachment " +
                             std::to_string(i + 1));
      continue;
    }
    auto doc = std::make_unique<PdfMemDocument>();
    try {
      LoadDocument(*doc, attachments[i]);
    } catch (const PdfError &e) {
      Logger::Instance().Warn("PDF merge: skipping attachment " +
                             std::to_string(i + 1) + ": " + e.what());
      continue;
    }
    parsed.push_back(std::move(doc));
  }
  if (parsed.empty())
    return primary;

  try {
    PdfMemDocument merged;
    LoadDocument(merged, primary);
    for (const auto &doc : parsed)
      AppendPages(merged, *doc);
    return SaveDocument(merged);
  } catch (const PdfError &e) {
    throw RenderError(std::string("failed to merge certificate attachments: ") +
                      e.what());
  }
}

} // namespace inspectdoc
