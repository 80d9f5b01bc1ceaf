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
#include "../core/errors.h"
#include "../pdf/documentcanvas.h"
#include "../pdf/pdf_merge.h"

#include <cstring>
#include <iostream>
#include <vector>

#include <podofo/podofo.h>

using namespace inspectdoc;

namespace {

std::string MakeDocument(int pages, const std::string &text) {
  DocumentCanvas canvas{CanvasServices{}};
  for (int i = 0; i < pages; ++i) {
    canvas.AddPage();
    canvas.Cell(0, 10, text + " " + std::to_string(i + 1));
  }
  return canvas.Finish();
}

// Text of every page, in page order.
std::vector<std::string> PageTexts(const std::string &pdf) {
  PoDoFo::PdfMemDocument doc;
  std::vector<std::string> texts;
#if PODOFO_VERSION >= PODOFO_MAKE_VERSION(0, 10, 0)
  doc.LoadFromBuffer(PoDoFo::bufferview(pdf.data(), pdf.size()));
  auto &pages = doc.GetPages();
  for (unsigned i = 0; i < pages.GetCount(); ++i) {
    PoDoFo::PdfTextExtractParams params;
    std::vector<PoDoFo::PdfTextEntry> entries;
    pages.GetPageAt(i).ExtractTextTo(entries, params);
    std::string text;
    for (const auto &entry : entries)
      text += entry.Text + " ";
    texts.push_back(text);
  }
#else
  doc.LoadFromBuffer(pdf.data(), static_cast<long>(pdf.size()));
  for (int i = 0; i < doc.GetPageCount(); ++i) {
    PoDoFo::PdfContentsTokenizer tokenizer(doc.GetPage(i));
    PoDoFo::EPdfContentsType type;
    const char *token = nullptr;
    PoDoFo::PdfVariant var;
    std::vector<PoDoFo::PdfVariant> stack;
    std::string text;
    while (tokenizer.ReadNext(type, token, var)) {
      if (type == PoDoFo::ePdfContentsType_Variant) {
        stack.push_back(var);
      } else if (type == PoDoFo::ePdfContentsType_Keyword) {
        if (!std::strcmp(token, "Tj") && !stack.empty() &&
            stack.back().IsString())
          text += stack.back().GetString().GetStringUtf8() + " ";
        stack.clear();
      }
    }
    texts.push_back(text);
  }
#endif
  return texts;
}

bool Contains(const std::string &text, const std::string &marker) {
  return text.find(marker) != std::string::npos;
}

} // namespace

int main() {
  const std::string report = MakeDocument(2, "Report page");
  const std::string certificate = MakeDocument(1, "Certificate");

  if (MergeWithCertificateAttachments(report, {}) != report) {
    std::cerr << "Merging nothing changed the document" << std::endl;
    return 1;
  }
  if (MergeWithCertificateAttachments(report, {"not a pdf", ""}) != report) {
    std::cerr << "Unreadable attachments changed the document" << std::endl;
    return 1;
  }

  const std::string merged =
      MergeWithCertificateAttachments(report, {certificate, "not a pdf"});
  if (merged.compare(0, 5, "%PDF-") != 0 || merged == report) {
    std::cerr << "Merged output is not a new PDF" << std::endl;
    return 1;
  }
  // Report pages first, then the attachments in the order given.
  const std::string other = MakeDocument(1, "Other certificate");
  const std::vector<std::string> pages = PageTexts(
      MergeWithCertificateAttachments(report, {certificate, "not a pdf", other}));
  if (pages.size() != 4) {
    std::cerr << "Merged document has " << pages.size()
              << " pages, expected 4" << std::endl;
    return 1;
  }
  if (!Contains(pages[0], "Report page 1") ||
      !Contains(pages[1], "Report page 2") ||
      !Contains(pages[2], "Certificate 1") ||
      !Contains(pages[3], "Other certificate 1")) {
    std::cerr << "Merged pages are out of order" << std::endl;
    return 1;
  }

  // Merging again with the merged file as primary still works.
  const std::string twice =
      MergeWithCertificateAttachments(merged, {certificate});
  if (twice.size() <= certificate.size()) {
    std::cerr << "Second merge lost content" << std::endl;
    return 1;
  }

  bool threw = false;
  try {
    MergeWithCertificateAttachments("garbage", {certificate});
  } catch (const RenderError &) {
    threw = true;
  }
  if (!threw) {
    std::cerr << "Unreadable primary document was accepted" << std::endl;
    return 1;
  }
  return 0;
}
