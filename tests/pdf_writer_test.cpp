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
#include "../pdf/pdf_draw_commands.h"
#include "../pdf/pdf_objects.h"
#include "../pdf/pdf_writer.h"

#include <iostream>
#include <sstream>

using namespace inspectdoc;
using namespace inspectdoc::pdf;

int main() {
  std::vector<PdfObject> objects;
  objects.push_back({"<< /Type /Catalog /Pages 2 0 R >>"});
  objects.push_back({"<< /Type /Pages /Kids [3 0 R] /Count 1 >>"});
  objects.push_back({"<< /Type /Page /Parent 2 0 R /MediaBox [0 0 100 100] /Contents 4 0 R >>"});
  objects.push_back({"<< /Length 0 >>\nstream\n\nendstream"});
  objects.push_back({"<< /Producer (InspectDoc) >>"});

  std::string data;
  std::string error;
  if (!WritePdfDocument(data, objects, 1, 5, error)) {
    std::cerr << error << std::endl;
    return 1;
  }
  if (data.compare(0, 5, "%PDF-") != 0) {
    std::cerr << "Missing PDF signature" << std::endl;
    return 1;
  }
  if (data.find("xref") == std::string::npos ||
      data.find("%%EOF") == std::string::npos) {
    std::cerr << "Missing xref or EOF markers" << std::endl;
    return 1;
  }
  if (data.find("/Root 1 0 R /Info 5 0 R") == std::string::npos) {
    std::cerr << "Trailer does not reference catalog and info" << std::endl;
    return 1;
  }

  std::string ignored;
  if (WritePdfDocument(ignored, objects, 9, 0, error)) {
    std::cerr << "Out of range catalog index was accepted" << std::endl;
    return 1;
  }

  // Draw command serialization stays stable.
  {
    GraphicsStateCache cache;
    FloatFormatter fmt(3);
    CanvasStroke stroke;
    std::ostringstream content;
    AppendLine(content, cache, fmt, {0.0, 0.0}, {10.0, 10.0}, stroke);
    const std::string expected = "0.000 0.000 0.000 RG\n0.567 w\n"
                                 "0.000 0.000 m\n10.000 10.000 l\nS\n";
    if (content.str() != expected) {
      std::cerr << "Unexpected serialized draw command output" << std::endl;
      return 1;
    }
    // A second line with the same stroke does not repeat the state.
    std::ostringstream second;
    AppendLine(second, cache, fmt, {1.0, 1.0}, {2.0, 2.0}, stroke);
    if (second.str() != "1.000 1.000 m\n2.000 2.000 l\nS\n") {
      std::cerr << "Graphics state was emitted twice" << std::endl;
      return 1;
    }
  }

  if (SubstitutePageCount("Page 2 of {nb}", 12) != "Page 2 of 12") {
    std::cerr << "Page count token was not substituted" << std::endl;
    return 1;
  }

  // The page count is substituted when the page is encoded.
  {
    CommandBuffer page;
    TextCommand text;
    text.x = 10.0;
    text.baseline = 20.0;
    text.boxWidth = 50.0;
    text.text = "Page 1 of {nb}";
    text.expandPageCount = true;
    text.style.hAlign = CanvasTextStyle::HorizontalAlign::Right;
    page.commands.push_back(text);
    // Body text keeps a literal token.
    TextCommand body;
    body.text = "Use {nb} as placeholder";
    page.commands.push_back(body);
    ImageCommand image;
    image.imageIndex = 2;
    image.w = 20.0;
    image.h = 10.0;
    page.commands.push_back(image);

    PdfFontCatalog fonts;
    std::set<size_t> used;
    const std::string content =
        EncodePageContent(page, PageMapping{}, fonts, 3, used);
    if (content.find("(Page 1 of 3) Tj") == std::string::npos) {
      std::cerr << "Encoded text does not carry the page count" << std::endl;
      return 1;
    }
    if (content.find("(Use {nb} as placeholder) Tj") == std::string::npos) {
      std::cerr << "Body text token was substituted" << std::endl;
      return 1;
    }
    if (used.count(2) != 1 || content.find("/Im3 Do") == std::string::npos) {
      std::cerr << "Image use was not recorded" << std::endl;
      return 1;
    }
  }

  if (EscapePdfString("a(b)\\c") != "a\\(b\\)\\\\c") {
    std::cerr << "PDF string escaping failed" << std::endl;
    return 1;
  }
  return 0;
}
