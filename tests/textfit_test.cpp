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
#include "../core/textfit.h"
#include <cassert>
#include <string>

using namespace inspectdoc;

int main() {
  // Short text keeps a single line.
  {
    TextFitResult r = FitText("OK", nullptr, 9, 50, 5, TextFitMode::Measured);
    assert(r.fits);
    assert(r.lines == 1);
    assert(r.height == 5);
  }

  // Measured wrapping never produces a line wider than the box.
  {
    std::string text;
    for (int i = 0; i < 40; ++i)
      text += "cable ";
    TextFitResult r = FitText(text, nullptr, 9, 30, 4, TextFitMode::Measured);
    assert(!r.fits);
    assert(r.lines > 1);
    assert(r.lines == static_cast<int>(r.wrappedLines.size()));
    assert(r.height == r.lines * 4);
    for (const auto &line : r.wrappedLines)
      assert(TextWidthMm(line, nullptr, 9) <= 30);

    // Same input, same result.
    TextFitResult again =
        FitText(text, nullptr, 9, 30, 4, TextFitMode::Measured);
    assert(again.wrappedLines == r.wrappedLines);
  }

  // Words wider than the box are broken.
  {
    const std::string word(200, 'x');
    TextFitResult r = FitText(word, nullptr, 10, 20, 5, TextFitMode::Measured);
    assert(r.lines > 1);
    for (const auto &line : r.wrappedLines) {
      assert(!line.empty());
      assert(TextWidthMm(line, nullptr, 10) <= 20);
    }
  }

  // Line breaks always start a new line.
  {
    TextFitResult r = FitText("a\nb", nullptr, 9, 100, 5, TextFitMode::Measured);
    assert(!r.fits);
    assert(r.lines == 2);
    assert(r.wrappedLines[0] == "a");
    assert(r.wrappedLines[1] == "b");
  }

  // Estimate mode: characters per line from half the font size, at least
  // two lines once the text overflows.
  {
    const std::string text(100, 'a');
    TextFitResult r = FitText(text, nullptr, 10, 50, 5, TextFitMode::Estimate);
    assert(r.lines == 4);
    assert(r.height == 20);
  }
  return 0;
}
