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

namespace StringUtils {

std::string ToUpper(const std::string &s);
std::string ToLower(const std::string &s);
std::string Trim(const std::string &s);
bool StartsWith(const std::string &s, const std::string &prefix);
bool EndsWith(const std::string &s, const std::string &suffix);
bool Contains(const std::string &s, const std::string &needle);
bool EqualsIgnoreCase(const std::string &a, const std::string &b);

// Joins the non-empty parts with the separator.
std::string JoinNonEmpty(const std::vector<std::string> &parts,
                         const std::string &separator);

// Dropdown answers are sometimes stored as array literals ('["OK"]', a
// truncated '["OK"' or "['OK']"). Returns the plain answer text.
std::string CleanValue(const std::string &value);

// Replaces symbols the protocol fonts cannot show (Omega, micro, greek
// letters, degree signs, infinity, comparison signs) with ASCII text.
std::string NormalizeSymbols(const std::string &utf8);

// "2025-03-07T14:05:00" -> "07/03/2025". Empty when the text is not an
// ISO-8601 date.
std::string FormatIsoDate(const std::string &iso);
// "2025-03-07T14:05:00" -> "07/03/2025 14:05".
std::string FormatIsoDateTime(const std::string &iso);
// "2025-03-07T14:05:00" -> "2025-03-07 14:05".
std::string FormatCaptureTimestamp(const std::string &iso);

} // namespace StringUtils
