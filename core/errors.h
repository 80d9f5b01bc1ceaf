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

#include <stdexcept>
#include <string>

namespace inspectdoc {

// Raised when no document can be produced at all.
class RenderError : public std::runtime_error {
public:
  explicit RenderError(const std::string &what) : std::runtime_error(what) {}
};

// Raised by ByteFetcher implementations when a resource cannot be fetched.
class FetchError : public std::runtime_error {
public:
  explicit FetchError(const std::string &what) : std::runtime_error(what) {}
};

} // namespace inspectdoc
