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
#include "../core/logger.h"
#include <cassert>
#include <string>

using inspectdoc::LogLevel;
using inspectdoc::Logger;

int main() {
  LogLevel level = LogLevel::Info;
  assert(Logger::ParseLevel(" Warning ", level) && level == LogLevel::Warning);
  assert(Logger::ParseLevel("warn", level) && level == LogLevel::Warning);
  assert(Logger::ParseLevel("DEBUG", level) && level == LogLevel::Debug);
  assert(!Logger::ParseLevel("verbose", level));
  assert(level == LogLevel::Debug);
  assert(std::string(Logger::LevelName(LogLevel::Error)) == "ERROR");

  Logger &log = Logger::Instance();
  log.SetMinimumLevel(LogLevel::Warning);
  const size_t before = log.MessageCount();
  log.Log("PDF render: filtered out");
  assert(log.MessageCount() == before);
  log.Warn("PDF render: kept");
  log.Log("PDF render: kept too", LogLevel::Error);
  assert(log.MessageCount() == before + 2);
  log.Flush();

  log.SetMinimumLevel(LogLevel::Info);
  assert(log.MinimumLevel() == LogLevel::Info);
  return 0;
}
