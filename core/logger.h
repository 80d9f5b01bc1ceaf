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
#include <chrono>
#include <condition_variable>
#include <deque>
#include <fstream>
#include <mutex>
#include <string>
#include <thread>

namespace inspectdoc {

enum class LogLevel { Debug, Info, Warning, Error };

// Asynchronous logger shared by every render. Lines are formatted as
// "<UTC time> <LEVEL> <message>" and written to stderr and, when
// INSPECTDOC_LOG_FILE names a writable file, appended to it. Messages below
// INSPECTDOC_LOG_LEVEL (debug, info, warning, error; default info) are
// dropped.
class Logger {
public:
  static Logger &Instance();

  void Log(const std::string &msg, LogLevel level = LogLevel::Info);
  void Warn(const std::string &msg) { Log(msg, LogLevel::Warning); }

  // Block until every queued message has been written.
  void Flush();

  void SetMinimumLevel(LogLevel level);
  LogLevel MinimumLevel() const;

  // Messages accepted (not filtered out) since start-up.
  size_t MessageCount() const;

  static const char *LevelName(LogLevel level);
  static bool ParseLevel(const std::string &text, LogLevel &level);

private:
  struct Entry {
    std::chrono::system_clock::time_point time;
    LogLevel level;
    std::string text;
  };

  Logger();
  ~Logger();
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  void Worker();
  void Write(const Entry &entry);

  std::ofstream file_;
  mutable std::mutex mutex_;
  std::condition_variable pending_;
  std::condition_variable drained_;
  std::deque<Entry> entries_;
  LogLevel minimumLevel_ = LogLevel::Info;
  size_t accepted_ = 0;
  bool writing_ = false;
  bool stopping_ = false;
  std::thread worker_;
};

} // namespace inspectdoc
