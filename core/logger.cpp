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
#include "logger.h"

#include <cstdlib>
#include <ctime>
#include <iostream>

#include "stringutils.h"

namespace inspectdoc {
namespace {

std::string FormatTime(std::chrono::system_clock::time_point time) {
  const std::time_t seconds = std::chrono::system_clock::to_time_t(time);
  std::tm utc{};
#ifdef _WIN32
  gmtime_s(&utc, &seconds);
#else
  gmtime_r(&seconds, &utc);
#endif
  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return buffer;
}

} // namespace

Logger &Logger::Instance() {
  static Logger instance;
  return instance;
}

const char *Logger::LevelName(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Warning:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  default:
    return "INFO";
  }
}

bool Logger::ParseLevel(const std::string &text, LogLevel &level) {
  const std::string lower = StringUtils::ToLower(StringUtils::Trim(text));
  if (lower == "debug")
    level = LogLevel::Debug;
  else if (lower == "info")
    level = LogLevel::Info;
  else if (lower == "warning" || lower == "warn")
    level = LogLevel::Warning;
  else if (lower == "error")
    level = LogLevel::Error;
  else
    return false;
  return true;
}

Logger::Logger() {
  if (const char *level = std::getenv("INSPECTDOC_LOG_LEVEL"))
    ParseLevel(level, minimumLevel_);
  if (const char *path = std::getenv("INSPECTDOC_LOG_FILE")) {
    if (*path)
      file_.open(path, std::ios::out | std::ios::app);
  }
  worker_ = std::thread(&Logger::Worker, this);
}

Logger::~Logger() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  pending_.notify_one();
  if (worker_.joinable())
    worker_.join();
}

void Logger::Log(const std::string &msg, LogLevel level) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < minimumLevel_)
      return;
    entries_.push_back({std::chrono::system_clock::now(), level, msg});
    ++accepted_;
  }
  pending_.notify_one();
}

void Logger::Flush() {
  std::unique_lock<std::mutex> lock(mutex_);
  drained_.wait(lock, [this] { return entries_.empty() && !writing_; });
}

void Logger::SetMinimumLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  minimumLevel_ = level;
}

LogLevel Logger::MinimumLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return minimumLevel_;
}

size_t Logger::MessageCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return accepted_;
}

void Logger::Write(const Entry &entry) {
  const std::string line =
      FormatTime(entry.time) + ' ' + LevelName(entry.level) + ' ' + entry.text;
  if (file_.is_open())
    file_ << line << '\n' << std::flush;
  std::cerr << line << std::endl;
}

void Logger::Worker() {
  std::unique_lock<std::mutex> lock(mutex_);
  for (;;) {
    pending_.wait(lock, [this] { return stopping_ || !entries_.empty(); });
    if (entries_.empty())
      break;
    const Entry entry = std::move(entries_.front());
    entries_.pop_front();
    writing_ = true;
    lock.unlock();
    Write(entry);
    lock.lock();
    writing_ = false;
    if (entries_.empty())
      drained_.notify_all();
  }
  drained_.notify_all();
}

} // namespace inspectdoc
