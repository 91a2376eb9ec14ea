// Repository: Clipper
// Component: Thread-Safe Logger Implementation
// Copyright (c) 2026 Clipper

#include "clipper/util/Logger.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <iostream>

namespace clipper::util {

namespace {

const auto kProcessStart = std::chrono::steady_clock::now();

LogLevel InitialLevel() {
  if (const char* env = std::getenv("CLIPPER_LOG_LEVEL")) {
    if (auto parsed = LogLevelFromName(env)) return *parsed;
  }
  if (std::getenv("CLIPPER_DEBUG") != nullptr) return LogLevel::kDebug;
  return LogLevel::kInfo;
}

std::atomic<int>& Threshold() {
  static std::atomic<int> threshold{static_cast<int>(InitialLevel())};
  return threshold;
}

}  // namespace

std::mutex Logger::mutex_;
Logger::CaptureFn Logger::capture_;
LogLevel Logger::capture_level_ = LogLevel::kDebug;

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug: return "DEBUG";
    case LogLevel::kInfo:  return "INFO";
    case LogLevel::kWarn:  return "WARN";
    case LogLevel::kError: return "ERROR";
  }
  return "INFO";
}

std::optional<LogLevel> LogLevelFromName(const std::string& name) {
  if (name == "debug") return LogLevel::kDebug;
  if (name == "info") return LogLevel::kInfo;
  if (name == "warn" || name == "warning") return LogLevel::kWarn;
  if (name == "error") return LogLevel::kError;
  return std::nullopt;
}

void Logger::SetLevel(LogLevel level) {
  Threshold().store(static_cast<int>(level));
}

LogLevel Logger::level() {
  return static_cast<LogLevel>(Threshold().load());
}

void Logger::SetCapture(LogLevel min_level, CaptureFn capture) {
  std::lock_guard<std::mutex> lock(mutex_);
  capture_level_ = min_level;
  capture_ = std::move(capture);
}

void Logger::Debug(const std::string& line) { Emit(LogLevel::kDebug, line); }
void Logger::Info(const std::string& line) { Emit(LogLevel::kInfo, line); }
void Logger::Warn(const std::string& line) { Emit(LogLevel::kWarn, line); }
void Logger::Error(const std::string& line) { Emit(LogLevel::kError, line); }

void Logger::Emit(LogLevel level, const std::string& line) {
  const bool to_console = static_cast<int>(level) >= Threshold().load();

  std::lock_guard<std::mutex> lock(mutex_);
  if (capture_ && level >= capture_level_) {
    capture_(level, line);
  }
  if (!to_console) return;

  const long long elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - kProcessStart).count();
  char stamp[32];
  std::snprintf(stamp, sizeof(stamp), "+%06lldms %-5s ", elapsed_ms, LogLevelName(level));

  std::ostream& out = level >= LogLevel::kWarn ? std::cerr : std::cout;
  out << stamp << line << '\n';
  out.flush();
}

}  // namespace clipper::util
