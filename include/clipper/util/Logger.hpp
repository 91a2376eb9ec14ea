// Repository: Clipper
// Component: Thread-Safe Logger
// Purpose: Leveled, mutex-protected log lines shared by batch workers and
//          cache fetch threads.
// Copyright (c) 2026 Clipper

#ifndef CLIPPER_UTIL_LOGGER_HPP_
#define CLIPPER_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace clipper::util {

enum class LogLevel : int {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

const char* LogLevelName(LogLevel level);
std::optional<LogLevel> LogLevelFromName(const std::string& name);

// Every line is written whole under one mutex, so output from concurrent jobs
// never interleaves. Lines carry the time since process start and the level:
//
//   +000412ms WARN  [JobOrchestrator] job=intro skipping cutaway: ...
//
// Debug and Info go to stdout, Warn and Error to stderr. The threshold starts
// at CLIPPER_LOG_LEVEL (debug|info|warn|error), else info; CLIPPER_DEBUG set
// to anything lowers it to debug.
class Logger {
 public:
  using CaptureFn = std::function<void(LogLevel, const std::string&)>;

  static void Debug(const std::string& line);
  static void Info(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  static void SetLevel(LogLevel level);
  static LogLevel level();

  // Test hook: receives every emitted line at or above `min_level` (without
  // the timestamp prefix), in addition to the console. nullptr clears it.
  static void SetCapture(LogLevel min_level, CaptureFn capture);

 private:
  static void Emit(LogLevel level, const std::string& line);

  static std::mutex mutex_;
  static CaptureFn capture_;
  static LogLevel capture_level_;
};

}  // namespace clipper::util

#endif  // CLIPPER_UTIL_LOGGER_HPP_
