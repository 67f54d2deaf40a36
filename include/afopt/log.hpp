#pragma once
#include <cstdio>
#include <string>

namespace afopt {

enum class LogLevel : int { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// Global threshold; messages below it are dropped. Default: Info.
void set_log_level(LogLevel level);
LogLevel log_level();

// "debug" | "info" | "warn" | "error" (case-insensitive); unknown -> Info.
LogLevel log_level_from_string(const std::string& s);

// Writes "[LEVEL] message" to stderr.
void log_message(LogLevel level, const char* message);

namespace detail {
template <typename... Args>
void log_formatted(LogLevel level, const char* format, Args... args) {
  if (static_cast<int>(level) < static_cast<int>(log_level())) return;
  char buffer[1024];
  std::snprintf(buffer, sizeof(buffer), format, args...);
  log_message(level, buffer);
}
} // namespace detail

template <typename... Args>
void log_debug(const char* format, Args... args) { detail::log_formatted(LogLevel::Debug, format, args...); }

template <typename... Args>
void log_info(const char* format, Args... args) { detail::log_formatted(LogLevel::Info, format, args...); }

template <typename... Args>
void log_warn(const char* format, Args... args) { detail::log_formatted(LogLevel::Warn, format, args...); }

template <typename... Args>
void log_error(const char* format, Args... args) { detail::log_formatted(LogLevel::Error, format, args...); }

} // namespace afopt
