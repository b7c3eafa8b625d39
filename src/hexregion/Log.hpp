#pragma once

#include <cstdint>
#include <string>

namespace hexregion {

// Leveled diagnostics for the library and tools.
//
// Lines go to std::cerr as "[hexregion:info] message", one line per call,
// serialized by a mutex so concurrent operations do not interleave. Route them
// into a file with LogTee.

enum class LogLevel : std::uint8_t {
  Debug = 0,
  Info,
  Warn,
  Error,
  Off,
};

// Accepted values (case-insensitive): debug, trace, info, warn, warning, error,
// off, none, quiet. Returns false for anything else.
bool ParseLogLevel(const std::string& s, LogLevel& out);

const char* LogLevelName(LogLevel level);

// Messages below the minimum level are dropped. Default: Info.
void SetLogLevel(LogLevel minLevel);
LogLevel GetLogLevel();
bool LogEnabled(LogLevel level);

void LogMessage(LogLevel level, const std::string& message);

// printf-style convenience; formats only when the level is enabled.
#if defined(__GNUC__)
void Logf(LogLevel level, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
#else
void Logf(LogLevel level, const char* fmt, ...);
#endif

} // namespace hexregion
