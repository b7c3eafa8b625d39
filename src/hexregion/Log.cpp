#include "hexregion/Log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <iostream>
#include <mutex>

namespace hexregion {

namespace {

static std::mutex g_mutex;
static std::atomic<int> g_minLevel{static_cast<int>(LogLevel::Info)};

static std::string ToLower(std::string s)
{
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

static void WriteLine(LogLevel level, const char* text)
{
  std::scoped_lock<std::mutex> lock(g_mutex);
  std::ostream& os = std::cerr;
  os << "[hexregion:" << LogLevelName(level) << "] " << ((text && text[0]) ? text : "(empty)");
  os << "\n";
  os.flush();
}

} // namespace

bool ParseLogLevel(const std::string& s, LogLevel& out)
{
  const std::string k = ToLower(s);
  if (k == "debug" || k == "trace") {
    out = LogLevel::Debug;
  } else if (k == "info") {
    out = LogLevel::Info;
  } else if (k == "warn" || k == "warning") {
    out = LogLevel::Warn;
  } else if (k == "error") {
    out = LogLevel::Error;
  } else if (k == "off" || k == "none" || k == "quiet") {
    out = LogLevel::Off;
  } else {
    return false;
  }
  return true;
}

const char* LogLevelName(LogLevel level)
{
  switch (level) {
    case LogLevel::Debug: return "debug";
    case LogLevel::Info: return "info";
    case LogLevel::Warn: return "warn";
    case LogLevel::Error: return "error";
    case LogLevel::Off: return "off";
    default: return "log";
  }
}

void SetLogLevel(LogLevel minLevel)
{
  g_minLevel.store(static_cast<int>(minLevel), std::memory_order_relaxed);
}

LogLevel GetLogLevel()
{
  return static_cast<LogLevel>(g_minLevel.load(std::memory_order_relaxed));
}

bool LogEnabled(LogLevel level)
{
  if (level == LogLevel::Off) return false;
  return static_cast<int>(level) >= g_minLevel.load(std::memory_order_relaxed);
}

void LogMessage(LogLevel level, const std::string& message)
{
  if (!LogEnabled(level)) return;
  WriteLine(level, message.c_str());
}

void Logf(LogLevel level, const char* fmt, ...)
{
  if (!LogEnabled(level) || !fmt) return;

  char buf[4096];
  va_list args;
  va_start(args, fmt);
  std::vsnprintf(buf, sizeof(buf), fmt, args);
  va_end(args);

  WriteLine(level, buf);
}

} // namespace hexregion
