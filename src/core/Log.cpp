#include "entente/core/Log.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

namespace entente::core {

namespace {

struct LevelNames {
  LogLevel level;
  std::string_view label;
  std::string_view name;
};

constexpr std::array<LevelNames, 6> kLevels{{
  {LogLevel::Trace, "TRACE", "trace"},
  {LogLevel::Debug, "DEBUG", "debug"},
  {LogLevel::Info,  "INFO ", "info"},
  {LogLevel::Warn,  "WARN ", "warn"},
  {LogLevel::Error, "ERROR", "error"},
  {LogLevel::Off,   "OFF  ", "off"},
}};

struct LogState {
  std::atomic<LogLevel> level{LogLevel::Info};
  std::atomic<bool> toStderr{true};

  std::mutex mutex; // guards sinks and serializes stderr lines
  std::vector<LogSink> sinks;
};

LogState& state() {
  static LogState s;
  return s;
}

// hh:mm:ss.mmm local time.
std::string timestampNow() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t t = std::chrono::system_clock::to_time_t(now);
  const long long ms =
    std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif

  char buf[16];
  std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d.%03lld", tm.tm_hour, tm.tm_min, tm.tm_sec, ms);
  return buf;
}

} // namespace

void setLogLevel(LogLevel level) { state().level.store(level, std::memory_order_relaxed); }
LogLevel getLogLevel() { return state().level.load(std::memory_order_relaxed); }

void setLogToStderr(bool enabled) { state().toStderr.store(enabled, std::memory_order_relaxed); }

std::string_view toString(LogLevel level) {
  for (const auto& l : kLevels) {
    if (l.level == level) return l.label;
  }
  return "?????";
}

std::string_view logLevelName(LogLevel level) {
  for (const auto& l : kLevels) {
    if (l.level == level) return l.name;
  }
  return "?";
}

bool parseLogLevel(std::string_view text, LogLevel& out) {
  std::string k;
  for (const char c : text) {
    if (!std::isspace((unsigned char)c)) k.push_back((char)std::tolower((unsigned char)c));
  }
  for (const auto& l : kLevels) {
    if (k == l.name) {
      out = l.level;
      return true;
    }
  }
  return false;
}

void addLogSink(LogSink sink) {
  if (!sink.fn) return;
  LogState& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  s.sinks.push_back(sink);
}

void removeLogSink(LogSink sink) {
  LogState& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  s.sinks.erase(std::remove_if(s.sinks.begin(), s.sinks.end(),
                               [&](const LogSink& x) { return x.fn == sink.fn && x.user == sink.user; }),
                s.sinks.end());
}

void log(LogLevel level, std::string_view message) {
  LogState& s = state();
  const LogLevel threshold = s.level.load(std::memory_order_relaxed);
  if (threshold == LogLevel::Off || level < threshold) return;

  const std::string ts = timestampNow();

  std::vector<LogSink> sinks;
  {
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.toStderr.load(std::memory_order_relaxed)) {
      std::cerr << '[' << ts << "][" << toString(level) << "] " << message << '\n';
    }
    sinks = s.sinks;
  }

  // Unlocked: a sink may log or unregister itself.
  for (const LogSink& sink : sinks) sink.fn(level, ts, message, sink.user);
}

} // namespace entente::core
