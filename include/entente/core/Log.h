#pragma once

#include <string_view>

namespace entente::core {

enum class LogLevel {
  Trace = 0,
  Debug = 1,
  Info  = 2,
  Warn  = 3,
  Error = 4,
  Off   = 5
};

void setLogLevel(LogLevel level);
LogLevel getLogLevel();

// Fixed-width upper-case label used in the stderr prefix ("INFO ").
std::string_view toString(LogLevel level);

// Lower-case name as accepted by parseLogLevel ("info").
std::string_view logLevelName(LogLevel level);

// trace|debug|info|warn|error|off, case-insensitive, surrounding blanks ignored.
bool parseLogLevel(std::string_view text, LogLevel& out);

// Callback receiving every message that passes the level filter.
// The views are only valid during the call.
struct LogSink {
  using Fn = void (*)(LogLevel level, std::string_view timestamp, std::string_view message, void* user);
  Fn fn{nullptr};
  void* user{nullptr};
};

void addLogSink(LogSink sink);
void removeLogSink(LogSink sink); // removes every registration of (fn, user)

// Registers a sink for the lifetime of the object.
class ScopedLogSink {
public:
  explicit ScopedLogSink(LogSink sink) : sink_(sink) { addLogSink(sink_); }
  ~ScopedLogSink() { removeLogSink(sink_); }

  ScopedLogSink(const ScopedLogSink&) = delete;
  ScopedLogSink& operator=(const ScopedLogSink&) = delete;

private:
  LogSink sink_;
};

// With false, messages reach the sinks only (tests and --json runs keep
// stderr clean this way).
void setLogToStderr(bool enabled);

// "[hh:mm:ss.mmm][LEVEL] message" to stderr, then the same parts to the sinks.
void log(LogLevel level, std::string_view message);

} // namespace entente::core

#define ENTENTE_LOG_TRACE(msg) ::entente::core::log(::entente::core::LogLevel::Trace, (msg))
#define ENTENTE_LOG_DEBUG(msg) ::entente::core::log(::entente::core::LogLevel::Debug, (msg))
#define ENTENTE_LOG_INFO(msg)  ::entente::core::log(::entente::core::LogLevel::Info,  (msg))
#define ENTENTE_LOG_WARN(msg)  ::entente::core::log(::entente::core::LogLevel::Warn,  (msg))
#define ENTENTE_LOG_ERROR(msg) ::entente::core::log(::entente::core::LogLevel::Error, (msg))
