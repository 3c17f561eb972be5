#pragma once

#include "entente/core/Log.h"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace entente::inspector {

struct LogLine {
  std::uint64_t seq{0};
  core::LogLevel level{core::LogLevel::Info};
  std::string timestamp;
  std::string message;
};

// Bounded, thread-safe store fed by a core::LogSink. The oldest lines are
// dropped once `capacity` is exceeded.
class LogRing {
public:
  explicit LogRing(std::size_t capacity = 2048) : capacity_(capacity ? capacity : 1) {}

  void push(core::LogLevel level, std::string_view timestamp, std::string_view message);
  void snapshot(std::vector<LogLine>& out) const;
  void clear();

  core::LogSink sink() { return core::LogSink{&LogRing::sinkFn, this}; }

private:
  static void sinkFn(core::LogLevel level, std::string_view timestamp, std::string_view message, void* user);

  mutable std::mutex mutex_;
  std::deque<LogLine> lines_;
  std::size_t capacity_;
  std::uint64_t nextSeq_{1};
};

struct LogWindowState {
  bool open{true};
  char filter[128]{};
  bool autoScroll{true};

  bool showDebug{false};
  bool showInfo{true};
  bool showWarn{true};
  bool showError{true};
};

using ToastFn = std::function<void(const std::string& msg, double ttlSec)>;

void drawLogWindow(LogWindowState& st, LogRing& ring, const ToastFn& toast);

} // namespace entente::inspector
