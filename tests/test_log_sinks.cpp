#include "entente/core/Log.h"
#include "tests/test_harness.h"

#include <atomic>
#include <string>

using namespace entente;

namespace {

struct Capture {
  std::atomic<int> count{0};
  std::string last;
};

} // namespace

static void testSink(core::LogLevel /*level*/, std::string_view /*ts*/, std::string_view msg, void* user) {
  auto* cap = reinterpret_cast<Capture*>(user);
  if (!cap) return;
  cap->count.fetch_add(1, std::memory_order_relaxed);
  cap->last = std::string(msg);
}

int test_log_sinks() {
  int failures = 0;

  const core::LogLevel prev = core::getLogLevel();
  core::setLogLevel(core::LogLevel::Trace);
  core::setLogToStderr(false);

  Capture cap;
  const core::LogSink sink{&testSink, &cap};

  core::addLogSink(sink);
  ENTENTE_LOG_INFO("hello");
  CHECK(cap.count.load(std::memory_order_relaxed) == 1);
  CHECK(cap.last == "hello");

  // Removing should stop callbacks.
  core::removeLogSink(sink);
  core::log(core::LogLevel::Info, "world");
  CHECK(cap.count.load(std::memory_order_relaxed) == 1);

  // Respect log-level filtering.
  core::addLogSink(sink);
  core::setLogLevel(core::LogLevel::Warn);
  ENTENTE_LOG_DEBUG("filtered");
  CHECK(cap.count.load(std::memory_order_relaxed) == 1);
  ENTENTE_LOG_WARN("kept");
  CHECK(cap.count.load(std::memory_order_relaxed) == 2);

  core::setLogLevel(core::LogLevel::Off);
  core::log(core::LogLevel::Error, "should_not_fire");
  CHECK(cap.count.load(std::memory_order_relaxed) == 2);

  // A scoped sink detaches at end of scope.
  core::removeLogSink(sink);
  core::setLogLevel(core::LogLevel::Info);
  {
    const core::ScopedLogSink scoped(sink);
    ENTENTE_LOG_INFO("scoped");
  }
  ENTENTE_LOG_INFO("after scope");
  CHECK(cap.count.load(std::memory_order_relaxed) == 3);
  CHECK(cap.last == "scoped");

  // Level names.
  core::LogLevel parsed = core::LogLevel::Info;
  CHECK(core::parseLogLevel("DEBUG", parsed) && parsed == core::LogLevel::Debug);
  CHECK(!core::parseLogLevel("loud", parsed));
  CHECK(core::toString(core::LogLevel::Warn).find("WARN") == 0);
  CHECK(core::logLevelName(core::LogLevel::Warn) == "warn");
  CHECK(core::parseLogLevel(core::logLevelName(core::LogLevel::Trace), parsed) && parsed == core::LogLevel::Trace);

  // Restore.
  core::removeLogSink(sink);
  core::setLogToStderr(true);
  core::setLogLevel(prev);
  return failures;
}
