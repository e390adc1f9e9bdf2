#include "safe-log.h"

#include <atomic>

namespace handshake {
namespace {
std::atomic<LogLevel> log_level{LogLevel::kInfo};
} // anonymous namespace

void SetLogLevel(LogLevel level) {
  log_level.store(level, std::memory_order_relaxed);
}

LogLevel GetLogLevel() {
  return log_level.load(std::memory_order_relaxed);
}

} // namespace handshake
