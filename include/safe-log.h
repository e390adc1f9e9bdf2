#ifndef _HANDSHAKE_SAFE_LOG_H_
#define _HANDSHAKE_SAFE_LOG_H_

#include <iostream>
#include <sstream>

namespace handshake {
enum class LogLevel {
  kQuiet = 0,
  kInfo,
  kDebug
};

void SetLogLevel(LogLevel level);
LogLevel GetLogLevel();

namespace internal {
// One line per call, written in a single operation so that lines from
// concurrent sessions never interleave.
template <class... Args>
void WriteLogLine(const char *tag, const Args&... args) {
  std::ostringstream output;
  output << "[handshake] " << tag;
  (output << ... << args) << std::endl;
  std::clog << output.rdbuf()->str() << std::flush;
}
} // namespace internal

template <class... Args>
void Log(const Args&... args) {
  if (GetLogLevel() >= LogLevel::kInfo)
    internal::WriteLogLine("", args...);
}

template <class... Args>
void LogDebug(const Args&... args) {
  if (GetLogLevel() >= LogLevel::kDebug)
    internal::WriteLogLine("debug: ", args...);
}

} // namespace handshake

#endif // _HANDSHAKE_SAFE_LOG_H_
