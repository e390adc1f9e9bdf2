#ifndef _HANDSHAKE_ARGUMENTS_H_
#define _HANDSHAKE_ARGUMENTS_H_

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

namespace handshake {
struct UsageError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

enum class Command {
  kVerify,
  kDescribe,
  kStep
};

constexpr std::chrono::milliseconds kMaxDelay{60000};

struct Arguments {
  Command command = Command::kVerify;
  std::vector<std::string> symbols;
  std::string table_path;
  // Pause between printed steps; never changes the verdict.
  std::chrono::milliseconds delay{0};
  bool verbose = false;
  bool help = false;

  // Throws UsageError on malformed command lines.
  Arguments(int argc, char *argv[]);

  static void PrintUsage(const char *program);
};

} // namespace handshake

#endif // _HANDSHAKE_ARGUMENTS_H_
