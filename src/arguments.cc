#include "arguments.h"

#include <cerrno>
#include <cstdlib>
#include <iostream>

#include <getopt.h>

namespace handshake {
void Arguments::PrintUsage(const char *program) {
  std::cout << "Usage: " << program << " [OPTIONS] verify SYMBOL...\n"
            << "       " << program << " [OPTIONS] describe\n"
            << "       " << program << " [OPTIONS] step\n\n"
            << "Checks packet event sequences against the TCP three-way handshake automaton\n\n"
            << "Options:\n"
            << "  -t, --table PATH   Load the transition table from PATH\n"
            << "  -d, --delay MS     Pause MS milliseconds between printed steps (at most 60000)\n"
            << "  -v, --verbose      Log every transition\n"
            << "  -h, --help         Print this help message\n\n"
            << "Step mode reads one symbol per line from stdin; 'reset', 'history'\n"
            << "and 'quit' are commands.\n";
}

Arguments::Arguments(int argc, char *argv[]) {
  static struct option long_options[] = {
    {"table", required_argument, nullptr, 't'},
    {"delay", required_argument, nullptr, 'd'},
    {"verbose", no_argument, nullptr, 'v'},
    {"help", no_argument, nullptr, 'h'},
    {nullptr, 0, nullptr, 0}
  };

  // Symbols are positional and never start with '-'; stop at the command.
  // 0 makes glibc rescan from argv[1] when parsed more than once.
  optind = 0;
  int c;
  while ((c = getopt_long(argc, argv, "+t:d:vh", long_options, nullptr)) != -1) {
    switch (c) {
      case 't':
        table_path = optarg;
        break;
      case 'd': {
        char *end = nullptr;
        errno = 0;
        const long ms = std::strtol(optarg, &end, 10);
        if (end == optarg || *end != '\0' || ms < 0 || errno == ERANGE ||
            ms > kMaxDelay.count())
          throw UsageError(std::string("invalid delay: ") + optarg);
        delay = std::chrono::milliseconds(ms);
        break;
      }
      case 'v':
        verbose = true;
        break;
      case 'h':
        help = true;
        return;
      default:
        // getopt_long already printed the offending option
        throw UsageError("unrecognized option");
    }
  }

  if (optind >= argc)
    throw UsageError("missing command");

  const std::string command_name = argv[optind++];
  if (command_name == "verify") {
    command = Command::kVerify;
  } else if (command_name == "describe") {
    command = Command::kDescribe;
  } else if (command_name == "step") {
    command = Command::kStep;
  } else {
    throw UsageError("unknown command: " + command_name);
  }

  for (int i = optind; i < argc; ++i)
    symbols.push_back(argv[i]);

  if (command != Command::kVerify && !symbols.empty())
    throw UsageError(command_name + " takes no symbols");
}

} // namespace handshake
