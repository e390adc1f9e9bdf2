#include <iostream>

#include "arguments.h"
#include "automaton.h"
#include "driver.h"
#include "safe-log.h"
#include "session.h"
#include "table-loader.h"

using namespace handshake;

int main(int argc, char *argv[]) {
  try {
    Arguments args(argc, argv);
    if (args.help) {
      Arguments::PrintUsage(argv[0]);
      return 0;
    }
    SetLogLevel(args.verbose ? LogLevel::kDebug : LogLevel::kInfo);

    auto automaton = args.table_path.empty()
        ? CanonicalAutomaton()
        : MakeAutomaton(LoadDefinitionFromFile(args.table_path));
    Session session(automaton);

    switch (args.command) {
      case Command::kVerify:
        return RunVerify(session, args.symbols, std::cout, args.delay);
      case Command::kDescribe:
        std::cout << session.Describe();
        return 0;
      case Command::kStep:
        return RunStep(session, std::cin, std::cout, args.delay);
    }
    return 2;
  } catch (const UsageError &e) {
    std::cerr << "Error: " << e.what() << "\n";
    Arguments::PrintUsage(argv[0]);
    return 2;
  } catch (const ConfigError &e) {
    std::cerr << "Configuration error: " << e.what() << "\n";
    return 2;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 2;
  }
}
