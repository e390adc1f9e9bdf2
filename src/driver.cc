#include "driver.h"

#include <iostream>
#include <sstream>
#include <thread>

namespace handshake {
namespace {
void Pause(std::chrono::milliseconds delay) {
  if (delay.count() > 0)
    std::this_thread::sleep_for(delay);
}
} // anonymous namespace

// The verdict is fixed before the first step is printed.
int RunVerify(Session &session, const std::vector<std::string> &symbols,
              std::ostream &out, std::chrono::milliseconds delay) {
  const auto result = session.Verify(symbols);

  out << "valid: " << (result.valid ? "true" : "false") << '\n'
      << "final state: " << result.final_state << std::endl;
  for (const auto &step : result.steps) {
    out << "  " << step << std::endl;
    Pause(delay);
  }
  out << result.message << std::endl;
  return result.valid ? 0 : 1;
}

int RunStep(Session &session, std::istream &in, std::ostream &out,
            std::chrono::milliseconds delay) {
  out << "state: " << session.GetState() << std::endl;

  std::string line;
  while (std::getline(in, line)) {
    std::istringstream iss(line);
    std::string token;
    if (!(iss >> token))
      continue;

    if (token == "quit") {
      break;
    } else if (token == "reset") {
      session.Reset();
      out << "state: " << session.GetState() << std::endl;
    } else if (token == "history") {
      for (const auto &record : session.GetHistory())
        out << "  " << record << '\n';
      out << std::flush;
    } else {
      out << session.Step(token) << std::endl;
      Pause(delay);
    }
  }
  return session.IsValidRun() ? 0 : 1;
}

} // namespace handshake
