#ifndef _HANDSHAKE_DRIVER_H_
#define _HANDSHAKE_DRIVER_H_

#include <chrono>
#include <iosfwd>
#include <string>
#include <vector>

#include "session.h"

namespace handshake {
// Text front ends behind handshake-verify. Both return the process exit code:
// 0 for a valid run, 1 otherwise. The delay only paces the printed steps.

int RunVerify(Session &session, const std::vector<std::string> &symbols,
              std::ostream &out, std::chrono::milliseconds delay);

// One token per line: a symbol is stepped, "reset", "history" and "quit" are
// commands. Blank lines are skipped.
int RunStep(Session &session, std::istream &in, std::ostream &out,
            std::chrono::milliseconds delay);

} // namespace handshake

#endif // _HANDSHAKE_DRIVER_H_
