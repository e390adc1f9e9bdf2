#ifndef _HANDSHAKE_SESSION_H_
#define _HANDSHAKE_SESSION_H_

#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "automaton.h"
#include "handshake-state.h"

namespace handshake {
enum class Rejection {
  kNone = 0,
  kAlreadyInError,
  kInvalidSymbol,
  kUndefinedTransition
};

const char *ToString(Rejection rejection);

struct TransitionRecord {
  std::string input;
  State from;
  State to;
  bool accepted;
};

struct StepResult {
  bool accepted = false;
  State old_state = State::kClosed;
  State new_state = State::kClosed;
  std::string input;
  Rejection rejection = Rejection::kNone;
  std::string message;
};

struct VerifyResult {
  bool valid = false;
  std::vector<StepResult> steps;
  State final_state = State::kClosed;
  // "server-side" or "client-side" for a valid run, empty otherwise.
  std::string path;
  std::string message;
};

template <class CharT, class Traits>
std::basic_ostream<CharT, Traits> &operator<<(
    std::basic_ostream<CharT, Traits> &o, const TransitionRecord &r) {
  return o << r.from << " --[" << r.input << "]--> " << r.to
           << (r.accepted ? "" : "  (rejected)");
}

template <class CharT, class Traits>
std::basic_ostream<CharT, Traits> &operator<<(
    std::basic_ostream<CharT, Traits> &o, const StepResult &r) {
  return o << r.old_state << " --[" << r.input << "]--> " << r.new_state
           << "  " << r.message;
}

template <class CharT, class Traits>
std::basic_ostream<CharT, Traits> &operator<<(
    std::basic_ostream<CharT, Traits> &o, const VerifyResult &r) {
  o << "valid: " << (r.valid ? "true" : "false") << '\n'
    << "final state: " << r.final_state << '\n';
  for (const auto &step : r.steps)
    o << "  " << step << '\n';
  return o << r.message << '\n';
}

// Mutable half of the engine. A session is owned by whoever drives one
// verification; the automaton behind it is shared and read-only.
//
// The current state always equals the target of the last history record, or
// the start state while the history is empty.
class Session {
public:
  Session();
  explicit Session(std::shared_ptr<const Automaton> automaton);

  void Reset();

  // Consumes one input. Never throws for bad input: an unknown symbol or an
  // undefined transition moves the session to ERROR and is reported in the
  // result. Exactly one history record is appended per call.
  StepResult Step(std::string_view symbol);

  // Resets, then steps through every symbol. Inputs after the first
  // rejection are still consumed so the history covers the whole sequence.
  VerifyResult Verify(const std::vector<std::string> &symbols);

  const Description &Describe() const {
    return automaton_->Describe();
  }

  State GetState() const {
    return state_;
  }

  const std::vector<TransitionRecord> &GetHistory() const {
    return history_;
  }

  bool AnyRejected() const {
    return rejected_;
  }

  // True when the inputs consumed since the last reset form a valid run.
  bool IsValidRun() const {
    return automaton_->IsAccepting(state_) && !rejected_;
  }

private:
  StepResult Record(StepResult result);

  std::shared_ptr<const Automaton> automaton_;
  State state_;
  std::vector<TransitionRecord> history_;
  bool rejected_ = false;
};

} // namespace handshake

#endif // _HANDSHAKE_SESSION_H_
