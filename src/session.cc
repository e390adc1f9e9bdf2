#include "session.h"

#include <cassert>
#include <iterator>
#include <sstream>
#include <utility>

#include "safe-log.h"

namespace handshake {
namespace {
constexpr const char *kRejectionNames[] = {
  "none",
  "already-in-error",
  "invalid-symbol",
  "undefined-transition"
};

std::string PathName(const std::vector<TransitionRecord> &history) {
  for (const auto &record : history) {
    if (record.to == State::kListen)
      return "server-side";
    if (record.to == State::kSynSent)
      return "client-side";
  }
  return "custom";
}

std::string Trail(State start, const std::vector<TransitionRecord> &history) {
  std::ostringstream output;
  output << start;
  for (const auto &record : history)
    output << " -> " << record.to;
  return output.str();
}

} // anonymous namespace

const char *ToString(Rejection rejection) {
  assert(static_cast<std::size_t>(rejection) < std::size(kRejectionNames));
  return kRejectionNames[static_cast<std::size_t>(rejection)];
}

Session::Session() : Session(CanonicalAutomaton()) {}

Session::Session(std::shared_ptr<const Automaton> automaton)
    : automaton_(std::move(automaton)) {
  if (!automaton_)
    throw ConfigError("session requires an automaton");
  state_ = automaton_->Start();
}

void Session::Reset() {
  state_ = automaton_->Start();
  history_.clear();
  rejected_ = false;
}

StepResult Session::Step(std::string_view symbol) {
  StepResult result;
  result.input = std::string(symbol);
  result.old_state = state_;
  result.new_state = State::kError;

  if (state_ == State::kError) {
    result.rejection = Rejection::kAlreadyInError;
    result.message = "automaton already in error state";
    return Record(std::move(result));
  }

  const auto parsed = ParseSymbol(symbol);
  if (!parsed || !automaton_->InAlphabet(*parsed)) {
    result.rejection = Rejection::kInvalidSymbol;
    result.message = "invalid symbol '" + result.input +
                     "': not in the input alphabet";
    return Record(std::move(result));
  }

  const auto next = automaton_->Next(state_, *parsed);
  if (!next) {
    result.rejection = Rejection::kUndefinedTransition;
    result.message = std::string("no transition from ") + ToString(state_) +
                     " on '" + ToString(*parsed) + "'";
    return Record(std::move(result));
  }

  result.accepted = true;
  result.new_state = *next;
  result.message = std::string("valid transition: ") + ToString(state_) +
                   " --[" + ToString(*parsed) + "]--> " + ToString(*next);
  return Record(std::move(result));
}

StepResult Session::Record(StepResult result) {
  history_.push_back(
      {result.input, result.old_state, result.new_state, result.accepted});
  state_ = result.new_state;
  if (!result.accepted)
    rejected_ = true;

  if (result.accepted)
    LogDebug(result.old_state, " --[", result.input, "]--> ", result.new_state);
  else
    LogDebug(result.old_state, " --[", result.input, "]--> ", result.new_state,
             " rejected: ", ToString(result.rejection));
  return result;
}

VerifyResult Session::Verify(const std::vector<std::string> &symbols) {
  Reset();

  VerifyResult result;
  result.steps.reserve(symbols.size());
  for (const auto &symbol : symbols)
    result.steps.push_back(Step(symbol));

  result.final_state = state_;
  result.valid = automaton_->IsAccepting(state_) && !rejected_;

  if (result.valid) {
    result.path = history_.empty() ? "empty" : PathName(history_);
    result.message = "valid " + result.path + " handshake: " +
                     Trail(automaton_->Start(), history_);
  } else if (symbols.empty()) {
    result.message = "no transitions executed";
  } else if (rejected_) {
    std::size_t index = 0;
    while (result.steps[index].accepted)
      ++index;
    const auto &failed = result.steps[index];
    result.message = "step " + std::to_string(index + 1) + " (" +
                     failed.input + ") rejected: " + failed.message;
  } else {
    result.message = std::string("incomplete handshake: ended in ") +
                     ToString(state_);
  }

  LogDebug("verify of ", symbols.size(), " symbols: ", result.message);
  return result;
}

} // namespace handshake
