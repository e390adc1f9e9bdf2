#ifndef _HANDSHAKE_AUTOMATON_H_
#define _HANDSHAKE_AUTOMATON_H_

#include <array>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <vector>

#include "handshake-state.h"
#include "transition-table.h"

namespace handshake {
struct ConfigError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Caller-supplied description of an automaton. Nothing is checked until it is
// handed to Automaton.
struct AutomatonDefinition {
  std::vector<State> states;
  std::vector<Symbol> alphabet;
  std::vector<Transition> transitions;
  State start = State::kClosed;
  std::vector<State> accepting;

  // The three-way handshake: passive open through LISTEN, active open
  // through SYN_SENT.
  static AutomatonDefinition Canonical();
};

struct Description {
  std::vector<State> states;
  std::vector<Symbol> alphabet;
  std::vector<Transition> transitions;
  State start_state = State::kClosed;
  std::vector<State> accepting_states;
};

template <class CharT, class Traits>
std::basic_ostream<CharT, Traits> &operator<<(
    std::basic_ostream<CharT, Traits> &o, const Description &d) {
  o << "states:";
  for (auto state : d.states)
    o << ' ' << state;
  o << "\nalphabet:";
  for (auto symbol : d.alphabet)
    o << ' ' << symbol;
  o << "\nstart: " << d.start_state << "\naccepting:";
  for (auto state : d.accepting_states)
    o << ' ' << state;
  o << "\ntransitions:\n";
  for (const auto &t : d.transitions)
    o << "  " << t << '\n';
  return o;
}

// Immutable once built, so one instance can back any number of sessions on
// any number of threads.
class Automaton {
public:
  Automaton();

  // Throws ConfigError if the definition is inconsistent.
  explicit Automaton(const AutomatonDefinition &definition);

  Automaton(const Automaton &) = delete;
  Automaton &operator=(const Automaton &) = delete;

  std::optional<State> Next(State from, Symbol symbol) const {
    return table_.Lookup(from, symbol);
  }

  bool InAlphabet(Symbol symbol) const {
    return alphabet_[Index(symbol)];
  }

  bool IsAccepting(State state) const {
    return accepting_[Index(state)];
  }

  State Start() const {
    return description_.start_state;
  }

  const Description &Describe() const {
    return description_;
  }

private:
  TransitionTable table_;
  std::array<bool, kSymbolCount> alphabet_{};
  std::array<bool, kStateCount> accepting_{};
  Description description_;
};

std::shared_ptr<const Automaton> MakeAutomaton(
    const AutomatonDefinition &definition);

// Built once per process and shared.
std::shared_ptr<const Automaton> CanonicalAutomaton();

} // namespace handshake

#endif // _HANDSHAKE_AUTOMATON_H_
