#include "automaton.h"

#include <string>

#include "safe-log.h"

namespace handshake {
namespace {
template <class T, std::size_t N>
void Declare(const std::vector<T> &values, std::array<bool, N> &present,
             std::vector<T> &ordered) {
  for (auto value : values) {
    if (!present[Index(value)]) {
      present[Index(value)] = true;
      ordered.push_back(value);
    }
  }
}

std::string Format(const Transition &t) {
  return std::string(ToString(t.from)) + " " + ToString(t.symbol) + " -> " +
         ToString(t.to);
}

} // anonymous namespace

AutomatonDefinition AutomatonDefinition::Canonical() {
  AutomatonDefinition definition;
  definition.states.assign(kAllStates.begin(), kAllStates.end());
  definition.alphabet.assign(kAllSymbols.begin(), kAllSymbols.end());
  definition.transitions = {
    {State::kClosed, Symbol::kListen, State::kListen},
    {State::kListen, Symbol::kSyn, State::kSynRcvd},
    {State::kSynRcvd, Symbol::kAck, State::kEstab},
    {State::kClosed, Symbol::kSyn, State::kSynSent},
    {State::kSynSent, Symbol::kSynAck, State::kEstab}
  };
  definition.start = State::kClosed;
  definition.accepting = {State::kEstab};
  return definition;
}

Automaton::Automaton() : Automaton(AutomatonDefinition::Canonical()) {}

Automaton::Automaton(const AutomatonDefinition &definition) {
  std::array<bool, kStateCount> declared{};
  Declare(definition.states, declared, description_.states);
  Declare(definition.alphabet, alphabet_, description_.alphabet);

  if (!declared[Index(State::kError)])
    throw ConfigError("state set must contain ERROR");

  if (!declared[Index(definition.start)])
    throw ConfigError(std::string("start state ") +
                      ToString(definition.start) + " is not a declared state");
  description_.start_state = definition.start;

  for (auto state : definition.accepting) {
    if (!declared[Index(state)])
      throw ConfigError(std::string("accepting state ") + ToString(state) +
                        " is not a declared state");
    if (state == State::kError)
      throw ConfigError("ERROR cannot be an accepting state");
  }
  Declare(definition.accepting, accepting_, description_.accepting_states);

  for (const auto &t : definition.transitions) {
    if (!declared[Index(t.from)] || !declared[Index(t.to)])
      throw ConfigError("transition " + Format(t) +
                        " references an undeclared state");
    if (!alphabet_[Index(t.symbol)])
      throw ConfigError("transition " + Format(t) +
                        " references an undeclared symbol");
    if (t.from == State::kError)
      throw ConfigError("transition " + Format(t) +
                        " leaves the absorbing ERROR state");
    if (!table_.Define(t.from, t.symbol, t.to))
      throw ConfigError("transition " + Format(t) +
                        " redefines an existing (state, symbol) pair");
    description_.transitions.push_back(t);
  }

  LogDebug("automaton built: ", description_.states.size(), " states, ",
           description_.alphabet.size(), " symbols, ", table_.Size(),
           " transitions");
}

std::shared_ptr<const Automaton> MakeAutomaton(
    const AutomatonDefinition &definition) {
  return std::make_shared<const Automaton>(definition);
}

std::shared_ptr<const Automaton> CanonicalAutomaton() {
  static const std::shared_ptr<const Automaton> automaton =
      std::make_shared<const Automaton>();
  return automaton;
}

} // namespace handshake
