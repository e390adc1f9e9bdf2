#include <cassert>

#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "automaton.h"
#include "test-util.h"
#include "transition-table.h"

using namespace handshake;

void TestTransitionTable() {
  TransitionTable table;
  assert(table.Size() == 0);
  assert(!table.Lookup(State::kClosed, Symbol::kSyn));
  assert(!table.HasOutgoing(State::kClosed));

  assert(table.Define(State::kClosed, Symbol::kSyn, State::kSynSent));
  assert(table.Lookup(State::kClosed, Symbol::kSyn) == State::kSynSent);
  assert(table.HasOutgoing(State::kClosed));
  assert(table.Size() == 1);

  // A defined cell is never overwritten.
  assert(!table.Define(State::kClosed, Symbol::kSyn, State::kListen));
  assert(table.Lookup(State::kClosed, Symbol::kSyn) == State::kSynSent);
  assert(table.Size() == 1);
}

void TestCanonicalAutomaton() {
  Automaton automaton;
  const auto &d = automaton.Describe();

  assert(d.states == std::vector<State>(kAllStates.begin(), kAllStates.end()));
  assert(d.alphabet ==
         std::vector<Symbol>(kAllSymbols.begin(), kAllSymbols.end()));
  assert(d.start_state == State::kClosed);
  assert(d.accepting_states == std::vector<State>{State::kEstab});
  assert(d.transitions.size() == 5);
  assert(d.transitions[0] ==
         (Transition{State::kClosed, Symbol::kListen, State::kListen}));
  assert(d.transitions[4] ==
         (Transition{State::kSynSent, Symbol::kSynAck, State::kEstab}));

  assert(automaton.Next(State::kClosed, Symbol::kListen) == State::kListen);
  assert(automaton.Next(State::kListen, Symbol::kSyn) == State::kSynRcvd);
  assert(automaton.Next(State::kSynRcvd, Symbol::kAck) == State::kEstab);
  assert(automaton.Next(State::kClosed, Symbol::kSyn) == State::kSynSent);
  assert(automaton.Next(State::kSynSent, Symbol::kSynAck) == State::kEstab);

  // Everything else is undefined, ERROR included.
  std::size_t defined = 0;
  for (auto state : kAllStates) {
    for (auto symbol : kAllSymbols) {
      if (automaton.Next(state, symbol))
        ++defined;
    }
  }
  assert(defined == 5);
  for (auto symbol : kAllSymbols)
    assert(!automaton.Next(State::kError, symbol));

  assert(automaton.IsAccepting(State::kEstab));
  assert(!automaton.IsAccepting(State::kError));
  assert(!automaton.IsAccepting(State::kClosed));

  assert(CanonicalAutomaton() == CanonicalAutomaton());
  assert(SameDescription(CanonicalAutomaton()->Describe(), d));
}

void TestDescriptionOutput() {
  std::ostringstream output;
  output << Automaton().Describe();
  const auto text = output.str();
  assert(Contains(text, "start: CLOSED"));
  assert(Contains(text, "accepting: ESTABLISHED"));
  assert(Contains(text, "  LISTEN --[SYN]--> SYN_RECEIVED\n"));
}

void ExpectConfigError(const AutomatonDefinition &definition,
                       const std::string &fragment) {
  const auto message = CaughtMessage<ConfigError>([&definition]() {
        MakeAutomaton(definition);
      });
  assert(Contains(message, fragment));
}

void TestConfigErrors() {
  {
    auto d = AutomatonDefinition::Canonical();
    d.states = {State::kClosed, State::kListen, State::kSynRcvd,
                State::kEstab, State::kError};
    ExpectConfigError(d, "references an undeclared state");
  }
  {
    auto d = AutomatonDefinition::Canonical();
    d.alphabet = {Symbol::kListen, Symbol::kSyn, Symbol::kAck};
    ExpectConfigError(d, "references an undeclared symbol");
  }
  {
    auto d = AutomatonDefinition::Canonical();
    d.states = {State::kListen, State::kSynSent, State::kSynRcvd,
                State::kEstab, State::kError};
    d.transitions.clear();
    ExpectConfigError(d, "start state CLOSED is not a declared state");
  }
  {
    auto d = AutomatonDefinition::Canonical();
    d.states = {State::kClosed, State::kListen, State::kSynSent,
                State::kSynRcvd, State::kEstab};
    ExpectConfigError(d, "state set must contain ERROR");
  }
  {
    auto d = AutomatonDefinition::Canonical();
    d.accepting.push_back(State::kError);
    ExpectConfigError(d, "ERROR cannot be an accepting state");
  }
  {
    auto d = AutomatonDefinition::Canonical();
    d.states = {State::kClosed, State::kListen, State::kError};
    d.transitions = {{State::kClosed, Symbol::kListen, State::kListen}};
    ExpectConfigError(d, "accepting state ESTABLISHED is not a declared state");
  }
  {
    auto d = AutomatonDefinition::Canonical();
    d.transitions.push_back({State::kError, Symbol::kListen, State::kClosed});
    ExpectConfigError(d, "leaves the absorbing ERROR state");
  }
  {
    auto d = AutomatonDefinition::Canonical();
    d.transitions.push_back({State::kClosed, Symbol::kSyn, State::kListen});
    ExpectConfigError(d, "redefines an existing (state, symbol) pair");
  }
  {
    auto d = AutomatonDefinition::Canonical();
    d.transitions.push_back(d.transitions.front());
    ExpectConfigError(d, "redefines");
  }
}

void TestDeclaredSetsAreDeduplicated() {
  auto d = AutomatonDefinition::Canonical();
  d.states.push_back(State::kClosed);
  d.alphabet.push_back(Symbol::kAck);
  d.accepting.push_back(State::kEstab);

  Automaton automaton(d);
  assert(automaton.Describe().states.size() == kStateCount);
  assert(automaton.Describe().alphabet.size() == kSymbolCount);
  assert(automaton.Describe().accepting_states.size() == 1);
}

void test_automaton() {
  TestTransitionTable();
  TestCanonicalAutomaton();
  TestDescriptionOutput();
  TestConfigErrors();
  TestDeclaredSetsAreDeduplicated();
  std::clog << __func__ << " Passed" << std::endl;
}
