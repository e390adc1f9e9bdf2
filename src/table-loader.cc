#include "table-loader.h"

#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "safe-log.h"

namespace handshake {
namespace {
std::vector<std::string> Tokenize(const std::string &line) {
  std::string code = line.substr(0, line.find('#'));
  std::istringstream iss(code);
  std::vector<std::string> tokens;
  std::string token;
  while (iss >> token)
    tokens.push_back(std::move(token));
  return tokens;
}

[[noreturn]] void Fail(int lineno, const std::string &what) {
  throw ConfigError("line " + std::to_string(lineno) + ": " + what);
}

State ToState(const std::string &token, int lineno) {
  auto state = ParseState(token);
  if (!state)
    Fail(lineno, "unknown state '" + token + "'");
  return *state;
}

Symbol ToSymbol(const std::string &token, int lineno) {
  auto symbol = ParseSymbol(token);
  if (!symbol)
    Fail(lineno, "unknown symbol '" + token + "'");
  return *symbol;
}

struct Directives {
  std::optional<std::vector<State>> states;
  std::optional<std::vector<Symbol>> alphabet;
  std::optional<State> start;
  std::optional<std::vector<State>> accepting;
};

void ParseDirective(const std::vector<std::string> &tokens, int lineno,
                    Directives &d) {
  const auto &name = tokens.front();
  if (tokens.size() < 2)
    Fail(lineno, name + " expects at least one name");

  auto states = [&]() {
    std::vector<State> result;
    for (std::size_t i = 1; i < tokens.size(); ++i)
      result.push_back(ToState(tokens[i], lineno));
    return result;
  };

  if (name == ".states") {
    if (d.states)
      Fail(lineno, "duplicate .states directive");
    d.states = states();
  } else if (name == ".alphabet") {
    if (d.alphabet)
      Fail(lineno, "duplicate .alphabet directive");
    std::vector<Symbol> symbols;
    for (std::size_t i = 1; i < tokens.size(); ++i)
      symbols.push_back(ToSymbol(tokens[i], lineno));
    d.alphabet = std::move(symbols);
  } else if (name == ".start") {
    if (d.start)
      Fail(lineno, "duplicate .start directive");
    if (tokens.size() != 2)
      Fail(lineno, ".start expects exactly one state");
    d.start = ToState(tokens[1], lineno);
  } else if (name == ".accept") {
    if (d.accepting)
      Fail(lineno, "duplicate .accept directive");
    d.accepting = states();
  } else {
    Fail(lineno, "unknown directive '" + name + "'");
  }
}

Transition ParseTransition(const std::vector<std::string> &tokens,
                           int lineno) {
  if (tokens.size() != 4 || tokens[2] != "->")
    Fail(lineno, "expected '<STATE> <SYMBOL> -> <STATE>'");
  return {ToState(tokens[0], lineno), ToSymbol(tokens[1], lineno),
          ToState(tokens[3], lineno)};
}

} // anonymous namespace

AutomatonDefinition LoadDefinition(std::istream &in) {
  const auto canonical = AutomatonDefinition::Canonical();
  AutomatonDefinition definition;
  Directives directives;

  std::string line;
  int lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    const auto tokens = Tokenize(line);
    if (tokens.empty())
      continue;
    if (tokens.front().front() == '.')
      ParseDirective(tokens, lineno, directives);
    else
      definition.transitions.push_back(ParseTransition(tokens, lineno));
  }
  if (in.bad())
    throw ConfigError("failed reading transition table");

  definition.states = directives.states.value_or(canonical.states);
  definition.alphabet = directives.alphabet.value_or(canonical.alphabet);
  definition.start = directives.start.value_or(canonical.start);
  definition.accepting = directives.accepting.value_or(canonical.accepting);

  LogDebug("table loaded: ", definition.transitions.size(), " transitions from ",
           lineno, " lines");
  return definition;
}

AutomatonDefinition LoadDefinitionFromString(const std::string &text) {
  std::istringstream iss(text);
  return LoadDefinition(iss);
}

AutomatonDefinition LoadDefinitionFromFile(const std::string &path) {
  std::ifstream file(path);
  if (!file)
    throw ConfigError("cannot open table file: " + path);
  Log("loading transition table from ", path);
  return LoadDefinition(file);
}

} // namespace handshake
