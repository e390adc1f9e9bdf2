#include "handshake-state.h"

#include <cassert>

namespace handshake {
namespace {
constexpr const char *kStateNames[kStateCount] = {
  "CLOSED",
  "LISTEN",
  "SYN_SENT",
  "SYN_RECEIVED",
  "ESTABLISHED",
  "ERROR"
};

constexpr const char *kSymbolNames[kSymbolCount] = {
  "LISTEN",
  "SYN",
  "SYN_ACK",
  "ACK"
};

template <class T, std::size_t N>
std::optional<T> Lookup(const std::array<T, N> &values, std::string_view text) {
  for (auto value : values) {
    if (text == ToString(value))
      return value;
  }
  return std::nullopt;
}

} // anonymous namespace

const char *ToString(State state) {
  assert(Index(state) < kStateCount);
  return kStateNames[Index(state)];
}

const char *ToString(Symbol symbol) {
  assert(Index(symbol) < kSymbolCount);
  return kSymbolNames[Index(symbol)];
}

std::optional<State> ParseState(std::string_view text) {
  return Lookup(kAllStates, text);
}

std::optional<Symbol> ParseSymbol(std::string_view text) {
  return Lookup(kAllSymbols, text);
}

} // namespace handshake
