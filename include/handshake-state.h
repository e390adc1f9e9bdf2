#ifndef _HANDSHAKE_STATE_H_
#define _HANDSHAKE_STATE_H_

#include <cstddef>

#include <array>
#include <optional>
#include <ostream>
#include <string_view>

namespace handshake {
enum class State {
  kClosed = 0,
  kListen,
  kSynSent,
  kSynRcvd,
  kEstab,
  kError
};

enum class Symbol {
  kListen = 0,
  kSyn,
  kSynAck,
  kAck
};

constexpr std::size_t kStateCount = 6;
constexpr std::size_t kSymbolCount = 4;

constexpr std::array<State, kStateCount> kAllStates {
  State::kClosed,
  State::kListen,
  State::kSynSent,
  State::kSynRcvd,
  State::kEstab,
  State::kError
};

constexpr std::array<Symbol, kSymbolCount> kAllSymbols {
  Symbol::kListen,
  Symbol::kSyn,
  Symbol::kSynAck,
  Symbol::kAck
};

constexpr std::size_t Index(State state) {
  return static_cast<std::size_t>(state);
}

constexpr std::size_t Index(Symbol symbol) {
  return static_cast<std::size_t>(symbol);
}

// Canonical identifiers, e.g. "SYN_RECEIVED" and "SYN_ACK".
const char *ToString(State state);
const char *ToString(Symbol symbol);

// Exact, case-sensitive match against the canonical identifiers. Anything
// else is unrecognized and yields an empty optional.
std::optional<State> ParseState(std::string_view text);
std::optional<Symbol> ParseSymbol(std::string_view text);

template <class CharT, class Traits>
std::basic_ostream<CharT, Traits> &operator<<(
    std::basic_ostream<CharT, Traits> &o, State state) {
  return o << ToString(state);
}

template <class CharT, class Traits>
std::basic_ostream<CharT, Traits> &operator<<(
    std::basic_ostream<CharT, Traits> &o, Symbol symbol) {
  return o << ToString(symbol);
}

} // namespace handshake

#endif // _HANDSHAKE_STATE_H_
