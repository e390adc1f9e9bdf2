#ifndef _HANDSHAKE_TRANSITION_TABLE_H_
#define _HANDSHAKE_TRANSITION_TABLE_H_

#include <cstddef>

#include <array>
#include <optional>
#include <ostream>

#include "handshake-state.h"

namespace handshake {
struct Transition {
  State from;
  Symbol symbol;
  State to;
};

inline bool operator==(const Transition &lhs, const Transition &rhs) {
  return lhs.from == rhs.from && lhs.symbol == rhs.symbol && lhs.to == rhs.to;
}

inline bool operator!=(const Transition &lhs, const Transition &rhs) {
  return !(lhs == rhs);
}

template <class CharT, class Traits>
std::basic_ostream<CharT, Traits> &operator<<(
    std::basic_ostream<CharT, Traits> &o, const Transition &t) {
  return o << t.from << " --[" << t.symbol << "]--> " << t.to;
}

// Every (state, symbol) cell holds either the next state or nothing. An empty
// cell is an undefined transition, not a self loop.
class TransitionTable {
public:
  TransitionTable() = default;

  // Returns false, leaving the table untouched, if the cell is already set.
  bool Define(State from, Symbol symbol, State to) {
    auto &cell = cells_[Index(from)][Index(symbol)];
    if (cell)
      return false;
    cell = to;
    ++size_;
    return true;
  }

  std::optional<State> Lookup(State from, Symbol symbol) const {
    return cells_[Index(from)][Index(symbol)];
  }

  bool HasOutgoing(State from) const {
    for (const auto &cell : cells_[Index(from)]) {
      if (cell)
        return true;
    }
    return false;
  }

  std::size_t Size() const {
    return size_;
  }

private:
  std::array<std::array<std::optional<State>, kSymbolCount>, kStateCount>
      cells_{};
  std::size_t size_ = 0;
};

} // namespace handshake

#endif // _HANDSHAKE_TRANSITION_TABLE_H_
