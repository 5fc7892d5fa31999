#pragma once
#include "santorini/move.hpp"
#include <array>
#include <cstddef>

namespace santorini {

// Fixed-size move list
// Max moves: 2 workers * 8 destinations * 8 build sites = 128
constexpr size_t MAX_MOVES = 128;

struct MoveList {
  std::array<Move, MAX_MOVES> moves;
  size_t size = 0;

  void clear() { size = 0; }
  void push_back(const Move& m) {
    if (size < MAX_MOVES) {
      moves[size++] = m;
    }
  }

  bool empty() const { return size == 0; }

  Move& operator[](size_t i) { return moves[i]; }
  const Move& operator[](size_t i) const { return moves[i]; }

  Move* begin() { return &moves[0]; }
  Move* end() { return &moves[size]; }
  const Move* begin() const { return &moves[0]; }
  const Move* end() const { return &moves[size]; }
};

} // namespace santorini
