#pragma once
#include "santorini/types.hpp"

namespace santorini {

// One complete turn: pick a worker, step, then build.
// A step onto level 3 wins outright and carries no build.
struct Move {
  int worker = -1;
  Coord from;
  Coord to;
  bool has_build = false;
  Coord build;
};

inline bool operator==(const Move& a, const Move& b) {
  return a.worker == b.worker && a.from == b.from && a.to == b.to
      && a.has_build == b.has_build && (!a.has_build || a.build == b.build);
}

inline bool operator!=(const Move& a, const Move& b) {
  return !(a == b);
}

} // namespace santorini
