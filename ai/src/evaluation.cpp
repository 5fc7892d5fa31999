#include "evaluation.hpp"

using namespace santorini;

namespace santorini_ai {

double effective_height(const Board& b, const Coord& c) {
  const Neighbors around = b.neighbors(c);
  double sum = 0.0;
  for (const Coord& n : around) {
    sum += b.height_at(n);
  }
  const double mean = around.size > 0 ? sum / static_cast<double>(around.size) : 0.0;
  return b.height_at(c) + mean;
}

double proximity_term(const GameState& s, Player p) {
  const Board& b = s.board();
  double total = 0.0;
  for (const Coord& own : s.workers(p)) {
    if (!b.in_bounds(own)) continue;
    for (const Coord& other : s.workers(opponent(p))) {
      if (!b.in_bounds(other)) continue;
      total += chebyshev_distance(own, other);
    }
  }
  return -total;
}

double height_term(const GameState& s, Player p) {
  const Board& b = s.board();
  double own_sum = 0.0;
  double other_sum = 0.0;
  for (const Coord& c : s.workers(p)) {
    if (b.in_bounds(c)) own_sum += effective_height(b, c);
  }
  for (const Coord& c : s.workers(opponent(p))) {
    if (b.in_bounds(c)) other_sum += effective_height(b, c);
  }
  return own_sum - other_sum;
}

Score evaluate(const GameState& s, Player p) {
  // Won(P) and NoLegalMove(O) both name P as winner
  if (s.is_over()) {
    return (s.winner() == p) ? kWinScore : kLossScore;
  }
  return proximity_term(s, p) + kHeightWeight * height_term(s, p);
}

} // namespace santorini_ai
