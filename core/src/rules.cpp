#include "santorini/rules.hpp"
#include "santorini/game_state.hpp"

namespace santorini {

bool Rules::can_move_to(const Board& b, const Coord& from, const Coord& to) {
  if (!b.in_bounds(from) || !b.in_bounds(to)) return false;
  if (chebyshev_distance(from, to) != 1) return false;
  if (b.is_occupied(to) || b.is_capped(to)) return false;
  // climb at most one level, drop any number
  return b.height_at(to) - b.height_at(from) <= 1;
}

bool Rules::can_build_at(const Board& b, const Coord& builder, const Coord& site, const Coord& vacated) {
  if (!b.in_bounds(builder) || !b.in_bounds(site)) return false;
  if (chebyshev_distance(builder, site) != 1) return false;
  if (b.is_capped(site)) return false;
  return !b.is_occupied(site) || site == vacated;
}

Neighbors Rules::legal_destinations(const Board& b, const Coord& from) {
  Neighbors out;
  if (!b.in_bounds(from)) return out;
  for (const Coord& to : b.neighbors(from)) {
    if (can_move_to(b, from, to)) {
      out.cells[out.size++] = to;
    }
  }
  return out;
}

Neighbors Rules::legal_builds(const Board& b, const Coord& builder, const Coord& vacated) {
  Neighbors out;
  if (!b.in_bounds(builder)) return out;
  for (const Coord& site : b.neighbors(builder)) {
    if (can_build_at(b, builder, site, vacated)) {
      out.cells[out.size++] = site;
    }
  }
  return out;
}

bool Rules::has_any_destination(const GameState& s, Player p) {
  if (p == Player::None || s.placed_workers() < 2 * WORKERS_PER_PLAYER) return false;
  const Board& b = s.board();
  for (const Coord& from : s.workers(p)) {
    if (legal_destinations(b, from).size > 0) return true;
  }
  return false;
}

void Rules::for_each_move(const GameState& s, Player p, const MoveVisitor& visit) {
  if (p == Player::None || s.is_over()) return;
  if (s.placed_workers() < 2 * WORKERS_PER_PLAYER) return;

  const Board& b = s.board();
  const WorkerPositions& positions = s.workers(p);

  for (int w = 0; w < WORKERS_PER_PLAYER; ++w) {
    const Coord from = positions[w];
    for (const Coord& to : legal_destinations(b, from)) {
      Move m;
      m.worker = w;
      m.from = from;
      m.to = to;

      // stepping onto level 3 wins, no build follows
      if (b.height_at(to) == MAX_HEIGHT) {
        m.has_build = false;
        if (!visit(m)) return;
        continue;
      }

      // the origin is empty once the worker has stepped off it
      for (const Coord& site : legal_builds(b, to, from)) {
        m.has_build = true;
        m.build = site;
        if (!visit(m)) return;
      }
    }
  }
}

void Rules::legal_moves(const GameState& s, Player p, MoveList& out) {
  out.clear();
  for_each_move(s, p, [&out](const Move& m) {
    out.push_back(m);
    return true;
  });
}

void Rules::legal_moves(const GameState& s, MoveList& out) {
  legal_moves(s, s.current_player(), out);
}

bool Rules::is_legal(const GameState& s, const Move& m) {
  bool found = false;
  for_each_move(s, s.current_player(), [&](const Move& candidate) {
    found = (candidate == m);
    return !found;
  });
  return found;
}

} // namespace santorini
