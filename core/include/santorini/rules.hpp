#pragma once
#include "santorini/types.hpp"
#include "santorini/board.hpp"
#include "santorini/move.hpp"
#include "santorini/move_list.hpp"
#include <functional>

namespace santorini {

class GameState; // forward

// Return false to stop the enumeration
using MoveVisitor = std::function<bool(const Move&)>;

namespace Rules {
  // Single-step legality
  bool can_move_to(const Board& b, const Coord& from, const Coord& to);
  // `vacated` is treated as empty: the cell a worker is about to leave
  bool can_build_at(const Board& b, const Coord& builder, const Coord& site,
                    const Coord& vacated = Coord{});

  Neighbors legal_destinations(const Board& b, const Coord& from);
  Neighbors legal_builds(const Board& b, const Coord& builder, const Coord& vacated = Coord{});

  bool has_any_destination(const GameState& s, Player p);

  // Full turns of player p, worker 0 first, in neighbour order
  void for_each_move(const GameState& s, Player p, const MoveVisitor& visit);
  void legal_moves(const GameState& s, Player p, MoveList& out);
  void legal_moves(const GameState& s, MoveList& out);

  bool is_legal(const GameState& s, const Move& m);
}

} // namespace santorini
