#include <iostream>
#include <chrono>
#include "heuristic_ai.hpp"
#include "santorini/board.hpp"
#include "santorini/game_state.hpp"
#include "notation.hpp"

int main() {
  using namespace santorini_ai;
  using namespace santorini;

  // a mid-game position: some towers up, workers spread out
  const Board board = Board::from_heights({{
    {{0, 1, 0, 0, 0}},
    {{0, 2, 1, 0, 0}},
    {{0, 0, 3, 1, 0}},
    {{1, 0, 0, 2, 0}},
    {{0, 0, 0, 0, 4}},
  }});
  const GameState s = GameState::from_position(board, {{Coord{1, 1}, Coord{3, 3}}},
                                               {{Coord{0, 4}, Coord{4, 0}}});

  for (int depth = 1; depth <= 3; ++depth) {
    for (bool use_cache : {false, true}) {
      HeuristicAI ai(depth);
      ai.set_use_cache(use_cache);
      ai.set_verbose(false);

      auto start = std::chrono::steady_clock::now();
      auto mv = ai.choose_move(s);
      auto end = std::chrono::steady_clock::now();

      auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
      const auto& stats = ai.get_stats();

      std::cout << "Depth " << depth << (use_cache ? " (cache)" : " (no cache)") << std::endl;
      std::cout << "  Elapsed ms: " << elapsed_ms << std::endl;
      std::cout << "  Nodes searched: " << stats.nodes_searched << ", cache hits: " << stats.cache_hits << std::endl;
      std::cout << "  Returned move: " << (mv ? notation::format_move(*mv) : std::string("(none)")) << std::endl;
    }
  }
  return 0;
}
