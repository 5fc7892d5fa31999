#pragma once
#include "santorini/game_state.hpp"
#include "santorini/move.hpp"
#include "evaluation.hpp"
#include "placement_policy.hpp"
#include <cstdint>
#include <optional>
#include <unordered_map>

namespace santorini_ai {

/**
 * Fixed-depth min-max search.
 * The root player's turns maximise evaluate(state, root), the opponent's minimise it.
 * Depth counts full turns (worker + step + build), not sub-actions.
 */
class HeuristicAI {
public:
  HeuristicAI();
  explicit HeuristicAI(int depth, uint32_t seed = 0);

  // Best move for the player to move, std::nullopt when that player has none.
  // Ties keep the first move in generation order.
  // Throws std::logic_error unless `s` is at the start of a turn or blocked.
  std::optional<santorini::Move> choose_move(const santorini::GameState& s, int depth);
  std::optional<santorini::Move> choose_move(const santorini::GameState& s) {
    return choose_move(s, depth_);
  }

  // Setup phase
  santorini::Coord choose_placement(const santorini::GameState& s);

  int depth() const { return depth_; }
  void set_use_cache(bool use) { use_cache_ = use; }
  void set_verbose(bool v) { verbose_ = v; }

  struct Stats {
    int nodes_searched;
    int cache_hits;
    int root_moves;
    int64_t time_ms;
    Score best_score;

    void reset() {
      nodes_searched = 0;
      cache_hits = 0;
      root_moves = 0;
      time_ms = 0;
      best_score = 0.0;
    }
  };

  const Stats& get_stats() const { return stats_; }

private:
  Score minimax(const santorini::GameState& state, int depth, santorini::Player root);

  struct CacheKey {
    uint64_t hash;
    int depth;
    santorini::Player root;
    bool operator==(const CacheKey& other) const {
      return hash == other.hash && depth == other.depth && root == other.root;
    }
  };

  struct CacheKeyHash {
    std::size_t operator()(const CacheKey& key) const {
      std::size_t h = static_cast<std::size_t>(key.hash);
      h ^= static_cast<std::size_t>(key.depth + 31) * 1315423911u;
      h ^= static_cast<std::size_t>(key.root) << 4;
      return h;
    }
  };

  // the full state guards against hash collisions
  struct CacheEntry {
    santorini::GameState state;
    Score score;
  };

  int depth_;
  bool use_cache_;
  bool verbose_;
  Stats stats_;
  std::unordered_map<CacheKey, CacheEntry, CacheKeyHash> cache_;
  PlacementPolicy placement_;
};

} // namespace santorini_ai
