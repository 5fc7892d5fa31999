#include "placement_policy.hpp"
#include <chrono>
#include <vector>

namespace santorini_ai {

PlacementPolicy::PlacementPolicy()
  : rng_(static_cast<uint32_t>(std::chrono::steady_clock::now().time_since_epoch().count())) {
}

PlacementPolicy::PlacementPolicy(uint32_t seed) : rng_(seed) {
}

santorini::Coord PlacementPolicy::pick(const santorini::GameState& s) {
  const santorini::Board& b = s.board();
  std::vector<santorini::Coord> centre;
  std::vector<santorini::Coord> any;
  for (int y = 0; y < santorini::BOARD_H; ++y) {
    for (int x = 0; x < santorini::BOARD_W; ++x) {
      const santorini::Coord c{x, y};
      if (b.is_occupied(c) || b.is_capped(c)) continue;
      any.push_back(c);
      if (x >= 1 && x < santorini::BOARD_W - 1 && y >= 1 && y < santorini::BOARD_H - 1) {
        centre.push_back(c);
      }
    }
  }

  const std::vector<santorini::Coord>& pool = centre.empty() ? any : centre;
  if (pool.empty()) {
    return santorini::Coord{}; // board full
  }

  std::uniform_int_distribution<size_t> dist(0, pool.size() - 1);
  return pool[dist(rng_)];
}

} // namespace santorini_ai
