#pragma once
#include "santorini/game_state.hpp"
#include "santorini/types.hpp"
#include <cstdint>
#include <random>

namespace santorini_ai {

// Setup-phase policy: a random free cell, preferring the 3x3 centre
class PlacementPolicy {
public:
  PlacementPolicy();
  explicit PlacementPolicy(uint32_t seed);
  santorini::Coord pick(const santorini::GameState& s);

private:
  std::mt19937 rng_;
};

} // namespace santorini_ai
