#pragma once
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace santorini_ai {
namespace config {

constexpr int kDefaultSearchDepth = 2;
constexpr int kMaxSearchDepth = 4;
constexpr uint32_t kDefaultSeed = 20240611u;
// match runner: games longer than this are scored as draws
constexpr int kMaxTurns = 300;
constexpr int kSeriesGames = 10;

// MCTS: playouts per move and the UCB exploration constant
constexpr int kDefaultMctsIterations = 1000;
constexpr int kMinMctsIterations = 10;
constexpr int kMaxMctsIterations = 100000;
constexpr double kExplorationConstant = 1.414;

// Elo table of the match runner
constexpr double kInitialRating = 1500.0;
constexpr double kInitialKFactor = 100.0;
constexpr double kMinKFactor = 10.0;
constexpr double kKFactorDecay = 0.75;
constexpr int kEloGamesPerPair = 5;

inline bool debug_enabled() { return std::getenv("SANTORINI_DEBUG") != nullptr; }

inline int parse_depth(const char* value, int fallback) {
  if (!value) return fallback;
  try {
    const int depth = std::stoi(value);
    if (depth < 1 || depth > kMaxSearchDepth) return fallback;
    return depth;
  } catch (const std::exception&) {
    return fallback;
  }
}

// SANTORINI_AI_DEPTH overrides the compiled-in default
inline int resolve_search_depth(int fallback = kDefaultSearchDepth) {
  return parse_depth(std::getenv("SANTORINI_AI_DEPTH"), fallback);
}

inline int parse_iterations(const char* value, int fallback) {
  if (!value) return fallback;
  try {
    const int iterations = std::stoi(value);
    if (iterations < kMinMctsIterations || iterations > kMaxMctsIterations) return fallback;
    return iterations;
  } catch (const std::exception&) {
    return fallback;
  }
}

// SANTORINI_MCTS_ITERATIONS overrides the compiled-in default
inline int resolve_mcts_iterations(int fallback = kDefaultMctsIterations) {
  return parse_iterations(std::getenv("SANTORINI_MCTS_ITERATIONS"), fallback);
}

} // namespace config
} // namespace santorini_ai
