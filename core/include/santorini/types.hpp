#pragma once
#include <cstdint>
#include <cstdlib>
#include <algorithm>

namespace santorini {

enum class Player : uint8_t { None = 0, One = 1, Two = 2 };

enum class Phase : uint8_t {
  PlacingWorkers = 0,
  SelectingWorker = 1,
  ChoosingDestination = 2,
  ChoosingBuildSite = 3,
  Won = 4,
  NoLegalMove = 5
};

// Why a finished game ended
enum class EndReason : uint8_t { None = 0, ReachedLevelThree = 1, Blocked = 2, Resignation = 3 };

constexpr int BOARD_W = 5;
constexpr int BOARD_H = 5;
constexpr int MAX_HEIGHT = 3;
constexpr int WORKERS_PER_PLAYER = 2;

struct Coord {
  int x = -1;
  int y = -1;
};

inline bool operator==(const Coord& a, const Coord& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Coord& a, const Coord& b) { return !(a == b); }

// L-infinity distance, matches 8-direction adjacency
inline int chebyshev_distance(const Coord& a, const Coord& b) {
  return std::max(std::abs(a.x - b.x), std::abs(a.y - b.y));
}

inline Player opponent(Player p) {
  if (p == Player::One) return Player::Two;
  if (p == Player::Two) return Player::One;
  return Player::None;
}

inline int player_index(Player p) { return (p == Player::Two) ? 1 : 0; }

inline const char* player_name(Player p) {
  switch (p) {
    case Player::One: return "Player 1";
    case Player::Two: return "Player 2";
    default: return "Nobody";
  }
}

} // namespace santorini
