#include "santorini/game_state.hpp"
#include <stdexcept>
#include <string>

namespace santorini {

GameState::GameState() { reset(); }

void GameState::reset() {
  board_.reset();
  for (auto& positions : workers_) {
    positions.fill(Coord{});
  }
  placed_ = 0;
  to_move_ = Player::One;
  phase_ = Phase::PlacingWorkers;
  selected_ = -1;
  winner_ = Player::None;
  end_reason_ = EndReason::None;
}

GameState GameState::from_position(const Board& board, const WorkerPositions& player_one,
                                   const WorkerPositions& player_two, Player to_move) {
  if (to_move == Player::None) {
    throw std::invalid_argument("Position needs a player to move");
  }

  GameState s;
  s.board_ = board;
  for (int y = 0; y < BOARD_H; ++y) {
    for (int x = 0; x < BOARD_W; ++x) {
      s.board_.at(x, y).occupant = Player::None;
    }
  }

  s.workers_[player_index(Player::One)] = player_one;
  s.workers_[player_index(Player::Two)] = player_two;

  for (Player p : {Player::One, Player::Two}) {
    for (const Coord& c : s.workers(p)) {
      if (!s.board_.in_bounds(c)) {
        throw std::invalid_argument("Worker off the board at (" + std::to_string(c.x) + ","
                                    + std::to_string(c.y) + ")");
      }
      if (s.board_.is_occupied(c)) {
        throw std::invalid_argument("Two workers share (" + std::to_string(c.x) + ","
                                    + std::to_string(c.y) + ")");
      }
      if (s.board_.is_capped(c)) {
        throw std::invalid_argument("Worker on a dome at (" + std::to_string(c.x) + ","
                                    + std::to_string(c.y) + ")");
      }
      s.board_.set_occupant(c, p);
    }
  }

  s.placed_ = 2 * WORKERS_PER_PLAYER;
  s.to_move_ = to_move;
  s.phase_ = Phase::SelectingWorker;
  return s;
}

uint64_t GameState::compute_hash() const {
  // FNV-1a over the cells and the turn structure
  uint64_t seed = 1469598103934665603ULL;
  auto mix = [&](uint64_t v){ seed ^= v; seed *= 1099511628211ULL; };

  for (int y = 0; y < BOARD_H; ++y) {
    for (int x = 0; x < BOARD_W; ++x) {
      const Cell& cell = board_.at(x, y);
      mix(static_cast<uint64_t>(cell.height));
      mix(static_cast<uint64_t>(cell.capped));
      mix(static_cast<uint64_t>(cell.occupant));
    }
  }

  mix(static_cast<uint64_t>(to_move_));
  mix(static_cast<uint64_t>(phase_));
  mix(static_cast<uint64_t>(selected_ + 1));
  return seed;
}

bool GameState::same_position(const GameState& other) const {
  return board_ == other.board_ && workers_ == other.workers_ && placed_ == other.placed_
      && to_move_ == other.to_move_ && phase_ == other.phase_ && selected_ == other.selected_
      && winner_ == other.winner_ && end_reason_ == other.end_reason_;
}

} // namespace santorini
