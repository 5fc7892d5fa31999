#pragma once
#include "santorini/board.hpp"
#include "santorini/types.hpp"
#include <array>
#include <cstdint>

namespace santorini {

class Engine; // only component allowed to mutate a live state

using WorkerPositions = std::array<Coord, WORKERS_PER_PLAYER>;

class GameState {
public:
  GameState();
  void reset();

  // Position after setup with Player `to_move` about to select a worker.
  // Throws std::invalid_argument when workers overlap, sit off the board or on a dome.
  static GameState from_position(const Board& board, const WorkerPositions& player_one,
                                 const WorkerPositions& player_two, Player to_move = Player::One);

  Player current_player() const { return to_move_; }
  Phase phase() const { return phase_; }
  bool is_over() const { return phase_ == Phase::Won || phase_ == Phase::NoLegalMove; }
  Player winner() const { return winner_; }
  EndReason end_reason() const { return end_reason_; }

  const Board& board() const { return board_; }

  const WorkerPositions& workers(Player p) const { return workers_[player_index(p)]; }
  Coord worker(Player p, int index) const { return workers_[player_index(p)][index]; }

  // Workers placed so far during setup, 0..4
  int placed_workers() const { return placed_; }

  // Index of the worker chosen this turn, -1 while none is selected
  int selected_worker() const { return selected_; }
  Coord selected_position() const {
    return (selected_ < 0) ? Coord{} : workers_[player_index(to_move_)][selected_];
  }

  uint64_t compute_hash() const;

  // Field-by-field comparison; compute_hash() equality alone can collide
  bool same_position(const GameState& other) const;

private:
  friend class Engine;

  Board board_;
  std::array<WorkerPositions, 2> workers_;
  int placed_ = 0;
  Player to_move_ = Player::One;
  Phase phase_ = Phase::PlacingWorkers;
  int selected_ = -1;
  Player winner_ = Player::None;
  EndReason end_reason_ = EndReason::None;
};

} // namespace santorini
