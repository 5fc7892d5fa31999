#pragma once
#include "santorini/game_state.hpp"
#include "santorini/move.hpp"
#include "santorini/types.hpp"
#include <string>
#include <vector>

namespace santorini {

enum class ActionType : uint8_t {
  PlaceWorker,
  SelectWorker,
  Deselect,
  MoveTo,
  BuildAt,
  Resign
};

// One sub-decision of a turn
struct Action {
  ActionType type = ActionType::SelectWorker;
  int worker = -1;
  Coord cell;

  static Action place(const Coord& c) { return Action{ActionType::PlaceWorker, -1, c}; }
  static Action select(int worker) { return Action{ActionType::SelectWorker, worker, Coord{}}; }
  // Select whichever worker stands on `c`
  static Action select_at(const Coord& c) { return Action{ActionType::SelectWorker, -1, c}; }
  static Action deselect() { return Action{ActionType::Deselect, -1, Coord{}}; }
  static Action move_to(const Coord& c) { return Action{ActionType::MoveTo, -1, c}; }
  static Action build_at(const Coord& c) { return Action{ActionType::BuildAt, -1, c}; }
  static Action resign() { return Action{ActionType::Resign, -1, Coord{}}; }
};

enum class ActionStatus : uint8_t {
  Ok,
  InvalidPlacement,
  InvalidSelection,
  InvalidDestination,
  InvalidBuild,
  OutOfPhase,
  GameAlreadyOver
};

struct ActionResult {
  ActionStatus status = ActionStatus::Ok;
  std::string reason;

  bool ok() const { return status == ActionStatus::Ok; }
};

struct Outcome {
  bool over = false;
  Player winner = Player::None;
  Player loser = Player::None;
  EndReason reason = EndReason::None;
};

// Everything a front end needs to draw the game
struct Snapshot {
  Board board;
  std::array<WorkerPositions, 2> workers;
  int placed_workers = 0;
  Player to_move = Player::None;
  Phase phase = Phase::PlacingWorkers;
  int selected_worker = -1;
  Outcome outcome;
  std::vector<Coord> highlights;
};

const char* to_string(ActionStatus status);
const char* to_string(Phase phase);
const char* to_string(EndReason reason);

class Engine {
public:
  Engine();
  explicit Engine(const GameState& state);
  void reset();

  const GameState& state() const { return state_; }
  Snapshot snapshot() const;

  // Applies one action; a rejected action leaves the state untouched
  ActionResult submit(const Action& a);

  // Submits select, move and build as one unit, rolling back on failure
  ActionResult play(const Move& m);

  Outcome outcome() const;
  bool is_over() const { return state_.is_over(); }

  // Cells the current phase accepts
  std::vector<Coord> highlights() const;

  // Copy of `s` after `m`; throws std::logic_error if `m` is rejected
  static GameState successor(const GameState& s, const Move& m);

private:
  ActionResult place_worker(const Coord& c);
  ActionResult select_worker(int worker, const Coord& at);
  ActionResult deselect();
  ActionResult move_to(const Coord& c);
  ActionResult build_at(const Coord& c);
  ActionResult resign();

  void begin_turn();

  GameState state_;
};

} // namespace santorini
