#include "santorini/engine.hpp"
#include "santorini/rules.hpp"
#include <stdexcept>
#include <utility>

namespace santorini {

namespace {

ActionResult reject(ActionStatus status, std::string reason) {
  return ActionResult{status, std::move(reason)};
}

std::string describe(const Coord& c) {
  return "(" + std::to_string(c.x) + "," + std::to_string(c.y) + ")";
}

} // namespace

const char* to_string(ActionStatus status) {
  switch (status) {
    case ActionStatus::Ok: return "Ok";
    case ActionStatus::InvalidPlacement: return "InvalidPlacement";
    case ActionStatus::InvalidSelection: return "InvalidSelection";
    case ActionStatus::InvalidDestination: return "InvalidDestination";
    case ActionStatus::InvalidBuild: return "InvalidBuild";
    case ActionStatus::OutOfPhase: return "OutOfPhase";
    case ActionStatus::GameAlreadyOver: return "GameAlreadyOver";
  }
  return "Unknown";
}

const char* to_string(Phase phase) {
  switch (phase) {
    case Phase::PlacingWorkers: return "PlacingWorkers";
    case Phase::SelectingWorker: return "SelectingWorker";
    case Phase::ChoosingDestination: return "ChoosingDestination";
    case Phase::ChoosingBuildSite: return "ChoosingBuildSite";
    case Phase::Won: return "Won";
    case Phase::NoLegalMove: return "NoLegalMove";
  }
  return "Unknown";
}

const char* to_string(EndReason reason) {
  switch (reason) {
    case EndReason::None: return "None";
    case EndReason::ReachedLevelThree: return "ReachedLevelThree";
    case EndReason::Blocked: return "Blocked";
    case EndReason::Resignation: return "Resignation";
  }
  return "Unknown";
}

Engine::Engine() { reset(); }

Engine::Engine(const GameState& state) : state_(state) {
  if (state_.phase() == Phase::SelectingWorker) {
    begin_turn();
  }
}

void Engine::reset() {
  state_.reset();
}

ActionResult Engine::submit(const Action& a) {
  if (state_.is_over()) {
    return reject(ActionStatus::GameAlreadyOver, "The game is already over");
  }

  const Phase phase = state_.phase();
  switch (a.type) {
    case ActionType::PlaceWorker:
      if (phase != Phase::PlacingWorkers) break;
      return place_worker(a.cell);
    case ActionType::SelectWorker:
      if (phase != Phase::SelectingWorker) break;
      return select_worker(a.worker, a.cell);
    case ActionType::Deselect:
      if (phase != Phase::ChoosingDestination) break;
      return deselect();
    case ActionType::MoveTo:
      if (phase != Phase::ChoosingDestination) break;
      return move_to(a.cell);
    case ActionType::BuildAt:
      if (phase != Phase::ChoosingBuildSite) break;
      return build_at(a.cell);
    case ActionType::Resign:
      return resign();
  }
  return reject(ActionStatus::OutOfPhase,
                std::string("Action not accepted during ") + to_string(phase));
}

ActionResult Engine::place_worker(const Coord& c) {
  Board& b = state_.board_;
  if (!b.in_bounds(c)) {
    return reject(ActionStatus::InvalidPlacement, "Cell " + describe(c) + " is off the board");
  }
  if (b.is_occupied(c)) {
    return reject(ActionStatus::InvalidPlacement, "Cell " + describe(c) + " is already occupied");
  }

  // placement order: P1, P2, P1, P2
  const Player p = state_.to_move_;
  const int index = state_.placed_ / 2;
  state_.workers_[player_index(p)][index] = c;
  b.set_occupant(c, p);
  state_.placed_ += 1;
  state_.to_move_ = opponent(p);

  if (state_.placed_ == 2 * WORKERS_PER_PLAYER) {
    state_.phase_ = Phase::SelectingWorker;
    begin_turn();
  }
  return ActionResult{};
}

ActionResult Engine::select_worker(int worker, const Coord& at) {
  if (worker < 0 && state_.board_.in_bounds(at)) {
    const WorkerPositions& own = state_.workers(state_.to_move_);
    for (int w = 0; w < WORKERS_PER_PLAYER; ++w) {
      if (own[w] == at) worker = w;
    }
    if (worker < 0) {
      return reject(ActionStatus::InvalidSelection,
                    "No worker of " + std::string(player_name(state_.to_move_)) + " at " + describe(at));
    }
  }
  if (worker < 0 || worker >= WORKERS_PER_PLAYER) {
    return reject(ActionStatus::InvalidSelection,
                  "No worker " + std::to_string(worker) + " for " + std::string(player_name(state_.to_move_)));
  }
  const Coord from = state_.worker(state_.to_move_, worker);
  if (Rules::legal_destinations(state_.board_, from).size == 0) {
    return reject(ActionStatus::InvalidSelection, "Worker at " + describe(from) + " cannot move");
  }
  state_.selected_ = worker;
  state_.phase_ = Phase::ChoosingDestination;
  return ActionResult{};
}

ActionResult Engine::deselect() {
  state_.selected_ = -1;
  state_.phase_ = Phase::SelectingWorker;
  return ActionResult{};
}

ActionResult Engine::move_to(const Coord& c) {
  Board& b = state_.board_;
  const Player p = state_.to_move_;
  const Coord from = state_.selected_position();
  if (!Rules::can_move_to(b, from, c)) {
    return reject(ActionStatus::InvalidDestination,
                  "Cannot move from " + describe(from) + " to " + describe(c));
  }

  b.set_occupant(from, Player::None);
  b.set_occupant(c, p);
  state_.workers_[player_index(p)][state_.selected_] = c;

  if (b.height_at(c) == MAX_HEIGHT) {
    state_.phase_ = Phase::Won;
    state_.winner_ = p;
    state_.end_reason_ = EndReason::ReachedLevelThree;
    return ActionResult{};
  }

  state_.phase_ = Phase::ChoosingBuildSite;
  return ActionResult{};
}

ActionResult Engine::build_at(const Coord& c) {
  Board& b = state_.board_;
  const Coord builder = state_.selected_position();
  if (!Rules::can_build_at(b, builder, c)) {
    return reject(ActionStatus::InvalidBuild,
                  "Cannot build at " + describe(c) + " from " + describe(builder));
  }

  b.build(c);
  state_.selected_ = -1;
  state_.to_move_ = opponent(state_.to_move_);
  state_.phase_ = Phase::SelectingWorker;
  begin_turn();
  return ActionResult{};
}

ActionResult Engine::resign() {
  const Player p = state_.to_move_;
  state_.phase_ = Phase::Won;
  state_.winner_ = opponent(p);
  state_.end_reason_ = EndReason::Resignation;
  state_.selected_ = -1;
  return ActionResult{};
}

void Engine::begin_turn() {
  // a worker that can step can always build on the cell it left,
  // so checking destinations is enough
  const Player p = state_.to_move_;
  if (!Rules::has_any_destination(state_, p)) {
    state_.phase_ = Phase::NoLegalMove;
    state_.winner_ = opponent(p);
    state_.end_reason_ = EndReason::Blocked;
  }
}

ActionResult Engine::play(const Move& m) {
  const GameState saved = state_;

  ActionResult r = submit(Action::select(m.worker));
  if (r.ok() && state_.selected_position() != m.from) {
    r = reject(ActionStatus::InvalidSelection,
               "Worker " + std::to_string(m.worker) + " is not at " + describe(m.from));
  }
  if (r.ok()) {
    r = submit(Action::move_to(m.to));
  }
  if (r.ok()) {
    if (m.has_build) {
      r = submit(Action::build_at(m.build));
    } else if (!state_.is_over()) {
      r = reject(ActionStatus::InvalidBuild, "Move to " + describe(m.to) + " needs a build site");
    }
  }

  if (!r.ok()) {
    state_ = saved;
  }
  return r;
}

GameState Engine::successor(const GameState& s, const Move& m) {
  Engine engine;
  engine.state_ = s;
  const ActionResult r = engine.play(m);
  if (!r.ok()) {
    throw std::logic_error(std::string("Illegal move in search: ") + to_string(r.status)
                           + " (" + r.reason + ")");
  }
  return engine.state_;
}

Outcome Engine::outcome() const {
  Outcome o;
  if (!state_.is_over()) return o;
  o.over = true;
  o.winner = state_.winner();
  o.loser = opponent(o.winner);
  o.reason = state_.end_reason();
  return o;
}

std::vector<Coord> Engine::highlights() const {
  std::vector<Coord> out;
  const Board& b = state_.board();
  switch (state_.phase()) {
    case Phase::PlacingWorkers:
      for (int y = 0; y < BOARD_H; ++y) {
        for (int x = 0; x < BOARD_W; ++x) {
          if (!b.is_occupied(Coord{x, y})) out.push_back(Coord{x, y});
        }
      }
      break;
    case Phase::SelectingWorker:
      for (const Coord& c : state_.workers(state_.current_player())) {
        if (Rules::legal_destinations(b, c).size > 0) out.push_back(c);
      }
      break;
    case Phase::ChoosingDestination:
      for (const Coord& c : Rules::legal_destinations(b, state_.selected_position())) out.push_back(c);
      break;
    case Phase::ChoosingBuildSite:
      for (const Coord& c : Rules::legal_builds(b, state_.selected_position())) out.push_back(c);
      break;
    case Phase::Won:
    case Phase::NoLegalMove:
      break;
  }
  return out;
}

Snapshot Engine::snapshot() const {
  Snapshot snap;
  snap.board = state_.board();
  snap.workers = state_.workers_;
  snap.placed_workers = state_.placed_workers();
  snap.to_move = state_.current_player();
  snap.phase = state_.phase();
  snap.selected_worker = state_.selected_worker();
  snap.outcome = outcome();
  snap.highlights = highlights();
  return snap;
}

} // namespace santorini
