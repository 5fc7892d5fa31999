#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include "santorini/engine.hpp"
#include "santorini/game_state.hpp"
#include "santorini/move_list.hpp"
#include "santorini/rules.hpp"

using namespace santorini;

static int g_failures = 0;

static void check(bool condition, const std::string& what) {
    if (condition) {
        std::cout << "[PASS] " << what << std::endl;
    } else {
        std::cout << "[FAIL] " << what << std::endl;
        ++g_failures;
    }
}

static Engine opening_engine() {
    return Engine(GameState::from_position(Board(), {{Coord{0, 0}, Coord{1, 0}}},
                                           {{Coord{4, 4}, Coord{3, 4}}}));
}

static void test_placement() {
    Engine engine;
    check(engine.state().phase() == Phase::PlacingWorkers, "a new game starts with placement");
    check(engine.state().current_player() == Player::One, "Player 1 places first");

    check(engine.submit(Action::place(Coord{2, 2})).ok(), "first placement is accepted");
    check(engine.state().current_player() == Player::Two, "placement alternates to Player 2");

    const uint64_t before = engine.state().compute_hash();
    check(engine.submit(Action::place(Coord{2, 2})).status == ActionStatus::InvalidPlacement,
          "placing on an occupied cell is refused");
    check(engine.submit(Action::place(Coord{5, 0})).status == ActionStatus::InvalidPlacement,
          "placing off the board is refused");
    check(engine.submit(Action::select(0)).status == ActionStatus::OutOfPhase,
          "selecting during placement is out of phase");
    check(engine.state().compute_hash() == before && engine.state().placed_workers() == 1,
          "refused placements leave the state unchanged");

    check(engine.submit(Action::place(Coord{0, 0})).ok(), "Player 2 places");
    check(engine.submit(Action::place(Coord{2, 3})).ok(), "Player 1 places its second worker");
    check(engine.state().phase() == Phase::PlacingWorkers, "setup continues until four workers are down");
    check(engine.submit(Action::place(Coord{4, 4})).ok(), "Player 2 places its second worker");

    const GameState& s = engine.state();
    check(s.phase() == Phase::SelectingWorker && s.current_player() == Player::One,
          "after setup Player 1 selects a worker");
    check(s.worker(Player::One, 0) == Coord{2, 2} && s.worker(Player::One, 1) == Coord{2, 3},
          "Player 1 workers are recorded in placement order");
    check(s.worker(Player::Two, 0) == Coord{0, 0} && s.worker(Player::Two, 1) == Coord{4, 4},
          "Player 2 workers are recorded in placement order");
    check(s.board().occupant(Coord{4, 4}) == Player::Two, "board occupancy follows placement");
}

static void test_out_of_phase() {
    Engine engine = opening_engine();
    const uint64_t before = engine.state().compute_hash();
    check(engine.submit(Action::build_at(Coord{1, 1})).status == ActionStatus::OutOfPhase,
          "building while selecting is out of phase");
    check(engine.submit(Action::move_to(Coord{1, 1})).status == ActionStatus::OutOfPhase,
          "moving while selecting is out of phase");
    check(engine.submit(Action::deselect()).status == ActionStatus::OutOfPhase,
          "cancelling with nothing selected is out of phase");
    check(engine.submit(Action::place(Coord{2, 2})).status == ActionStatus::OutOfPhase,
          "placing after setup is out of phase");
    check(engine.state().compute_hash() == before, "out-of-phase actions leave the state unchanged");

    check(engine.submit(Action::select(0)).ok(), "selection is accepted");
    check(engine.submit(Action::select(1)).status == ActionStatus::OutOfPhase,
          "a second selection is out of phase");
}

static void test_selection() {
    // worker 0 of Player 1 is boxed in, worker 1 is free
    const HeightGrid grid = {{
        {{0, 4, 0, 0, 0}},
        {{4, 4, 0, 0, 0}},
        {{0, 0, 0, 0, 0}},
        {{0, 0, 0, 0, 0}},
        {{0, 0, 0, 0, 0}},
    }};
    Engine engine(GameState::from_position(Board::from_heights(grid), {{Coord{0, 0}, Coord{3, 3}}},
                                           {{Coord{4, 4}, Coord{4, 0}}}));
    const uint64_t before = engine.state().compute_hash();

    check(engine.submit(Action::select(0)).status == ActionStatus::InvalidSelection,
          "a worker without destinations cannot be selected");
    check(engine.submit(Action::select(2)).status == ActionStatus::InvalidSelection,
          "a worker index out of range is refused");
    check(engine.submit(Action::select_at(Coord{4, 4})).status == ActionStatus::InvalidSelection,
          "an opposing worker cannot be selected");
    check(engine.submit(Action::select_at(Coord{2, 2})).status == ActionStatus::InvalidSelection,
          "an empty cell cannot be selected");
    check(engine.state().compute_hash() == before, "refused selections leave the state unchanged");

    check(engine.submit(Action::select_at(Coord{3, 3})).ok(), "own free worker can be selected by cell");
    check(engine.state().phase() == Phase::ChoosingDestination && engine.state().selected_worker() == 1,
          "selection moves on to choosing a destination");

    check(engine.submit(Action::deselect()).ok(), "selection can be cancelled");
    check(engine.state().phase() == Phase::SelectingWorker && engine.state().selected_worker() == -1,
          "cancel returns to worker selection");
    check(engine.state().compute_hash() == before, "select then cancel is a no-op");
}

static void test_move_and_build() {
    const HeightGrid grid = {{
        {{0, 0, 0, 0, 0}},
        {{0, 2, 0, 0, 0}},
        {{4, 0, 3, 0, 0}},
        {{0, 0, 0, 0, 0}},
        {{0, 0, 0, 0, 0}},
    }};
    Engine engine(GameState::from_position(Board::from_heights(grid), {{Coord{0, 1}, Coord{4, 0}}},
                                           {{Coord{4, 4}, Coord{1, 0}}}));
    check(engine.submit(Action::select(0)).ok(), "select the worker on the left edge");

    const uint64_t before = engine.state().compute_hash();
    check(engine.submit(Action::move_to(Coord{2, 1})).status == ActionStatus::InvalidDestination,
          "non-adjacent destination is refused");
    check(engine.submit(Action::move_to(Coord{1, 1})).status == ActionStatus::InvalidDestination,
          "two levels up is refused");
    check(engine.submit(Action::move_to(Coord{0, 2})).status == ActionStatus::InvalidDestination,
          "dome destination is refused");
    check(engine.submit(Action::move_to(Coord{1, 0})).status == ActionStatus::InvalidDestination,
          "occupied destination is refused");
    check(engine.submit(Action::move_to(Coord{-1, 1})).status == ActionStatus::InvalidDestination,
          "off-board destination is refused");
    check(engine.state().compute_hash() == before, "refused moves leave the state unchanged");

    check(engine.submit(Action::move_to(Coord{1, 2})).ok(), "legal step is accepted");
    const GameState& mid = engine.state();
    check(mid.phase() == Phase::ChoosingBuildSite, "after a step the worker builds");
    check(mid.worker(Player::One, 0) == Coord{1, 2}, "worker position follows the step");
    check(!mid.board().is_occupied(Coord{0, 1}) && mid.board().occupant(Coord{1, 2}) == Player::One,
          "occupancy follows the step");

    const uint64_t mid_hash = engine.state().compute_hash();
    check(engine.submit(Action::build_at(Coord{0, 2})).status == ActionStatus::InvalidBuild,
          "building on a dome is refused");
    check(engine.submit(Action::build_at(Coord{3, 3})).status == ActionStatus::InvalidBuild,
          "building away from the worker is refused");
    check(engine.submit(Action::build_at(Coord{1, 2})).status == ActionStatus::InvalidBuild,
          "building under the worker is refused");
    check(engine.state().compute_hash() == mid_hash, "refused builds leave the state unchanged");

    check(engine.submit(Action::build_at(Coord{2, 2})).ok(), "building on level 3 is accepted");
    const GameState& after = engine.state();
    check(after.board().is_capped(Coord{2, 2}) && after.board().height_at(Coord{2, 2}) == 3,
          "building on level 3 places a dome");
    check(after.current_player() == Player::Two && after.phase() == Phase::SelectingWorker,
          "the turn passes to Player 2");

    check(engine.submit(Action::select(0)).ok() && engine.submit(Action::move_to(Coord{3, 3})).ok()
          && engine.submit(Action::build_at(Coord{3, 2})).ok(), "Player 2 plays a full turn");
    check(engine.state().board().height_at(Coord{3, 2}) == 1, "building on the ground raises level 1");
    check(engine.state().current_player() == Player::One, "the turn returns to Player 1");
}

static void test_win_on_level_three() {
    const HeightGrid grid = {{
        {{0, 0, 0, 0, 0}},
        {{0, 2, 0, 0, 0}},
        {{0, 0, 3, 0, 0}},
        {{0, 0, 0, 0, 0}},
        {{0, 0, 0, 0, 0}},
    }};
    Engine engine(GameState::from_position(Board::from_heights(grid), {{Coord{1, 1}, Coord{4, 0}}},
                                           {{Coord{4, 4}, Coord{0, 4}}}));
    check(engine.submit(Action::select(0)).ok() && engine.submit(Action::move_to(Coord{2, 2})).ok(),
          "step onto level 3 is accepted");

    const Outcome o = engine.outcome();
    check(engine.state().phase() == Phase::Won && o.over, "reaching level 3 ends the game at once");
    check(o.winner == Player::One && o.loser == Player::Two && o.reason == EndReason::ReachedLevelThree,
          "the climber wins");

    const uint64_t before = engine.state().compute_hash();
    check(engine.submit(Action::build_at(Coord{2, 1})).status == ActionStatus::GameAlreadyOver,
          "no build follows a winning step");
    check(engine.submit(Action::resign()).status == ActionStatus::GameAlreadyOver,
          "nothing is accepted after the game ends");
    check(engine.state().compute_hash() == before, "actions after the end leave the state unchanged");
}

static void test_no_legal_move() {
    // both Player 1 workers boxed in from the start
    const HeightGrid boxed = {{
        {{0, 4, 0, 4, 0}},
        {{2, 4, 0, 4, 4}},
        {{0, 0, 0, 0, 0}},
        {{0, 0, 0, 0, 0}},
        {{0, 0, 0, 0, 0}},
    }};
    Engine engine(GameState::from_position(Board::from_heights(boxed), {{Coord{0, 0}, Coord{4, 0}}},
                                           {{Coord{2, 4}, Coord{3, 4}}}));
    const Outcome o = engine.outcome();
    check(engine.state().phase() == Phase::NoLegalMove, "a boxed-in player to move is in NoLegalMove");
    check(o.over && o.winner == Player::Two && o.loser == Player::One && o.reason == EndReason::Blocked,
          "the opponent of a boxed-in player wins");
    check(engine.submit(Action::select(0)).status == ActionStatus::GameAlreadyOver,
          "a blocked game accepts no further actions");

    // Player 2 raises the last open neighbour out of reach
    const HeightGrid almost = {{
        {{0, 4, 0, 4, 0}},
        {{4, 1, 0, 4, 4}},
        {{0, 0, 0, 0, 0}},
        {{0, 0, 0, 0, 0}},
        {{0, 0, 0, 0, 0}},
    }};
    Engine closing(GameState::from_position(Board::from_heights(almost), {{Coord{0, 0}, Coord{4, 0}}},
                                            {{Coord{2, 2}, Coord{4, 4}}}, Player::Two));
    check(!closing.is_over(), "Player 2 still has a turn to play");
    check(closing.submit(Action::select(0)).ok() && closing.submit(Action::move_to(Coord{2, 1})).ok()
          && closing.submit(Action::build_at(Coord{1, 1})).ok(), "Player 2 builds next to Player 1");
    check(closing.state().phase() == Phase::NoLegalMove && closing.outcome().winner == Player::Two,
          "Player 1 loses at the start of a turn with no legal step");
}

static void test_resign() {
    Engine engine = opening_engine();
    check(engine.submit(Action::select(1)).ok(), "select before resigning");
    check(engine.submit(Action::resign()).ok(), "resigning mid-turn is accepted");
    const Outcome o = engine.outcome();
    check(o.over && o.winner == Player::Two && o.reason == EndReason::Resignation,
          "resignation hands the game to the opponent");
}

static void test_play_is_atomic() {
    Engine engine = opening_engine();
    const uint64_t before = engine.state().compute_hash();

    Move wrong_origin;
    wrong_origin.worker = 0;
    wrong_origin.from = Coord{1, 0};
    wrong_origin.to = Coord{1, 1};
    wrong_origin.has_build = true;
    wrong_origin.build = Coord{2, 2};
    check(engine.play(wrong_origin).status == ActionStatus::InvalidSelection,
          "a move naming the wrong origin is refused");
    check(engine.state().compute_hash() == before, "refused move rolls back the selection");

    Move bad_build = wrong_origin;
    bad_build.from = Coord{0, 0};
    bad_build.build = Coord{3, 3};
    check(engine.play(bad_build).status == ActionStatus::InvalidBuild, "a move with an illegal build is refused");
    check(engine.state().compute_hash() == before && engine.state().worker(Player::One, 0) == Coord{0, 0},
          "refused build rolls back the step");

    Move no_build = bad_build;
    no_build.has_build = false;
    check(engine.play(no_build).status == ActionStatus::InvalidBuild,
          "a non-winning move without a build is refused");
    check(engine.state().compute_hash() == before, "incomplete move rolls back");

    bool threw = false;
    try {
        Engine::successor(engine.state(), bad_build);
    } catch (const std::logic_error&) {
        threw = true;
    }
    check(threw, "successor of an illegal move throws");

    Move good = bad_build;
    good.build = Coord{0, 0};
    const GameState next = Engine::successor(engine.state(), good);
    check(next.board().height_at(Coord{0, 0}) == 1 && next.current_player() == Player::Two,
          "successor applies a full turn to a copy");
    check(engine.state().compute_hash() == before, "successor leaves the original untouched");
}

static void test_highlights_and_snapshot() {
    Engine engine = opening_engine();
    check(engine.highlights().size() == 2, "both free workers are highlighted for selection");
    check(engine.submit(Action::select(0)).ok(), "select corner worker");
    check(engine.highlights().size() == 2, "the corner worker has two destinations highlighted");

    const Snapshot snap = engine.snapshot();
    check(snap.phase == Phase::ChoosingDestination && snap.to_move == Player::One
          && snap.selected_worker == 0, "snapshot carries phase, player and selection");
    check(snap.workers[1][0] == Coord{4, 4} && snap.placed_workers == 4, "snapshot carries worker positions");
    check(!snap.outcome.over && snap.highlights.size() == 2, "snapshot carries outcome and highlights");

    Engine setup;
    check(setup.highlights().size() == 25, "every cell is open for the first placement");
}

static void test_invalid_positions() {
    bool threw = false;
    try {
        GameState::from_position(Board(), {{Coord{0, 0}, Coord{0, 0}}}, {{Coord{4, 4}, Coord{3, 4}}});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    check(threw, "overlapping workers are rejected");

    threw = false;
    try {
        GameState::from_position(Board(), {{Coord{0, 0}, Coord{0, 5}}}, {{Coord{4, 4}, Coord{3, 4}}});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    check(threw, "off-board workers are rejected");
}

static void test_same_position() {
    Engine engine = opening_engine();
    const GameState start = engine.state();
    check(start.same_position(engine.state()), "a copy is the same position");

    check(engine.submit(Action::select(0)).ok(), "select for comparison");
    check(!start.same_position(engine.state()), "a selection changes the position");
    check(engine.submit(Action::deselect()).ok(), "cancel for comparison");
    check(start.same_position(engine.state()), "cancelling restores the position");

    Move m;
    m.worker = 0;
    m.from = Coord{0, 0};
    m.to = Coord{1, 1};
    m.has_build = true;
    m.build = Coord{2, 2};
    Move other = m;
    other.build = Coord{2, 1};
    const GameState a = Engine::successor(start, m);
    const GameState b = Engine::successor(start, other);
    check(!a.same_position(b), "different build sites are different positions");
    check(a.same_position(Engine::successor(start, m)), "the same turn gives the same position");
}

// Random legal games: every generated turn is accepted and the board invariants hold
static void test_random_games_keep_invariants() {
    std::mt19937 rng(12345);
    bool accepted = true;
    bool heights_ok = true;
    bool workers_ok = true;
    bool monotone = true;
    int finished = 0;

    for (int game = 0; game < 30; ++game) {
        Engine engine(GameState::from_position(Board(), {{Coord{1, 1}, Coord{3, 1}}},
                                               {{Coord{1, 3}, Coord{3, 3}}}));
        for (int turn = 0; turn < 200 && !engine.is_over(); ++turn) {
            MoveList moves;
            Rules::legal_moves(engine.state(), moves);
            if (moves.empty()) {
                accepted = false;
                break;
            }
            std::uniform_int_distribution<size_t> dist(0, moves.size - 1);
            const Board before = engine.state().board();
            if (!engine.play(moves[dist(rng)]).ok()) {
                accepted = false;
                break;
            }

            const GameState& s = engine.state();
            const Board& b = s.board();
            for (int y = 0; y < BOARD_H; ++y) {
                for (int x = 0; x < BOARD_W; ++x) {
                    const Cell& cell = b.at(x, y);
                    heights_ok = heights_ok && cell.height >= 0 && cell.height <= MAX_HEIGHT
                              && (!cell.capped || cell.height == MAX_HEIGHT);
                    monotone = monotone && cell.height >= before.at(x, y).height
                            && (!before.at(x, y).capped || cell.capped);
                }
            }
            const Coord all[4] = {s.worker(Player::One, 0), s.worker(Player::One, 1),
                                  s.worker(Player::Two, 0), s.worker(Player::Two, 1)};
            for (int i = 0; i < 4; ++i) {
                const Player owner = (i < 2) ? Player::One : Player::Two;
                workers_ok = workers_ok && b.occupant(all[i]) == owner && !b.is_capped(all[i]);
                for (int j = i + 1; j < 4; ++j) {
                    workers_ok = workers_ok && all[i] != all[j];
                }
            }
        }
        if (engine.is_over()) ++finished;
    }

    check(accepted, "every generated turn is accepted by the engine");
    check(heights_ok, "heights stay in 0..3 and domes sit on level 3");
    check(monotone, "towers never shrink and domes never vanish");
    check(workers_ok, "workers never share a cell and match board occupancy");
    check(finished > 0, "random games reach an end");
}

int main() {
    std::cout << "=== Rules Engine Test ===" << std::endl;
    test_placement();
    test_out_of_phase();
    test_selection();
    test_move_and_build();
    test_win_on_level_three();
    test_no_legal_move();
    test_resign();
    test_play_is_atomic();
    test_highlights_and_snapshot();
    test_invalid_positions();
    test_same_position();
    test_random_games_keep_invariants();

    if (g_failures > 0) {
        std::cout << "\n" << g_failures << " check(s) failed" << std::endl;
        return 1;
    }
    std::cout << "\n=== All tests passed ===" << std::endl;
    return 0;
}
