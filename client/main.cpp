// main.cpp - terminal front end: renders the engine snapshot and forwards typed commands

#include <array>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "notation.hpp"
#include "santorini/engine.hpp"
#include "santorini/game_state.hpp"
#include "santorini/move_list.hpp"
#include "santorini/rules.hpp"
#include "santorini/types.hpp"

#include "config.hpp"
#include "heuristic_ai.hpp"
#include "mcts.hpp"

namespace {

const char* phase_prompt(santorini::Phase phase) {
    switch (phase) {
        case santorini::Phase::PlacingWorkers:      return "place a worker (place <cell>)";
        case santorini::Phase::SelectingWorker:     return "select a worker (select <cell>)";
        case santorini::Phase::ChoosingDestination: return "move the worker (move <cell>, or cancel)";
        case santorini::Phase::ChoosingBuildSite:   return "build next to it (build <cell>)";
        default:                                    return "";
    }
}

void print_help() {
    std::cout << "Commands:\n"
              << "  place <cell>   put a worker down during setup\n"
              << "  select <cell>  pick one of your workers\n"
              << "  cancel         pick another worker instead\n"
              << "  move <cell>    step to an adjacent cell\n"
              << "  build <cell>   build next to the worker that moved\n"
              << "  moves          list every legal turn\n"
              << "  resign         give up the game\n"
              << "  :quit          leave\n"
              << "Cells are a1..e5; levels show 0-3, '^' is a dome, a/b are workers,\n"
              << "capitals mark the selected worker and '*' marks cells you may pick.\n";
}

// ================================================================
// Policy adapters
// ================================================================

class PolicyAdapter {
public:
    virtual ~PolicyAdapter() = default;
    virtual std::string name() const = 0;
    virtual santorini::Coord place(const santorini::GameState& state) = 0;
    virtual std::optional<santorini::Move> pick(const santorini::GameState& state) = 0;
};

class HeuristicAdapter final : public PolicyAdapter {
public:
    HeuristicAdapter(int depth, uint32_t seed) : ai_(depth, seed) {
        ai_.set_verbose(santorini_ai::config::debug_enabled());
    }
    std::string name() const override { return "heuristic(depth=" + std::to_string(ai_.depth()) + ")"; }
    santorini::Coord place(const santorini::GameState& state) override { return ai_.choose_placement(state); }
    std::optional<santorini::Move> pick(const santorini::GameState& state) override {
        return ai_.choose_move(state);
    }
private:
    santorini_ai::HeuristicAI ai_;
};

class MCTSAdapter final : public PolicyAdapter {
public:
    MCTSAdapter(int iterations, santorini_ai::TreePolicy policy, uint32_t seed) : mcts_(seed) {
        mcts_.set_iterations(iterations);
        mcts_.set_tree_policy(policy);
        mcts_.set_verbose(santorini_ai::config::debug_enabled());
    }
    std::string name() const override {
        return std::string("mcts(") + santorini_ai::to_string(mcts_.tree_policy()) + ", "
               + std::to_string(mcts_.iterations()) + ")";
    }
    santorini::Coord place(const santorini::GameState& state) override { return mcts_.choose_placement(state); }
    std::optional<santorini::Move> pick(const santorini::GameState& state) override {
        return mcts_.choose_move(state);
    }
private:
    santorini_ai::MCTS mcts_;
};

// Seat spec: human | ai[:depth] | mcts[:iterations] | puct[:iterations].
// Returns nullptr for a human seat.
std::unique_ptr<PolicyAdapter> make_seat(const std::string& text, int default_depth, uint32_t seed) {
    const std::string normalized = notation::to_lower(text);
    if (normalized == "human" || normalized == "manual") {
        return nullptr;
    }

    const auto pos = normalized.find(':');
    const std::string kind = normalized.substr(0, pos);
    const char* arg = (pos == std::string::npos) ? nullptr : normalized.c_str() + pos + 1;

    if (kind == "ai" || kind == "heuristic") {
        const int depth = santorini_ai::config::parse_depth(arg, default_depth);
        return std::make_unique<HeuristicAdapter>(depth, seed);
    }
    if (kind == "mcts" || kind == "puct") {
        const int iterations = santorini_ai::config::parse_iterations(arg, santorini_ai::config::resolve_mcts_iterations());
        const auto policy = (kind == "puct") ? santorini_ai::TreePolicy::PUCT : santorini_ai::TreePolicy::UCB1;
        return std::make_unique<MCTSAdapter>(iterations, policy, seed);
    }
    throw std::invalid_argument("Unsupported seat type: " + text);
}

// ================================================================
// TerminalGame
// ================================================================

class TerminalGame {
public:
    TerminalGame(std::unique_ptr<PolicyAdapter> p1, std::unique_ptr<PolicyAdapter> p2) {
        seats_[0] = std::move(p1);
        seats_[1] = std::move(p2);
        for (int i = 0; i < 2; ++i) {
            if (seats_[i]) {
                std::cout << "[AUTO] Player " << (i + 1) << " is " << seats_[i]->name() << "\n";
            }
        }
    }

    int run() {
        std::cout << "Santorini - Player 1 (a) vs Player 2 (b). Type 'help' for commands.\n";
        while (!engine_.is_over()) {
            print_state();
            const santorini::Player p = engine_.state().current_player();
            const int seat = santorini::player_index(p);
            if (seats_[seat]) {
                if (!auto_turn(*seats_[seat])) return 1;
                continue;
            }
            if (!human_turn()) {
                std::cout << "Bye\n";
                return 0;
            }
        }
        print_state();
        print_outcome();
        return 0;
    }

private:
    void print_state() const {
        const santorini::Snapshot snap = engine_.snapshot();
        std::cout << "\n" << notation::render_board(snap) << "\n";
        if (!snap.outcome.over) {
            std::cout << santorini::player_name(snap.to_move) << ": " << phase_prompt(snap.phase) << "\n";
        }
    }

    void print_outcome() const {
        const santorini::Outcome o = engine_.outcome();
        std::cout << "*** " << santorini::player_name(o.winner) << " WINS! ***";
        switch (o.reason) {
            case santorini::EndReason::ReachedLevelThree:
                std::cout << " (reached the third level)";
                break;
            case santorini::EndReason::Blocked:
                std::cout << " (" << santorini::player_name(o.loser) << " has no legal move)";
                break;
            case santorini::EndReason::Resignation:
                std::cout << " (" << santorini::player_name(o.loser) << " resigned)";
                break;
            case santorini::EndReason::None:
                break;
        }
        std::cout << "\n";
    }

    // false when the policy produced something the engine refused
    bool auto_turn(PolicyAdapter& policy) {
        const santorini::GameState& state = engine_.state();
        const santorini::Player p = state.current_player();

        if (state.phase() == santorini::Phase::PlacingWorkers) {
            const santorini::Coord c = policy.place(state);
            std::cout << "[AI] " << santorini::player_name(p) << " places at " << notation::format_coord(c) << "\n";
            return report(engine_.submit(santorini::Action::place(c)));
        }

        // blocked turns end the game inside the engine, so a move always exists here
        const std::optional<santorini::Move> move = policy.pick(state);
        if (!move) {
            std::cout << "[ERROR] " << policy.name() << " found no move for " << santorini::player_name(p) << "\n";
            return false;
        }
        std::cout << "[AI] " << santorini::player_name(p) << " plays " << notation::format_move(*move) << "\n";
        return report(engine_.play(*move));
    }

    // false when the user quits
    bool human_turn() {
        std::string line;
        std::cout << "move> " << std::flush;
        if (!std::getline(std::cin, line)) return false;
        line = notation::trim(line);
        if (line.empty()) return true;

        if (line == ":quit" || line == ":q") return false;
        if (line == "help") {
            print_help();
            return true;
        }
        if (line == "moves") {
            list_moves();
            return true;
        }

        try {
            report(engine_.submit(notation::parse_action(line)));
        } catch (const notation::NotationError& ex) {
            std::cout << "[LOCAL] Invalid command: " << ex.what() << "\n";
        }
        return true;
    }

    void list_moves() const {
        santorini::MoveList moves;
        santorini::Rules::legal_moves(engine_.state(), moves);
        std::cout << moves.size << " legal turns:";
        for (const auto& m : moves) {
            std::cout << "  " << notation::format_move(m);
        }
        std::cout << "\n";
    }

    bool report(const santorini::ActionResult& r) const {
        if (!r.ok()) {
            std::cout << "[ERROR] " << santorini::to_string(r.status) << ": " << r.reason << "\n";
        }
        return r.ok();
    }

    santorini::Engine engine_;
    std::array<std::unique_ptr<PolicyAdapter>, 2> seats_;
};

} // namespace

int main(int argc, char** argv) {
    try {
        int depth = santorini_ai::config::resolve_search_depth();
        uint32_t seed = santorini_ai::config::kDefaultSeed;
        std::string p1 = "human";
        std::string p2 = "ai";

        for (int i = 1; i < argc; ++i) {
            const std::string_view arg = argv[i];
            if (arg.rfind("--p1=", 0) == 0) {
                p1 = std::string(arg.substr(5));
            } else if (arg.rfind("--p2=", 0) == 0) {
                p2 = std::string(arg.substr(5));
            } else if (arg.rfind("--depth=", 0) == 0) {
                depth = santorini_ai::config::parse_depth(std::string(arg.substr(8)).c_str(), depth);
            } else if (arg.rfind("--seed=", 0) == 0) {
                seed = static_cast<uint32_t>(std::stoul(std::string(arg.substr(7))));
            } else if (arg == "--help" || arg == "-h") {
                std::cout << "Usage: santorini [--p1=SEAT] [--p2=SEAT] [--depth=N] [--seed=N]\n"
                             "  SEAT: human | ai[:depth] | mcts[:iterations] | puct[:iterations]\n";
                return 0;
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
            }
        }

        TerminalGame game(make_seat(p1, depth, seed), make_seat(p2, depth, seed + 1));
        return game.run();
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << "\n";
        return 1;
    }
}
