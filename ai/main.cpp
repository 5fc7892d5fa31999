#include "santorini/engine.hpp"
#include "santorini/game_state.hpp"
#include "santorini/rules.hpp"
#include "config.hpp"
#include "heuristic_ai.hpp"
#include "mcts.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using namespace santorini;
using namespace santorini_ai;

void print_board(const GameState& state) {
    std::cout << "\nBoard (y=0 at top, y=4 at bottom; level, then worker 1/2):\n";
    for (int y = 0; y < BOARD_H; ++y) {
        std::cout << "y=" << y << ": ";
        for (int x = 0; x < BOARD_W; ++x) {
            const Cell& cell = state.board().at(x, y);
            std::cout << (cell.capped ? '^' : static_cast<char>('0' + cell.height));
            if (cell.occupant == Player::One) std::cout << "1 ";
            else if (cell.occupant == Player::Two) std::cout << "2 ";
            else std::cout << ". ";
        }
        std::cout << "\n";
    }
    std::cout << "Current player: " << player_name(state.current_player()) << "\n";
}

void print_move(const Move& m) {
    std::cout << "  Move: worker " << m.worker << " (" << m.from.x << "," << m.from.y << ") -> ("
              << m.to.x << "," << m.to.y << ")";
    if (m.has_build) {
        std::cout << " + build at (" << m.build.x << "," << m.build.y << ")";
    } else {
        std::cout << " [wins]";
    }
    std::cout << "\n";
}

struct PolicyBinding {
    std::string name;
    std::function<Coord(const GameState&)> place;
    std::function<std::optional<Move>(const GameState&)> pick;
};

Player play_game(const PolicyBinding& p1_policy, const PolicyBinding& p2_policy,
                 int& turns, bool verbose = false, int max_turns_to_log = 0) {
    Engine engine;
    turns = 0;

    if (verbose) {
        std::cout << "\n========== Game Start =========="
                  << "\nPlayer 1 policy: " << p1_policy.name
                  << "\nPlayer 2 policy: " << p2_policy.name << "\n";
    }

    while (engine.state().phase() == Phase::PlacingWorkers) {
        const GameState& state = engine.state();
        const PolicyBinding& policy = (state.current_player() == Player::One) ? p1_policy : p2_policy;
        const ActionResult r = engine.submit(Action::place(policy.place(state)));
        if (!r.ok()) {
            throw std::runtime_error(policy.name + " placed illegally: " + r.reason);
        }
    }

    if (verbose) {
        print_board(engine.state());
    }

    while (!engine.is_over() && turns < config::kMaxTurns) {
        const GameState& state = engine.state();
        const Player mover = state.current_player();
        const PolicyBinding& policy = (mover == Player::One) ? p1_policy : p2_policy;

        const std::optional<Move> move = policy.pick(state);
        if (!move) {
            throw std::runtime_error(policy.name + " found no move in a running game");
        }

        if (verbose && turns < max_turns_to_log) {
            std::cout << "\nTurn " << (turns + 1) << " - " << player_name(mover) << ":\n";
            print_move(*move);
        }

        const ActionResult r = engine.play(*move);
        if (!r.ok()) {
            throw std::runtime_error(policy.name + " chose a rejected move: " + to_string(r.status));
        }
        ++turns;

        if (verbose && turns < max_turns_to_log) {
            print_board(engine.state());
        }
    }

    const Outcome o = engine.outcome();
    if (verbose) {
        if (o.over) {
            std::cout << "\n*** " << player_name(o.winner) << " WINS! (" << to_string(o.reason) << ") ***\n";
        } else {
            std::cout << "\n*** DRAW (max turns reached) ***\n";
        }
    }
    return o.over ? o.winner : Player::None;
}

void run_match_series(const PolicyBinding& p1_policy, const PolicyBinding& p2_policy, int num_games) {
    int p1_wins = 0;
    int p2_wins = 0;
    int draws = 0;
    int total_turns = 0;

    std::cout << "\n======================================\n";
    std::cout << "Testing " << p1_policy.name << " (Player 1) vs " << p2_policy.name << " (Player 2)\n";
    std::cout << "Number of games: " << num_games << "\n";
    std::cout << "======================================\n";

    for (int i = 0; i < num_games; ++i) {
        int turns = 0;
        const bool log_game = (i == 0);
        const Player winner = play_game(p1_policy, p2_policy, turns, log_game, 20);
        if (winner == Player::One) {
            ++p1_wins;
        } else if (winner == Player::Two) {
            ++p2_wins;
        } else {
            ++draws;
        }
        total_turns += turns;
        if (config::debug_enabled()) {
            std::cerr << "[Match] game " << (i + 1) << " winner=" << player_name(winner)
                      << " turns=" << turns << std::endl;
        }
    }

    std::cout << "\n======================================\n";
    std::cout << "Results after " << num_games << " games:\n";
    std::cout << "  Player 1 wins: " << p1_wins << " (" << (100.0 * p1_wins / num_games) << "%)\n";
    std::cout << "  Player 2 wins: " << p2_wins << " (" << (100.0 * p2_wins / num_games) << "%)\n";
    std::cout << "  Draws: " << draws << " (" << (100.0 * draws / num_games) << "%)\n";
    std::cout << "  Average turns: " << static_cast<double>(total_turns) / num_games << "\n";
    std::cout << "======================================\n";
}

bool is_number_string(std::string_view text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char ch) { return std::isdigit(ch); });
}

PolicyBinding make_heuristic(int depth, uint32_t seed) {
    auto ai = std::make_shared<HeuristicAI>(depth, seed);
    ai->set_verbose(config::debug_enabled());
    return {"Heuristic(depth=" + std::to_string(depth) + ")",
            [ai](const GameState& state) { return ai->choose_placement(state); },
            [ai](const GameState& state) { return ai->choose_move(state); }};
}

PolicyBinding make_mcts(int iterations, TreePolicy policy, uint32_t seed) {
    auto mcts = std::make_shared<MCTS>(seed);
    mcts->set_iterations(iterations);
    mcts->set_tree_policy(policy);
    mcts->set_verbose(config::debug_enabled());
    return {std::string("MCTS ") + to_string(policy) + "(" + std::to_string(iterations) + ")",
            [mcts](const GameState& state) { return mcts->choose_placement(state); },
            [mcts](const GameState& state) { return mcts->choose_move(state); }};
}

// ai[:depth] | mcts[:iterations] | puct[:iterations]
PolicyBinding make_policy(const std::string& spec, int default_depth, uint32_t seed) {
    const auto pos = spec.find(':');
    const std::string kind = spec.substr(0, pos);
    const char* arg = (pos == std::string::npos) ? nullptr : spec.c_str() + pos + 1;
    if (kind == "ai" || kind == "heuristic") {
        return make_heuristic(config::parse_depth(arg, default_depth), seed);
    }
    if (kind == "mcts" || kind == "puct") {
        const int iterations = config::parse_iterations(arg, config::resolve_mcts_iterations());
        return make_mcts(iterations, kind == "puct" ? TreePolicy::PUCT : TreePolicy::UCB1, seed);
    }
    throw std::invalid_argument("Unsupported policy: " + spec);
}

// ================================================================
// Elo tournament
// ================================================================

struct Contestant {
    std::string name;
    double rating;
    double diff;
    std::function<PolicyBinding(uint32_t)> create;
};

// Expected score of a player rated `own` against one rated `other`
double expected_score(double own, double other) {
    return 1.0 / (1.0 + std::pow(10.0, (other - own) / 400.0));
}

// Every pair meets `games_per_pair` times per round; ratings move after each
// round and the K factor shrinks until it drops below kMinKFactor
void run_elo_tournament(std::vector<Contestant>& players, int games_per_pair, uint32_t seed) {
    std::cout << "Calculating Elo ratings...\n";
    double k = config::kInitialKFactor;
    int round = 0;
    uint32_t game_seed = seed;

    while (k >= config::kMinKFactor) {
        ++round;
        for (size_t i1 = 0; i1 < players.size(); ++i1) {
            for (size_t i2 = i1 + 1; i2 < players.size(); ++i2) {
                for (int g = 0; g < games_per_pair; ++g) {
                    const PolicyBinding p1 = players[i1].create(game_seed++);
                    const PolicyBinding p2 = players[i2].create(game_seed++);
                    int turns = 0;
                    const Player winner = play_game(p1, p2, turns);
                    const double result = (winner == Player::One) ? 1.0 : (winner == Player::Two) ? 0.0 : 0.5;

                    const double diff = k * (result - expected_score(players[i1].rating, players[i2].rating));
                    players[i1].diff += diff;
                    players[i2].diff -= diff;
                    if (config::debug_enabled()) {
                        std::cerr << "[Elo] round " << round << ": " << players[i1].name << " vs "
                                  << players[i2].name << " -> " << result << " in " << turns << " turns" << std::endl;
                    }
                }
            }
        }

        for (auto& player : players) {
            player.rating += player.diff;
            player.diff = 0.0;
        }

        std::cout << "\nRound " << round << " (K=" << k << ")\n";
        std::cout << "  Ratings:\n";
        for (const auto& player : players) {
            std::cout << "    " << player.name << ": " << player.rating << "\n";
        }
        k *= config::kKFactorDecay;
    }
}

int main(int argc, char** argv) {
    try {
        int num_games = 0; // unset: mode default
        int p1_depth = config::resolve_search_depth();
        int p2_depth = p1_depth;
        std::string p1_spec;
        std::string p2_spec;
        bool elo = false;
        uint32_t seed = config::kDefaultSeed;

        int arg_index = 1;
        if (arg_index < argc && is_number_string(argv[arg_index])) {
            num_games = std::max(1, std::atoi(argv[arg_index]));
            ++arg_index;
        }

        for (; arg_index < argc; ++arg_index) {
            std::string_view arg = argv[arg_index];
            if (arg.rfind("--p1-depth=", 0) == 0) {
                p1_depth = config::parse_depth(std::string(arg.substr(11)).c_str(), p1_depth);
            } else if (arg.rfind("--p2-depth=", 0) == 0) {
                p2_depth = config::parse_depth(std::string(arg.substr(11)).c_str(), p2_depth);
            } else if (arg.rfind("--p1=", 0) == 0) {
                p1_spec = std::string(arg.substr(5));
            } else if (arg.rfind("--p2=", 0) == 0) {
                p2_spec = std::string(arg.substr(5));
            } else if (arg.rfind("--games=", 0) == 0) {
                num_games = std::max(1, std::atoi(std::string(arg.substr(8)).c_str()));
            } else if (arg.rfind("--seed=", 0) == 0) {
                seed = static_cast<uint32_t>(std::stoul(std::string(arg.substr(7))));
            } else if (arg == "--elo") {
                elo = true;
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
            }
        }

        if (elo) {
            const int depth = config::resolve_search_depth();
            const int iterations = config::resolve_mcts_iterations();
            std::vector<Contestant> players = {
                {"Heuristic", config::kInitialRating, 0.0,
                 [depth](uint32_t s) { return make_heuristic(depth, s); }},
                {"MCTS UCT", config::kInitialRating, 0.0,
                 [iterations](uint32_t s) { return make_mcts(iterations, TreePolicy::UCB1, s); }},
                {"MCTS PUCT", config::kInitialRating, 0.0,
                 [iterations](uint32_t s) { return make_mcts(iterations, TreePolicy::PUCT, s); }},
            };
            // --games counts games per pair and round here
            run_elo_tournament(players, num_games > 0 ? num_games : config::kEloGamesPerPair, seed);
            return 0;
        }

        const PolicyBinding p1 = p1_spec.empty() ? make_heuristic(p1_depth, seed)
                                                 : make_policy(p1_spec, p1_depth, seed);
        const PolicyBinding p2 = p2_spec.empty() ? make_heuristic(p2_depth, seed + 1)
                                                 : make_policy(p2_spec, p2_depth, seed + 1);
        run_match_series(p1, p2, num_games > 0 ? num_games : config::kSeriesGames);
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << "\n";
        return 1;
    }
}
