#include "mcts.hpp"
#include "config.hpp"
#include "santorini/engine.hpp"
#include "santorini/rules.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

using namespace santorini_ai;
using namespace santorini;

namespace santorini_ai {

const char* to_string(TreePolicy policy) {
  switch (policy) {
    case TreePolicy::UCB1: return "UCB1";
    case TreePolicy::PUCT: return "PUCT";
  }
  return "Unknown";
}

} // namespace santorini_ai

MCTSNode::MCTSNode(const GameState& s, const Move& m, Player who, MCTSNode* p)
  : state(s), move(m), mover(who), parent(p), visits(0), total_value(0.0),
    is_terminal(s.is_over()) {
  if (!is_terminal) {
    Rules::legal_moves(state, untried);
  }
}

MCTS::MCTS()
  : iterations_(config::kDefaultMctsIterations), tree_policy_(TreePolicy::UCB1),
    exploration_constant_(config::kExplorationConstant), verbose_(false),
    rng_(static_cast<uint32_t>(std::chrono::steady_clock::now().time_since_epoch().count())) {
  stats_.reset();
}

MCTS::MCTS(uint32_t seed)
  : iterations_(config::kDefaultMctsIterations), tree_policy_(TreePolicy::UCB1),
    exploration_constant_(config::kExplorationConstant), verbose_(false),
    rng_(seed), placement_(seed) {
  stats_.reset();
}

Coord MCTS::choose_placement(const GameState& s) {
  return placement_.pick(s);
}

double MCTS::exploration_bonus(const MCTSNode& parent, const MCTSNode& child) const {
  const double n = static_cast<double>(child.visits);
  const double total = static_cast<double>(parent.visits);
  if (tree_policy_ == TreePolicy::PUCT) {
    return exploration_constant_ * std::sqrt(total) / n;
  }
  return exploration_constant_ * std::sqrt(std::log(total) / n);
}

MCTSNode* MCTS::select(MCTSNode* node) const {
  while (!node->is_terminal && node->fully_expanded() && !node->children.empty()) {
    MCTSNode* best_child = nullptr;
    double best_weight = -std::numeric_limits<double>::infinity();

    for (auto& child : node->children) {
      // average rescaled from [-1, 1] to [0, 1]
      const double exploitation = (1.0 + child->average_value()) / 2.0;
      const double weight = exploitation + exploration_bonus(*node, *child);
      if (weight > best_weight) {
        best_weight = weight;
        best_child = child.get();
      }
    }

    node = best_child;
  }
  return node;
}

MCTSNode* MCTS::expand(MCTSNode* node) {
  if (node->is_terminal || node->fully_expanded()) {
    return node;
  }

  // take a random untried turn and swap the last one into its slot
  std::uniform_int_distribution<size_t> dist(0, node->untried.size - 1);
  const size_t index = dist(rng_);
  const Move move = node->untried[index];
  node->untried[index] = node->untried[node->untried.size - 1];
  node->untried.size -= 1;

  const GameState next_state = Engine::successor(node->state, move);
  node->children.push_back(
    std::make_unique<MCTSNode>(next_state, move, node->state.current_player(), node));
  stats_.nodes_created++;
  return node->children.back().get();
}

Player MCTS::playout(GameState state) {
  MoveList moves;
  while (!state.is_over()) {
    Rules::legal_moves(state, moves);
    if (moves.empty()) {
      return opponent(state.current_player());
    }

    const Move* chosen = nullptr;
    for (const auto& m : moves) {
      if (!m.has_build) {
        chosen = &m;
        break;
      }
    }
    if (!chosen) {
      std::uniform_int_distribution<size_t> dist(0, moves.size - 1);
      chosen = &moves[dist(rng_)];
    }
    state = Engine::successor(state, *chosen);
  }
  return state.winner();
}

Player MCTS::simulate(const MCTSNode* node) {
  if (node->is_terminal) {
    return node->state.winner();
  }
  return playout(node->state);
}

void MCTS::backpropagate(MCTSNode* node, Player winner) const {
  while (node != nullptr) {
    node->visits++;
    node->total_value += (winner == node->mover) ? 1.0 : -1.0;
    node = node->parent;
  }
}

std::optional<Move> MCTS::search(const GameState& s, int iterations) {
  stats_.reset();

  if (s.phase() == Phase::NoLegalMove) {
    return std::nullopt;
  }
  if (s.phase() != Phase::SelectingWorker) {
    throw std::logic_error(std::string("MCTS asked for a move during ") + santorini::to_string(s.phase()));
  }

  MoveList moves;
  Rules::legal_moves(s, moves);
  stats_.root_moves = static_cast<int>(moves.size);
  if (moves.empty()) {
    return std::nullopt;
  }

  // generation puts no build on a winning step
  for (const auto& m : moves) {
    if (!m.has_build) {
      return m;
    }
  }

  const int budget = std::max(iterations, 1);
  if (verbose_) {
    std::cerr << "[MCTS] Starting " << to_string(tree_policy_) << " search with " << budget
              << " iterations over " << moves.size << " moves..." << std::endl;
  }

  auto start_time = std::chrono::steady_clock::now();
  auto root = std::make_unique<MCTSNode>(s, Move{}, opponent(s.current_player()), nullptr);

  for (int i = 0; i < budget; ++i) {
    // 1. Selection
    MCTSNode* node = select(root.get());
    // 2. Expansion
    node = expand(node);
    // 3. Simulation
    const Player winner = simulate(node);
    // 4. Backpropagation
    backpropagate(node, winner);
    stats_.iterations++;
  }

  MCTSNode* best_child = nullptr;
  int best_visits = -1;
  for (auto& child : root->children) {
    if (child->visits > best_visits) {
      best_visits = child->visits;
      best_child = child.get();
    }
  }

  auto end_time = std::chrono::steady_clock::now();
  stats_.time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
  stats_.best_visits = best_visits;

  if (verbose_) {
    std::cerr << "[MCTS] Best move: visits=" << best_visits
              << ", avg_value=" << (best_child ? best_child->average_value() : 0.0)
              << " | Nodes: " << stats_.nodes_created
              << " | Time: " << stats_.time_ms << "ms" << std::endl;
  }

  if (!best_child) {
    return std::nullopt;
  }
  return best_child->move;
}
