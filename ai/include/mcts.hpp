#pragma once
#include "santorini/game_state.hpp"
#include "santorini/move.hpp"
#include "santorini/move_list.hpp"
#include "placement_policy.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <vector>

namespace santorini_ai {

// Exploration bonus used when descending the tree
enum class TreePolicy : uint8_t {
  UCB1,  // c * sqrt(ln(N) / n)
  PUCT   // c * sqrt(N) / n
};

const char* to_string(TreePolicy policy);

/**
 * MCTS node.
 * total_value is kept from the viewpoint of `mover`, the player whose turn
 * led to this node, so a parent compares its children's averages directly.
 */
struct MCTSNode {
  santorini::GameState state;
  santorini::Move move;  // the turn that led here
  santorini::Player mover;
  MCTSNode* parent;
  std::vector<std::unique_ptr<MCTSNode>> children;
  santorini::MoveList untried;

  int visits;
  double total_value;
  bool is_terminal;

  MCTSNode(const santorini::GameState& s, const santorini::Move& m, santorini::Player who, MCTSNode* p);

  bool fully_expanded() const { return untried.empty(); }
  double average_value() const {
    return visits > 0 ? total_value / visits : 0.0;
  }
};

/**
 * Monte Carlo tree search with random playouts.
 * A playout takes a winning step whenever one exists and a uniformly random
 * turn otherwise, until the game ends.
 */
class MCTS {
public:
  MCTS();
  explicit MCTS(uint32_t seed);

  // Most visited root move, std::nullopt when the player to move has none.
  // A step onto level 3 is returned without searching.
  // Throws std::logic_error unless `s` is at the start of a turn or blocked.
  std::optional<santorini::Move> search(const santorini::GameState& s, int iterations);
  std::optional<santorini::Move> choose_move(const santorini::GameState& s) {
    return search(s, iterations_);
  }

  santorini::Coord choose_placement(const santorini::GameState& s);

  void set_iterations(int iterations) { iterations_ = iterations; }
  int iterations() const { return iterations_; }
  void set_tree_policy(TreePolicy policy) { tree_policy_ = policy; }
  TreePolicy tree_policy() const { return tree_policy_; }
  void set_exploration_constant(double c) { exploration_constant_ = c; }
  void set_verbose(bool v) { verbose_ = v; }

  struct Stats {
    int iterations;
    int nodes_created;
    int root_moves;
    int best_visits;
    int64_t time_ms;

    void reset() {
      iterations = 0;
      nodes_created = 0;
      root_moves = 0;
      best_visits = 0;
      time_ms = 0;
    }
  };

  const Stats& get_stats() const { return stats_; }

private:
  MCTSNode* select(MCTSNode* node) const;
  MCTSNode* expand(MCTSNode* node);
  santorini::Player simulate(const MCTSNode* node);
  void backpropagate(MCTSNode* node, santorini::Player winner) const;

  double exploration_bonus(const MCTSNode& parent, const MCTSNode& child) const;
  santorini::Player playout(santorini::GameState state);

  int iterations_;
  TreePolicy tree_policy_;
  double exploration_constant_;
  bool verbose_;
  Stats stats_;
  std::mt19937 rng_;
  PlacementPolicy placement_;
};

} // namespace santorini_ai
