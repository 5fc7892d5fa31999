#include "heuristic_ai.hpp"
#include "config.hpp"
#include "santorini/engine.hpp"
#include "santorini/move_list.hpp"
#include "santorini/rules.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace santorini_ai;
using namespace santorini;

HeuristicAI::HeuristicAI()
  : depth_(config::kDefaultSearchDepth), use_cache_(true), verbose_(false),
    placement_(config::kDefaultSeed) {
  stats_.reset();
}

HeuristicAI::HeuristicAI(int depth, uint32_t seed)
  : depth_(depth), use_cache_(true), verbose_(false), placement_(seed) {
  stats_.reset();
}

Coord HeuristicAI::choose_placement(const GameState& s) {
  return placement_.pick(s);
}

Score HeuristicAI::minimax(const GameState& state, int depth, Player root) {
  stats_.nodes_searched++;

  if (depth <= 0 || state.is_over()) {
    return evaluate(state, root);
  }

  const CacheKey key{state.compute_hash(), depth, root};
  if (use_cache_) {
    auto it = cache_.find(key);
    if (it != cache_.end() && it->second.state.same_position(state)) {
      stats_.cache_hits++;
      return it->second.score;
    }
  }

  MoveList moves;
  Rules::legal_moves(state, moves);
  if (moves.empty()) {
    // unreachable for engine-produced states: begin_turn ends the game first
    return evaluate(state, root);
  }

  const bool maximizing = (state.current_player() == root);
  Score best = maximizing ? kLossScore : kWinScore;

  for (const auto& move : moves) {
    // each branch searches its own copy
    const GameState next_state = Engine::successor(state, move);
    const Score value = minimax(next_state, depth - 1, root);

    if (maximizing) {
      best = std::max(best, value);
      if (best == kWinScore) break;
    } else {
      best = std::min(best, value);
      if (best == kLossScore) break;
    }
  }

  if (use_cache_) {
    cache_[key] = CacheEntry{state, best};
  }
  return best;
}

std::optional<Move> HeuristicAI::choose_move(const GameState& s, int depth) {
  stats_.reset();
  cache_.clear();

  if (s.phase() == Phase::NoLegalMove) {
    return std::nullopt;
  }
  if (s.phase() != Phase::SelectingWorker) {
    throw std::logic_error(std::string("HeuristicAI asked for a move during ") + to_string(s.phase()));
  }

  MoveList moves;
  Rules::legal_moves(s, moves);
  stats_.root_moves = static_cast<int>(moves.size);
  if (moves.empty()) {
    return std::nullopt;
  }

  const int search_depth = std::max(depth, 1);
  const Player root = s.current_player();

  if (verbose_) {
    std::cerr << "[HeuristicAI] Searching depth " << search_depth << " over "
              << moves.size << " moves for " << player_name(root) << "..." << std::endl;
  }

  auto start_time = std::chrono::steady_clock::now();

  std::optional<Move> best_move;
  Score best_value = kLossScore;
  for (const auto& move : moves) {
    const GameState next_state = Engine::successor(s, move);
    const Score value = minimax(next_state, search_depth - 1, root);

    // strict comparison keeps the first of equal moves
    if (!best_move || value > best_value) {
      best_value = value;
      best_move = move;
    }
    if (best_value == kWinScore) break;
  }

  auto end_time = std::chrono::steady_clock::now();
  stats_.time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
  stats_.best_score = best_value;

  if (verbose_) {
    std::cerr << "[HeuristicAI] Search complete | Depth: " << search_depth
              << " | Nodes: " << stats_.nodes_searched
              << " | Cache hits: " << stats_.cache_hits
              << " | Time: " << stats_.time_ms << "ms"
              << " | Score: " << best_value << std::endl;
  }
  return best_move;
}
