#pragma once
#include "santorini/game_state.hpp"
#include "santorini/types.hpp"
#include <limits>

namespace santorini_ai {

using Score = double;

constexpr Score kWinScore = std::numeric_limits<double>::max();
constexpr Score kLossScore = std::numeric_limits<double>::lowest();

// Weight of the height term against the proximity term
constexpr double kHeightWeight = 2.0;

/**
 * Cell height plus the mean height of its in-bounds neighbours.
 * Domes count as level 3.
 */
double effective_height(const santorini::Board& b, const santorini::Coord& c);

// Minus the sum of Chebyshev distances over all (own, opponent) worker pairs
double proximity_term(const santorini::GameState& s, santorini::Player p);

// Own effective heights minus the opponent's
double height_term(const santorini::GameState& s, santorini::Player p);

/**
 * Scores a state from p's point of view.
 * A win for p is kWinScore, a loss (opponent won, or p cannot move) is kLossScore,
 * anything else is proximity + kHeightWeight * height, strictly between the two.
 */
Score evaluate(const santorini::GameState& s, santorini::Player p);

} // namespace santorini_ai
