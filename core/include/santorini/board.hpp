#pragma once
#include "santorini/types.hpp"
#include <array>
#include <cstddef>

namespace santorini {

struct Cell {
  int height = 0;
  bool capped = false;
  Player occupant = Player::None;
};

inline bool operator==(const Cell& a, const Cell& b) {
  return a.height == b.height && a.capped == b.capped && a.occupant == b.occupant;
}

inline bool operator!=(const Cell& a, const Cell& b) {
  return !(a == b);
}

// rows[y][x]: level 0..3, or 4 for a capped tower
using HeightGrid = std::array<std::array<int, BOARD_W>, BOARD_H>;

// In-bounds neighbours of one cell, at most 8
struct Neighbors {
  std::array<Coord, 8> cells;
  size_t size = 0;

  const Coord* begin() const { return &cells[0]; }
  const Coord* end() const { return &cells[size]; }
};

class Board {
public:
  Board();
  int width() const { return BOARD_W; }
  int height() const { return BOARD_H; }
  void reset();

  static Board from_heights(const HeightGrid& rows);

  bool in_bounds(int x, int y) const {
    return x >= 0 && x < width() && y >= 0 && y < height();
  }
  bool in_bounds(const Coord& c) const { return in_bounds(c.x, c.y); }

  Cell& at(int x, int y) { return cells_[y * width() + x]; }
  const Cell& at(int x, int y) const { return cells_[y * width() + x]; }
  const Cell& at(const Coord& c) const { return at(c.x, c.y); }

  Neighbors neighbors(const Coord& c) const;

  int height_at(const Coord& c) const { return at(c).height; }
  bool is_capped(const Coord& c) const { return at(c).capped; }
  bool is_occupied(const Coord& c) const { return at(c).occupant != Player::None; }
  Player occupant(const Coord& c) const { return at(c).occupant; }

  // Raises the tower by one level, or places the dome on a level-3 tower.
  // Throws std::logic_error on a capped cell.
  void build(const Coord& c);
  void set_occupant(const Coord& c, Player p) { at(c.x, c.y).occupant = p; }

  int total_height() const;

  bool operator==(const Board& other) const { return cells_ == other.cells_; }

private:
  std::array<Cell, BOARD_W * BOARD_H> cells_;
};

} // namespace santorini
