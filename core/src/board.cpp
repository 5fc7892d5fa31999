#include "santorini/board.hpp"
#include <stdexcept>
#include <string>

using namespace santorini;

// (dx, dy) offsets; the generation order of every move list follows this table
static constexpr int ALL_8[8][2] = {{-1,-1},{0,-1},{1,-1},{-1,0},{1,0},{-1,1},{0,1},{1,1}};

Board::Board() { reset(); }

void Board::reset() {
  // clear all 25 cells (5x5 board): ground level, no domes, no workers
  for (auto& cell : cells_) {
    cell.height = 0;
    cell.capped = false;
    cell.occupant = Player::None;
  }
}

Board Board::from_heights(const HeightGrid& rows) {
  Board b;
  for (int y = 0; y < BOARD_H; ++y) {
    for (int x = 0; x < BOARD_W; ++x) {
      const int level = rows[y][x];
      if (level < 0 || level > MAX_HEIGHT + 1) {
        throw std::invalid_argument("Invalid tower level " + std::to_string(level)
                                    + " at (" + std::to_string(x) + "," + std::to_string(y) + ")");
      }
      b.at(x, y).height = std::min(level, MAX_HEIGHT);
      b.at(x, y).capped = (level > MAX_HEIGHT);
    }
  }
  return b;
}

Neighbors Board::neighbors(const Coord& c) const {
  Neighbors out;
  for (int i = 0; i < 8; ++i) {
    const int nx = c.x + ALL_8[i][0];
    const int ny = c.y + ALL_8[i][1];
    if (!in_bounds(nx, ny)) continue;
    out.cells[out.size++] = Coord{nx, ny};
  }
  return out;
}

void Board::build(const Coord& c) {
  Cell& cell = at(c.x, c.y);
  if (cell.capped) {
    throw std::logic_error("Cannot build on a capped tower at ("
                           + std::to_string(c.x) + "," + std::to_string(c.y) + ")");
  }
  if (cell.height < MAX_HEIGHT) {
    cell.height += 1;
  } else {
    cell.capped = true;
  }
}

int Board::total_height() const {
  int sum = 0;
  for (const auto& cell : cells_) sum += cell.height;
  return sum;
}
