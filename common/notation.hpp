#pragma once

#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "santorini/board.hpp"
#include "santorini/engine.hpp"
#include "santorini/move.hpp"
#include "santorini/types.hpp"

namespace notation {

inline constexpr std::array<char, 5> FILES{'a', 'b', 'c', 'd', 'e'};
inline constexpr std::array<char, 5> RANKS{'1', '2', '3', '4', '5'};

struct NotationError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

inline std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return text;
}

inline std::string trim(const std::string& text) {
    auto trimmed = text;
    trimmed.erase(trimmed.begin(), std::find_if(trimmed.begin(), trimmed.end(), [](unsigned char ch) {
        return !std::isspace(ch);
    }));
    trimmed.erase(std::find_if(trimmed.rbegin(), trimmed.rend(), [](unsigned char ch) {
                      return !std::isspace(ch);
                  }).base(),
                  trimmed.end());
    return trimmed;
}

inline bool is_valid_coord(std::string_view coord) {
    if (coord.size() != 2) {
        return false;
    }
    return std::find(FILES.begin(), FILES.end(), coord[0]) != FILES.end() &&
           std::find(RANKS.begin(), RANKS.end(), coord[1]) != RANKS.end();
}

// "a5" is the top-left cell (0,0), "e1" the bottom-right (4,4)
inline santorini::Coord parse_coord(const std::string& text) {
    const std::string coord = to_lower(trim(text));
    if (!is_valid_coord(coord)) {
        throw NotationError("Invalid board coordinate: " + text);
    }
    const int x = coord[0] - 'a';
    const int rank_index = coord[1] - '1';
    return santorini::Coord{x, santorini::BOARD_H - 1 - rank_index};
}

inline std::string format_coord(const santorini::Coord& c) {
    if (c.x < 0 || c.x >= santorini::BOARD_W || c.y < 0 || c.y >= santorini::BOARD_H) {
        return "--";
    }
    const char file = static_cast<char>('a' + c.x);
    const char rank = static_cast<char>('1' + (santorini::BOARD_H - 1 - c.y));
    return std::string{file, rank};
}

// "b2-c3 d4", or "b2-c3" for a winning step
inline std::string format_move(const santorini::Move& move) {
    std::ostringstream oss;
    oss << format_coord(move.from) << '-' << format_coord(move.to);
    if (move.has_build) {
        oss << ' ' << format_coord(move.build);
    }
    return oss.str();
}

inline std::vector<std::string> split(const std::string& text, char delim) {
    std::vector<std::string> parts;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, delim)) {
        if (!item.empty()) {
            parts.push_back(item);
        }
    }
    return parts;
}

// Parses one terminal command into an engine action:
//   place <cell> | select <cell> | cancel | move <cell> | build <cell> | resign
inline santorini::Action parse_action(const std::string& line) {
    const auto words = split(to_lower(trim(line)), ' ');
    if (words.empty()) {
        throw NotationError("Empty command");
    }
    const std::string& verb = words[0];
    if (verb == "cancel" || verb == "resign") {
        if (words.size() != 1) {
            throw NotationError("'" + verb + "' takes no argument");
        }
        return verb == "cancel" ? santorini::Action::deselect() : santorini::Action::resign();
    }
    if (words.size() != 2) {
        throw NotationError("'" + verb + "' needs exactly one cell, e.g. '" + verb + " c3'");
    }
    const santorini::Coord cell = parse_coord(words[1]);
    if (verb == "place") return santorini::Action::place(cell);
    if (verb == "select") return santorini::Action::select_at(cell);
    if (verb == "move") return santorini::Action::move_to(cell);
    if (verb == "build") return santorini::Action::build_at(cell);
    throw NotationError("Unknown command: " + verb);
}

inline char worker_symbol(const santorini::Snapshot& snap, const santorini::Coord& c) {
    for (santorini::Player p : {santorini::Player::One, santorini::Player::Two}) {
        const auto& positions = snap.workers[santorini::player_index(p)];
        for (int w = 0; w < santorini::WORKERS_PER_PLAYER; ++w) {
            if (positions[w] != c) continue;
            const bool selected = (p == snap.to_move && w == snap.selected_worker);
            if (p == santorini::Player::One) return selected ? 'A' : 'a';
            return selected ? 'B' : 'b';
        }
    }
    return ' ';
}

// Each cell shows its level (0-3, '^' for a dome), the worker if any,
// and '*' when the current phase accepts that cell
inline std::string render_board(const santorini::Snapshot& snap) {
    std::ostringstream oss;
    for (int y = 0; y < santorini::BOARD_H; ++y) {
        oss << RANKS[santorini::BOARD_H - 1 - y] << '|';
        for (int x = 0; x < santorini::BOARD_W; ++x) {
            const santorini::Coord c{x, y};
            const santorini::Cell& cell = snap.board.at(c);
            const char level = cell.capped ? '^' : static_cast<char>('0' + cell.height);
            const bool lit = std::find(snap.highlights.begin(), snap.highlights.end(), c) != snap.highlights.end();
            oss << ' ' << level << worker_symbol(snap, c) << (lit ? '*' : ' ');
        }
        oss << "|\n";
    }
    oss << "  ";
    for (char file : FILES) {
        oss << ' ' << file << "  ";
    }
    return oss.str();
}

}  // namespace notation
