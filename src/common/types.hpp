#pragma once

#include <array>
#include <cstdint>
#include <cstdlib>

namespace snakebot {

struct Cell {
  int x = 0;
  int y = 0;
};

inline bool operator==(const Cell& a, const Cell& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Cell& a, const Cell& b) { return !(a == b); }

inline int manhattan(const Cell& a, const Cell& b) {
  return std::abs(a.x - b.x) + std::abs(a.y - b.y);
}

// Clave entera canonica de (x, y) para sets/maps.
using CellKey = std::int64_t;

inline CellKey cell_key(const Cell& c) {
  return (static_cast<CellKey>(c.y) << 32) | static_cast<std::uint32_t>(c.x);
}

enum class Direction : std::uint8_t { kUp = 0, kRight = 1, kDown = 2, kLeft = 3 };

struct Move {
  int dx = 0;
  int dy = 0;
  Direction dir = Direction::kUp;
};

inline bool operator==(const Move& a, const Move& b) { return a.dx == b.dx && a.dy == b.dy; }
inline bool operator!=(const Move& a, const Move& b) { return !(a == b); }

// Orden fijo: up, right, down, left. El BFS depende de este orden.
inline const std::array<Move, 4>& all_moves() {
  static const std::array<Move, 4> kMoves{{{0, -1, Direction::kUp},
                                           {1, 0, Direction::kRight},
                                           {0, 1, Direction::kDown},
                                           {-1, 0, Direction::kLeft}}};
  return kMoves;
}

inline const Move& move_for(Direction d) {
  return all_moves()[static_cast<std::size_t>(d)];
}

inline Cell apply_move(const Cell& c, const Move& m) { return {c.x + m.dx, c.y + m.dy}; }

inline const char* input_key(Direction d) {
  switch (d) {
    case Direction::kUp:
      return "ArrowUp";
    case Direction::kRight:
      return "ArrowRight";
    case Direction::kDown:
      return "ArrowDown";
    case Direction::kLeft:
    default:
      return "ArrowLeft";
  }
}

// Rumbo actual de la serpiente como delta unitario.
struct Heading {
  int x = 1;
  int y = 0;
};

inline bool reverses(const Move& m, const Heading& h) { return m.dx == -h.x && m.dy == -h.y; }

}  // namespace snakebot
