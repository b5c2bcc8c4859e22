#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/config.hpp"
#include "common/types.hpp"
#include "perception/board_analyzer.hpp"

namespace snakebot {

enum class SearchMode { kFood, kTail };

// BFS sobre estados de serpiente completa (cabeza + cuerpo ordenado), no solo
// sobre la posicion de la cabeza: la auto-colision depende del cuerpo entero.
class PathPlanner {
 public:
  explicit PathPlanner(const BotConfig& cfg);

  // true con `out` = movimientos hasta `target`. false si no hay camino o se
  // agota el tope de nodos. En modo kFood estar ya sobre el objetivo es exito
  // con camino vacio; en kTail hace falta al menos un movimiento.
  bool find_path(const std::vector<Cell>& body,
                 const Cell& target,
                 SearchMode mode,
                 std::vector<Move>& out) const;

  // Comida -> persecucion de cola -> un paso seguro. Vacio si nada sirve.
  [[nodiscard]] std::vector<Move> plan(const Observation& obs, const Heading& heading) const;

  // Primer movimiento que no invierte el rumbo (cuerpo > 1), no sale del
  // tablero y no choca con el cuerpo sin la cola. `preferred` va primero.
  [[nodiscard]] std::optional<Move> choose_safe_direction(
      const std::vector<Cell>& body,
      const Heading& heading,
      const std::vector<Move>& preferred = {}) const;

  static std::vector<Move> perpendicular_moves(const Heading& heading);

  [[nodiscard]] bool inside(const Cell& c) const {
    return c.x >= 0 && c.y >= 0 && c.x < grid_ && c.y < grid_;
  }
  [[nodiscard]] int max_nodes() const { return max_nodes_; }

 private:
  struct SearchState {
    std::vector<Cell> body;
    int parent = -1;
    int move_index = -1;
  };

  int grid_;
  int max_nodes_;

  static std::string body_key(const std::vector<Cell>& body);
  static std::vector<Move> reconstruct_path(const std::vector<SearchState>& states, int index);
};

}  // namespace snakebot
