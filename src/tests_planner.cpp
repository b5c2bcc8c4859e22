#include <algorithm>
#include <cassert>
#include <iostream>
#include <vector>

#include "common/config.hpp"
#include "planner/path_planner.hpp"

using namespace snakebot;

namespace {

// Reproduce el camino con las reglas del juego; false si choca o sale del tablero.
bool replay(std::vector<Cell> body, const std::vector<Move>& path, const Cell& food, Cell& head) {
  for (const auto& m : path) {
    const Cell next = apply_move(body.front(), m);
    if (next.x < 0 || next.y < 0 || next.x >= 28 || next.y >= 28) {
      return false;
    }
    const bool grows = next == food;
    const std::size_t solid = grows ? body.size() : body.size() - 1;
    if (std::find(body.begin(), body.begin() + static_cast<std::ptrdiff_t>(solid), next) !=
        body.begin() + static_cast<std::ptrdiff_t>(solid)) {
      return false;
    }
    body.insert(body.begin(), next);
    if (!grows) {
      body.pop_back();
    }
  }
  head = body.front();
  return true;
}

bool same_moves(const std::vector<Move>& a, const std::vector<Move>& b) {
  return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin());
}

}  // namespace

int main() {
  const BotConfig cfg;
  const PathPlanner planner(cfg);
  const Move up = move_for(Direction::kUp);
  const Move right = move_for(Direction::kRight);
  const Move down = move_for(Direction::kDown);
  const Move left = move_for(Direction::kLeft);

  {
    // Camino recto hacia la comida.
    const std::vector<Cell> body{{14, 14}, {13, 14}, {12, 14}};
    std::vector<Move> path;
    assert(planner.find_path(body, {14, 10}, SearchMode::kFood, path));
    assert(same_moves(path, {up, up, up, up}));
  }

  {
    // Ya encima de la comida: exito con camino vacio.
    std::vector<Move> path{up};
    assert(planner.find_path({{3, 3}}, {3, 3}, SearchMode::kFood, path));
    assert(path.empty());
  }

  {
    // Persecucion de cola: el objetivo inicial no cuenta, hace falta moverse.
    const std::vector<Cell> body{{5, 5}, {4, 5}, {3, 5}};
    std::vector<Move> path;
    assert(planner.find_path(body, body.back(), SearchMode::kTail, path));
    assert(path.size() == 4);
    assert(path.front() == up);
    Cell head;
    assert(replay(body, path, {-1, -1}, head));
    assert(head == (Cell{3, 5}));

    // Dos celdas: la cola es el cuello y el juego ignora la reversa, asi que
    // hay que dar la vuelta por un lado.
    const std::vector<Cell> pair{{5, 5}, {4, 5}};
    assert(planner.find_path(pair, pair.back(), SearchMode::kTail, path));
    assert(same_moves(path, {up, left, down}));
    assert(replay(pair, path, {-1, -1}, head));
    assert(head == (Cell{4, 5}));

    // Una celda: volver al inicio repite el estado raiz y no hay camino.
    assert(!planner.find_path({{5, 5}}, {5, 5}, SearchMode::kTail, path));
    assert(path.empty());
  }

  {
    // Serpiente en C sobre la cabeza: hay que rodearla sin atravesar el cuerpo.
    const std::vector<Cell> body{{5, 5}, {6, 5}, {7, 5}, {7, 4}, {6, 4}, {5, 4}, {4, 4}, {3, 4}};
    const Cell food{6, 3};
    std::vector<Move> path;
    assert(planner.find_path(body, food, SearchMode::kFood, path));
    Cell head;
    assert(replay(body, path, food, head));
    assert(head == food);
    assert(path.size() > static_cast<std::size_t>(manhattan(body.front(), food)));
  }

  {
    // Tope de nodos agotado: fallo aunque el objetivo sea alcanzable.
    BotConfig tiny = cfg;
    tiny.max_search_nodes = 1;
    const PathPlanner capped(tiny);
    std::vector<Move> path;
    assert(!capped.find_path({{0, 0}}, {5, 5}, SearchMode::kFood, path));
    assert(path.empty());
    assert(capped.max_nodes() == 1);
  }

  {
    // Paso seguro: la preferida es reversa, gana el primero del orden fijo.
    const std::vector<Cell> body{{5, 5}, {4, 5}};
    const auto safe = planner.choose_safe_direction(body, Heading{1, 0}, {left});
    assert(safe && *safe == up);

    const auto pref = planner.choose_safe_direction(body, Heading{1, 0}, {down});
    assert(pref && *pref == down);

    // Con una celda la reversa esta permitida.
    const auto single = planner.choose_safe_direction({{5, 5}}, Heading{1, 0}, {left});
    assert(single && *single == left);

    // Esquina sin salida.
    const std::vector<Cell> trapped{{27, 0}, {26, 0}, {26, 1}, {27, 1}, {27, 2}};
    assert(!planner.choose_safe_direction(trapped, Heading{1, 0}));
  }

  {
    const auto horizontal = PathPlanner::perpendicular_moves(Heading{1, 0});
    assert(same_moves(horizontal, {up, down}));
    const auto vertical = PathPlanner::perpendicular_moves(Heading{0, -1});
    assert(same_moves(vertical, {right, left}));
    assert(PathPlanner::perpendicular_moves(Heading{0, 0}).size() == 4);
  }

  {
    // Sin comida: persigue la cola y nunca empieza dando la vuelta.
    Observation obs;
    obs.body = {{14, 14}, {13, 14}, {12, 14}};
    obs.head = obs.body.front();
    obs.tail = obs.body.back();
    const auto moves = planner.plan(obs, Heading{1, 0});
    assert(!moves.empty());
    assert(moves.front() != left);
    Cell head;
    assert(replay(obs.body, moves, {-1, -1}, head));
    assert(head == obs.tail);

    obs.food = Cell{20, 14};
    const auto to_food = planner.plan(obs, Heading{1, 0});
    assert(to_food.size() == 6);
    assert(std::all_of(to_food.begin(), to_food.end(), [&](const Move& m) { return m == right; }));
  }

  {
    // Ni comida ni cola alcanzables: un paso seguro perpendicular.
    BotConfig tiny = cfg;
    tiny.max_search_nodes = 1;
    const PathPlanner capped(tiny);
    Observation obs;
    obs.body = {{14, 14}, {13, 14}, {12, 14}};
    obs.head = obs.body.front();
    obs.tail = obs.body.back();
    const auto moves = capped.plan(obs, Heading{1, 0});
    assert(moves.size() == 1);
    assert(moves.front() == up);
  }

  std::cout << "tests_planner: OK\n";
  return 0;
}
