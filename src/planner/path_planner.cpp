#include "planner/path_planner.hpp"

#include <algorithm>
#include <unordered_set>

namespace snakebot {
namespace {

bool hits(const std::vector<Cell>& body, std::size_t count, const Cell& c) {
  return std::find(body.begin(), body.begin() + static_cast<std::ptrdiff_t>(count), c) !=
         body.begin() + static_cast<std::ptrdiff_t>(count);
}

}  // namespace

PathPlanner::PathPlanner(const BotConfig& cfg)
    : grid_(cfg.grid), max_nodes_(std::max(1, cfg.max_search_nodes)) {}

std::string PathPlanner::body_key(const std::vector<Cell>& body) {
  // 2 bytes por celda (x, y < 256).
  std::string key;
  key.reserve(body.size() * 2);
  for (const auto& c : body) {
    key.push_back(static_cast<char>(c.x));
    key.push_back(static_cast<char>(c.y));
  }
  return key;
}

std::vector<Move> PathPlanner::reconstruct_path(const std::vector<SearchState>& states,
                                                int index) {
  std::vector<Move> path;
  for (int cursor = index; cursor != -1; cursor = states[static_cast<std::size_t>(cursor)].parent) {
    const SearchState& st = states[static_cast<std::size_t>(cursor)];
    if (st.move_index >= 0) {
      path.push_back(all_moves()[static_cast<std::size_t>(st.move_index)]);
    }
  }
  std::reverse(path.begin(), path.end());
  return path;
}

bool PathPlanner::find_path(const std::vector<Cell>& body,
                            const Cell& target,
                            SearchMode mode,
                            std::vector<Move>& out) const {
  out.clear();
  if (body.empty()) {
    return false;
  }

  const std::size_t cap = static_cast<std::size_t>(max_nodes_);
  std::vector<SearchState> states;
  std::unordered_set<std::string> visited;

  states.push_back({body, -1, -1});
  visited.insert(body_key(body));

  std::size_t cursor = 0;
  while (cursor < states.size() && cursor < cap) {
    if (states[cursor].body.front() == target &&
        (mode == SearchMode::kFood || states[cursor].parent != -1)) {
      out = reconstruct_path(states, static_cast<int>(cursor));
      return true;
    }

    for (std::size_t m = 0; m < all_moves().size(); ++m) {
      // `states` puede realocar al insertar: se relee por indice.
      const std::vector<Cell>& cur = states[cursor].body;
      const Cell head = apply_move(cur.front(), all_moves()[m]);
      if (!inside(head)) {
        continue;
      }
      // El juego ignora la tecla opuesta: nunca se entra en el cuello.
      if (cur.size() > 1 && head == cur[1]) {
        continue;
      }
      const bool grows = mode == SearchMode::kFood && head == target;
      // La cola se libera al avanzar salvo que la serpiente crezca.
      const std::size_t solid = grows ? cur.size() : cur.size() - 1;
      if (hits(cur, solid, head)) {
        continue;
      }

      std::vector<Cell> next;
      next.reserve(cur.size() + 1);
      next.push_back(head);
      next.insert(next.end(), cur.begin(), cur.begin() + static_cast<std::ptrdiff_t>(solid));

      if (!visited.insert(body_key(next)).second) {
        continue;
      }
      if (states.size() < cap) {
        states.push_back({std::move(next), static_cast<int>(cursor), static_cast<int>(m)});
      }
    }
    ++cursor;
  }
  return false;
}

std::vector<Move> PathPlanner::perpendicular_moves(const Heading& heading) {
  std::vector<Move> out;
  for (const auto& m : all_moves()) {
    if ((heading.x != 0 && m.dx == 0) || (heading.x == 0 && heading.y != 0 && m.dy == 0)) {
      out.push_back(m);
    }
  }
  if (out.empty()) {
    out.assign(all_moves().begin(), all_moves().end());
  }
  return out;
}

std::optional<Move> PathPlanner::choose_safe_direction(const std::vector<Cell>& body,
                                                       const Heading& heading,
                                                       const std::vector<Move>& preferred) const {
  if (body.empty()) {
    return std::nullopt;
  }

  std::vector<Move> order;
  auto push_unique = [&order](const Move& m) {
    if (std::find(order.begin(), order.end(), m) == order.end()) {
      order.push_back(m);
    }
  };
  for (const auto& m : preferred) {
    push_unique(m);
  }
  for (const auto& m : all_moves()) {
    push_unique(m);
  }

  for (const auto& m : order) {
    if (body.size() > 1 && reverses(m, heading)) {
      continue;
    }
    const Cell next = apply_move(body.front(), m);
    if (!inside(next)) {
      continue;
    }
    if (!hits(body, body.size() - 1, next)) {
      return m;
    }
  }
  return std::nullopt;
}

std::vector<Move> PathPlanner::plan(const Observation& obs, const Heading& heading) const {
  if (obs.body.empty()) {
    return {};
  }

  std::vector<Move> path;
  if (obs.food && find_path(obs.body, *obs.food, SearchMode::kFood, path) && !path.empty()) {
    return path;
  }
  if (find_path(obs.body, obs.body.back(), SearchMode::kTail, path) && !path.empty()) {
    return path;
  }
  if (auto safe = choose_safe_direction(obs.body, heading, perpendicular_moves(heading))) {
    return {*safe};
  }
  return {};
}

}  // namespace snakebot
