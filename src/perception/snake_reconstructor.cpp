#include "perception/snake_reconstructor.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace snakebot {
namespace {

struct RankedCell {
  Cell cell;
  float value = 0.0f;
};

const Cell& closest_to(const std::vector<Cell>& cells, const Cell& reference) {
  // min_element devuelve el primero entre iguales, igual que un sort estable.
  return *std::min_element(cells.begin(), cells.end(), [&](const Cell& a, const Cell& b) {
    return manhattan(a, reference) < manhattan(b, reference);
  });
}

bool same_cells(const Cluster& cluster, const std::vector<Cell>& body) {
  return cluster.size() == body.size() &&
         std::all_of(body.begin(), body.end(), [&](const Cell& c) { return cluster.contains(c); });
}

// Una cabeza nueva nunca ocupa el cuello ni el interior del cuerpo anterior;
// solo la cola, que se libera en el mismo paso (y nunca con 2 celdas: seria reversa).
bool blocked_by_body(const Cell& c, const std::vector<Cell>* prev_body) {
  if (!prev_body) {
    return false;
  }
  const auto it = std::find(prev_body->begin(), prev_body->end(), c);
  if (it == prev_body->end()) {
    return false;
  }
  const bool is_tail = it + 1 == prev_body->end();
  return !(is_tail && prev_body->size() >= 3);
}

}  // namespace

const char* reconstruct_status_name(ReconstructStatus status) {
  switch (status) {
    case ReconstructStatus::kOk:
      return "ok";
    case ReconstructStatus::kEmptyCluster:
      return "empty_cluster";
    case ReconstructStatus::kWalkLoop:
      return "walk_loop";
    case ReconstructStatus::kTooShort:
      return "too_short";
    case ReconstructStatus::kBrokenPadding:
    default:
      return "broken_padding";
  }
}

bool is_valid_body(const std::vector<Cell>& body) {
  std::unordered_set<CellKey> seen;
  for (std::size_t i = 0; i < body.size(); ++i) {
    if (!seen.insert(cell_key(body[i])).second) {
      return false;
    }
    if (i > 0 && manhattan(body[i - 1], body[i]) != 1) {
      return false;
    }
  }
  return true;
}

SnakeReconstructor::SnakeReconstructor(const BotConfig& cfg)
    : grid_(cfg.grid),
      value_threshold_(cfg.value_threshold),
      refine_extra_keep_(cfg.refine_extra_keep),
      walk_guard_slack_(cfg.walk_guard_slack) {}

Cluster SnakeReconstructor::refine(const Cluster& cluster,
                                   const MetricGrid& metrics,
                                   int expected_length) const {
  if (cluster.empty()) {
    return cluster;
  }
  const std::size_t expected = static_cast<std::size_t>(std::max(1, expected_length));

  std::vector<RankedCell> ranked;
  ranked.reserve(cluster.size());
  for (const auto& c : cluster.cells) {
    ranked.push_back({c, metrics.at(c).value});
  }
  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const RankedCell& a, const RankedCell& b) { return a.value > b.value; });

  const std::size_t max_keep =
      std::max(expected + static_cast<std::size_t>(refine_extra_keep_),
               std::min(ranked.size(), expected * 2));
  ranked.resize(std::min(ranked.size(), max_keep));

  const std::size_t cutoff_index = std::min(expected - 1, ranked.size() - 1);
  const float cutoff = std::max(value_threshold_, ranked[cutoff_index].value);

  Cluster refined;
  for (std::size_t i = 0; i < ranked.size(); ++i) {
    const Cell& c = ranked[i].cell;
    if ((ranked[i].value >= cutoff || i < expected) && !refined.contains(c)) {
      refined.add(c);
    }
  }
  return refined;
}

Cell SnakeReconstructor::choose_head(const Cluster& cluster,
                                     const MetricGrid& metrics,
                                     const TrackingHints& hints) const {
  const std::vector<Cell>* prev_body =
      hints.prev_body && !hints.prev_body->empty() ? hints.prev_body : nullptr;

  // Mismas celdas que el tick anterior: o el juego no ha avanzado, o la cabeza
  // entro en la celda que dejaba la cola. La cabeza es la mas brillante.
  if (prev_body && same_cells(cluster, *prev_body)) {
    const Cell& old_head = prev_body->front();
    const Cell& old_tail = prev_body->back();
    return metrics.at(old_tail).value > metrics.at(old_head).value ? old_tail : old_head;
  }

  if (hints.expected_head && cluster.contains(*hints.expected_head)) {
    return *hints.expected_head;
  }
  if (hints.prev_head) {
    for (const auto& c : cluster.cells) {
      if (manhattan(c, *hints.prev_head) == 1 && !blocked_by_body(c, prev_body)) {
        return c;
      }
    }
  }

  std::vector<Cell> endpoints;
  for (const auto& c : cluster.cells) {
    if (cluster_neighbors(c, cluster, grid_).size() <= 1) {
      endpoints.push_back(c);
    }
  }
  if (endpoints.size() == 1) {
    return endpoints.front();
  }

  const Cell reference = hints.prev_head ? *hints.prev_head : start_cell();
  return endpoints.empty() ? closest_to(cluster.cells, reference)
                           : closest_to(endpoints, reference);
}

void SnakeReconstructor::pad_from_previous(std::vector<Cell>& body,
                                           std::size_t expected_length,
                                           const std::vector<Cell>& prev_body) {
  // Si la cola recorrida aparece en el cuerpo anterior, se continua desde ahi;
  // si no, se toman los ultimos segmentos del cuerpo anterior.
  auto it = std::find(prev_body.begin(), prev_body.end(), body.back());
  if (it != prev_body.end()) {
    for (++it; it != prev_body.end() && body.size() < expected_length; ++it) {
      body.push_back(*it);
    }
    return;
  }
  const std::size_t missing = expected_length - body.size();
  const std::size_t take = std::min(missing, prev_body.size());
  body.insert(body.end(), prev_body.end() - static_cast<std::ptrdiff_t>(take), prev_body.end());
}

ReconstructStatus SnakeReconstructor::reconstruct(const Cluster& cluster,
                                                  const MetricGrid& metrics,
                                                  int expected_length,
                                                  const TrackingHints& hints,
                                                  SnakeState& out) const {
  if (cluster.empty()) {
    return ReconstructStatus::kEmptyCluster;
  }
  const std::size_t expected = static_cast<std::size_t>(std::max(1, expected_length));
  // El recorrido nunca repite celda, asi que no puede pasar de cluster.size():
  // el tope solo acota un cluster degenerado, no detecta bucles.
  const std::size_t guard = cluster.size() + static_cast<std::size_t>(walk_guard_slack_);

  const std::vector<Cell>* prev_body =
      hints.prev_body && !hints.prev_body->empty() ? hints.prev_body : nullptr;
  std::unordered_map<CellKey, std::size_t> prev_index;
  if (prev_body) {
    for (std::size_t i = 0; i < prev_body->size(); ++i) {
      prev_index.emplace(cell_key((*prev_body)[i]), i);
    }
  }

  std::vector<Cell> body;
  std::unordered_set<CellKey> visited;
  Cell current = choose_head(cluster, metrics, hints);
  std::optional<Cell> came_from;

  auto usable = [&](const Cell& n) {
    return !(came_from && n == *came_from) && visited.count(cell_key(n)) == 0;
  };

  while (true) {
    body.push_back(current);
    visited.insert(cell_key(current));

    // Se sigue el orden del cuerpo anterior cuando es posible: en formas
    // compactas (un cuadrado 2x2) el orden fijo de vecinos elegiria mal.
    std::optional<Cell> follow;
    if (prev_body) {
      const auto it = prev_index.find(cell_key(current));
      if (body.size() == 1 && current != prev_body->front()) {
        follow = prev_body->front();
      } else if (it != prev_index.end() && it->second + 1 < prev_body->size()) {
        follow = (*prev_body)[it->second + 1];
      }
    }

    std::optional<Cell> next;
    if (follow && manhattan(current, *follow) == 1 && cluster.contains(*follow) &&
        usable(*follow)) {
      next = follow;
    }
    if (!next) {
      for (const auto& n : cluster_neighbors(current, cluster, grid_)) {
        if (usable(n)) {
          next = n;
          break;
        }
      }
    }
    if (!next) {
      break;
    }
    came_from = current;
    current = *next;
    if (body.size() > guard) {
      return ReconstructStatus::kWalkLoop;
    }
  }

  if (body.size() > expected) {
    body.resize(expected);
  }
  if (body.size() < expected && hints.prev_body && !hints.prev_body->empty()) {
    pad_from_previous(body, expected, *hints.prev_body);
  }
  if (body.size() < expected) {
    return ReconstructStatus::kTooShort;
  }
  if (!is_valid_body(body)) {
    return ReconstructStatus::kBrokenPadding;
  }

  out.head = body.front();
  out.tail = body.back();
  out.body = std::move(body);
  return ReconstructStatus::kOk;
}

}  // namespace snakebot
