#pragma once

#include <unordered_set>
#include <vector>

#include "common/types.hpp"
#include "perception/pixel_sampler.hpp"

namespace snakebot {

// Conjunto maximal 4-conexo de celdas brillantes. `cells` conserva el orden de
// recorrido del flood fill; no hay que depender de el salvo para desempates.
struct Cluster {
  std::vector<Cell> cells;
  std::unordered_set<CellKey> members;

  void add(const Cell& c) {
    cells.push_back(c);
    members.insert(cell_key(c));
  }
  [[nodiscard]] bool contains(const Cell& c) const { return members.count(cell_key(c)) != 0; }
  [[nodiscard]] std::size_t size() const { return cells.size(); }
  [[nodiscard]] bool empty() const { return cells.empty(); }
};

// Flood fill iterativo (pila explicita) sobre celdas `bright`, 4-conexo.
std::vector<Cluster> build_clusters(const MetricGrid& metrics);

// Vecinos 4-conexos de `cell` dentro del cluster, en orden +x, -x, +y, -y.
std::vector<Cell> cluster_neighbors(const Cell& cell, const Cluster& cluster, int grid);

}  // namespace snakebot
