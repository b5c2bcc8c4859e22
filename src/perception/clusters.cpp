#include "perception/clusters.hpp"

#include <array>

namespace snakebot {
namespace {

constexpr std::array<std::array<int, 2>, 4> kNeighborDeltas{{{1, 0}, {-1, 0}, {0, 1}, {0, -1}}};

Cluster flood_from(const MetricGrid& metrics, const Cell& seed, std::vector<bool>& visited) {
  const int grid = metrics.grid();
  Cluster cluster;
  std::vector<Cell> stack;
  stack.push_back(seed);
  visited[static_cast<std::size_t>(seed.y * grid + seed.x)] = true;

  while (!stack.empty()) {
    const Cell c = stack.back();
    stack.pop_back();
    cluster.add(c);
    for (const auto& d : kNeighborDeltas) {
      const Cell n{c.x + d[0], c.y + d[1]};
      if (!metrics.inside(n) || !metrics.at(n).bright) {
        continue;
      }
      const auto idx = static_cast<std::size_t>(n.y * grid + n.x);
      if (visited[idx]) {
        continue;
      }
      visited[idx] = true;
      stack.push_back(n);
    }
  }
  return cluster;
}

}  // namespace

std::vector<Cluster> build_clusters(const MetricGrid& metrics) {
  const int grid = metrics.grid();
  std::vector<bool> visited(static_cast<std::size_t>(grid * grid), false);
  std::vector<Cluster> clusters;

  for (int y = 0; y < grid; ++y) {
    for (int x = 0; x < grid; ++x) {
      if (!metrics.at(x, y).bright || visited[static_cast<std::size_t>(y * grid + x)]) {
        continue;
      }
      clusters.push_back(flood_from(metrics, {x, y}, visited));
    }
  }
  return clusters;
}

std::vector<Cell> cluster_neighbors(const Cell& cell, const Cluster& cluster, int grid) {
  std::vector<Cell> out;
  for (const auto& d : kNeighborDeltas) {
    const Cell n{cell.x + d[0], cell.y + d[1]};
    if (n.x < 0 || n.y < 0 || n.x >= grid || n.y >= grid) {
      continue;
    }
    if (cluster.contains(n)) {
      out.push_back(n);
    }
  }
  return out;
}

}  // namespace snakebot
