#include "perception/food_locator.hpp"

#include <cmath>

namespace snakebot {
namespace {

constexpr float kBrightnessEps = 1e-3f;

}  // namespace

float cluster_brightness(const Cluster& cluster, const MetricGrid& metrics) {
  if (cluster.empty()) {
    return 0.0f;
  }
  float total = 0.0f;
  for (const auto& c : cluster.cells) {
    total += metrics.at(c).value;
  }
  return total / static_cast<float>(cluster.size());
}

std::optional<Cell> locate_food(const std::vector<Cluster>& clusters,
                                int snake_index,
                                const MetricGrid& metrics) {
  const Cluster* best = nullptr;
  float best_score = 0.0f;
  for (std::size_t i = 0; i < clusters.size(); ++i) {
    if (static_cast<int>(i) == snake_index) {
      continue;
    }
    const Cluster& cluster = clusters[i];
    const float score = cluster_brightness(cluster, metrics);
    if (!best) {
      best = &cluster;
      best_score = score;
      continue;
    }
    if (std::fabs(score - best_score) > kBrightnessEps) {
      if (score > best_score) {
        best = &cluster;
        best_score = score;
      }
    } else if (cluster.size() < best->size()) {
      best = &cluster;
      best_score = score;
    }
  }

  if (!best || best->empty()) {
    return std::nullopt;
  }

  Cell food = best->cells.front();
  float food_value = metrics.at(food).value;
  for (const auto& c : best->cells) {
    const float v = metrics.at(c).value;
    if (v > food_value) {
      food = c;
      food_value = v;
    }
  }
  return food;
}

}  // namespace snakebot
