#pragma once

#include <optional>
#include <vector>

#include "common/types.hpp"
#include "perception/clusters.hpp"
#include "perception/pixel_sampler.hpp"

namespace snakebot {

float cluster_brightness(const Cluster& cluster, const MetricGrid& metrics);

// Entre los clusters distintos de `snake_index`: mayor brillo medio (empate:
// menos celdas), y dentro de el la celda mas brillante.
std::optional<Cell> locate_food(const std::vector<Cluster>& clusters,
                                int snake_index,
                                const MetricGrid& metrics);

}  // namespace snakebot
