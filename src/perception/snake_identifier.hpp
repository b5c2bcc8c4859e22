#pragma once

#include <unordered_set>
#include <vector>

#include "common/types.hpp"
#include "perception/clusters.hpp"

namespace snakebot {

// Indice del cluster de la serpiente, o -1 si no hay clusters.
//
// Con serpiente previa: maximo solapamiento con `prev_snake_keys`; en empate
// gana el primero en orden de recorrido. Sin serpiente previa: el cluster que
// contiene `start_cell` (spawn) y, si ninguno, el mas grande.
int identify_snake_cluster(const std::vector<Cluster>& clusters,
                           const std::unordered_set<CellKey>& prev_snake_keys,
                           const Cell& start_cell);

}  // namespace snakebot
