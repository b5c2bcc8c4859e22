#include "perception/snake_identifier.hpp"

namespace snakebot {

int identify_snake_cluster(const std::vector<Cluster>& clusters,
                           const std::unordered_set<CellKey>& prev_snake_keys,
                           const Cell& start_cell) {
  if (clusters.empty()) {
    return -1;
  }

  if (!prev_snake_keys.empty()) {
    int best = -1;
    int best_overlap = -1;
    for (std::size_t i = 0; i < clusters.size(); ++i) {
      int overlap = 0;
      for (const auto& c : clusters[i].cells) {
        overlap += static_cast<int>(prev_snake_keys.count(cell_key(c)));
      }
      if (overlap > best_overlap) {
        best_overlap = overlap;
        best = static_cast<int>(i);
      }
    }
    return best;
  }

  for (std::size_t i = 0; i < clusters.size(); ++i) {
    if (clusters[i].contains(start_cell)) {
      return static_cast<int>(i);
    }
  }

  int largest = 0;
  for (std::size_t i = 1; i < clusters.size(); ++i) {
    if (clusters[i].size() > clusters[static_cast<std::size_t>(largest)].size()) {
      largest = static_cast<int>(i);
    }
  }
  return largest;
}

}  // namespace snakebot
