#pragma once

#include <optional>
#include <vector>

#include "common/config.hpp"
#include "common/types.hpp"
#include "perception/clusters.hpp"
#include "perception/pixel_sampler.hpp"

namespace snakebot {

struct SnakeState {
  Cell head;
  Cell tail;
  std::vector<Cell> body;  // head -> tail
};

// Lo que se sabe del tick anterior. Todo es opcional (primer tick / reset).
struct TrackingHints {
  std::optional<Cell> expected_head;
  std::optional<Cell> prev_head;
  const std::vector<Cell>* prev_body = nullptr;
};

enum class ReconstructStatus {
  kOk,
  kEmptyCluster,
  kWalkLoop,
  kTooShort,
  kBrokenPadding,
};

const char* reconstruct_status_name(ReconstructStatus status);

// Celdas unicas y consecutivas a distancia Manhattan 1.
bool is_valid_body(const std::vector<Cell>& body);

class SnakeReconstructor {
 public:
  explicit SnakeReconstructor(const BotConfig& cfg);

  // Descarta artefactos tenues: ordena por brillo y conserva como mucho
  // max(L + extra, min(n, 2L)) celdas, las que superan el corte dinamico o
  // estan entre las L primeras (L = longitud esperada).
  [[nodiscard]] Cluster refine(const Cluster& cluster,
                               const MetricGrid& metrics,
                               int expected_length) const;

  // Elige la cabeza, recorre el cluster en un camino simple y lo ajusta a
  // `expected_length` (recorta o rellena con la cola del cuerpo anterior).
  // `metrics` solo se usa para desempatar cabeza y cola cuando el cluster
  // coincide con el cuerpo anterior.
  ReconstructStatus reconstruct(const Cluster& cluster,
                                const MetricGrid& metrics,
                                int expected_length,
                                const TrackingHints& hints,
                                SnakeState& out) const;

  [[nodiscard]] Cell start_cell() const { return {grid_ / 2, grid_ / 2}; }

 private:
  int grid_;
  float value_threshold_;
  int refine_extra_keep_;
  int walk_guard_slack_;

  [[nodiscard]] Cell choose_head(const Cluster& cluster,
                                 const MetricGrid& metrics,
                                 const TrackingHints& hints) const;
  static void pad_from_previous(std::vector<Cell>& body,
                                std::size_t expected_length,
                                const std::vector<Cell>& prev_body);
};

}  // namespace snakebot
