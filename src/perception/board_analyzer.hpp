#pragma once

#include <optional>
#include <unordered_set>
#include <vector>

#include "common/config.hpp"
#include "common/types.hpp"
#include "perception/pixel_sampler.hpp"
#include "perception/snake_reconstructor.hpp"

namespace snakebot {

enum class PerceptionFailure {
  kNone,
  kEmptyFrame,
  kNoBrightCells,
  kNoClusters,
  kNoSnakeCluster,
  kWalkLoop,
  kTooShort,
};

const char* perception_failure_name(PerceptionFailure failure);

struct Observation {
  Cell head;
  Cell tail;
  std::vector<Cell> body;  // head -> tail
  std::optional<Cell> food;
};

// Resultado etiquetado: `ok` con `observation`, o `failure` con el motivo.
struct PerceptionResult {
  bool ok = false;
  PerceptionFailure failure = PerceptionFailure::kNone;
  Observation observation;

  static PerceptionResult fail(PerceptionFailure why) {
    PerceptionResult r;
    r.failure = why;
    return r;
  }
};

// Pipeline de percepcion de un tick: muestreo -> clusters -> serpiente ->
// refinado/recorrido -> comida. No guarda estado entre ticks.
class BoardAnalyzer {
 public:
  explicit BoardAnalyzer(const BotConfig& cfg);

  PerceptionResult analyze(const FrameView& frame,
                           int expected_length,
                           const std::unordered_set<CellKey>& prev_snake_keys,
                           const TrackingHints& hints) const;

  [[nodiscard]] Cell start_cell() const { return reconstructor_.start_cell(); }

 private:
  int grid_;
  float value_threshold_;
  float alpha_threshold_;
  SnakeReconstructor reconstructor_;
};

}  // namespace snakebot
