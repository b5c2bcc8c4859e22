#include "perception/board_analyzer.hpp"

#include <algorithm>

#include "perception/clusters.hpp"
#include "perception/food_locator.hpp"
#include "perception/snake_identifier.hpp"

namespace snakebot {

const char* perception_failure_name(PerceptionFailure failure) {
  switch (failure) {
    case PerceptionFailure::kNone:
      return "none";
    case PerceptionFailure::kEmptyFrame:
      return "empty_frame";
    case PerceptionFailure::kNoBrightCells:
      return "no_bright_cells";
    case PerceptionFailure::kNoClusters:
      return "no_clusters";
    case PerceptionFailure::kNoSnakeCluster:
      return "no_snake_cluster";
    case PerceptionFailure::kWalkLoop:
      return "walk_loop";
    case PerceptionFailure::kTooShort:
    default:
      return "too_short";
  }
}

BoardAnalyzer::BoardAnalyzer(const BotConfig& cfg)
    : grid_(cfg.grid),
      value_threshold_(cfg.value_threshold),
      alpha_threshold_(cfg.alpha_threshold),
      reconstructor_(cfg) {}

PerceptionResult BoardAnalyzer::analyze(const FrameView& frame,
                                        int expected_length,
                                        const std::unordered_set<CellKey>& prev_snake_keys,
                                        const TrackingHints& hints) const {
  if (frame.empty()) {
    return PerceptionResult::fail(PerceptionFailure::kEmptyFrame);
  }
  const int expected = std::max(1, expected_length);

  const MetricGrid metrics = sample_grid(frame, grid_, value_threshold_, alpha_threshold_);
  if (metrics.bright_count() == 0) {
    return PerceptionResult::fail(PerceptionFailure::kNoBrightCells);
  }

  const std::vector<Cluster> clusters = build_clusters(metrics);
  if (clusters.empty()) {
    return PerceptionResult::fail(PerceptionFailure::kNoClusters);
  }

  const int snake_index = identify_snake_cluster(clusters, prev_snake_keys, start_cell());
  if (snake_index < 0) {
    return PerceptionResult::fail(PerceptionFailure::kNoSnakeCluster);
  }

  const Cluster refined =
      reconstructor_.refine(clusters[static_cast<std::size_t>(snake_index)], metrics, expected);
  SnakeState snake;
  const ReconstructStatus status =
      reconstructor_.reconstruct(refined, metrics, expected, hints, snake);
  switch (status) {
    case ReconstructStatus::kOk:
      break;
    case ReconstructStatus::kWalkLoop:
      return PerceptionResult::fail(PerceptionFailure::kWalkLoop);
    case ReconstructStatus::kEmptyCluster:
      return PerceptionResult::fail(PerceptionFailure::kNoSnakeCluster);
    case ReconstructStatus::kTooShort:
    case ReconstructStatus::kBrokenPadding:
    default:
      return PerceptionResult::fail(PerceptionFailure::kTooShort);
  }

  PerceptionResult result;
  result.ok = true;
  result.observation.head = snake.head;
  result.observation.tail = snake.tail;
  result.observation.body = std::move(snake.body);
  result.observation.food = locate_food(clusters, snake_index, metrics);
  return result;
}

}  // namespace snakebot
