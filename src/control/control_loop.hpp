#pragma once

#include <deque>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "common/config.hpp"
#include "common/types.hpp"
#include "control/game_surface.hpp"
#include "perception/board_analyzer.hpp"
#include "planner/path_planner.hpp"

namespace snakebot {

struct ControlStats {
  long long ticks = 0;
  long long perception_failures = 0;
  long long extrapolations = 0;
  long long resyncs = 0;
  long long replans = 0;
  long long dispatched = 0;
  long long refused = 0;
  long long restarts = 0;
};

// Texto del marcador -> entero en [0, max_score]. Lo que no sea un numero
// cuenta como 0.
int parse_score(const std::string& text, int max_score);

// Un tick por frame del host: percepcion (o extrapolacion), reconciliacion con
// el comando pendiente, planificacion cuando no quedan movimientos y como
// mucho una tecla por tick. Es el unico componente con estado entre ticks.
//
// El FrameHost no debe ejecutar callbacks pedidos por un loop ya destruido.
class ControlLoop {
 public:
  ControlLoop(const BotConfig& cfg, GameSurface& surface, ActionSink& sink, FrameHost& host);

  void start();
  void stop();
  [[nodiscard]] bool running() const { return running_; }

  // Trabajo de un frame. Las excepciones salen de aqui; start() las convierte en parada.
  void tick();

  [[nodiscard]] const std::deque<Move>& plan() const { return plan_; }
  [[nodiscard]] bool command_pending() const { return command_pending_; }
  [[nodiscard]] const std::optional<Cell>& expected_head() const { return expected_head_; }
  [[nodiscard]] const std::optional<Cell>& prev_head() const { return prev_head_; }
  [[nodiscard]] const std::optional<Cell>& prev_food() const { return prev_food_; }
  [[nodiscard]] const std::vector<Cell>& prev_snake() const { return prev_snake_; }
  [[nodiscard]] Heading heading() const { return heading_; }
  [[nodiscard]] const ControlStats& stats() const { return stats_; }
  [[nodiscard]] const std::string& last_error() const { return last_error_; }

 private:
  const BotConfig cfg_;
  GameSurface& surface_;
  ActionSink& sink_;
  FrameHost& host_;
  BoardAnalyzer analyzer_;
  PathPlanner planner_;

  bool running_ = false;
  std::string last_error_;

  std::unordered_set<CellKey> prev_snake_keys_;
  std::vector<Cell> prev_snake_;
  std::optional<Cell> prev_head_;
  std::optional<Cell> expected_head_;
  std::optional<Cell> prev_food_;
  bool command_pending_ = false;
  std::deque<Move> plan_;
  int last_score_ = 0;
  Heading heading_;
  std::size_t last_body_length_ = 1;

  ControlStats stats_;

  void schedule_next();
  void run_frame();

  void ensure_game_running();
  void reset_tracking();
  [[nodiscard]] int read_score() const;

  [[nodiscard]] std::unordered_set<CellKey> identity_keys() const;
  void extrapolate(bool grew, Observation& out);
  void update_heading(const Observation& obs);
  [[nodiscard]] bool should_avoid_wall(const Observation& obs) const;
  void reconcile(const Observation& obs);
  bool send_direction(const Move& move);
};

}  // namespace snakebot
