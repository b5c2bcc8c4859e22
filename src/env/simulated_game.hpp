#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "common/config.hpp"
#include "control/game_surface.hpp"
#include "env/canvas_renderer.hpp"
#include "env/snake_env.hpp"

namespace snakebot {

// Juego simulado detras de las mismas interfaces que el juego real: pixeles,
// marcador en texto, overlays de inicio/game over y teclas. Avanza un paso
// cada `frames_per_step` frames del host.
class SimulatedGame : public GameSurface, public ActionSink {
 public:
  enum class Phase { kStart, kPlaying, kGameOver };

  SimulatedGame(const BotConfig& cfg, uint32_t seed);

  // GameSurface
  [[nodiscard]] bool available() const override { return true; }
  [[nodiscard]] FrameView frame() const override;
  [[nodiscard]] std::string score_text() const override;
  [[nodiscard]] bool is_playing() const override { return phase_ == Phase::kPlaying; }
  [[nodiscard]] bool start_overlay_active() const override { return phase_ == Phase::kStart; }
  [[nodiscard]] bool game_over_active() const override { return phase_ == Phase::kGameOver; }
  void press_start() override;
  void press_play_again() override;

  // ActionSink
  void emit(Direction dir) override;

  void advance_frame();
  void place_food(const Cell& c);

  [[nodiscard]] Phase phase() const { return phase_; }
  [[nodiscard]] const SnakeEnv& env() const { return env_; }
  SnakeEnv& env() { return env_; }
  [[nodiscard]] const std::vector<int>& final_scores() const { return final_scores_; }
  // Pasos de cada partida terminada; env() ya se reinicia al pulsar "jugar otra vez".
  [[nodiscard]] const std::vector<int>& final_steps() const { return final_steps_; }
  [[nodiscard]] const std::vector<Direction>& emitted() const { return emitted_; }
  [[nodiscard]] int best_score() const { return best_score_; }
  [[nodiscard]] long long frames() const { return frames_; }

 private:
  int frames_per_step_;
  uint32_t seed_;
  SnakeEnv env_;
  CanvasRenderer renderer_;
  std::vector<std::uint8_t> pixels_;

  Phase phase_ = Phase::kStart;
  long long frames_ = 0;
  int games_started_ = 0;
  int best_score_ = 0;
  std::vector<int> final_scores_;
  std::vector<int> final_steps_;
  std::vector<Direction> emitted_;

  void begin_game();
  void redraw();
};

}  // namespace snakebot
