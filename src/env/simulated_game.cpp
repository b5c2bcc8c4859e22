#include "env/simulated_game.hpp"

#include <algorithm>

namespace snakebot {

SimulatedGame::SimulatedGame(const BotConfig& cfg, uint32_t seed)
    : frames_per_step_(std::max(1, cfg.frames_per_step)),
      seed_(seed),
      env_(cfg.grid, cfg.eval_max_steps, seed),
      renderer_(cfg.grid, cfg.canvas_size) {
  renderer_.render_empty(pixels_);
}

FrameView SimulatedGame::frame() const {
  return {pixels_.data(), renderer_.width(), renderer_.height()};
}

std::string SimulatedGame::score_text() const {
  return phase_ == Phase::kStart ? "0" : std::to_string(env_.score());
}

void SimulatedGame::begin_game() {
  env_.reset(seed_ + static_cast<uint32_t>(games_started_) * 97u);
  ++games_started_;
  phase_ = Phase::kPlaying;
  redraw();
}

void SimulatedGame::press_start() {
  if (phase_ == Phase::kStart) {
    begin_game();
  }
}

void SimulatedGame::press_play_again() {
  if (phase_ == Phase::kGameOver) {
    begin_game();
  }
}

void SimulatedGame::emit(Direction dir) {
  emitted_.push_back(dir);
  if (phase_ == Phase::kPlaying) {
    env_.queue_direction(dir);
  }
}

void SimulatedGame::advance_frame() {
  ++frames_;
  if (phase_ != Phase::kPlaying || frames_ % frames_per_step_ != 0) {
    return;
  }
  const StepResult r = env_.step();
  best_score_ = std::max(best_score_, env_.score());
  if (r.done) {
    phase_ = Phase::kGameOver;
    final_scores_.push_back(env_.score());
    final_steps_.push_back(env_.steps());
  }
  redraw();
}

void SimulatedGame::place_food(const Cell& c) {
  env_.set_food(c);
  redraw();
}

void SimulatedGame::redraw() { renderer_.render(env_, pixels_); }

}  // namespace snakebot
