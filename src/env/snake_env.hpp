#pragma once

#include <cstdint>
#include <deque>
#include <random>
#include <vector>

#include "common/types.hpp"

namespace snakebot {

struct StepResult {
  bool done = false;
  bool food_eaten = false;
  bool won = false;
};

// Reglas del juego contra el que juega el bot en evaluacion offline.
// Spawn de 1 celda en el centro mirando a la derecha; score = longitud - 1.
class SnakeEnv {
 public:
  SnakeEnv(int board_size = 28, int max_steps = 5000, uint32_t seed = 42);

  void reset(uint32_t seed);
  void reset();

  // Tecla pulsada entre pasos; gana la ultima. Se aplica en step().
  void queue_direction(Direction dir);
  StepResult step();

  [[nodiscard]] std::vector<Cell> free_cells() const;
  void set_food(const Cell& c);

  [[nodiscard]] int board_size() const { return board_size_; }
  [[nodiscard]] int max_steps() const { return max_steps_; }
  [[nodiscard]] int steps() const { return steps_; }
  [[nodiscard]] int score() const { return static_cast<int>(snake_.size()) - 1; }
  [[nodiscard]] Direction direction() const { return direction_; }
  [[nodiscard]] std::size_t snake_length() const { return snake_.size(); }
  [[nodiscard]] bool is_done() const { return done_; }
  [[nodiscard]] bool is_win() const { return won_; }
  [[nodiscard]] const std::deque<Cell>& snake() const { return snake_; }
  [[nodiscard]] Cell food() const { return food_; }

 private:
  int board_size_ = 28;
  int max_steps_ = 5000;
  int steps_ = 0;
  Direction direction_ = Direction::kRight;
  Direction queued_ = Direction::kRight;

  bool done_ = false;
  bool won_ = false;

  std::deque<Cell> snake_;
  // 1 por celda ocupada por el cuerpo, fila a fila.
  std::vector<std::uint8_t> occupied_;
  Cell food_{};

  std::mt19937 rng_;

  [[nodiscard]] bool is_reverse(Direction dir) const;
  [[nodiscard]] bool in_bounds(const Cell& c) const;
  [[nodiscard]] bool hits_body(const Cell& c) const;
  [[nodiscard]] std::size_t index_of(const Cell& c) const {
    return static_cast<std::size_t>(c.y * board_size_ + c.x);
  }
  void push_head(const Cell& c);
  void pop_tail();
  void spawn_food();
};

}  // namespace snakebot
