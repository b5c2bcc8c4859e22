#include "env/snake_env.hpp"

namespace snakebot {

SnakeEnv::SnakeEnv(int board_size, int max_steps, uint32_t seed)
    : board_size_(board_size), max_steps_(max_steps), rng_(seed) {
  reset(seed);
}

void SnakeEnv::reset(uint32_t seed) {
  rng_.seed(seed);
  reset();
}

void SnakeEnv::reset() {
  done_ = false;
  won_ = false;
  steps_ = 0;
  direction_ = Direction::kRight;
  queued_ = Direction::kRight;

  snake_.clear();
  occupied_.assign(static_cast<std::size_t>(board_size_ * board_size_), 0);
  push_head({board_size_ / 2, board_size_ / 2});

  spawn_food();
}

void SnakeEnv::queue_direction(Direction dir) { queued_ = dir; }

bool SnakeEnv::is_reverse(Direction dir) const {
  const Move& m = move_for(dir);
  const Move& cur = move_for(direction_);
  return m.dx == -cur.dx && m.dy == -cur.dy;
}

bool SnakeEnv::in_bounds(const Cell& c) const {
  return c.x >= 0 && c.y >= 0 && c.x < board_size_ && c.y < board_size_;
}

bool SnakeEnv::hits_body(const Cell& c) const {
  return in_bounds(c) && occupied_[index_of(c)] != 0;
}

void SnakeEnv::push_head(const Cell& c) {
  snake_.push_front(c);
  occupied_[index_of(c)] = 1;
}

void SnakeEnv::pop_tail() {
  occupied_[index_of(snake_.back())] = 0;
  snake_.pop_back();
}

StepResult SnakeEnv::step() {
  StepResult out{};
  if (done_) {
    out.done = true;
    out.won = won_;
    return out;
  }

  // La tecla opuesta se ignora salvo con una sola celda.
  if (snake_.size() == 1 || !is_reverse(queued_)) {
    direction_ = queued_;
  }

  const Cell next = apply_move(snake_.front(), move_for(direction_));
  if (!in_bounds(next)) {
    done_ = true;
    out.done = true;
    return out;
  }

  const bool eats = next == food_;
  // Sin comer, la cola deja su celda en este mismo paso.
  const bool into_tail = !eats && next == snake_.back();
  if (hits_body(next) && !into_tail) {
    done_ = true;
    out.done = true;
    return out;
  }
  if (!eats) {
    pop_tail();
  }
  push_head(next);

  if (eats) {
    out.food_eaten = true;
    spawn_food();
    if (won_) {
      out.done = true;
      out.won = true;
      return out;
    }
  }

  if (++steps_ >= max_steps_) {
    done_ = true;
    out.done = true;
  }
  return out;
}

std::vector<Cell> SnakeEnv::free_cells() const {
  std::vector<Cell> out;
  out.reserve(occupied_.size() - snake_.size());
  for (int y = 0; y < board_size_; ++y) {
    for (int x = 0; x < board_size_; ++x) {
      if (occupied_[static_cast<std::size_t>(y * board_size_ + x)] == 0) {
        out.push_back({x, y});
      }
    }
  }
  return out;
}

void SnakeEnv::set_food(const Cell& c) {
  if (in_bounds(c) && !hits_body(c)) {
    food_ = c;
  }
}

void SnakeEnv::spawn_food() {
  const std::vector<Cell> free = free_cells();
  if (free.empty()) {
    // Tablero lleno: victoria.
    done_ = true;
    won_ = true;
    return;
  }
  std::uniform_int_distribution<std::size_t> pick(0, free.size() - 1);
  food_ = free[pick(rng_)];
}

}  // namespace snakebot
