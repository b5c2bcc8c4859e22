#include <cassert>
#include <iostream>
#include <vector>

#include "env/canvas_renderer.hpp"
#include "env/snake_env.hpp"
#include "perception/pixel_sampler.hpp"

using namespace snakebot;

namespace {

// Come en linea recta hacia la derecha hasta tener `length` celdas.
void grow_right(SnakeEnv& env, std::size_t length) {
  while (env.snake_length() < length) {
    const Cell h = env.snake().front();
    env.set_food({h.x + 1, h.y});
    env.queue_direction(Direction::kRight);
    StepResult st = env.step();
    assert(st.food_eaten);
    assert(!st.done);
  }
}

}  // namespace

int main() {
  {
    SnakeEnv env(28, 1000, 123);
    assert(env.snake_length() == 1);
    assert(env.snake().front() == (Cell{14, 14}));
    assert(env.score() == 0);
    assert(env.direction() == Direction::kRight);
  }

  {
    SnakeEnv env(28, 1000, 123);
    grow_right(env, 2);
    auto head0 = env.snake().front();
    env.queue_direction(Direction::kLeft);  // LEFT es reversa directa si va RIGHT
    StepResult st = env.step();
    auto head1 = env.snake().front();
    assert(!st.done);
    assert(head1.x == head0.x + 1);  // Debe seguir RIGHT
  }

  {
    SnakeEnv env(28, 1000, 123);
    env.queue_direction(Direction::kLeft);  // con 1 celda si puede girar en redondo
    env.step();
    assert(env.snake().front() == (Cell{13, 14}));
  }

  {
    SnakeEnv env(28, 1000, 123);
    grow_right(env, 2);
    assert(env.score() == 1);
    assert(env.snake_length() == 2);
  }

  {
    SnakeEnv env(28, 1000, 123);
    StepResult st{};
    for (int i = 0; i < 40; ++i) {
      st = env.step();  // RIGHT hasta chocar
      if (st.done) break;
    }
    assert(st.done);
    assert(!st.won);
    assert(env.is_done());
  }

  {
    SnakeEnv env(28, 1000, 123);
    grow_right(env, 5);  // cuerpo (18,14) .. (14,14)
    env.queue_direction(Direction::kDown);
    StepResult down = env.step();
    assert(!down.done);
    env.queue_direction(Direction::kLeft);
    StepResult left = env.step();
    assert(!left.done);
    env.queue_direction(Direction::kUp);
    StepResult st = env.step();  // (17,14) sigue ocupado
    assert(st.done);
  }

  {
    // Entrar en la celda que deja la cola no es colision.
    SnakeEnv env(28, 1000, 123);
    grow_right(env, 4);  // cuerpo (17,14) .. (14,14)
    env.set_food({0, 0});
    for (Direction d : {Direction::kDown, Direction::kLeft, Direction::kUp}) {
      env.queue_direction(d);
      const StepResult st = env.step();
      assert(!st.done && !st.food_eaten);
    }
    assert(env.snake().front() == (Cell{16, 14}));
    assert(env.snake_length() == 4);
  }

  {
    SnakeEnv env(28, 3, 123);
    env.queue_direction(Direction::kUp);
    env.step();
    env.step();
    StepResult st = env.step();
    assert(st.done);
    assert(env.steps() == 3);
  }

  {
    SnakeEnv env(28, 1000, 123);
    grow_right(env, 3);
    env.set_food({2, 2});
    CanvasRenderer renderer(28, 560);
    std::vector<std::uint8_t> rgba;
    renderer.render(env, rgba);
    assert(rgba.size() == static_cast<std::size_t>(560 * 560 * 4));

    const FrameView frame{rgba.data(), 560, 560};
    const MetricGrid metrics = sample_grid(frame, 28, 32.0f, 20.0f);
    assert(metrics.bright_count() == 4);
    assert(metrics.at(2, 2).bright);
    const auto& body = env.snake();
    assert(metrics.at(body[0]).value > metrics.at(body[1]).value);
    assert(metrics.at(body[1]).value > metrics.at(body[2]).value);
    // La cola sigue siendo mas brillante que la comida.
    assert(metrics.at(body[2]).value > metrics.at(2, 2).value);

    std::vector<std::uint8_t> empty;
    renderer.render_empty(empty);
    assert(sample_grid({empty.data(), 560, 560}, 28, 32.0f, 20.0f).bright_count() == 0);
  }

  std::cout << "tests_env: OK\n";
  return 0;
}
