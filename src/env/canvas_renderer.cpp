#include "env/canvas_renderer.hpp"

#include <algorithm>

namespace snakebot {
namespace {

Rgb scaled(Rgb c, float f) {
  auto ch = [f](std::uint8_t v) {
    return static_cast<std::uint8_t>(std::min(255.0f, static_cast<float>(v) * f));
  };
  return {ch(c.r), ch(c.g), ch(c.b)};
}

}  // namespace

CanvasRenderer::CanvasRenderer(int grid, int canvas_size)
    : grid_(grid), canvas_size_(canvas_size), cell_px_(std::max(1, canvas_size / grid)) {}

void CanvasRenderer::fill_rect(std::vector<std::uint8_t>& rgba,
                               int x0, int y0, int w, int h, Rgb color) const {
  const int x1 = std::min(canvas_size_, x0 + w);
  const int y1 = std::min(canvas_size_, y0 + h);
  for (int y = std::max(0, y0); y < y1; ++y) {
    for (int x = std::max(0, x0); x < x1; ++x) {
      const std::size_t idx = (static_cast<std::size_t>(y) * canvas_size_ + x) * 4;
      rgba[idx] = color.r;
      rgba[idx + 1] = color.g;
      rgba[idx + 2] = color.b;
      rgba[idx + 3] = 255;
    }
  }
}

void CanvasRenderer::fill_cell(std::vector<std::uint8_t>& rgba,
                               const Cell& c, int inset, Rgb color) const {
  fill_rect(rgba, c.x * cell_px_ + inset, c.y * cell_px_ + inset,
            cell_px_ - 2 * inset, cell_px_ - 2 * inset, color);
}

void CanvasRenderer::render_empty(std::vector<std::uint8_t>& rgba) const {
  rgba.assign(static_cast<std::size_t>(canvas_size_) * canvas_size_ * 4, 0);
  fill_rect(rgba, 0, 0, canvas_size_, canvas_size_, kBackground);
  for (int i = 0; i <= grid_; ++i) {
    fill_rect(rgba, i * cell_px_, 0, 1, canvas_size_, kGridLine);
    fill_rect(rgba, 0, i * cell_px_, canvas_size_, 1, kGridLine);
  }
}

void CanvasRenderer::render(const SnakeEnv& env, std::vector<std::uint8_t>& rgba) const {
  render_empty(rgba);
  fill_cell(rgba, env.food(), 2, kFood);

  const auto& snake = env.snake();
  const std::size_t n = snake.size();
  for (std::size_t i = 0; i < n; ++i) {
    const float t = n > 1 ? static_cast<float>(i) / static_cast<float>(n - 1) : 0.0f;
    fill_cell(rgba, snake[i], 1, scaled(kSnakeHead, 1.0f - (1.0f - kTailFade) * t));
  }
}

}  // namespace snakebot
