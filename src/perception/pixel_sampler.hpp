#pragma once

#include <cstdint>
#include <vector>

#include "common/types.hpp"

namespace snakebot {

// Buffer RGBA de solo lectura, 4 bytes por pixel, filas contiguas.
struct FrameView {
  const std::uint8_t* data = nullptr;
  int width = 0;
  int height = 0;

  [[nodiscard]] bool empty() const { return data == nullptr || width <= 0 || height <= 0; }
};

struct Metric {
  float r = 0.0f;
  float g = 0.0f;
  float b = 0.0f;
  float a = 0.0f;
  float value = 0.0f;  // luma
  bool bright = false;
};

class MetricGrid {
 public:
  explicit MetricGrid(int grid) : grid_(grid), cells_(static_cast<std::size_t>(grid * grid)) {}

  [[nodiscard]] int grid() const { return grid_; }
  [[nodiscard]] bool inside(const Cell& c) const {
    return c.x >= 0 && c.y >= 0 && c.x < grid_ && c.y < grid_;
  }

  Metric& at(int x, int y) { return cells_[static_cast<std::size_t>(y * grid_ + x)]; }
  [[nodiscard]] const Metric& at(int x, int y) const {
    return cells_[static_cast<std::size_t>(y * grid_ + x)];
  }
  [[nodiscard]] const Metric& at(const Cell& c) const { return at(c.x, c.y); }

  [[nodiscard]] std::size_t bright_count() const;

 private:
  int grid_ = 0;
  std::vector<Metric> cells_;
};

float luma(float r, float g, float b);

// Promedia 4 sub-posiciones (35%/65% en cada eje) de la celda; evita bordes y lineas de rejilla.
Metric sample_cell(const FrameView& frame, float cell_size, int cell_x, int cell_y);

MetricGrid sample_grid(const FrameView& frame,
                       int grid,
                       float value_threshold,
                       float alpha_threshold);

}  // namespace snakebot
