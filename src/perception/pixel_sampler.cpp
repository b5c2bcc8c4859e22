#include "perception/pixel_sampler.hpp"

#include <algorithm>
#include <array>
#include <cmath>

namespace snakebot {
namespace {

constexpr std::array<std::array<float, 2>, 4> kSampleOffsets{{
    {0.35f, 0.35f},
    {0.65f, 0.35f},
    {0.35f, 0.65f},
    {0.65f, 0.65f},
}};

int clamp_px(double v, int limit) {
  const long px = std::lround(v);
  return static_cast<int>(std::min<long>(limit - 1, std::max<long>(0, px)));
}

}  // namespace

std::size_t MetricGrid::bright_count() const {
  return static_cast<std::size_t>(
      std::count_if(cells_.begin(), cells_.end(), [](const Metric& m) { return m.bright; }));
}

float luma(float r, float g, float b) { return 0.2126f * r + 0.7152f * g + 0.0722f * b; }

Metric sample_cell(const FrameView& frame, float cell_size, int cell_x, int cell_y) {
  Metric m;
  for (const auto& off : kSampleOffsets) {
    const int px = clamp_px((cell_x + off[0]) * static_cast<double>(cell_size), frame.width);
    const int py = clamp_px((cell_y + off[1]) * static_cast<double>(cell_size), frame.height);
    const std::size_t idx = (static_cast<std::size_t>(py) * frame.width + px) * 4;
    m.r += frame.data[idx];
    m.g += frame.data[idx + 1];
    m.b += frame.data[idx + 2];
    m.a += frame.data[idx + 3];
  }
  const float n = static_cast<float>(kSampleOffsets.size());
  m.r /= n;
  m.g /= n;
  m.b /= n;
  m.a /= n;
  m.value = luma(m.r, m.g, m.b);
  return m;
}

MetricGrid sample_grid(const FrameView& frame,
                       int grid,
                       float value_threshold,
                       float alpha_threshold) {
  MetricGrid metrics(grid);
  const float cell_size = static_cast<float>(frame.width) / static_cast<float>(grid);
  for (int y = 0; y < grid; ++y) {
    for (int x = 0; x < grid; ++x) {
      Metric m = sample_cell(frame, cell_size, x, y);
      m.bright = m.value > value_threshold && m.a > alpha_threshold;
      metrics.at(x, y) = m;
    }
  }
  return metrics;
}

}  // namespace snakebot
