#pragma once

#include <cstdint>
#include <vector>

#include "common/types.hpp"
#include "env/snake_env.hpp"

namespace snakebot {

struct Rgb {
  std::uint8_t r = 0;
  std::uint8_t g = 0;
  std::uint8_t b = 0;
};

// Dibuja el tablero en RGBA como lo haria el canvas del juego: fondo oscuro,
// rejilla tenue, serpiente que se apaga de cabeza a cola y comida en otro color.
class CanvasRenderer {
 public:
  CanvasRenderer(int grid, int canvas_size);

  void render(const SnakeEnv& env, std::vector<std::uint8_t>& rgba) const;
  // Solo fondo y rejilla (pantallas de inicio / game over).
  void render_empty(std::vector<std::uint8_t>& rgba) const;

  [[nodiscard]] int width() const { return canvas_size_; }
  [[nodiscard]] int height() const { return canvas_size_; }

  static constexpr Rgb kBackground{14, 16, 22};
  static constexpr Rgb kGridLine{26, 29, 36};
  static constexpr Rgb kSnakeHead{120, 255, 150};
  static constexpr Rgb kFood{255, 70, 70};
  // Factor de brillo de la cola respecto a la cabeza.
  static constexpr float kTailFade = 0.7f;

 private:
  int grid_;
  int canvas_size_;
  int cell_px_;

  void fill_rect(std::vector<std::uint8_t>& rgba, int x0, int y0, int w, int h, Rgb color) const;
  void fill_cell(std::vector<std::uint8_t>& rgba, const Cell& c, int inset, Rgb color) const;
};

}  // namespace snakebot
