#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <unordered_set>
#include <vector>

#include "common/config.hpp"
#include "env/canvas_renderer.hpp"
#include "env/snake_env.hpp"
#include "perception/board_analyzer.hpp"
#include "perception/clusters.hpp"
#include "perception/food_locator.hpp"
#include "perception/pixel_sampler.hpp"
#include "perception/snake_identifier.hpp"
#include "perception/snake_reconstructor.hpp"

using namespace snakebot;

namespace {

// '#' = celda brillante (200), cualquier otro caracter = oscura.
MetricGrid grid_from(const std::vector<std::string>& rows, int grid = 28) {
  MetricGrid metrics(grid);
  for (std::size_t y = 0; y < rows.size(); ++y) {
    for (std::size_t x = 0; x < rows[y].size(); ++x) {
      if (rows[y][x] == '#') {
        Metric& m = metrics.at(static_cast<int>(x), static_cast<int>(y));
        m.value = 200.0f;
        m.a = 255.0f;
        m.bright = true;
      }
    }
  }
  return metrics;
}

void set_bright(MetricGrid& metrics, const Cell& c, float value) {
  Metric& m = metrics.at(c.x, c.y);
  m.value = value;
  m.a = 255.0f;
  m.bright = true;
}

Cluster cluster_of(const std::vector<Cell>& cells) {
  Cluster c;
  for (const auto& cell : cells) {
    c.add(cell);
  }
  return c;
}

std::size_t total_cells(const std::vector<Cluster>& clusters) {
  std::size_t n = 0;
  for (const auto& c : clusters) {
    n += c.size();
  }
  return n;
}

}  // namespace

int main() {
  const BotConfig cfg;

  {
    // Color uniforme: la metrica es el promedio exacto y la luma del color.
    std::vector<std::uint8_t> rgba(40 * 40 * 4);
    for (std::size_t i = 0; i < rgba.size(); i += 4) {
      rgba[i] = 100;
      rgba[i + 1] = 150;
      rgba[i + 2] = 50;
      rgba[i + 3] = 255;
    }
    const Metric m = sample_cell({rgba.data(), 40, 40}, 20.0f, 1, 1);
    assert(std::fabs(m.r - 100.0f) < 1e-3f);
    assert(std::fabs(m.a - 255.0f) < 1e-3f);
    assert(std::fabs(m.value - 132.15f) < 0.01f);

    // Coordenadas fuera del buffer se recortan al borde.
    const Metric edge = sample_cell({rgba.data(), 40, 40}, 20.0f, 5, 5);
    assert(std::fabs(edge.g - 150.0f) < 1e-3f);
  }

  {
    // Lineas de rejilla brillantes en los bordes de celda no contaminan el muestreo.
    std::vector<std::uint8_t> rgba(560 * 560 * 4, 0);
    for (int y = 0; y < 560; ++y) {
      for (int x = 0; x < 560; ++x) {
        if (x % 20 == 0 || y % 20 == 0) {
          const std::size_t idx = (static_cast<std::size_t>(y) * 560 + x) * 4;
          rgba[idx] = rgba[idx + 1] = rgba[idx + 2] = rgba[idx + 3] = 255;
        }
      }
    }
    assert(sample_grid({rgba.data(), 560, 560}, 28, 32.0f, 20.0f).bright_count() == 0);
  }

  {
    // Dos regiones disjuntas -> dos clusters.
    const MetricGrid metrics = grid_from({
        "##..##",
        "##..##",
    });
    const auto clusters = build_clusters(metrics);
    assert(clusters.size() == 2);
    assert(clusters[0].size() == 4 && clusters[1].size() == 4);
    assert(total_cells(clusters) == metrics.bright_count());
  }

  {
    // Un cuello de botella de una celda sigue siendo un solo cluster.
    const MetricGrid metrics = grid_from({
        "##.##",
        "#####",
    });
    const auto clusters = build_clusters(metrics);
    assert(clusters.size() == 1);
    assert(clusters[0].size() == 9);
  }

  {
    // Contacto solo en diagonal no conecta.
    const MetricGrid metrics = grid_from({
        "#.",
        ".#",
    });
    assert(build_clusters(metrics).size() == 2);
    assert(build_clusters(MetricGrid(28)).empty());
  }

  {
    // Identificacion por solapamiento con la serpiente anterior.
    MetricGrid metrics(28);
    set_bright(metrics, {0, 0}, 200.0f);
    set_bright(metrics, {1, 0}, 200.0f);
    set_bright(metrics, {5, 5}, 200.0f);
    set_bright(metrics, {6, 5}, 200.0f);
    set_bright(metrics, {7, 5}, 200.0f);
    const auto clusters = build_clusters(metrics);
    assert(clusters.size() == 2);
    const Cell start{14, 14};

    std::unordered_set<CellKey> prev{cell_key({6, 5}), cell_key({7, 5})};
    assert(identify_snake_cluster(clusters, prev, start) == 1);

    // Empate de solapamiento: gana el primero en orden de recorrido.
    std::unordered_set<CellKey> tie{cell_key({0, 0}), cell_key({5, 5})};
    assert(identify_snake_cluster(clusters, tie, start) == 0);

    // Sin serpiente previa y nada en el centro: el mas grande.
    assert(identify_snake_cluster(clusters, {}, start) == 1);
    assert(identify_snake_cluster({}, prev, start) == -1);
  }

  {
    // Sin serpiente previa gana el cluster del centro aunque sea menor.
    MetricGrid metrics(28);
    for (int x = 0; x < 5; ++x) {
      set_bright(metrics, {x, 2}, 200.0f);
    }
    set_bright(metrics, {14, 14}, 200.0f);
    const auto clusters = build_clusters(metrics);
    assert(identify_snake_cluster(clusters, {}, {14, 14}) == 1);
  }

  {
    // score 5 -> longitud 6; linea de 9 celdas que se apaga hacia la cola.
    MetricGrid metrics(28);
    for (int i = 0; i < 9; ++i) {
      set_bright(metrics, {14 - i, 14}, 200.0f - 10.0f * static_cast<float>(i));
    }
    const auto clusters = build_clusters(metrics);
    assert(clusters.size() == 1);

    SnakeReconstructor rec(cfg);
    const int expected = 5 + 1;
    const Cluster refined = rec.refine(clusters[0], metrics, expected);
    assert(refined.size() <= 9);
    assert(refined.size() == 6);
    assert(refined.contains({14, 14}) && refined.contains({9, 14}));
    assert(!refined.contains({8, 14}));

    SnakeState snake;
    assert(rec.reconstruct(refined, metrics, expected, TrackingHints{}, snake) == ReconstructStatus::kOk);
    assert(snake.body.size() == 6);
    assert(snake.head == (Cell{14, 14}));
    assert(snake.tail == (Cell{9, 14}));
    assert(is_valid_body(snake.body));
  }

  {
    // Celdas de rango < L se conservan aunque esten por debajo del corte.
    MetricGrid metrics(28);
    set_bright(metrics, {3, 3}, 200.0f);
    set_bright(metrics, {4, 3}, 40.0f);
    set_bright(metrics, {5, 3}, 35.0f);
    const auto clusters = build_clusters(metrics);
    SnakeReconstructor rec(cfg);
    assert(rec.refine(clusters[0], metrics, 3).size() == 3);
    assert(rec.refine(clusters[0], metrics, 1).size() == 1);
  }

  {
    // Cola apagada: se rellena siguiendo el cuerpo anterior.
    const std::vector<Cell> prev{{10, 5}, {9, 5}, {8, 5}, {7, 5}, {6, 5}, {5, 5}};
    const Cluster seen = cluster_of({{11, 5}, {10, 5}, {9, 5}, {8, 5}});
    TrackingHints hints;
    hints.expected_head = Cell{11, 5};
    hints.prev_head = Cell{10, 5};
    hints.prev_body = &prev;

    SnakeReconstructor rec(cfg);
    SnakeState snake;
    assert(rec.reconstruct(seen, MetricGrid(28), 6, hints, snake) == ReconstructStatus::kOk);
    const std::vector<Cell> want{{11, 5}, {10, 5}, {9, 5}, {8, 5}, {7, 5}, {6, 5}};
    assert(snake.body.size() == want.size());
    for (std::size_t i = 0; i < want.size(); ++i) {
      assert(snake.body[i] == want[i]);
    }
  }

  {
    // Demasiado corta y sin historia: fallo del tick.
    SnakeReconstructor rec(cfg);
    SnakeState snake;
    const Cluster seen = cluster_of({{3, 3}, {4, 3}});
    assert(rec.reconstruct(seen, MetricGrid(28), 4, TrackingHints{}, snake) == ReconstructStatus::kTooShort);
    assert(rec.reconstruct(Cluster{}, MetricGrid(28), 1, TrackingHints{}, snake) ==
           ReconstructStatus::kEmptyCluster);
  }

  {
    // Cabeza nueva adyacente a la cabeza anterior.
    SnakeReconstructor rec(cfg);
    SnakeState snake;
    TrackingHints hints;
    hints.prev_head = Cell{7, 7};
    const Cluster seen = cluster_of({{7, 7}, {7, 6}});
    assert(rec.reconstruct(seen, MetricGrid(28), 2, hints, snake) == ReconstructStatus::kOk);
    assert(snake.head == (Cell{7, 6}));
    assert(snake.tail == (Cell{7, 7}));
  }

  {
    // El juego aun no avanzo tras enviar la tecla: la cabeza sigue siendo la
    // misma aunque el cuello sea la unica celda vecina de la cabeza anterior.
    MetricGrid metrics(28);
    set_bright(metrics, {13, 18}, 218.0f);
    set_bright(metrics, {13, 17}, 152.0f);
    const std::vector<Cell> prev{{13, 18}, {13, 17}};
    TrackingHints hints;
    hints.expected_head = Cell{13, 19};
    hints.prev_head = Cell{13, 18};
    hints.prev_body = &prev;

    SnakeReconstructor rec(cfg);
    SnakeState snake;
    const Cluster seen = cluster_of({{13, 17}, {13, 18}});
    assert(rec.reconstruct(seen, metrics, 2, hints, snake) == ReconstructStatus::kOk);
    assert(snake.head == (Cell{13, 18}));
    assert(snake.tail == (Cell{13, 17}));

    // Igual con 3 celdas: antes salia invertido y fallaba el relleno.
    set_bright(metrics, {13, 16}, 140.0f);
    const std::vector<Cell> prev3{{13, 18}, {13, 17}, {13, 16}};
    hints.prev_body = &prev3;
    const Cluster seen3 = cluster_of({{13, 16}, {13, 17}, {13, 18}});
    assert(rec.reconstruct(seen3, metrics, 3, hints, snake) == ReconstructStatus::kOk);
    assert(snake.body.size() == 3);
    for (std::size_t i = 0; i < prev3.size(); ++i) {
      assert(snake.body[i] == prev3[i]);
    }
  }

  {
    // Desincronizado: el juego giro hacia arriba y no a la derecha. El cuello
    // tambien es vecino de la cabeza anterior pero no puede ser la cabeza.
    const std::vector<Cell> prev{{5, 5}, {4, 5}, {3, 5}};
    TrackingHints hints;
    hints.expected_head = Cell{6, 5};
    hints.prev_head = Cell{5, 5};
    hints.prev_body = &prev;
    SnakeReconstructor rec(cfg);
    SnakeState snake;
    const Cluster seen = cluster_of({{4, 5}, {5, 5}, {5, 4}});
    assert(rec.reconstruct(seen, MetricGrid(28), 3, hints, snake) == ReconstructStatus::kOk);
    assert(snake.head == (Cell{5, 4}));
    assert(snake.tail == (Cell{4, 5}));
  }

  {
    // Persiguiendo la cola en un cuadrado 2x2: el conjunto de celdas no cambia,
    // la cabeza nueva es la mas brillante y el orden sigue al cuerpo anterior.
    MetricGrid metrics(28);
    set_bright(metrics, {17, 24}, 218.0f);
    set_bright(metrics, {17, 23}, 190.0f);
    set_bright(metrics, {18, 23}, 170.0f);
    set_bright(metrics, {18, 24}, 152.0f);
    const std::vector<Cell> prev{{17, 23}, {18, 23}, {18, 24}, {17, 24}};
    TrackingHints hints;
    hints.expected_head = Cell{17, 24};
    hints.prev_head = Cell{17, 23};
    hints.prev_body = &prev;
    SnakeReconstructor rec(cfg);
    SnakeState snake;
    const Cluster seen = cluster_of({{17, 23}, {18, 23}, {17, 24}, {18, 24}});
    assert(rec.reconstruct(seen, metrics, 4, hints, snake) == ReconstructStatus::kOk);
    const std::vector<Cell> want{{17, 24}, {17, 23}, {18, 23}, {18, 24}};
    for (std::size_t i = 0; i < want.size(); ++i) {
      assert(snake.body[i] == want[i]);
    }

    // Mismo frame antes de que el juego avance: la cabeza sigue en (17,23).
    MetricGrid before(28);
    set_bright(before, {17, 23}, 218.0f);
    set_bright(before, {18, 23}, 190.0f);
    set_bright(before, {18, 24}, 170.0f);
    set_bright(before, {17, 24}, 152.0f);
    assert(rec.reconstruct(seen, before, 4, hints, snake) == ReconstructStatus::kOk);
    for (std::size_t i = 0; i < prev.size(); ++i) {
      assert(snake.body[i] == prev[i]);
    }
  }

  {
    // Comida: mayor brillo medio, y en empate el cluster mas pequeno.
    MetricGrid metrics(28);
    set_bright(metrics, {14, 14}, 220.0f);
    set_bright(metrics, {2, 2}, 60.0f);
    set_bright(metrics, {3, 2}, 60.0f);
    set_bright(metrics, {4, 2}, 60.0f);
    set_bright(metrics, {20, 20}, 150.0f);
    const auto clusters = build_clusters(metrics);
    const int snake = identify_snake_cluster(clusters, {}, {14, 14});
    const auto food = locate_food(clusters, snake, metrics);
    assert(food && *food == (Cell{20, 20}));

    MetricGrid tie(28);
    set_bright(tie, {1, 1}, 100.0f);
    set_bright(tie, {2, 1}, 100.0f);
    set_bright(tie, {9, 9}, 100.0f);
    const auto tie_clusters = build_clusters(tie);
    const auto tie_food = locate_food(tie_clusters, -1, tie);
    assert(tie_food && *tie_food == (Cell{9, 9}));

    // Dentro del cluster elegido, la celda mas brillante.
    MetricGrid blob(28);
    set_bright(blob, {5, 5}, 90.0f);
    set_bright(blob, {6, 5}, 130.0f);
    const auto blob_clusters = build_clusters(blob);
    const auto blob_food = locate_food(blob_clusters, -1, blob);
    assert(blob_food && *blob_food == (Cell{6, 5}));

    assert(!locate_food(blob_clusters, 0, blob));
  }

  {
    // Pipeline completo sobre un frame renderizado.
    SnakeEnv env(28, 1000, 5);
    env.set_food({15, 14});
    env.queue_direction(Direction::kRight);
    StepResult st = env.step();
    assert(st.food_eaten);
    env.set_food({16, 14});
    st = env.step();
    assert(st.food_eaten);
    env.set_food({3, 3});

    CanvasRenderer renderer(28, 560);
    std::vector<std::uint8_t> rgba;
    renderer.render(env, rgba);

    BoardAnalyzer analyzer(cfg);
    TrackingHints hints;
    hints.expected_head = Cell{16, 14};
    const PerceptionResult r =
        analyzer.analyze({rgba.data(), 560, 560}, env.score() + 1, {}, hints);
    assert(r.ok);
    assert(r.observation.body.size() == 3);
    assert(r.observation.head == (Cell{16, 14}));
    assert(r.observation.tail == (Cell{14, 14}));
    assert(r.observation.food && *r.observation.food == (Cell{3, 3}));

    // Un paso mas y la cola desaparece del frame: se recupera del cuerpo anterior.
    const std::vector<Cell> prev = r.observation.body;
    st = env.step();
    assert(!st.done && !st.food_eaten);
    renderer.render(env, rgba);
    for (int y = 14 * 20; y < 15 * 20; ++y) {
      for (int x = 15 * 20; x < 16 * 20; ++x) {
        const std::size_t idx = (static_cast<std::size_t>(y) * 560 + x) * 4;
        rgba[idx] = rgba[idx + 1] = rgba[idx + 2] = 0;
      }
    }
    TrackingHints next;
    next.expected_head = Cell{17, 14};
    next.prev_head = Cell{16, 14};
    next.prev_body = &prev;
    std::unordered_set<CellKey> prev_keys;
    for (const auto& c : prev) {
      prev_keys.insert(cell_key(c));
    }
    const PerceptionResult r2 = analyzer.analyze({rgba.data(), 560, 560}, 3, prev_keys, next);
    assert(r2.ok);
    assert(r2.observation.body.size() == 3);
    assert(r2.observation.head == (Cell{17, 14}));
    assert(r2.observation.tail == (Cell{15, 14}));

    std::vector<std::uint8_t> blank;
    renderer.render_empty(blank);
    const PerceptionResult none = analyzer.analyze({blank.data(), 560, 560}, 1, {}, {});
    assert(!none.ok && none.failure == PerceptionFailure::kNoBrightCells);
    assert(analyzer.analyze(FrameView{}, 1, {}, {}).failure == PerceptionFailure::kEmptyFrame);
  }

  std::cout << "tests_perception: OK\n";
  return 0;
}
