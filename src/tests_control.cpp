#include <cassert>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/config.hpp"
#include "control/bootstrap.hpp"
#include "control/control_loop.hpp"
#include "control/game_surface.hpp"
#include "env/simulated_game.hpp"

using namespace snakebot;

namespace {

// Delega en el juego simulado; permite apagar el frame o hacer que falle.
class FlakySurface : public GameSurface {
 public:
  explicit FlakySurface(SimulatedGame& game) : game_(game) {}

  bool blank = false;
  bool broken = false;

  bool available() const override { return game_.available(); }
  FrameView frame() const override {
    if (broken) {
      throw std::runtime_error("canvas sin contexto 2d");
    }
    return blank ? FrameView{} : game_.frame();
  }
  std::string score_text() const override { return game_.score_text(); }
  bool is_playing() const override { return game_.is_playing(); }
  bool start_overlay_active() const override { return game_.start_overlay_active(); }
  bool game_over_active() const override { return game_.game_over_active(); }
  void press_start() override { game_.press_start(); }
  void press_play_again() override { game_.press_play_again(); }

 private:
  SimulatedGame& game_;
};

// Superficie inerte: ni jugando ni con overlays.
class IdleSurface : public GameSurface {
 public:
  bool ready = false;

  bool available() const override { return ready; }
  FrameView frame() const override { return {}; }
  std::string score_text() const override { return "0"; }
  bool is_playing() const override { return false; }
  bool start_overlay_active() const override { return false; }
  bool game_over_active() const override { return false; }
  void press_start() override {}
  void press_play_again() override {}
};

class RecordingSink : public ActionSink {
 public:
  void emit(Direction dir) override { keys.push_back(dir); }
  std::vector<Direction> keys;
};

BotConfig test_config() {
  BotConfig cfg;
  cfg.frames_per_step = 1;
  return cfg;
}

struct TrackedRun {
  int best_score = 0;
  int mismatches = 0;
  int checked = 0;
  bool running = false;
};

// Partida contra el juego simulado comprobando en cada frame que la cabeza
// seguida por el loop es la del juego.
TrackedRun play_tracked(int frames_per_step, int frames, uint32_t seed) {
  BotConfig cfg;
  cfg.frames_per_step = frames_per_step;
  SimulatedGame game(cfg, seed);
  ManualFrameHost host;
  std::string err;
  auto loop = bootstrap(cfg, game, game, host, err);
  assert(loop);

  TrackedRun run;
  for (int frame = 0; frame < frames && loop->running(); ++frame) {
    game.advance_frame();
    host.run_frame();
    if (game.is_playing() && !loop->prev_snake().empty()) {
      ++run.checked;
      if (loop->prev_snake().front() != game.env().snake().front()) {
        ++run.mismatches;
      }
    }
  }
  assert(loop->last_error().empty());
  run.best_score = game.best_score();
  run.running = loop->running();
  return run;
}

}  // namespace

int main() {
  {
    assert(parse_score("12", 784) == 12);
    assert(parse_score(" 7 \n", 784) == 7);
    assert(parse_score("3.9", 784) == 3);
    assert(parse_score("", 784) == 0);
    assert(parse_score("abc", 784) == 0);
    assert(parse_score("12abc", 784) == 0);
    assert(parse_score("1e12", 784) == 784);
    assert(parse_score("-5", 784) == 0);
  }

  {
    // Pantalla de inicio: el primer tick pulsa start y empieza a jugar.
    const BotConfig cfg = test_config();
    SimulatedGame game(cfg, 11);
    ManualFrameHost host;
    ControlLoop loop(cfg, game, game, host);
    assert(game.start_overlay_active());
    loop.start();
    assert(loop.running());
    const bool ran = host.run_frame();
    assert(ran);
    assert(game.is_playing());
    assert(host.has_pending());
    assert(loop.stats().ticks == 1);
  }

  {
    // Una tecla por movimiento: el comando pendiente bloquea hasta ver la cabeza prevista.
    const BotConfig cfg = test_config();
    SimulatedGame game(cfg, 11);
    game.press_start();
    game.place_food({14, 18});
    ManualFrameHost host;
    ControlLoop loop(cfg, game, game, host);
    loop.start();

    host.run_frame();
    assert(game.emitted().size() == 1);
    assert(game.emitted().back() == Direction::kDown);
    assert(loop.command_pending());
    assert(loop.expected_head() && *loop.expected_head() == (Cell{14, 15}));
    assert(loop.plan().size() == 3);

    // Sin avanzar el juego no se envia nada mas.
    host.run_frame();
    assert(game.emitted().size() == 1);
    assert(loop.command_pending());
    assert(loop.heading().x == 0 && loop.heading().y == 1);

    for (int i = 0; i < 4; ++i) {
      game.advance_frame();
      host.run_frame();
    }
    assert(game.env().score() == 1);
    assert(game.emitted().size() >= 4);
    for (std::size_t i = 0; i < 4; ++i) {
      assert(game.emitted()[i] == Direction::kDown);
    }
    assert(loop.prev_snake().size() == 2);
    assert(loop.prev_snake().front() == (Cell{14, 18}));
    assert(loop.stats().resyncs == 0);
  }

  {
    // La cabeza aparece donde no se esperaba: se descarta el plan y se replanifica.
    const BotConfig cfg = test_config();
    SimulatedGame game(cfg, 11);
    game.press_start();
    game.place_food({14, 18});
    ManualFrameHost host;
    ControlLoop loop(cfg, game, game, host);
    loop.start();

    host.run_frame();
    assert(game.emitted().back() == Direction::kDown);
    game.env().queue_direction(Direction::kRight);
    game.advance_frame();
    assert(game.env().snake().front() == (Cell{15, 14}));

    const long long replans = loop.stats().replans;
    host.run_frame();
    assert(loop.stats().resyncs == 1);
    assert(loop.stats().replans == replans + 1);
    assert(loop.prev_head() && *loop.prev_head() == (Cell{15, 14}));
    assert(game.emitted().size() == 2);
    assert(loop.expected_head() && manhattan(*loop.expected_head(), {15, 14}) == 1);
  }

  {
    // Frame ilegible con comando pendiente: se extrapola la serpiente.
    const BotConfig cfg = test_config();
    SimulatedGame game(cfg, 11);
    game.press_start();
    game.place_food({14, 18});
    FlakySurface surface(game);
    ManualFrameHost host;
    ControlLoop loop(cfg, surface, game, host);
    loop.start();

    host.run_frame();
    assert(loop.expected_head() && *loop.expected_head() == (Cell{14, 15}));
    game.advance_frame();
    surface.blank = true;
    host.run_frame();
    assert(loop.stats().perception_failures == 1);
    assert(loop.stats().extrapolations == 1);
    assert(loop.prev_snake().size() == 1);
    assert(loop.prev_snake().front() == (Cell{14, 15}));
    assert(loop.prev_food() && *loop.prev_food() == (Cell{14, 18}));
    // El plan sigue y se envia la siguiente tecla.
    assert(game.emitted().size() == 2);
    assert(loop.expected_head() && *loop.expected_head() == (Cell{14, 16}));

    // Otro frame ilegible: se vuelve a dar por ejecutado el comando pendiente.
    host.run_frame();
    assert(loop.stats().extrapolations == 2);
    assert(loop.prev_snake().front() == (Cell{14, 16}));

    surface.blank = false;
    game.advance_frame();
    host.run_frame();
    assert(loop.running());
    assert(loop.stats().resyncs == 0);
  }

  {
    // Un error estructural detiene el loop y no se reprograma.
    const BotConfig cfg = test_config();
    SimulatedGame game(cfg, 11);
    game.press_start();
    FlakySurface surface(game);
    surface.broken = true;
    ManualFrameHost host;
    ControlLoop loop(cfg, surface, game, host);
    loop.start();
    host.run_frame();
    assert(!loop.running());
    assert(loop.last_error() == "canvas sin contexto 2d");
    assert(!host.has_pending());
    assert(game.emitted().empty());
  }

  {
    // Game over: se pulsa "jugar otra vez" y se olvida el seguimiento.
    const BotConfig cfg = test_config();
    SimulatedGame game(cfg, 11);
    game.press_start();
    game.place_food({0, 20});
    for (int i = 0; i < 15 && !game.game_over_active(); ++i) {
      game.env().queue_direction(Direction::kUp);
      game.advance_frame();
    }
    assert(game.game_over_active());
    assert(game.final_scores().size() == 1);
    assert(game.final_steps().size() == 1);
    assert(game.final_steps().back() == 14);

    ManualFrameHost host;
    ControlLoop loop(cfg, game, game, host);
    loop.start();
    host.run_frame();
    assert(game.is_playing());
    assert(loop.stats().restarts == 1);
    assert(game.env().snake_length() == 1);
    assert(loop.prev_snake().size() == 1);
    assert(loop.prev_snake().front() == (Cell{14, 14}));
    // Los pasos de la partida terminada sobreviven al reinicio.
    assert(game.env().steps() == 0);
    assert(game.final_steps().back() == 14);
  }

  {
    // Fuera de partida no se percibe ni se envian teclas.
    const BotConfig cfg = test_config();
    IdleSurface surface;
    RecordingSink sink;
    ManualFrameHost host;
    ControlLoop loop(cfg, surface, sink, host);
    loop.start();
    host.run_frame();
    host.run_frame();
    assert(loop.running());
    assert(loop.stats().ticks == 2);
    assert(loop.stats().perception_failures == 0);
    assert(sink.keys.empty());
    assert(loop.prev_snake().empty());
  }

  {
    // Arranque: la superficie no aparece a tiempo.
    BotConfig cfg = test_config();
    cfg.startup_timeout_ms = 30;
    cfg.startup_poll_interval_ms = 5;
    IdleSurface surface;
    RecordingSink sink;
    ManualFrameHost host;
    std::string err;
    assert(!bootstrap(cfg, surface, sink, host, err));
    assert(err.find("30 ms") != std::string::npos);
    assert(!host.has_pending());

    surface.ready = true;
    err.clear();
    auto loop = bootstrap(cfg, surface, sink, host, err);
    assert(loop);
    assert(err.empty());
    assert(loop->running());
    assert(host.has_pending());

    BotConfig bad = cfg;
    bad.max_search_nodes = 0;
    assert(!bootstrap(bad, surface, sink, host, err));
    assert(!err.empty());
  }

  {
    // Contra la pared sin plan: giro perpendicular inmediato aunque hubiera
    // un comando pendiente, sin pasar por el planificador.
    const BotConfig cfg = test_config();
    SimulatedGame game(cfg, 11);
    game.press_start();
    game.place_food({15, 14});
    ManualFrameHost host;
    ControlLoop loop(cfg, game, game, host);
    loop.start();
    host.run_frame();
    assert(game.emitted().back() == Direction::kRight);

    game.advance_frame();
    game.place_food({27, 14});
    host.run_frame();
    assert(loop.prev_snake().size() == 2);
    assert(loop.plan().size() == 11);

    for (int i = 0; i < 11; ++i) {
      game.advance_frame();
      host.run_frame();
    }
    assert(game.env().snake().front() == (Cell{26, 14}));
    assert(loop.plan().empty());
    assert(loop.command_pending());
    assert(loop.expected_head() && *loop.expected_head() == (Cell{27, 14}));
    const long long replans = loop.stats().replans;

    game.advance_frame();
    assert(game.env().snake().front() == (Cell{27, 14}));
    host.run_frame();
    assert(loop.heading().x == 1 && loop.heading().y == 0);
    assert(game.emitted().size() == 14);
    assert(game.emitted().back() == Direction::kUp);
    assert(loop.stats().replans == replans);
    assert(loop.plan().empty());
    assert(loop.command_pending());
    assert(loop.expected_head() && *loop.expected_head() == (Cell{27, 13}));

    game.advance_frame();
    host.run_frame();
    assert(game.is_playing());
    assert(game.env().snake().front() == (Cell{27, 13}));
  }

  {
    // Partidas completas: la cabeza seguida coincide con la del juego en todos
    // los frames, tambien cuando el juego avanza cada 2 frames.
    const TrackedRun every_frame = play_tracked(1, 4000, 7);
    assert(every_frame.running);
    assert(every_frame.checked > 0);
    assert(every_frame.mismatches == 0);
    assert(every_frame.best_score >= 3);

    const TrackedRun every_other = play_tracked(2, 6000, 7);
    assert(every_other.running);
    assert(every_other.checked > 0);
    assert(every_other.mismatches == 0);
    assert(every_other.best_score >= 3);
  }

  std::cout << "tests_control: OK\n";
  return 0;
}
