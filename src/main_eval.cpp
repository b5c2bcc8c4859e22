#include <algorithm>
#include <iostream>
#include <numeric>
#include <string>

#include "common/cli.hpp"
#include "common/config.hpp"
#include "control/bootstrap.hpp"
#include "control/game_surface.hpp"
#include "env/simulated_game.hpp"

using namespace snakebot;

int main(int argc, char** argv) {
  auto args = parse_cli(argc, argv);

  const std::string config_path = cli_get(args, "--config", "config/snakebot_28x28.yaml");
  const std::string profile = cli_get(args, "--profile", "default");

  BotConfig base_cfg;
  std::string err;
  if (!load_config_file(config_path, base_cfg, err)) {
    std::cerr << "[ERROR] " << err << "\n";
    return 1;
  }

  BotConfig cfg = with_profile(base_cfg, profile);
  if (!cli_get_int(args, "--games", cfg.eval_games, err) ||
      !cli_get_int(args, "--frames-per-step", cfg.frames_per_step, err) ||
      !cli_get_int(args, "--max-nodes", cfg.max_search_nodes, err) ||
      !cli_get_int(args, "--seed", cfg.seed, err)) {
    std::cerr << "[ERROR] " << err << "\n";
    return 1;
  }
  if (cli_has(args, "--verbose")) {
    cfg.verbose = cli_get(args, "--verbose") != "0";
  }
  cfg.eval_games = std::max(1, cfg.eval_games);

  SimulatedGame game(cfg, static_cast<uint32_t>(cfg.seed));
  ManualFrameHost host;
  auto loop = bootstrap(cfg, game, game, host, err);
  if (!loop) {
    std::cerr << "[ERROR] " << err << "\n";
    return 1;
  }

  std::cout << "Evaluando bot | perfil=" << cfg.profile << " juegos=" << cfg.eval_games
            << " frames/paso=" << cfg.frames_per_step << " max_nodes=" << cfg.max_search_nodes
            << "\n" << std::flush;

  // Limite duro de frames por si el juego nunca termina.
  const long long frame_limit = static_cast<long long>(cfg.eval_games) *
                                (cfg.eval_max_steps + 8) * cfg.frames_per_step * 2;
  std::size_t reported = 0;
  while (game.final_scores().size() < static_cast<std::size_t>(cfg.eval_games) &&
         loop->running() && game.frames() < frame_limit) {
    game.advance_frame();
    host.run_frame();

    if (game.final_scores().size() > reported) {
      reported = game.final_scores().size();
      std::cout << "  [Eval] juego " << reported << "/" << cfg.eval_games
                << " score=" << game.final_scores().back()
                << " pasos=" << game.final_steps().back() << "\n" << std::flush;
    }
  }
  loop->stop();

  if (!loop->last_error().empty()) {
    std::cerr << "[ERROR] loop detenido: " << loop->last_error() << "\n";
    return 1;
  }

  const auto& scores = game.final_scores();
  const double avg = scores.empty() ? 0.0
                                    : static_cast<double>(std::accumulate(scores.begin(), scores.end(), 0)) /
                                          static_cast<double>(scores.size());
  const ControlStats& st = loop->stats();

  std::cout << "\nResultado:\n";
  std::cout << "  juegos=" << scores.size() << "\n";
  std::cout << "  avg_score=" << avg << "\n";
  std::cout << "  best_score=" << game.best_score() << "\n";
  std::cout << "  ticks=" << st.ticks << " fallos_percepcion=" << st.perception_failures
            << " extrapolaciones=" << st.extrapolations << " resyncs=" << st.resyncs
            << " teclas=" << st.dispatched << " rechazadas=" << st.refused << "\n";

  return 0;
}
