#include "control/bootstrap.hpp"

#include <chrono>

#include "common/wait.hpp"

namespace snakebot {

std::unique_ptr<ControlLoop> bootstrap(const BotConfig& cfg,
                                       GameSurface& surface,
                                       ActionSink& sink,
                                       FrameHost& host,
                                       std::string& error) {
  if (!validate_config(cfg, error)) {
    return nullptr;
  }

  const bool ready = wait_for([&surface]() { return surface.available(); },
                              std::chrono::milliseconds(cfg.startup_timeout_ms),
                              std::chrono::milliseconds(cfg.startup_poll_interval_ms));
  if (!ready) {
    error = "Superficie de juego no disponible tras " + std::to_string(cfg.startup_timeout_ms) +
            " ms";
    return nullptr;
  }

  auto loop = std::make_unique<ControlLoop>(cfg, surface, sink, host);
  loop->start();
  return loop;
}

}  // namespace snakebot
