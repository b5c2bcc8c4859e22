#pragma once

#include <memory>
#include <string>

#include "common/config.hpp"
#include "control/control_loop.hpp"
#include "control/game_surface.hpp"

namespace snakebot {

// Espera a que la superficie exista (sondeo con timeout) y arranca el loop.
// nullptr + `error` si la config es invalida o la superficie no aparece.
std::unique_ptr<ControlLoop> bootstrap(const BotConfig& cfg,
                                       GameSurface& surface,
                                       ActionSink& sink,
                                       FrameHost& host,
                                       std::string& error);

}  // namespace snakebot
