#pragma once

#include <deque>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "common/types.hpp"
#include "perception/pixel_sampler.hpp"

namespace snakebot {

// Lo unico que el bot ve del juego: pixeles, texto del marcador y estado de la UI.
class GameSurface {
 public:
  virtual ~GameSurface() = default;

  [[nodiscard]] virtual bool available() const = 0;
  // Valido hasta la siguiente llamada que modifique la superficie.
  [[nodiscard]] virtual FrameView frame() const = 0;
  [[nodiscard]] virtual std::string score_text() const = 0;

  [[nodiscard]] virtual bool is_playing() const = 0;
  [[nodiscard]] virtual bool start_overlay_active() const = 0;
  [[nodiscard]] virtual bool game_over_active() const = 0;

  virtual void press_start() = 0;
  virtual void press_play_again() = 0;
};

// Destino de las teclas sinteticas.
class ActionSink {
 public:
  virtual ~ActionSink() = default;
  virtual void emit(Direction dir) = 0;
};

// Callback por frame del host (requestAnimationFrame o equivalente).
class FrameHost {
 public:
  virtual ~FrameHost() = default;
  virtual void request_frame(std::function<void()> callback) = 0;
};

// Host sin reloj propio: quien lo usa llama a run_frame() una vez por frame.
class ManualFrameHost : public FrameHost {
 public:
  void request_frame(std::function<void()> callback) override {
    pending_.push_back(std::move(callback));
  }

  // Ejecuta los callbacks pedidos antes de este frame. false si no habia ninguno.
  bool run_frame() {
    if (pending_.empty()) {
      return false;
    }
    std::deque<std::function<void()>> batch;
    batch.swap(pending_);
    ++frames_run_;
    for (auto& cb : batch) {
      cb();
    }
    return true;
  }

  [[nodiscard]] bool has_pending() const { return !pending_.empty(); }
  [[nodiscard]] std::size_t frames_run() const { return frames_run_; }

 private:
  std::deque<std::function<void()>> pending_;
  std::size_t frames_run_ = 0;
};

}  // namespace snakebot
