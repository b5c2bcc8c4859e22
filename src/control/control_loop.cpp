#include "control/control_loop.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>

#include "common/text.hpp"

namespace snakebot {
namespace {

std::unordered_set<CellKey> keys_of(const std::vector<Cell>& body) {
  std::unordered_set<CellKey> keys;
  keys.reserve(body.size());
  for (const auto& c : body) {
    keys.insert(cell_key(c));
  }
  return keys;
}

}  // namespace

int parse_score(const std::string& text, int max_score) {
  const std::string t = trim(text);
  if (t.empty()) {
    return 0;
  }
  double v = 0.0;
  if (!to_num(t, v) || !std::isfinite(v)) {
    return 0;
  }
  // Se acota antes de convertir: un double fuera de rango no cabe en int.
  v = std::min(std::max(v, 0.0), static_cast<double>(std::max(0, max_score)));
  return static_cast<int>(v);
}

ControlLoop::ControlLoop(const BotConfig& cfg,
                         GameSurface& surface,
                         ActionSink& sink,
                         FrameHost& host)
    : cfg_(cfg),
      surface_(surface),
      sink_(sink),
      host_(host),
      analyzer_(cfg),
      planner_(cfg),
      last_score_(read_score()) {}

void ControlLoop::start() {
  if (running_) {
    return;
  }
  running_ = true;
  last_error_.clear();
  std::cout << "[SnakeBot] iniciando\n";
  schedule_next();
}

void ControlLoop::stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  std::cout << "[SnakeBot] detenido\n";
}

void ControlLoop::schedule_next() {
  host_.request_frame([this]() { run_frame(); });
}

void ControlLoop::run_frame() {
  if (!running_) {
    return;
  }
  try {
    tick();
  } catch (const std::exception& e) {
    // Fallo estructural: se repetiria en cada tick, no se reintenta.
    last_error_ = e.what();
    std::cerr << "[SnakeBot] detenido por error: " << e.what() << "\n";
    stop();
    return;
  }
  schedule_next();
}

int ControlLoop::read_score() const {
  return parse_score(surface_.score_text(), cfg_.grid * cfg_.grid);
}

void ControlLoop::reset_tracking() {
  prev_snake_keys_.clear();
  prev_snake_.clear();
  prev_head_.reset();
  expected_head_.reset();
  prev_food_.reset();
  command_pending_ = false;
  plan_.clear();
  last_score_ = read_score();
  heading_ = Heading{};
  last_body_length_ = 1;
}

void ControlLoop::ensure_game_running() {
  if (surface_.start_overlay_active()) {
    std::cout << "[SnakeBot] pantalla de inicio, pulsando start\n";
    surface_.press_start();
    reset_tracking();
  }
  if (surface_.game_over_active()) {
    std::cout << "[SnakeBot] game over con score=" << read_score() << ", reiniciando\n";
    surface_.press_play_again();
    reset_tracking();
    ++stats_.restarts;
  }
}

std::unordered_set<CellKey> ControlLoop::identity_keys() const {
  // Cuerpo anterior mas la cabeza prevista: una serpiente de 1 celda que acaba
  // de moverse no solapa con su cuerpo anterior.
  std::unordered_set<CellKey> keys = prev_snake_keys_;
  if (keys.empty()) {
    return keys;
  }
  if (expected_head_) {
    keys.insert(cell_key(*expected_head_));
  } else if (prev_head_) {
    keys.insert(cell_key({prev_head_->x + heading_.x, prev_head_->y + heading_.y}));
  }
  return keys;
}

void ControlLoop::extrapolate(bool grew, Observation& out) {
  if (expected_head_) {
    std::vector<Cell> simulated;
    simulated.reserve(prev_snake_.size() + 1);
    simulated.push_back(*expected_head_);
    simulated.insert(simulated.end(), prev_snake_.begin(), prev_snake_.end());
    if (!grew && simulated.size() > 1) {
      simulated.pop_back();
    }
    prev_snake_ = std::move(simulated);
    prev_snake_keys_ = keys_of(prev_snake_);
    prev_head_ = prev_snake_.front();
    command_pending_ = false;
    expected_head_.reset();
    ++stats_.extrapolations;
  }
  out.body = prev_snake_;
  out.head = out.body.front();
  out.tail = out.body.back();
  out.food = prev_food_;
}

void ControlLoop::update_heading(const Observation& obs) {
  if (obs.body.size() >= 2) {
    heading_ = {obs.body[0].x - obs.body[1].x, obs.body[0].y - obs.body[1].y};
    return;
  }
  // Solo si la cabeza prevista es vecina: confirmada o desincronizada no aporta rumbo.
  if (expected_head_ && manhattan(*expected_head_, obs.head) == 1) {
    heading_ = {expected_head_->x - obs.head.x, expected_head_->y - obs.head.y};
  }
}

bool ControlLoop::should_avoid_wall(const Observation& obs) const {
  return !planner_.inside({obs.head.x + heading_.x, obs.head.y + heading_.y});
}

void ControlLoop::reconcile(const Observation& obs) {
  if (expected_head_ && *expected_head_ == obs.head) {
    command_pending_ = false;
    prev_head_ = obs.head;
    expected_head_.reset();
    return;
  }
  if (!prev_head_ || *prev_head_ != obs.head) {
    // La cabeza se movio sin coincidir con lo previsto: la percepcion manda.
    if (prev_head_) {
      ++stats_.resyncs;
      if (cfg_.verbose) {
        std::cout << "[SnakeBot] resync cabeza=(" << obs.head.x << "," << obs.head.y
                  << ") plan descartado=" << plan_.size() << "\n";
      }
    }
    prev_head_ = obs.head;
    command_pending_ = false;
    plan_.clear();
    expected_head_.reset();
  }
}

bool ControlLoop::send_direction(const Move& move) {
  if (last_body_length_ > 1 && reverses(move, heading_)) {
    ++stats_.refused;
    return false;
  }
  sink_.emit(move.dir);
  ++stats_.dispatched;
  return true;
}

void ControlLoop::tick() {
  ++stats_.ticks;
  ensure_game_running();
  if (!surface_.is_playing()) {
    return;
  }

  const int score = read_score();
  const bool grew = score > last_score_;
  if (grew) {
    prev_food_.reset();
  }
  last_score_ = score;

  TrackingHints hints;
  hints.expected_head = expected_head_;
  hints.prev_head = prev_head_;
  hints.prev_body = prev_snake_.empty() ? nullptr : &prev_snake_;

  PerceptionResult seen = analyzer_.analyze(surface_.frame(), score + 1, identity_keys(), hints);
  Observation obs;
  if (seen.ok) {
    obs = std::move(seen.observation);
    prev_snake_ = obs.body;
    if (obs.food) {
      prev_food_ = obs.food;
    } else {
      // Comida no visible este frame (parpadeo): se conserva la ultima vista.
      obs.food = prev_food_;
    }
  } else {
    ++stats_.perception_failures;
    if (cfg_.verbose) {
      std::cout << "[SnakeBot] percepcion fallida: " << perception_failure_name(seen.failure)
                << "\n";
    }
    if (prev_snake_.empty()) {
      return;
    }
    extrapolate(grew, obs);
  }

  last_body_length_ = obs.body.size();
  update_heading(obs);

  if (plan_.empty() && should_avoid_wall(obs)) {
    const auto turn = planner_.choose_safe_direction(obs.body, heading_,
                                                     PathPlanner::perpendicular_moves(heading_));
    if (turn) {
      plan_.assign(1, *turn);
      command_pending_ = false;
    }
  }

  reconcile(obs);
  prev_snake_keys_ = keys_of(obs.body);

  if (plan_.empty()) {
    const std::vector<Move> path = planner_.plan(obs, heading_);
    plan_.assign(path.begin(), path.end());
    ++stats_.replans;
  }
  if (plan_.empty() || command_pending_) {
    return;
  }

  const Move next = plan_.front();
  plan_.pop_front();
  if (send_direction(next)) {
    command_pending_ = true;
    expected_head_ = apply_move(obs.head, next);
  } else {
    // El plan ya no encaja con el rumbo real: se replanifica el proximo tick.
    plan_.clear();
  }
}

}  // namespace snakebot
