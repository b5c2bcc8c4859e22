#include "common/config.hpp"

#include <algorithm>
#include <fstream>

#include "common/text.hpp"

namespace snakebot {
namespace {

bool parse_kv(const std::string& line, std::string& key, std::string& value) {
  const auto p = line.find(':');
  if (p == std::string::npos) {
    return false;
  }
  key = trim(line.substr(0, p));
  value = trim(line.substr(p + 1));
  if (!value.empty() && (value.front() == '"' || value.front() == '\'')) {
    if (value.back() == value.front() && value.size() > 1) {
      value = value.substr(1, value.size() - 2);
    }
  }
  return !key.empty();
}

}  // namespace

bool load_config_file(const std::string& path, BotConfig& cfg, std::string& error) {
  std::ifstream in(path);
  if (!in) {
    error = "No se pudo abrir config: " + path;
    return false;
  }

  std::string line;
  std::string section;
  std::size_t lineno = 0;

  while (std::getline(in, line)) {
    ++lineno;
    std::string t = trim(line);
    if (t.empty() || t[0] == '#') {
      continue;
    }
    if (t.back() == ':') {
      section = trim(t.substr(0, t.size() - 1));
      continue;
    }
    // Una clave sin sangria cierra la seccion abierta.
    if (!line.empty() && !std::isspace(static_cast<unsigned char>(line[0]))) {
      section.clear();
    }

    std::string key;
    std::string value;
    if (!parse_kv(t, key, value)) {
      continue;
    }

    const std::string full = section.empty() ? key : (section + "." + key);
    const std::string bad = "Valor invalido en linea " + std::to_string(lineno) + ": " + full;

    auto set_int = [&](int& target) {
      int v = 0;
      if (!to_num(value, v)) {
        error = bad;
        return false;
      }
      target = v;
      return true;
    };

    auto set_float = [&](float& target) {
      float v = 0.0f;
      if (!to_num(value, v)) {
        error = bad;
        return false;
      }
      target = v;
      return true;
    };

    auto set_flag = [&](bool& target) {
      if (!to_bool(value, target)) {
        error = bad;
        return false;
      }
      return true;
    };

    if (full == "grid") {
      if (!set_int(cfg.grid)) return false;
    } else if (full == "canvas_size") {
      if (!set_int(cfg.canvas_size)) return false;
    } else if (full == "perception.value_threshold" || full == "value_threshold") {
      if (!set_float(cfg.value_threshold)) return false;
    } else if (full == "perception.alpha_threshold" || full == "alpha_threshold") {
      if (!set_float(cfg.alpha_threshold)) return false;
    } else if (full == "perception.refine_extra_keep" || full == "refine_extra_keep") {
      if (!set_int(cfg.refine_extra_keep)) return false;
    } else if (full == "perception.walk_guard_slack" || full == "walk_guard_slack") {
      if (!set_int(cfg.walk_guard_slack)) return false;
    } else if (full == "planner.max_nodes" || full == "max_search_nodes") {
      if (!set_int(cfg.max_search_nodes)) return false;
    } else if (full == "startup.timeout_ms") {
      if (!set_int(cfg.startup_timeout_ms)) return false;
    } else if (full == "startup.poll_interval_ms") {
      if (!set_int(cfg.startup_poll_interval_ms)) return false;
    } else if (full == "eval.games" || full == "eval_games") {
      if (!set_int(cfg.eval_games)) return false;
    } else if (full == "eval.max_steps" || full == "eval_max_steps") {
      if (!set_int(cfg.eval_max_steps)) return false;
    } else if (full == "eval.frames_per_step" || full == "frames_per_step") {
      if (!set_int(cfg.frames_per_step)) return false;
    } else if (full == "eval.seed" || full == "seed") {
      if (!set_int(cfg.seed)) return false;
    } else if (full == "verbose") {
      if (!set_flag(cfg.verbose)) return false;
    } else if (full == "profile") {
      cfg.profile = value;
    }
  }

  return true;
}

BotConfig with_profile(const BotConfig& base, const std::string& profile) {
  BotConfig cfg = base;
  cfg.profile = profile;

  if (profile == "low_latency") {
    cfg.max_search_nodes = std::min(cfg.max_search_nodes, 5000);
    return cfg;
  }

  if (profile == "smoke") {
    cfg.eval_games = 2;
    cfg.eval_max_steps = 600;
    cfg.startup_timeout_ms = 500;
    return cfg;
  }

  return cfg;
}

bool validate_config(const BotConfig& cfg, std::string& error) {
  if (cfg.grid <= 0) {
    error = "grid debe ser > 0";
    return false;
  }
  // El planificador guarda cada coordenada en un byte.
  if (cfg.grid > 255) {
    error = "grid debe ser <= 255";
    return false;
  }
  if (cfg.canvas_size < cfg.grid) {
    error = "canvas_size debe ser >= grid";
    return false;
  }
  if (cfg.max_search_nodes <= 0) {
    error = "planner.max_nodes debe ser > 0";
    return false;
  }
  if (cfg.walk_guard_slack < 0 || cfg.refine_extra_keep < 0) {
    error = "parametros de percepcion negativos";
    return false;
  }
  if (cfg.frames_per_step <= 0) {
    error = "eval.frames_per_step debe ser > 0";
    return false;
  }
  if (cfg.startup_poll_interval_ms <= 0 || cfg.startup_timeout_ms < 0) {
    error = "parametros de arranque invalidos";
    return false;
  }
  return true;
}

}  // namespace snakebot
