#pragma once

#include <string>

namespace snakebot {

struct BotConfig {
  int grid = 28;
  int canvas_size = 560;

  float value_threshold = 32.0f;
  float alpha_threshold = 20.0f;
  int refine_extra_keep = 6;
  int walk_guard_slack = 2;

  int max_search_nodes = 20000;

  int startup_timeout_ms = 5000;
  int startup_poll_interval_ms = 50;

  int eval_games = 20;
  int eval_max_steps = 5000;
  int frames_per_step = 2;
  int seed = 42;

  bool verbose = false;
  std::string profile = "default";
};

bool load_config_file(const std::string& path, BotConfig& cfg, std::string& error);
BotConfig with_profile(const BotConfig& base, const std::string& profile);
bool validate_config(const BotConfig& cfg, std::string& error);

}  // namespace snakebot
