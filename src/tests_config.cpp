#include <cassert>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>

#include "common/cli.hpp"
#include "common/config.hpp"

using namespace snakebot;

namespace {

const char* kTmpPath = "tests_config_tmp.yaml";

void write_file(const std::string& text) {
  std::ofstream out(kTmpPath);
  out << text;
}

}  // namespace

int main() {
  {
    const BotConfig cfg;
    std::string err;
    assert(validate_config(cfg, err));
    assert(cfg.max_search_nodes == 20000);
    assert(cfg.grid == 28 && cfg.canvas_size == 560);
  }

  {
    write_file(
        "# bot\n"
        "grid: 20\n"
        "canvas_size: 400\n"
        "\n"
        "perception:\n"
        "  value_threshold: 40.5\n"
        "  walk_guard_slack: 3\n"
        "planner:\n"
        "  max_nodes: 1234\n"
        "eval:\n"
        "  games: 3\n"
        "  seed: 9\n"
        "verbose: true\n"
        "profile: \"smoke\"\n");
    BotConfig cfg;
    std::string err;
    assert(load_config_file(kTmpPath, cfg, err));
    assert(cfg.grid == 20);
    assert(cfg.canvas_size == 400);
    assert(cfg.value_threshold > 40.4f && cfg.value_threshold < 40.6f);
    assert(cfg.walk_guard_slack == 3);
    assert(cfg.max_search_nodes == 1234);
    assert(cfg.eval_games == 3);
    assert(cfg.seed == 9);
    assert(cfg.verbose);
    assert(cfg.profile == "smoke");
    // Lo que no aparece conserva el valor por defecto.
    assert(cfg.alpha_threshold == 20.0f);
    assert(cfg.startup_timeout_ms == 5000);
  }

  {
    write_file(
        "planner:\n"
        "  max_nodes: muchos\n");
    BotConfig cfg;
    std::string err;
    assert(!load_config_file(kTmpPath, cfg, err));
    assert(err.find("linea 2") != std::string::npos);
    assert(err.find("planner.max_nodes") != std::string::npos);
  }

  {
    BotConfig cfg;
    std::string err;
    assert(!load_config_file("no_existe/snakebot.yaml", cfg, err));
    assert(err.find("no_existe") != std::string::npos);
  }

  {
    const BotConfig base;
    const BotConfig fast = with_profile(base, "low_latency");
    assert(fast.max_search_nodes == 5000);
    assert(fast.profile == "low_latency");
    const BotConfig smoke = with_profile(base, "smoke");
    assert(smoke.eval_games == 2);
    assert(smoke.max_search_nodes == base.max_search_nodes);
    assert(with_profile(base, "default").max_search_nodes == 20000);
  }

  {
    BotConfig cfg;
    std::string err;
    cfg.grid = 0;
    assert(!validate_config(cfg, err));
    cfg = BotConfig{};
    cfg.grid = 256;
    cfg.canvas_size = 2560;
    assert(!validate_config(cfg, err));
    assert(err == "grid debe ser <= 255");
    cfg.grid = 255;
    assert(validate_config(cfg, err));
    cfg = BotConfig{};
    cfg.canvas_size = 10;
    assert(!validate_config(cfg, err));
    cfg = BotConfig{};
    cfg.frames_per_step = 0;
    assert(!validate_config(cfg, err));
    cfg = BotConfig{};
    cfg.startup_poll_interval_ms = 0;
    assert(!validate_config(cfg, err));
  }

  {
    const char* argv[] = {"snakebot_eval", "--games", "5", "--verbose", "--seed", "x"};
    auto args = parse_cli(6, const_cast<char**>(argv));
    assert(cli_has(args, "--verbose"));
    assert(cli_get(args, "--profile", "default") == "default");
    int games = 0;
    std::string err;
    assert(cli_get_int(args, "--games", games, err) && games == 5);
    int seed = 42;
    assert(!cli_get_int(args, "--seed", seed, err));
    assert(seed == 42);
    int untouched = 7;
    assert(cli_get_int(args, "--max-nodes", untouched, err) && untouched == 7);
  }

  std::remove(kTmpPath);
  std::cout << "tests_config: OK\n";
  return 0;
}
