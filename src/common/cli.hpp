#pragma once

#include <string>
#include <unordered_map>

#include "common/text.hpp"

namespace snakebot {

using CliArgs = std::unordered_map<std::string, std::string>;

// --clave valor; una clave sin valor queda como "1".
inline CliArgs parse_cli(int argc, char** argv) {
  CliArgs out;
  for (int i = 1; i < argc; ++i) {
    std::string k = argv[i];
    if (k.rfind("--", 0) != 0) {
      continue;
    }
    std::string v = "1";
    if (i + 1 < argc) {
      std::string nxt = argv[i + 1];
      if (nxt.rfind("--", 0) != 0) {
        v = nxt;
        ++i;
      }
    }
    out[k] = v;
  }
  return out;
}

inline std::string cli_get(const CliArgs& args, const std::string& key,
                           const std::string& fallback = "") {
  auto it = args.find(key);
  return it == args.end() ? fallback : it->second;
}

inline bool cli_has(const CliArgs& args, const std::string& key) {
  return args.find(key) != args.end();
}

// Lee un entero si la clave existe. Devuelve false solo si el valor es invalido.
inline bool cli_get_int(const CliArgs& args, const std::string& key, int& target,
                        std::string& error) {
  auto it = args.find(key);
  if (it == args.end()) {
    return true;
  }
  int v = 0;
  if (!to_num(it->second, v)) {
    error = "Valor invalido para " + key + ": " + it->second;
    return false;
  }
  target = v;
  return true;
}

}  // namespace snakebot
