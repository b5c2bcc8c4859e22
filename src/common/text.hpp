#pragma once

#include <cctype>
#include <sstream>
#include <string>

namespace snakebot {

inline std::string trim(const std::string& s) {
  std::size_t b = 0;
  while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b]))) {
    ++b;
  }
  std::size_t e = s.size();
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) {
    --e;
  }
  return s.substr(b, e - b);
}

template <typename T>
bool to_num(const std::string& s, T& out) {
  std::stringstream ss(s);
  ss >> out;
  return !ss.fail() && ss.eof();
}

inline bool to_bool(const std::string& s, bool& out) {
  if (s == "1" || s == "true" || s == "True" || s == "yes") {
    out = true;
    return true;
  }
  if (s == "0" || s == "false" || s == "False" || s == "no") {
    out = false;
    return true;
  }
  return false;
}

}  // namespace snakebot
