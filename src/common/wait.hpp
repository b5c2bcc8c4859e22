#pragma once

#include <chrono>
#include <thread>

namespace snakebot {

// Sondea `predicate` cada `interval` hasta que devuelva true o pase `timeout`.
template <typename Predicate>
bool wait_for(Predicate&& predicate,
              std::chrono::milliseconds timeout,
              std::chrono::milliseconds interval) {
  const auto start = std::chrono::steady_clock::now();
  while (std::chrono::steady_clock::now() - start < timeout) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(interval);
  }
  return false;
}

}  // namespace snakebot
