#pragma once

#include <chrono>
#include <cstdint>

namespace joule_gate::core {

inline std::uint64_t unix_timestamp_now_ns() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}

// Epoch seconds with sub-second precision, the unit used on the wire and in the ledger.
inline double unix_seconds_now() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::duration<double>>(now).count();
}

inline double seconds_between(const std::chrono::steady_clock::time_point from,
                              const std::chrono::steady_clock::time_point to) {
  return std::chrono::duration_cast<std::chrono::duration<double>>(to - from).count();
}

}  // namespace joule_gate::core
