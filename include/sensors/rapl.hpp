#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>

namespace joule_gate::sensors {

// Package power from the intel-rapl powercap energy counter.
class RaplSensor {
 public:
  RaplSensor();
  RaplSensor(std::FILE* energy_file, std::uint64_t max_energy_range_uj, bool owns_file = false);
  ~RaplSensor();

  RaplSensor(const RaplSensor&) = delete;
  RaplSensor& operator=(const RaplSensor&) = delete;

  [[nodiscard]] bool available() const noexcept;

  // Average watts since the previous read. Needs two reads; the first one
  // returns false.
  bool read_power_w(double& watts, std::chrono::steady_clock::time_point now) noexcept;

 private:
  static bool read_u64(std::FILE* file, std::uint64_t& value) noexcept;

  std::FILE* energy_file_{nullptr};
  bool owns_file_{true};
  std::uint64_t max_energy_range_uj_{0};
  std::uint64_t prev_energy_uj_{0};
  std::chrono::steady_clock::time_point prev_time_{};
  bool has_prev_{false};
};

}  // namespace joule_gate::sensors
