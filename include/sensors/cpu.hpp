#pragma once

#include <cstdint>
#include <cstdio>

namespace joule_gate::sensors {

// Aggregate CPU utilization from the first line of /proc/stat.
class CpuSensor {
 public:
  CpuSensor();
  explicit CpuSensor(std::FILE* file, bool owns_file = false);
  ~CpuSensor();

  CpuSensor(const CpuSensor&) = delete;
  CpuSensor& operator=(const CpuSensor&) = delete;

  // Busy share since the previous read in percent. The first read only
  // records the baseline and returns false.
  bool read_utilization(double& utilization_pct) noexcept;

 private:
  static constexpr std::size_t kReadBufferSize = 512;

  std::FILE* file_{nullptr};
  bool owns_file_{true};
  std::uint64_t prev_total_{0};
  std::uint64_t prev_idle_{0};
  bool has_prev_{false};
};

}  // namespace joule_gate::sensors
