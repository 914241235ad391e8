#pragma once

#include <optional>
#include <string>

namespace joule_gate::model {

// One sensor pass. An empty field means the device could not be read.
struct power_reading {
  std::optional<double> cpu_w{};
  std::optional<double> gpu_w{};
};

// Snapshot of the bucket and the idle baselines it is charged against.
// net_power_w == max(0, cpu - idle_cpu) + max(0, gpu - idle_gpu).
struct energy_sample {
  double timestamp{0.0};
  double cpu_power_w{0.0};
  double gpu_power_w{0.0};
  double idle_cpu_w{0.0};
  double idle_gpu_w{0.0};
  double net_power_w{0.0};
  double bucket_joules{0.0};
  std::string integrity_hash{};
};

struct take_result {
  bool ok{false};
  double remaining_j{0.0};
};

}  // namespace joule_gate::model
