#include "sinks/stdout_debug.hpp"

#include <cstdio>

namespace joule_gate::sinks {

void StdoutDebugSink::publish(const model::energy_sample& sample) const {
  std::printf("[energy] cpu_w=%.2f gpu_w=%.2f idle_cpu_w=%.2f idle_gpu_w=%.2f net_w=%.2f bucket_j=%.2f\n",
              sample.cpu_power_w, sample.gpu_power_w, sample.idle_cpu_w, sample.idle_gpu_w, sample.net_power_w,
              sample.bucket_joules);
  std::fflush(stdout);
}

}  // namespace joule_gate::sinks
