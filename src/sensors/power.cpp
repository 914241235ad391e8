#include "sensors/power.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace joule_gate::sensors {

SystemPowerSource::SystemPowerSource(const double cpu_tdp_w, std::unique_ptr<CpuSensor> cpu,
                                   std::unique_ptr<gpu::GpuSensor> gpu)
    : cpu_source_(CpuPowerSource::utilization), cpu_tdp_w_(cpu_tdp_w), cpu_(std::move(cpu)), gpu_(std::move(gpu)) {
  if (gpu_ == nullptr) {
    gpu_ = gpu::make_none_sensor();
  }
}

SystemPowerSource::SystemPowerSource(std::unique_ptr<RaplSensor> rapl, std::unique_ptr<gpu::GpuSensor> gpu)
    : cpu_source_(CpuPowerSource::rapl), rapl_(std::move(rapl)), gpu_(std::move(gpu)) {
  if (gpu_ == nullptr) {
    gpu_ = gpu::make_none_sensor();
  }
}

model::power_reading SystemPowerSource::read(const std::chrono::steady_clock::time_point now) {
  model::power_reading reading{};

  if (cpu_source_ == CpuPowerSource::utilization) {
    double utilization_pct = 0.0;
    if (cpu_ != nullptr && cpu_->read_utilization(utilization_pct)) {
      reading.cpu_w = (std::clamp(utilization_pct, 0.0, 100.0) / 100.0) * cpu_tdp_w_;
    }
  } else {
    double watts = 0.0;
    if (rapl_ != nullptr && rapl_->read_power_w(watts, now)) {
      reading.cpu_w = watts;
    }
  }

  double gpu_watts = 0.0;
  if (gpu_->available() && gpu_->read_power_w(gpu_watts) && std::isfinite(gpu_watts)) {
    reading.gpu_w = gpu_watts;
  }

  return reading;
}

}  // namespace joule_gate::sensors
