#pragma once

#include <chrono>
#include <memory>

#include "model/energy_sample.hpp"
#include "sensors/cpu.hpp"
#include "sensors/gpu/gpu.hpp"
#include "sensors/rapl.hpp"

namespace joule_gate::sensors {

class PowerSource {
 public:
  virtual model::power_reading read(std::chrono::steady_clock::time_point now) = 0;
  virtual ~PowerSource() = default;
};

enum class CpuPowerSource {
  utilization,
  rapl,
};

// CPU watts come either from utilization scaled by the package TDP or from
// the RAPL energy counter. GPU watts come from the GPU sensor when present.
class SystemPowerSource final : public PowerSource {
 public:
  SystemPowerSource(double cpu_tdp_w, std::unique_ptr<CpuSensor> cpu, std::unique_ptr<gpu::GpuSensor> gpu);
  SystemPowerSource(std::unique_ptr<RaplSensor> rapl, std::unique_ptr<gpu::GpuSensor> gpu);

  model::power_reading read(std::chrono::steady_clock::time_point now) override;

  [[nodiscard]] CpuPowerSource cpu_source() const noexcept { return cpu_source_; }

 private:
  CpuPowerSource cpu_source_{CpuPowerSource::utilization};
  double cpu_tdp_w_{0.0};
  std::unique_ptr<CpuSensor> cpu_{};
  std::unique_ptr<RaplSensor> rapl_{};
  std::unique_ptr<gpu::GpuSensor> gpu_{};
};

}  // namespace joule_gate::sensors
