#pragma once

#include <memory>

namespace joule_gate::sensors::gpu {

class GpuSensor {
 public:
  virtual bool available() const = 0;
  // Board power draw in watts.
  virtual bool read_power_w(double& watts) = 0;
  virtual ~GpuSensor() = default;
};

std::unique_ptr<GpuSensor> make_nvml_sensor(unsigned int device_index);
std::unique_ptr<GpuSensor> make_none_sensor();

}  // namespace joule_gate::sensors::gpu
