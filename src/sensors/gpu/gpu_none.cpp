#include "sensors/gpu/gpu.hpp"

#include <memory>

namespace joule_gate::sensors::gpu {
namespace {

class NoneGpuSensor final : public GpuSensor {
 public:
  bool available() const override { return false; }

  bool read_power_w(double& watts) override {
    watts = 0.0;
    return false;
  }
};

}  // namespace

std::unique_ptr<GpuSensor> make_none_sensor() { return std::make_unique<NoneGpuSensor>(); }

}  // namespace joule_gate::sensors::gpu
