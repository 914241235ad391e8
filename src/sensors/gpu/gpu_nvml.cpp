#include "sensors/gpu/gpu.hpp"

#include <dlfcn.h>
#include <memory>

namespace joule_gate::sensors::gpu {
namespace {

// libnvidia-ml is resolved at runtime so hosts without a driver still start.
// Only the handful of entry points used here are declared, by signature.
using NvmlReturn = int;
using NvmlDevice = void*;
constexpr NvmlReturn kNvmlSuccess = 0;

class NvmlGpuSensor final : public GpuSensor {
 public:
  explicit NvmlGpuSensor(unsigned int device_index) noexcept : device_index_(device_index) { init(); }

  ~NvmlGpuSensor() override {
    if (initialized_ && fn_shutdown_ != nullptr) {
      (void)fn_shutdown_();
      initialized_ = false;
    }

    if (library_ != nullptr) {
      dlclose(library_);
      library_ = nullptr;
    }
  }

  NvmlGpuSensor(const NvmlGpuSensor&) = delete;
  NvmlGpuSensor& operator=(const NvmlGpuSensor&) = delete;

  bool available() const override { return available_; }

  bool read_power_w(double& watts) override {
    watts = 0.0;
    if (!available_) {
      return false;
    }

    unsigned int power_mw = 0;
    if (fn_device_get_power_usage_(device_, &power_mw) != kNvmlSuccess) {
      return false;
    }

    watts = static_cast<double>(power_mw) / 1000.0;
    return true;
  }

 private:
  using FnNvmlInit = NvmlReturn (*)();
  using FnNvmlShutdown = NvmlReturn (*)();
  using FnNvmlDeviceGetHandleByIndex = NvmlReturn (*)(unsigned int, NvmlDevice*);
  using FnNvmlDeviceGetPowerUsage = NvmlReturn (*)(NvmlDevice, unsigned int*);

  template <typename FnType>
  bool resolve(FnType& fn, const char* symbol) noexcept {
    fn = reinterpret_cast<FnType>(dlsym(library_, symbol));
    return fn != nullptr;
  }

  void init() noexcept {
    library_ = dlopen("libnvidia-ml.so.1", RTLD_NOW);
    if (library_ == nullptr) {
      return;
    }

    if (!resolve(fn_init_, "nvmlInit_v2") && !resolve(fn_init_, "nvmlInit")) {
      return;
    }

    if (!resolve(fn_shutdown_, "nvmlShutdown")) {
      return;
    }

    if (!resolve(fn_device_get_handle_by_index_, "nvmlDeviceGetHandleByIndex_v2") &&
        !resolve(fn_device_get_handle_by_index_, "nvmlDeviceGetHandleByIndex")) {
      return;
    }

    if (!resolve(fn_device_get_power_usage_, "nvmlDeviceGetPowerUsage")) {
      return;
    }

    if (fn_init_() != kNvmlSuccess) {
      return;
    }
    initialized_ = true;

    if (fn_device_get_handle_by_index_(device_index_, &device_) != kNvmlSuccess) {
      return;
    }

    available_ = true;
  }

  void* library_{nullptr};
  bool available_{false};
  bool initialized_{false};
  unsigned int device_index_{0};
  NvmlDevice device_{nullptr};

  FnNvmlInit fn_init_{nullptr};
  FnNvmlShutdown fn_shutdown_{nullptr};
  FnNvmlDeviceGetHandleByIndex fn_device_get_handle_by_index_{nullptr};
  FnNvmlDeviceGetPowerUsage fn_device_get_power_usage_{nullptr};
};

}  // namespace

std::unique_ptr<GpuSensor> make_nvml_sensor(unsigned int device_index) {
  return std::make_unique<NvmlGpuSensor>(device_index);
}

}  // namespace joule_gate::sensors::gpu
