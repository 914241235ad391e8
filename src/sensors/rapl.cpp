#include "sensors/rapl.hpp"

#include <cerrno>
#include <cstdlib>
#include <string>

namespace joule_gate::sensors {

namespace {
constexpr const char* kRaplPackagePath = "/sys/class/powercap/intel-rapl/intel-rapl:0";
}

RaplSensor::RaplSensor() : owns_file_(true) {
  const std::string base = kRaplPackagePath;
  energy_file_ = std::fopen((base + "/energy_uj").c_str(), "r");

  if (std::FILE* range_file = std::fopen((base + "/max_energy_range_uj").c_str(), "r"); range_file != nullptr) {
    if (!read_u64(range_file, max_energy_range_uj_)) {
      max_energy_range_uj_ = 0;
    }
    std::fclose(range_file);
  }
}

RaplSensor::RaplSensor(std::FILE* energy_file, const std::uint64_t max_energy_range_uj, const bool owns_file)
    : energy_file_(energy_file), owns_file_(owns_file), max_energy_range_uj_(max_energy_range_uj) {}

RaplSensor::~RaplSensor() {
  if (owns_file_ && energy_file_ != nullptr) {
    std::fclose(energy_file_);
    energy_file_ = nullptr;
  }
}

bool RaplSensor::available() const noexcept { return energy_file_ != nullptr; }

bool RaplSensor::read_power_w(double& watts, const std::chrono::steady_clock::time_point now) noexcept {
  watts = 0.0;

  std::uint64_t energy_uj = 0;
  if (!read_u64(energy_file_, energy_uj)) {
    has_prev_ = false;
    return false;
  }

  if (!has_prev_) {
    prev_energy_uj_ = energy_uj;
    prev_time_ = now;
    has_prev_ = true;
    return false;
  }

  const double elapsed_s = std::chrono::duration_cast<std::chrono::duration<double>>(now - prev_time_).count();
  std::uint64_t delta_uj = 0;
  if (energy_uj >= prev_energy_uj_) {
    delta_uj = energy_uj - prev_energy_uj_;
  } else if (max_energy_range_uj_ > prev_energy_uj_) {
    delta_uj = (max_energy_range_uj_ - prev_energy_uj_) + energy_uj;
  }

  prev_energy_uj_ = energy_uj;
  prev_time_ = now;

  if (elapsed_s <= 0.0) {
    return false;
  }

  watts = (static_cast<double>(delta_uj) / 1'000'000.0) / elapsed_s;
  return true;
}

bool RaplSensor::read_u64(std::FILE* file, std::uint64_t& value) noexcept {
  if (file == nullptr) {
    value = 0;
    return false;
  }

  if (std::fseek(file, 0L, SEEK_SET) != 0) {
    value = 0;
    return false;
  }

  unsigned long long parsed = 0;
  if (std::fscanf(file, "%llu", &parsed) != 1) {
    std::clearerr(file);
    value = 0;
    return false;
  }

  value = static_cast<std::uint64_t>(parsed);
  return true;
}

}  // namespace joule_gate::sensors
