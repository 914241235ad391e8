#include "sensors/cpu.hpp"

#include <cerrno>
#include <cstdlib>

namespace joule_gate::sensors {

namespace {

struct CpuTicks {
  std::uint64_t busy{0};
  std::uint64_t idle{0};
};

// Fields after "cpu": user nice system idle iowait irq softirq steal guest guest_nice.
// guest time is already folded into user by the kernel, so only the first eight count.
bool parse_cpu_line(const char* line, CpuTicks& ticks) noexcept {
  if (line[0] != 'c' || line[1] != 'p' || line[2] != 'u' || line[3] != ' ') {
    return false;
  }

  std::uint64_t fields[8]{};
  std::size_t count = 0;
  const char* cursor = line + 4;
  while (count < 8) {
    char* end = nullptr;
    errno = 0;
    const unsigned long long value = std::strtoull(cursor, &end, 10);
    if (end == cursor) {
      break;
    }
    if (errno != 0) {
      return false;
    }
    fields[count++] = value;
    cursor = end;
  }

  if (count < 4) {
    return false;
  }

  ticks.idle = fields[3] + fields[4];
  ticks.busy = fields[0] + fields[1] + fields[2] + fields[5] + fields[6] + fields[7];
  return true;
}

std::uint64_t forward_delta(const std::uint64_t now, const std::uint64_t before) noexcept {
  return now >= before ? now - before : 0;
}

}  // namespace

CpuSensor::CpuSensor() : file_(std::fopen("/proc/stat", "r")), owns_file_(true) {}

CpuSensor::CpuSensor(std::FILE* file, const bool owns_file) : file_(file), owns_file_(owns_file) {}

CpuSensor::~CpuSensor() {
  if (owns_file_ && file_ != nullptr) {
    std::fclose(file_);
  }
}

bool CpuSensor::read_utilization(double& utilization_pct) noexcept {
  utilization_pct = 0.0;
  if (file_ == nullptr || std::fseek(file_, 0L, SEEK_SET) != 0) {
    return false;
  }

  char line[kReadBufferSize]{};
  if (std::fgets(line, static_cast<int>(sizeof(line)), file_) == nullptr) {
    std::clearerr(file_);
    return false;
  }

  CpuTicks ticks{};
  if (!parse_cpu_line(line, ticks)) {
    return false;
  }

  const std::uint64_t total = ticks.busy + ticks.idle;
  const bool had_baseline = has_prev_;
  const std::uint64_t total_delta = forward_delta(total, prev_total_);
  const std::uint64_t idle_delta = forward_delta(ticks.idle, prev_idle_);
  prev_total_ = total;
  prev_idle_ = ticks.idle;
  has_prev_ = true;

  // The first read has nothing to diff against and is not a measurement.
  if (!had_baseline) {
    return false;
  }
  // A shrinking total means the counters were reset; report idle for that window.
  if (total_delta == 0 || idle_delta > total_delta) {
    return true;
  }

  utilization_pct = static_cast<double>(total_delta - idle_delta) / static_cast<double>(total_delta) * 100.0;
  return true;
}

}  // namespace joule_gate::sensors
