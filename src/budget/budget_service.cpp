#include "budget/budget_service.hpp"

#include <algorithm>
#include <cmath>

#include "core/digest.hpp"
#include "core/timestamp.hpp"

namespace joule_gate::budget {

namespace {
double ema(const double alpha, const double current, const double previous) noexcept {
  return (alpha * current) + ((1.0 - alpha) * previous);
}
}  // namespace

double net_power_w(const double cpu_w, const double idle_cpu_w, const double gpu_w, const double idle_gpu_w) noexcept {
  return std::max(0.0, cpu_w - idle_cpu_w) + std::max(0.0, gpu_w - idle_gpu_w);
}

BudgetService::BudgetService(BudgetOptions options)
    : options_(options), idle_cpu_w_(options.idle_cpu_seed_w), idle_gpu_w_(options.idle_gpu_seed_w) {}

model::energy_sample BudgetService::sample() {
  const double now = core::unix_seconds_now();
  std::lock_guard<std::mutex> lock(mutex_);
  return snapshot_locked(now);
}

model::take_result BudgetService::take(const double joules) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!std::isfinite(joules) || joules < 0.0 || bucket_j_ < joules) {
    return model::take_result{false, bucket_j_};
  }

  bucket_j_ -= joules;
  return model::take_result{true, bucket_j_};
}

model::energy_sample BudgetService::accumulate(const model::power_reading& reading, const double elapsed_s) {
  const double now = core::unix_seconds_now();
  const bool has_cpu = reading.cpu_w.has_value() && std::isfinite(*reading.cpu_w);
  const bool has_gpu = reading.gpu_w.has_value() && std::isfinite(*reading.gpu_w);
  const double cpu_w = has_cpu ? std::max(0.0, *reading.cpu_w) : 0.0;
  const double gpu_w = has_gpu ? std::max(0.0, *reading.gpu_w) : 0.0;

  std::lock_guard<std::mutex> lock(mutex_);

  const bool learn = options_.idle_learn_w <= 0.0 ||
                     net_power_w(cpu_w, idle_cpu_w_, gpu_w, idle_gpu_w_) < options_.idle_learn_w;
  if (learn) {
    if (has_cpu) {
      idle_cpu_w_ = ema(options_.smoothing_alpha, cpu_w, idle_cpu_w_);
    }
    if (has_gpu) {
      idle_gpu_w_ = ema(options_.smoothing_alpha, gpu_w, idle_gpu_w_);
    }
  }

  cpu_w_ = cpu_w;
  gpu_w_ = gpu_w;
  net_w_ = net_power_w(cpu_w_, idle_cpu_w_, gpu_w_, idle_gpu_w_);
  if (std::isfinite(elapsed_s) && elapsed_s > 0.0) {
    bucket_j_ += net_w_ * elapsed_s;
  }

  return snapshot_locked(now);
}

model::energy_sample BudgetService::snapshot_locked(const double timestamp) const {
  model::energy_sample out{};
  out.timestamp = timestamp;
  out.cpu_power_w = cpu_w_;
  out.gpu_power_w = gpu_w_;
  out.idle_cpu_w = idle_cpu_w_;
  out.idle_gpu_w = idle_gpu_w_;
  out.net_power_w = net_w_;
  out.bucket_joules = bucket_j_;
  out.integrity_hash = core::sample_digest(timestamp, bucket_j_);
  return out;
}

}  // namespace joule_gate::budget
