#include "core/sampler.hpp"

#include <cmath>
#include <exception>
#include <iostream>
#include <utility>

#include "core/timestamp.hpp"

namespace joule_gate::core {

PowerSampler::PowerSampler(budget::BudgetService& budget, std::unique_ptr<sensors::PowerSource> source,
                           const std::chrono::milliseconds period)
    : budget_(budget), source_(std::move(source)), period_(period) {}

PowerSampler::~PowerSampler() { stop(); }

void PowerSampler::add_observer(Observer observer) { observers_.push_back(std::move(observer)); }

void PowerSampler::start() {
  if (worker_.joinable()) {
    return;
  }

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    stop_requested_ = false;
  }
  worker_ = std::thread([this]() { run(); });
}

void PowerSampler::stop() {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    stop_requested_ = true;
  }
  wake_.notify_all();

  if (worker_.joinable()) {
    worker_.join();
  }
}

model::energy_sample PowerSampler::tick(const std::chrono::steady_clock::time_point now) {
  const model::power_reading reading = source_->read(now);

  // Measured, not nominal: a late wakeup charges for the time that actually passed.
  double elapsed_s = 0.0;
  if (previous_tick_.has_value() && now > *previous_tick_) {
    elapsed_s = seconds_between(*previous_tick_, now);
  }
  previous_tick_ = now;

  const model::energy_sample sample = budget_.accumulate(reading, elapsed_s);

  SamplerStats snapshot{};
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    ++stats_.ticks;
    if (!reading.cpu_w.has_value()) {
      ++stats_.cpu_read_failures;
    }
    if (!reading.gpu_w.has_value()) {
      ++stats_.gpu_read_failures;
    }
    const double period_s = std::chrono::duration_cast<std::chrono::duration<double>>(period_).count();
    stats_.last_jitter_ms = elapsed_s > 0.0 ? static_cast<float>(std::fabs(elapsed_s - period_s) * 1000.0) : 0.0F;
    snapshot = stats_;
  }

  for (const auto& observer : observers_) {
    try {
      observer(sample, snapshot);
    } catch (const std::exception& ex) {
      std::cerr << "[sampler] observer failed: " << ex.what() << '\n';
    }
  }

  return sample;
}

SamplerStats PowerSampler::stats() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return stats_;
}

void PowerSampler::run() {
  auto next_wakeup = std::chrono::steady_clock::now();

  while (true) {
    try {
      tick(std::chrono::steady_clock::now());
    } catch (const std::exception& ex) {
      std::cerr << "[sampler] tick failed: " << ex.what() << '\n';
    }

    next_wakeup += period_;
    const auto now = std::chrono::steady_clock::now();
    if (now > next_wakeup + period_) {
      // Fell more than a period behind; re-anchor instead of bursting ticks.
      {
        std::lock_guard<std::mutex> lock(state_mutex_);
        ++stats_.missed_periods;
      }
      next_wakeup = now;
    }

    std::unique_lock<std::mutex> lock(state_mutex_);
    if (wake_.wait_until(lock, next_wakeup, [this]() { return stop_requested_; })) {
      return;
    }
  }
}

}  // namespace joule_gate::core
