#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "budget/budget_service.hpp"
#include "model/energy_sample.hpp"
#include "sensors/power.hpp"

namespace joule_gate::core {

struct SamplerStats {
  std::uint64_t ticks{0};
  std::uint64_t cpu_read_failures{0};
  std::uint64_t gpu_read_failures{0};
  std::uint64_t missed_periods{0};
  float last_jitter_ms{0.0F};
};

// Periodic credit loop: reads the source, and charges the budget with net
// power times the measured time since the previous tick.
class PowerSampler {
 public:
  using Observer = std::function<void(const model::energy_sample&, const SamplerStats&)>;

  PowerSampler(budget::BudgetService& budget, std::unique_ptr<sensors::PowerSource> source,
               std::chrono::milliseconds period);
  ~PowerSampler();

  PowerSampler(const PowerSampler&) = delete;
  PowerSampler& operator=(const PowerSampler&) = delete;

  void add_observer(Observer observer);

  void start();
  void stop();

  // One tick at the given instant. The first tick integrates nothing.
  model::energy_sample tick(std::chrono::steady_clock::time_point now);

  [[nodiscard]] SamplerStats stats() const;

 private:
  void run();

  budget::BudgetService& budget_;
  std::unique_ptr<sensors::PowerSource> source_;
  std::chrono::milliseconds period_;
  std::optional<std::chrono::steady_clock::time_point> previous_tick_{};
  std::vector<Observer> observers_{};

  mutable std::mutex state_mutex_;
  std::condition_variable wake_;
  bool stop_requested_{false};
  SamplerStats stats_{};
  std::thread worker_{};
};

}  // namespace joule_gate::core
