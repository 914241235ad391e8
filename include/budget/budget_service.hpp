#pragma once

#include <mutex>

#include "budget/budget_source.hpp"
#include "model/energy_sample.hpp"

namespace joule_gate::budget {

struct BudgetOptions {
  double smoothing_alpha{0.2};
  double idle_cpu_seed_w{15.0};
  double idle_gpu_seed_w{20.0};
  // Baselines only learn on ticks whose net power is below this. 0 disables the gate.
  double idle_learn_w{0.0};
};

// Sole owner of the Joule bucket and the idle baselines. Every read and write
// goes through one mutex, so sample(), take() and accumulate() are linearizable.
class BudgetService final : public BudgetSource {
 public:
  explicit BudgetService(BudgetOptions options = {});

  BudgetService(const BudgetService&) = delete;
  BudgetService& operator=(const BudgetService&) = delete;

  model::energy_sample sample() override;

  // All-or-nothing debit. Negative or non-finite requests are refused.
  model::take_result take(double joules) override;

  // Sampler credit: updates the baselines from the reading, computes net
  // power and integrates it over elapsed_s into the bucket.
  model::energy_sample accumulate(const model::power_reading& reading, double elapsed_s);

  [[nodiscard]] const BudgetOptions& options() const noexcept { return options_; }

 private:
  model::energy_sample snapshot_locked(double timestamp) const;

  BudgetOptions options_;
  mutable std::mutex mutex_;
  double bucket_j_{0.0};
  double idle_cpu_w_{0.0};
  double idle_gpu_w_{0.0};
  double cpu_w_{0.0};
  double gpu_w_{0.0};
  double net_w_{0.0};
};

double net_power_w(double cpu_w, double idle_cpu_w, double gpu_w, double idle_gpu_w) noexcept;

}  // namespace joule_gate::budget
