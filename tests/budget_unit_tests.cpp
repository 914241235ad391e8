#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "budget/budget_service.hpp"
#include "core/digest.hpp"
#include "core/sampler.hpp"
#include "model/energy_sample.hpp"
#include "sensors/power.hpp"

using joule_gate::budget::BudgetOptions;
using joule_gate::budget::BudgetService;
using joule_gate::budget::net_power_w;
using joule_gate::core::PowerSampler;
using joule_gate::core::SamplerStats;
using joule_gate::model::energy_sample;
using joule_gate::model::power_reading;
using joule_gate::model::take_result;
using joule_gate::sensors::PowerSource;

namespace {

bool almost_equal(double a, double b, double eps = 1e-6) { return std::fabs(a - b) <= eps; }

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

// Zero baselines that never learn: every watt read is net and lands in the bucket.
BudgetOptions charging_options() {
  BudgetOptions options{};
  options.idle_cpu_seed_w = 0.0;
  options.idle_gpu_seed_w = 0.0;
  options.idle_learn_w = 1e-9;
  return options;
}

void fund(BudgetService& budget, double joules) {
  power_reading reading{};
  reading.cpu_w = joules;
  budget.accumulate(reading, 1.0);
}

class ScriptedSource final : public PowerSource {
 public:
  explicit ScriptedSource(power_reading reading) : reading_(reading) {}

  power_reading read(std::chrono::steady_clock::time_point) override { return reading_; }

 private:
  power_reading reading_;
};

int test_take_from_empty_bucket_is_refused() {
  BudgetService budget{charging_options()};
  const take_result result = budget.take(20.0);
  if (result.ok || !almost_equal(result.remaining_j, 0.0)) {
    return fail("test_take_from_empty_bucket_is_refused", "take(20) on 0 J should return (false, 0)");
  }
  if (!almost_equal(budget.sample().bucket_joules, 0.0)) {
    return fail("test_take_from_empty_bucket_is_refused", "refused take must not change the bucket");
  }
  return 0;
}

int test_take_debits_exact_amount() {
  BudgetService budget{charging_options()};
  fund(budget, 50.0);
  if (!almost_equal(budget.sample().bucket_joules, 50.0)) {
    return fail("test_take_debits_exact_amount", "funding should leave 50 J");
  }

  const take_result result = budget.take(20.0);
  if (!result.ok || !almost_equal(result.remaining_j, 30.0)) {
    return fail("test_take_debits_exact_amount", "take(20) on 50 J should return (true, 30)");
  }
  if (!almost_equal(budget.sample().bucket_joules, 30.0)) {
    return fail("test_take_debits_exact_amount", "bucket should read 30 J after the debit");
  }
  return 0;
}

int test_take_rejects_invalid_amounts() {
  BudgetService budget{charging_options()};
  fund(budget, 10.0);

  if (budget.take(-1.0).ok) {
    return fail("test_take_rejects_invalid_amounts", "negative take must be refused");
  }
  if (budget.take(std::numeric_limits<double>::quiet_NaN()).ok) {
    return fail("test_take_rejects_invalid_amounts", "NaN take must be refused");
  }
  if (budget.take(std::numeric_limits<double>::infinity()).ok) {
    return fail("test_take_rejects_invalid_amounts", "infinite take must be refused");
  }
  if (!almost_equal(budget.sample().bucket_joules, 10.0)) {
    return fail("test_take_rejects_invalid_amounts", "refused takes must not change the bucket");
  }
  if (!budget.take(0.0).ok) {
    return fail("test_take_rejects_invalid_amounts", "zero take is a valid no-op debit");
  }
  return 0;
}

int test_concurrent_takes_admit_exactly_one() {
  for (int round = 0; round < 200; ++round) {
    BudgetService budget{charging_options()};
    fund(budget, 30.0);

    std::atomic<bool> go{false};
    std::atomic<int> admitted{0};
    const auto contender = [&]() {
      while (!go.load()) {
        std::this_thread::yield();
      }
      if (budget.take(20.0).ok) {
        admitted.fetch_add(1);
      }
    };

    std::thread first(contender);
    std::thread second(contender);
    go.store(true);
    first.join();
    second.join();

    if (admitted.load() != 1) {
      return fail("test_concurrent_takes_admit_exactly_one", "exactly one of two take(20) on 30 J must succeed");
    }
    if (!almost_equal(budget.sample().bucket_joules, 10.0)) {
      return fail("test_concurrent_takes_admit_exactly_one", "final bucket should be 10 J");
    }
  }
  return 0;
}

int test_bucket_never_negative_under_contention() {
  BudgetService budget{charging_options()};
  fund(budget, 1000.0);

  std::vector<std::thread> workers;
  for (int t = 0; t < 4; ++t) {
    workers.emplace_back([&budget, t]() {
      for (int i = 0; i < 500; ++i) {
        budget.take(static_cast<double>((i + t) % 7) + 0.5);
      }
    });
  }
  workers.emplace_back([&budget]() {
    for (int i = 0; i < 100; ++i) {
      fund(budget, 3.0);
    }
  });

  for (auto& worker : workers) {
    worker.join();
  }

  if (budget.sample().bucket_joules < 0.0) {
    return fail("test_bucket_never_negative_under_contention", "bucket went negative");
  }
  return 0;
}

int test_net_power_matches_baselines_for_every_sample() {
  BudgetService budget{};
  const double readings[][2] = {{5.0, 10.0}, {80.0, 250.0}, {15.0, 20.0}, {0.0, 0.0}, {200.0, 5.0}, {30.0, 300.0}};
  for (const auto& values : readings) {
    power_reading reading{};
    reading.cpu_w = values[0];
    reading.gpu_w = values[1];
    const energy_sample sample = budget.accumulate(reading, 0.5);
    const double expected = std::max(0.0, sample.cpu_power_w - sample.idle_cpu_w) +
                            std::max(0.0, sample.gpu_power_w - sample.idle_gpu_w);
    if (!almost_equal(sample.net_power_w, expected) || sample.net_power_w < 0.0) {
      return fail("test_net_power_matches_baselines_for_every_sample", "net power invariant violated");
    }
  }

  if (!almost_equal(net_power_w(10.0, 15.0, 30.0, 20.0), 10.0)) {
    return fail("test_net_power_matches_baselines_for_every_sample", "below-idle cpu should contribute 0");
  }
  return 0;
}

int test_idle_baseline_converges_monotonically() {
  BudgetOptions options{};
  options.smoothing_alpha = 0.2;
  options.idle_cpu_seed_w = 15.0;
  options.idle_gpu_seed_w = 120.0;
  BudgetService budget{options};

  power_reading reading{};
  reading.cpu_w = 40.0;
  reading.gpu_w = 30.0;

  double previous_cpu_gap = std::fabs(15.0 - 40.0);
  double previous_gpu_gap = std::fabs(120.0 - 30.0);
  double previous_idle_cpu = 15.0;
  double previous_idle_gpu = 120.0;
  for (int tick = 0; tick < 60; ++tick) {
    const energy_sample sample = budget.accumulate(reading, 1.0);
    const double cpu_gap = std::fabs(sample.idle_cpu_w - 40.0);
    const double gpu_gap = std::fabs(sample.idle_gpu_w - 30.0);
    if (cpu_gap > previous_cpu_gap || gpu_gap > previous_gpu_gap) {
      return fail("test_idle_baseline_converges_monotonically", "baseline moved away from a constant input");
    }
    if (sample.idle_cpu_w < previous_idle_cpu || sample.idle_gpu_w > previous_idle_gpu) {
      return fail("test_idle_baseline_converges_monotonically", "baseline overshot or reversed direction");
    }
    previous_cpu_gap = cpu_gap;
    previous_gpu_gap = gpu_gap;
    previous_idle_cpu = sample.idle_cpu_w;
    previous_idle_gpu = sample.idle_gpu_w;
  }

  if (previous_cpu_gap > 0.01 || previous_gpu_gap > 0.01) {
    return fail("test_idle_baseline_converges_monotonically", "baseline did not converge within 60 ticks");
  }
  return 0;
}

int test_first_ema_step_uses_alpha() {
  BudgetOptions options{};
  options.smoothing_alpha = 0.2;
  options.idle_cpu_seed_w = 15.0;
  options.idle_gpu_seed_w = 20.0;
  BudgetService budget{options};

  power_reading reading{};
  reading.cpu_w = 65.0;
  reading.gpu_w = 20.0;
  const energy_sample sample = budget.accumulate(reading, 2.0);
  // idle_cpu = 0.2 * 65 + 0.8 * 15 = 25, net = 40, bucket = 80.
  if (!almost_equal(sample.idle_cpu_w, 25.0) || !almost_equal(sample.net_power_w, 40.0) ||
      !almost_equal(sample.bucket_joules, 80.0)) {
    return fail("test_first_ema_step_uses_alpha", "first EMA step mismatch");
  }
  return 0;
}

int test_unavailable_device_adds_no_charge() {
  BudgetOptions options{};
  options.idle_cpu_seed_w = 15.0;
  options.idle_gpu_seed_w = 20.0;
  BudgetService budget{options};

  power_reading reading{};
  reading.cpu_w = 15.0;
  const energy_sample sample = budget.accumulate(reading, 10.0);
  if (!almost_equal(sample.idle_gpu_w, 20.0)) {
    return fail("test_unavailable_device_adds_no_charge", "missing gpu must not move its baseline");
  }
  if (!almost_equal(sample.gpu_power_w, 0.0) || !almost_equal(sample.bucket_joules, 0.0)) {
    return fail("test_unavailable_device_adds_no_charge", "missing gpu must contribute 0 J");
  }

  power_reading nothing{};
  if (!almost_equal(budget.accumulate(nothing, 10.0).bucket_joules, 0.0)) {
    return fail("test_unavailable_device_adds_no_charge", "an empty reading must not charge the bucket");
  }
  return 0;
}

int test_idle_learning_gate_holds_baseline_under_load() {
  BudgetOptions options{};
  options.smoothing_alpha = 0.5;
  options.idle_cpu_seed_w = 10.0;
  options.idle_gpu_seed_w = 0.0;
  options.idle_learn_w = 5.0;
  BudgetService budget{options};

  power_reading busy{};
  busy.cpu_w = 100.0;
  if (!almost_equal(budget.accumulate(busy, 1.0).idle_cpu_w, 10.0)) {
    return fail("test_idle_learning_gate_holds_baseline_under_load", "busy tick must not train the baseline");
  }

  power_reading quiet{};
  quiet.cpu_w = 12.0;
  if (!almost_equal(budget.accumulate(quiet, 1.0).idle_cpu_w, 11.0)) {
    return fail("test_idle_learning_gate_holds_baseline_under_load", "quiet tick should train the baseline");
  }
  return 0;
}

int test_sample_carries_integrity_hash() {
  BudgetService budget{charging_options()};
  fund(budget, 12.5);
  const energy_sample sample = budget.sample();
  if (sample.integrity_hash.size() != 64 ||
      sample.integrity_hash != joule_gate::core::sample_digest(sample.timestamp, sample.bucket_joules)) {
    return fail("test_sample_carries_integrity_hash", "hash should bind timestamp and bucket");
  }
  if (joule_gate::core::sha256_hex("abc") !=
      "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad") {
    return fail("test_sample_carries_integrity_hash", "sha256 known answer mismatch");
  }
  return 0;
}

int test_sampler_integrates_measured_elapsed_time() {
  BudgetService budget{charging_options()};
  power_reading reading{};
  reading.cpu_w = 25.0;
  PowerSampler sampler(budget, std::make_unique<ScriptedSource>(reading), std::chrono::milliseconds(1000));

  int observed = 0;
  sampler.add_observer([&observed](const energy_sample&, const SamplerStats&) { ++observed; });
  sampler.add_observer([](const energy_sample&, const SamplerStats&) { throw std::runtime_error("sink down"); });

  const auto t0 = std::chrono::steady_clock::now();
  if (!almost_equal(sampler.tick(t0).bucket_joules, 0.0)) {
    return fail("test_sampler_integrates_measured_elapsed_time", "first tick must not charge anything");
  }
  if (!almost_equal(sampler.tick(t0 + std::chrono::milliseconds(500)).bucket_joules, 12.5)) {
    return fail("test_sampler_integrates_measured_elapsed_time", "25 W over 0.5 s should add 12.5 J");
  }
  if (!almost_equal(sampler.tick(t0 + std::chrono::milliseconds(2500)).bucket_joules, 62.5)) {
    return fail("test_sampler_integrates_measured_elapsed_time", "late tick should charge the full 2 s");
  }

  const SamplerStats stats = sampler.stats();
  if (stats.ticks != 3 || observed != 3) {
    return fail("test_sampler_integrates_measured_elapsed_time", "every tick should reach every observer");
  }
  if (stats.gpu_read_failures != 3 || stats.cpu_read_failures != 0) {
    return fail("test_sampler_integrates_measured_elapsed_time", "missing gpu should count as a read failure");
  }
  if (std::fabs(stats.last_jitter_ms - 1000.0F) > 0.5F) {
    return fail("test_sampler_integrates_measured_elapsed_time", "jitter should be 1000 ms for a 2 s gap");
  }
  return 0;
}

int test_sampler_thread_starts_and_stops() {
  BudgetService budget{charging_options()};
  power_reading reading{};
  reading.cpu_w = 10.0;
  PowerSampler sampler(budget, std::make_unique<ScriptedSource>(reading), std::chrono::milliseconds(10));

  sampler.start();
  std::this_thread::sleep_for(std::chrono::milliseconds(120));
  sampler.stop();

  const std::uint64_t ticks = sampler.stats().ticks;
  if (ticks < 2) {
    return fail("test_sampler_thread_starts_and_stops", "sampler thread should tick repeatedly");
  }
  if (!(budget.sample().bucket_joules > 0.0)) {
    return fail("test_sampler_thread_starts_and_stops", "sampler thread should credit the bucket");
  }

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  if (sampler.stats().ticks != ticks) {
    return fail("test_sampler_thread_starts_and_stops", "no ticks after stop()");
  }
  return 0;
}

int test_sampler_reanchors_after_a_stalled_tick() {
  using std::chrono::milliseconds;
  using std::chrono::steady_clock;

  BudgetService budget{charging_options()};
  power_reading reading{};
  reading.cpu_w = 10.0;
  const milliseconds period(20);
  PowerSampler sampler(budget, std::make_unique<ScriptedSource>(reading), period);

  std::mutex mutex;
  std::vector<steady_clock::time_point> tick_times;
  sampler.add_observer([&](const energy_sample&, const SamplerStats&) {
    std::size_t index = 0;
    {
      std::lock_guard<std::mutex> lock(mutex);
      tick_times.push_back(steady_clock::now());
      index = tick_times.size();
    }
    // One tick stalls for more than five periods.
    if (index == 3) {
      std::this_thread::sleep_for(milliseconds(110));
    }
  });

  sampler.start();
  std::this_thread::sleep_for(milliseconds(300));
  sampler.stop();

  std::lock_guard<std::mutex> lock(mutex);
  if (tick_times.size() < 5) {
    return fail("test_sampler_reanchors_after_a_stalled_tick", "sampler should keep ticking after the stall");
  }
  if (sampler.stats().missed_periods < 1) {
    return fail("test_sampler_reanchors_after_a_stalled_tick", "the stall should count as missed periods");
  }

  // Catching up on the skipped slots would add about five ticks right after the stall.
  const auto stall_start = tick_times[2];
  const auto last = tick_times.back();
  const auto span_ms = std::chrono::duration_cast<milliseconds>(last - stall_start).count();
  const auto ticks_since_stall = static_cast<long long>(tick_times.size() - 3);
  const long long slots_after_stall = (span_ms - 110) / period.count() + 2;
  if (ticks_since_stall > slots_after_stall) {
    return fail("test_sampler_reanchors_after_a_stalled_tick", "ticks after a stall must not burst");
  }
  if (tick_times[3] - stall_start < milliseconds(110)) {
    return fail("test_sampler_reanchors_after_a_stalled_tick", "next tick cannot start before the stall ends");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_take_from_empty_bucket_is_refused(); rc != 0) {
    return rc;
  }
  if (int rc = test_take_debits_exact_amount(); rc != 0) {
    return rc;
  }
  if (int rc = test_take_rejects_invalid_amounts(); rc != 0) {
    return rc;
  }
  if (int rc = test_concurrent_takes_admit_exactly_one(); rc != 0) {
    return rc;
  }
  if (int rc = test_bucket_never_negative_under_contention(); rc != 0) {
    return rc;
  }
  if (int rc = test_net_power_matches_baselines_for_every_sample(); rc != 0) {
    return rc;
  }
  if (int rc = test_idle_baseline_converges_monotonically(); rc != 0) {
    return rc;
  }
  if (int rc = test_first_ema_step_uses_alpha(); rc != 0) {
    return rc;
  }
  if (int rc = test_unavailable_device_adds_no_charge(); rc != 0) {
    return rc;
  }
  if (int rc = test_idle_learning_gate_holds_baseline_under_load(); rc != 0) {
    return rc;
  }
  if (int rc = test_sample_carries_integrity_hash(); rc != 0) {
    return rc;
  }
  if (int rc = test_sampler_integrates_measured_elapsed_time(); rc != 0) {
    return rc;
  }
  if (int rc = test_sampler_thread_starts_and_stops(); rc != 0) {
    return rc;
  }
  if (int rc = test_sampler_reanchors_after_a_stalled_tick(); rc != 0) {
    return rc;
  }

  std::cout << "[PASS] budget unit tests\n";
  return 0;
}
