#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

#include "budget/budget_service.hpp"
#include "budget/remote_budget.hpp"
#include "core/config.hpp"
#include "core/sampler.hpp"
#include "ledger/receipt_ledger.hpp"
#include "merge/merge_gate.hpp"
#include "rpc/budget_server.hpp"
#include "sched/backoff.hpp"
#include "sched/command_task.hpp"
#include "sched/scheduler.hpp"
#include "sched/selection_policy.hpp"
#include "sensors/cpu.hpp"
#include "sensors/gpu/gpu.hpp"
#include "sensors/power.hpp"
#include "sensors/rapl.hpp"
#include "sinks/redis_ts.hpp"
#include "sinks/stdout_debug.hpp"

namespace {

std::atomic<bool> g_shutdown_requested{false};

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested.store(true);
}

using joule_gate::core::GateConfig;

std::string format_config_settings(const GateConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[agent] loaded config from " << config_path
         << " | mode=" << config.budget.mode
         << " | sample_hz=" << config.energy.sample_hz
         << " | cpu_source=" << config.energy.cpu_source
         << " | cpu_tdp_w=" << config.energy.cpu_tdp_w
         << " | smoothing_alpha=" << config.energy.smoothing_alpha
         << " | tasks=" << config.tasks.size()
         << " | ledger=" << config.ledger.path
         << " | redis_enabled=" << (config.redis.enabled ? "true" : "false")
         << " | redis_address=";

  if (!config.redis.unix_socket.empty()) {
    output << "unix://" << config.redis.unix_socket;
  } else {
    output << config.redis.host << ':' << config.redis.port;
  }
  return output.str();
}

std::unique_ptr<joule_gate::sensors::PowerSource> make_power_source(const joule_gate::core::EnergyConfig& energy) {
  using namespace joule_gate::sensors;

  std::unique_ptr<gpu::GpuSensor> gpu_sensor =
      energy.gpu_enabled ? gpu::make_nvml_sensor(energy.gpu_device_index) : gpu::make_none_sensor();
  if (energy.gpu_enabled && !gpu_sensor->available()) {
    std::cerr << "[agent] NVML unavailable; GPU contributes 0 W\n";
    gpu_sensor = gpu::make_none_sensor();
  }

  if (energy.cpu_source == "rapl") {
    auto rapl = std::make_unique<RaplSensor>();
    if (rapl->available()) {
      return std::make_unique<SystemPowerSource>(std::move(rapl), std::move(gpu_sensor));
    }
    std::cerr << "[agent] RAPL counter unavailable; falling back to utilization x TDP\n";
  }
  return std::make_unique<SystemPowerSource>(energy.cpu_tdp_w, std::make_unique<CpuSensor>(), std::move(gpu_sensor));
}

void attach_sinks(joule_gate::core::PowerSampler& sampler, const GateConfig& config) {
  if (config.redis.enabled) {
    joule_gate::sinks::RedisTsOptions options{};
    options.host = config.redis.host;
    options.port = config.redis.port;
    options.unix_socket = config.redis.unix_socket;
    auto redis = std::make_shared<joule_gate::sinks::RedisTsSink>(std::move(options));
    if (!redis->check_connectivity()) {
      std::cerr << "[redis] not reachable at startup; will retry on each tick\n";
    }
    sampler.add_observer([redis](const joule_gate::model::energy_sample& sample,
                                 const joule_gate::core::SamplerStats& stats) { redis->publish(sample, stats); });
  }

  if (config.stdout_debug) {
    sampler.add_observer([sink = joule_gate::sinks::StdoutDebugSink{}](
                             const joule_gate::model::energy_sample& sample,
                             const joule_gate::core::SamplerStats&) { sink.publish(sample); });
  }
}

std::unique_ptr<joule_gate::core::PowerSampler> start_sampler(joule_gate::budget::BudgetService& budget,
                                                              const GateConfig& config) {
  auto sampler = std::make_unique<joule_gate::core::PowerSampler>(budget, make_power_source(config.energy),
                                                                   config.sample_period());
  attach_sinks(*sampler, config);
  sampler->start();
  return sampler;
}

joule_gate::budget::BudgetOptions budget_options(const joule_gate::core::EnergyConfig& energy) {
  joule_gate::budget::BudgetOptions options{};
  options.smoothing_alpha = energy.smoothing_alpha;
  options.idle_cpu_seed_w = energy.idle_cpu_seed_w;
  options.idle_gpu_seed_w = energy.idle_gpu_seed_w;
  options.idle_learn_w = energy.idle_learn_w;
  return options;
}

void ensure_state_directories(const GateConfig& config) {
  namespace fs = std::filesystem;
  for (const fs::path& dir : {fs::path(config.merge.generations_dir), fs::path(config.merge.candidates_dir),
                              fs::path(config.merge.base_path).parent_path()}) {
    if (dir.empty()) {
      continue;
    }
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
      throw std::runtime_error("unable to create " + dir.string() + ": " + ec.message());
    }
  }
}

int run_scheduler(joule_gate::budget::BudgetSource& budget, const GateConfig& config) {
  using namespace joule_gate;

  ensure_state_directories(config);
  ledger::FileReceiptLedger ledger{config.ledger.path, config.ledger.fsync};
  std::cerr << "[ledger] " << ledger.path().string() << " holds " << ledger.size() << " receipts; next id "
            << ledger.next_id() << '\n';

  merge::MergeGate gate{merge::MergeThresholds{config.merge.delta_threshold, config.merge.secondary_threshold},
                        config.merge.base_path, config.merge.generations_dir, config.merge.candidates_dir};

  sched::SelectionPolicy policy;
  for (const auto& task : config.tasks) {
    sched::CommandTaskOptions options{};
    options.name = task.name;
    options.cost_j = task.cost_j;
    options.command = task.command;
    options.candidates_dir = config.merge.candidates_dir;
    policy.add(task.min_budget_j, std::make_shared<sched::CommandTask>(std::move(options), task.merge ? &gate : nullptr));
  }
  if (policy.empty()) {
    std::cerr << "[scheduler] no tasks configured; the scheduler will only idle\n";
  }

  sched::SchedulerOptions options{};
  options.idle_delay = config.scheduler.idle_delay;
  options.ledger_retry_delay = config.scheduler.ledger_retry_delay;
  options.ledger_max_attempts = config.scheduler.ledger_max_attempts;

  sched::Scheduler scheduler{budget, ledger, std::move(policy),
                             sched::make_backoff(config.scheduler.backoff, config.scheduler.backoff_delay,
                                                 config.scheduler.backoff_max),
                             options};
  scheduler.run(g_shutdown_requested);

  const auto& stats = scheduler.stats();
  std::cerr << "[scheduler] stopped | executions=" << stats.executions << " | task_failures=" << stats.task_failures
            << " | debit_failures=" << stats.debit_failures << '\n';
  return 0;
}

int run_local(const GateConfig& config) {
  joule_gate::budget::BudgetService budget{budget_options(config.energy)};
  auto sampler = start_sampler(budget, config);

  std::thread server_thread;
  if (!config.budget.socket_path.empty()) {
    server_thread = std::thread([&budget, &config]() {
      joule_gate::rpc::BudgetServer server{budget};
      if (!server.serve(config.budget.socket_path, g_shutdown_requested)) {
        std::cerr << "[rpc] budget socket disabled\n";
      }
    });
  }

  int status = 0;
  try {
    status = run_scheduler(budget, config);
  } catch (...) {
    g_shutdown_requested.store(true);
    if (server_thread.joinable()) {
      server_thread.join();
    }
    sampler->stop();
    throw;
  }

  g_shutdown_requested.store(true);
  if (server_thread.joinable()) {
    server_thread.join();
  }
  sampler->stop();
  return status;
}

int run_agent(const GateConfig& config) {
  joule_gate::budget::BudgetService budget{budget_options(config.energy)};
  auto sampler = start_sampler(budget, config);

  joule_gate::rpc::BudgetServer server{budget};
  const bool served = server.serve(config.budget.socket_path, g_shutdown_requested);
  sampler->stop();
  return served ? 0 : 1;
}

int run_remote(const GateConfig& config) {
  joule_gate::budget::RemoteBudget budget{config.budget.socket_path, config.budget.transport_timeout};
  const int status = run_scheduler(budget, config);
  std::cerr << "[budget] transport_errors=" << budget.transport_errors()
            << " | rejected_samples=" << budget.rejected_samples() << '\n';
  return status;
}

}  // namespace

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

  const std::string config_path = argc > 1 ? argv[1] : "configs/joule-gate.yaml";

  GateConfig config{};
  try {
    config = joule_gate::core::load_gate_config(config_path);
    joule_gate::core::apply_env_overrides(config);
    joule_gate::core::validate_gate_config(config);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  int status = 0;
  try {
    if (config.budget.mode == "agent") {
      status = run_agent(config);
    } else if (config.budget.mode == "remote") {
      status = run_remote(config);
    } else {
      status = run_local(config);
    }
  } catch (const joule_gate::ledger::LedgerError& ex) {
    std::cerr << "[ledger] fatal: " << ex.what() << '\n';
    return 2;
  } catch (const std::exception& ex) {
    std::cerr << "[agent] fatal: " << ex.what() << '\n';
    return 1;
  }

  if (g_shutdown_requested.load()) {
    std::cerr << "[agent] shutdown signal received; exiting cleanly\n";
  }
  return status;
}
