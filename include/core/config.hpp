#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace joule_gate::core {

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  bool enabled{false};
};

struct EnergyConfig {
  double cpu_tdp_w{65.0};
  double smoothing_alpha{0.2};
  double sample_hz{1.0};
  double idle_cpu_seed_w{15.0};
  double idle_gpu_seed_w{20.0};
  double idle_learn_w{0.0};
  std::string cpu_source{"utilization"};
  bool gpu_enabled{true};
  std::uint32_t gpu_device_index{0};
};

struct BudgetConfig {
  std::string mode{"local"};
  std::string socket_path{};
  std::chrono::milliseconds transport_timeout{500};
};

struct SchedulerConfig {
  std::chrono::milliseconds idle_delay{300};
  std::string backoff{"fixed"};
  std::chrono::milliseconds backoff_delay{200};
  std::chrono::milliseconds backoff_max{2000};
  std::chrono::milliseconds ledger_retry_delay{500};
  std::uint32_t ledger_max_attempts{0};
};

struct MergeConfig {
  double delta_threshold{0.002};
  double secondary_threshold{0.01};
  std::string base_path{"./state/base_model"};
  std::string generations_dir{"./state/generations"};
  std::string candidates_dir{"./state/candidates"};
};

struct LedgerConfig {
  std::string path{"./state/receipts.jsonl"};
  bool fsync{true};
};

struct TaskConfig {
  std::string name;
  double min_budget_j{0.0};
  double cost_j{0.0};
  std::string command{};
  bool merge{false};
};

struct GateConfig {
  EnergyConfig energy{};
  BudgetConfig budget{};
  SchedulerConfig scheduler{};
  MergeConfig merge{};
  LedgerConfig ledger{};
  RedisConfig redis{};
  bool stdout_debug{false};
  std::vector<TaskConfig> tasks{};

  [[nodiscard]] std::chrono::milliseconds sample_period() const;
};

GateConfig load_gate_config(const std::string& path);

// JOULE_CPU_TDP_W, JOULE_SMOOTHING, JOULE_HZ, JOULE_IDLE_LEARN_W, JOULE_AGENT_SOCKET.
void apply_env_overrides(GateConfig& config);

// Throws std::runtime_error naming the first offending key.
void validate_gate_config(const GateConfig& config);

}  // namespace joule_gate::core
