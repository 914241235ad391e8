#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace joule_gate::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool parse_bool(const std::string& value) {
  const std::string lower = [&value]() {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
      out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
  }();

  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

std::chrono::milliseconds parse_millis(const std::string& key, const std::string& value) {
  const auto parsed = std::stoll(value);
  if (parsed < 0) {
    throw std::runtime_error(key + " must be greater than or equal to 0");
  }
  return std::chrono::milliseconds(parsed);
}

TaskConfig& task_entry(GateConfig& config, const std::string& name) {
  const auto it = std::find_if(config.tasks.begin(), config.tasks.end(),
                               [&name](const TaskConfig& task) { return task.name == name; });
  if (it != config.tasks.end()) {
    return *it;
  }
  config.tasks.push_back(TaskConfig{name});
  return config.tasks.back();
}

void apply_redis_address(RedisConfig& redis, const std::string& value) {
  redis.enabled = !value.empty();
  if (value.empty()) {
    return;
  }
  if (value.rfind("unix://", 0) == 0) {
    redis.unix_socket = value.substr(std::string("unix://").size());
    redis.host.clear();
    redis.port = 0;
    return;
  }

  if (!value.empty() && value.front() == '/') {
    redis.unix_socket = value;
    redis.host.clear();
    redis.port = 0;
    return;
  }

  redis.unix_socket.clear();
  const auto split = value.find(':');
  if (split == std::string::npos) {
    redis.host = value;
    return;
  }

  redis.host = value.substr(0, split);
  const auto parsed_port = std::stoi(value.substr(split + 1));
  if (parsed_port <= 0 || parsed_port > 65535) {
    throw std::runtime_error("redis.address port must be in range 1..65535");
  }
  redis.port = static_cast<std::uint16_t>(parsed_port);
}

void apply_task_key(GateConfig& config, const std::string& key, const std::string& value) {
  const std::string rest = key.substr(std::string("tasks.").size());
  const auto split = rest.rfind('.');
  if (split == std::string::npos || split == 0) {
    throw std::runtime_error("task settings must be nested as tasks.<name>.<field>: " + key);
  }

  TaskConfig& task = task_entry(config, rest.substr(0, split));
  const std::string field = rest.substr(split + 1);
  if (field == "min_budget_j") {
    task.min_budget_j = std::stod(value);
  } else if (field == "cost_j") {
    task.cost_j = std::stod(value);
  } else if (field == "command") {
    task.command = value;
  } else if (field == "merge") {
    task.merge = parse_bool(value);
  } else {
    throw std::runtime_error("unknown task setting: " + key);
  }
}

void apply_key_value(GateConfig& config, const std::string& key, const std::string& raw_value) {
  const std::string value = unquote(raw_value);

  if (key == "energy.cpu_tdp_w") {
    config.energy.cpu_tdp_w = std::stod(value);
    return;
  }
  if (key == "energy.smoothing_alpha") {
    config.energy.smoothing_alpha = std::stod(value);
    return;
  }
  if (key == "energy.sample_hz") {
    config.energy.sample_hz = std::stod(value);
    return;
  }
  if (key == "energy.idle_cpu_seed_w") {
    config.energy.idle_cpu_seed_w = std::stod(value);
    return;
  }
  if (key == "energy.idle_gpu_seed_w") {
    config.energy.idle_gpu_seed_w = std::stod(value);
    return;
  }
  if (key == "energy.idle_learn_w") {
    config.energy.idle_learn_w = std::stod(value);
    return;
  }
  if (key == "energy.cpu_source") {
    config.energy.cpu_source = value;
    return;
  }
  if (key == "energy.gpu") {
    config.energy.gpu_enabled = parse_bool(value);
    return;
  }
  if (key == "energy.gpu_device_index") {
    const auto parsed_index = std::stoll(value);
    if (parsed_index < 0) {
      throw std::runtime_error("energy.gpu_device_index must be greater than or equal to 0");
    }
    config.energy.gpu_device_index = static_cast<std::uint32_t>(parsed_index);
    return;
  }

  if (key == "budget.mode") {
    config.budget.mode = value;
    return;
  }
  if (key == "budget.socket_path") {
    config.budget.socket_path = value;
    return;
  }
  if (key == "budget.transport_timeout_ms") {
    config.budget.transport_timeout = parse_millis(key, value);
    return;
  }

  if (key == "scheduler.idle_delay_ms") {
    config.scheduler.idle_delay = parse_millis(key, value);
    return;
  }
  if (key == "scheduler.backoff") {
    config.scheduler.backoff = value;
    return;
  }
  if (key == "scheduler.backoff_ms") {
    config.scheduler.backoff_delay = parse_millis(key, value);
    return;
  }
  if (key == "scheduler.backoff_max_ms") {
    config.scheduler.backoff_max = parse_millis(key, value);
    return;
  }
  if (key == "scheduler.ledger_retry_delay_ms") {
    config.scheduler.ledger_retry_delay = parse_millis(key, value);
    return;
  }
  if (key == "scheduler.ledger_max_attempts") {
    const auto parsed = std::stoll(value);
    if (parsed < 0) {
      throw std::runtime_error("scheduler.ledger_max_attempts must be greater than or equal to 0");
    }
    config.scheduler.ledger_max_attempts = static_cast<std::uint32_t>(parsed);
    return;
  }

  if (key == "merge.delta_threshold") {
    config.merge.delta_threshold = std::stod(value);
    return;
  }
  if (key == "merge.secondary_threshold") {
    config.merge.secondary_threshold = std::stod(value);
    return;
  }
  if (key == "merge.base_path") {
    config.merge.base_path = value;
    return;
  }
  if (key == "merge.generations_dir") {
    config.merge.generations_dir = value;
    return;
  }
  if (key == "merge.candidates_dir") {
    config.merge.candidates_dir = value;
    return;
  }

  if (key == "ledger.path") {
    config.ledger.path = value;
    return;
  }
  if (key == "ledger.fsync") {
    config.ledger.fsync = parse_bool(value);
    return;
  }

  if (key == "agent.stdout_debug") {
    config.stdout_debug = parse_bool(value);
    return;
  }

  if (key == "redis.address") {
    apply_redis_address(config.redis, value);
    return;
  }

  if (key.rfind("tasks.", 0) == 0) {
    apply_task_key(config, key, value);
  }
}

bool read_env_double(const char* name, double& out) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return false;
  }

  char* end = nullptr;
  const double parsed = std::strtod(value, &end);
  if (end == value || *end != '\0' || !std::isfinite(parsed)) {
    throw std::runtime_error(std::string(name) + " is not a number: " + value);
  }
  out = parsed;
  return true;
}

}  // namespace

std::chrono::milliseconds GateConfig::sample_period() const {
  return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(1000.0 / energy.sample_hz)));
}

GateConfig load_gate_config(const std::string& path) {
  GateConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  return config;
}

void apply_env_overrides(GateConfig& config) {
  read_env_double("JOULE_CPU_TDP_W", config.energy.cpu_tdp_w);
  read_env_double("JOULE_SMOOTHING", config.energy.smoothing_alpha);
  read_env_double("JOULE_HZ", config.energy.sample_hz);
  read_env_double("JOULE_IDLE_LEARN_W", config.energy.idle_learn_w);

  if (const char* socket = std::getenv("JOULE_AGENT_SOCKET"); socket != nullptr && *socket != '\0') {
    config.budget.socket_path = socket;
  }
}

void validate_gate_config(const GateConfig& config) {
  if (!(config.energy.cpu_tdp_w > 0.0)) {
    throw std::runtime_error("energy.cpu_tdp_w must be greater than 0");
  }
  if (!(config.energy.smoothing_alpha > 0.0 && config.energy.smoothing_alpha <= 1.0)) {
    throw std::runtime_error("energy.smoothing_alpha must be in range (0, 1]");
  }
  if (!(config.energy.sample_hz > 0.0)) {
    throw std::runtime_error("energy.sample_hz must be greater than 0");
  }
  if (config.energy.sample_hz > 1000.0) {
    throw std::runtime_error("energy.sample_hz must be less than or equal to 1000");
  }
  if (!(config.energy.idle_cpu_seed_w >= 0.0) || !(config.energy.idle_gpu_seed_w >= 0.0)) {
    throw std::runtime_error("energy idle seeds must be greater than or equal to 0");
  }
  if (!(config.energy.idle_learn_w >= 0.0)) {
    throw std::runtime_error("energy.idle_learn_w must be greater than or equal to 0");
  }
  if (config.energy.cpu_source != "utilization" && config.energy.cpu_source != "rapl") {
    throw std::runtime_error("energy.cpu_source must be utilization or rapl");
  }

  if (config.budget.mode != "local" && config.budget.mode != "agent" && config.budget.mode != "remote") {
    throw std::runtime_error("budget.mode must be local, agent or remote");
  }
  if (config.budget.mode != "local" && config.budget.socket_path.empty()) {
    throw std::runtime_error("budget.socket_path is required in " + config.budget.mode + " mode");
  }
  if (config.budget.transport_timeout.count() <= 0 || config.budget.transport_timeout.count() >= 1000) {
    throw std::runtime_error("budget.transport_timeout_ms must be in range 1..999");
  }

  if (config.scheduler.backoff != "fixed" && config.scheduler.backoff != "exponential") {
    throw std::runtime_error("scheduler.backoff must be fixed or exponential");
  }
  if (config.scheduler.backoff_max < config.scheduler.backoff_delay) {
    throw std::runtime_error("scheduler.backoff_max_ms must be greater than or equal to scheduler.backoff_ms");
  }

  if (!std::isfinite(config.merge.delta_threshold) || !std::isfinite(config.merge.secondary_threshold)) {
    throw std::runtime_error("merge thresholds must be finite");
  }
  if (config.ledger.path.empty()) {
    throw std::runtime_error("ledger.path must not be empty");
  }

  for (const auto& task : config.tasks) {
    if (task.command.empty()) {
      throw std::runtime_error("tasks." + task.name + ".command must not be empty");
    }
    if (!(task.cost_j >= 0.0) || !std::isfinite(task.cost_j)) {
      throw std::runtime_error("tasks." + task.name + ".cost_j must be a finite value >= 0");
    }
    if (!(task.min_budget_j >= 0.0) || !std::isfinite(task.min_budget_j)) {
      throw std::runtime_error("tasks." + task.name + ".min_budget_j must be a finite value >= 0");
    }
  }
}

}  // namespace joule_gate::core
