#include "sinks/redis_ts.hpp"

#include "core/timestamp.hpp"

#include <array>
#include <cmath>
#include <cstddef>
#include <cstring>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <hiredis/hiredis.h>

namespace joule_gate::sinks {
namespace {

constexpr std::array<const char*, 8> kMetricSuffixes = {
    "energy:bucket_j",
    "energy:cpu_w",
    "energy:gpu_w",
    "energy:idle_cpu_w",
    "energy:idle_gpu_w",
    "energy:net_w",
    "agent:heartbeat",
    "agent:loop_jitter",
};
constexpr std::size_t kMaxCommandArgCount = 1 + (kMetricSuffixes.size() * 3);

double sanitize_value(const double value) {
  return std::isfinite(value) ? value : 0.0;
}

void add_metric_args(std::vector<std::string>& args, const std::string& key_prefix,
                     const std::uint64_t timestamp_ms, const char* suffix, const double value) {
  args.emplace_back(key_prefix + ":" + suffix);
  args.emplace_back(std::to_string(timestamp_ms));
  args.emplace_back(std::to_string(value));
}

}  // namespace

RedisTsSink::RedisTsSink(RedisTsOptions options) : options_(std::move(options)) {
  reserve_command_buffers();
}

RedisTsSink::~RedisTsSink() = default;

RedisTsSink::RedisTsSink(RedisTsSink&&) noexcept = default;
RedisTsSink& RedisTsSink::operator=(RedisTsSink&&) noexcept = default;

bool RedisTsSink::check_connectivity() {
  return ensure_connected();
}

void RedisTsSink::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

bool RedisTsSink::ensure_connected() {
  if (!timeseries_available_) {
    return false;
  }
  if (context_ != nullptr && context_->err == REDIS_OK) {
    return true;
  }
  return reconnect();
}

bool RedisTsSink::reconnect() {
  context_.reset();

  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(options_.connect_timeout_ms / 1000);
  timeout.tv_usec = static_cast<suseconds_t>((options_.connect_timeout_ms % 1000) * 1000);

  redisContext* raw = nullptr;
  if (!options_.unix_socket.empty()) {
    raw = redisConnectUnixWithTimeout(options_.unix_socket.c_str(), timeout);
  } else {
    raw = redisConnectWithTimeout(options_.host.c_str(), static_cast<int>(options_.port), timeout);
  }
  if (raw == nullptr || raw->err != REDIS_OK) {
    if (raw != nullptr) {
      std::cerr << "[redis] connect failed: " << raw->errstr << '\n';
      redisFree(raw);
    } else {
      std::cerr << "[redis] connect failed: out of memory\n";
    }
    return false;
  }

  context_.reset(raw);
  if (!authenticate() || !select_db() || !ensure_schema()) {
    context_.reset();
    return false;
  }
  return true;
}

bool RedisTsSink::authenticate() {
  if (options_.password.empty()) {
    return true;
  }

  redisReply* reply = static_cast<redisReply*>(redisCommand(context_.get(), "AUTH %s", options_.password.c_str()));
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok) {
    std::cerr << "[redis] AUTH rejected\n";
  }
  freeReplyObject(reply);
  return ok;
}

bool RedisTsSink::select_db() {
  if (options_.db == 0) {
    return true;
  }

  redisReply* reply = static_cast<redisReply*>(redisCommand(context_.get(), "SELECT %d", options_.db));
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  freeReplyObject(reply);
  return ok;
}

bool RedisTsSink::ensure_schema() {
  if (schema_ready_) {
    return true;
  }

  for (const char* suffix : kMetricSuffixes) {
    const std::string key = options_.key_prefix + ":" + suffix;
    redisReply* reply = static_cast<redisReply*>(
        redisCommand(context_.get(), "TS.CREATE %s DUPLICATE_POLICY LAST", key.c_str()));
    if (reply == nullptr) {
      return false;
    }

    const bool is_error = reply->type == REDIS_REPLY_ERROR && reply->str != nullptr;
    const bool already_exists = is_error && strstr(reply->str, "already exists") != nullptr;
    const bool unknown_command = is_error && strstr(reply->str, "unknown command") != nullptr;
    const bool ok = reply->type != REDIS_REPLY_ERROR || already_exists;
    const std::string reply_message = reply->str != nullptr ? reply->str : "unknown";
    freeReplyObject(reply);

    if (unknown_command) {
      std::cerr << "[redis] RedisTimeSeries module not available (TS.CREATE unknown command)\n";
      timeseries_available_ = false;
      return false;
    }
    if (!ok) {
      std::cerr << "[redis] schema error on TS.CREATE " << key << ": " << reply_message << '\n';
      return false;
    }
  }

  schema_ready_ = true;
  return true;
}

bool RedisTsSink::publish(const model::energy_sample& sample, const core::SamplerStats& stats) {
  if (!ensure_connected()) {
    return false;
  }
  if (publish_impl(sample, stats)) {
    return true;
  }
  if (!reconnect()) {
    return false;
  }
  return publish_impl(sample, stats);
}

bool RedisTsSink::publish_impl(const model::energy_sample& sample, const core::SamplerStats& stats) {
  const std::uint64_t timestamp_ms = core::unix_timestamp_now_ns() / 1'000'000ULL;

  command_args_.clear();
  command_argv_.clear();
  command_argv_len_.clear();
  command_args_.emplace_back("TS.MADD");

  const auto append_metric = [&](const char* suffix, const double value) {
    add_metric_args(command_args_, options_.key_prefix, timestamp_ms, suffix, sanitize_value(value));
  };

  append_metric("energy:bucket_j", sample.bucket_joules);
  append_metric("energy:cpu_w", sample.cpu_power_w);
  append_metric("energy:gpu_w", sample.gpu_power_w);
  append_metric("energy:idle_cpu_w", sample.idle_cpu_w);
  append_metric("energy:idle_gpu_w", sample.idle_gpu_w);
  append_metric("energy:net_w", sample.net_power_w);
  append_metric("agent:heartbeat", static_cast<double>(timestamp_ms));
  append_metric("agent:loop_jitter", stats.last_jitter_ms);

  for (const auto& arg : command_args_) {
    command_argv_.push_back(arg.c_str());
    command_argv_len_.push_back(arg.size());
  }

  redisReply* reply = static_cast<redisReply*>(
      redisCommandArgv(context_.get(), static_cast<int>(command_argv_.size()), command_argv_.data(),
                       command_argv_len_.data()));
  if (reply == nullptr) {
    return false;
  }

  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok && reply->str != nullptr) {
    std::cerr << "[redis] TS.MADD failed: " << reply->str << '\n';
  }
  freeReplyObject(reply);
  return ok;
}

void RedisTsSink::reserve_command_buffers() {
  command_args_.reserve(kMaxCommandArgCount);
  command_argv_.reserve(kMaxCommandArgCount);
  command_argv_len_.reserve(kMaxCommandArgCount);
}

}  // namespace joule_gate::sinks
