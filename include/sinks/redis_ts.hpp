#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "core/sampler.hpp"
#include "model/energy_sample.hpp"

struct redisContext;

namespace joule_gate::sinks {

struct RedisTsOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"joule:node"};
  std::uint32_t connect_timeout_ms{1000};
};

// Publishes one TS.MADD per sampler tick. A server without the TimeSeries
// module disables the sink for the life of the process.
class RedisTsSink {
 public:
  explicit RedisTsSink(RedisTsOptions options = {});
  ~RedisTsSink();

  RedisTsSink(const RedisTsSink&) = delete;
  RedisTsSink& operator=(const RedisTsSink&) = delete;
  RedisTsSink(RedisTsSink&&) noexcept;
  RedisTsSink& operator=(RedisTsSink&&) noexcept;

  bool check_connectivity();
  bool publish(const model::energy_sample& sample, const core::SamplerStats& stats);

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };

  bool ensure_connected();
  bool reconnect();
  bool authenticate();
  bool select_db();
  bool ensure_schema();
  bool publish_impl(const model::energy_sample& sample, const core::SamplerStats& stats);
  void reserve_command_buffers();

  RedisTsOptions options_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
  std::vector<std::string> command_args_;
  std::vector<const char*> command_argv_;
  std::vector<std::size_t> command_argv_len_;
  bool timeseries_available_{true};
  bool schema_ready_{false};
};

}  // namespace joule_gate::sinks
