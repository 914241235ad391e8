#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "model/energy_sample.hpp"

namespace joule_gate::rpc {

// Budget calls framed as JSON-RPC 2.0, one object per line.
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

enum class BudgetMethod {
  sample,
  take,
};

struct BudgetRequest {
  BudgetMethod method{BudgetMethod::sample};
  // Validated finite and >= 0; only meaningful for take.
  double joules{0.0};
  // Absent for notifications.
  std::optional<nlohmann::json> id{};
};

// A request or response that cannot be honoured, with the error code it maps to.
class ProtocolError : public std::runtime_error {
 public:
  ProtocolError(int code, const std::string& message, nlohmann::json id = nullptr, bool answerable = true);

  [[nodiscard]] int code() const noexcept { return code_; }
  [[nodiscard]] const nlohmann::json& id() const noexcept { return id_; }
  // False when the offending request was a notification.
  [[nodiscard]] bool answerable() const noexcept { return answerable_; }

 private:
  int code_;
  nlohmann::json id_;
  bool answerable_;
};

// Server side.
BudgetRequest decode_request(const std::string& line);
std::string encode_result(const nlohmann::json& id, const nlohmann::json& result);
std::string encode_error(const nlohmann::json& id, int code, const std::string& message);

// Client side. decode_result checks the envelope and the id and returns the
// result object; an error member is rethrown as ProtocolError with its code.
std::string encode_request(BudgetMethod method, double joules, std::uint64_t id);
nlohmann::json decode_result(const std::string& line, std::uint64_t expected_id);

// `sample` result: {ts, bucket_j, cpu_w, gpu_w, idle_cpu_w, idle_gpu_w, net_w, hash}.
nlohmann::json sample_to_json(const model::energy_sample& sample);
model::energy_sample sample_from_json(const nlohmann::json& value);

// `take` result: {ok, remaining_j}.
nlohmann::json take_to_json(const model::take_result& result);
model::take_result take_from_json(const nlohmann::json& value);

}  // namespace joule_gate::rpc
