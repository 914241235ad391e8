#include "budget/remote_budget.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "core/digest.hpp"
#include "core/timestamp.hpp"
#include "rpc/budget_protocol.hpp"
#include "rpc/socket_io.hpp"

namespace joule_gate::budget {

namespace {

model::energy_sample empty_sample() {
  model::energy_sample sample{};
  sample.timestamp = core::unix_seconds_now();
  return sample;
}

}  // namespace

RemoteBudget::RemoteBudget(std::string socket_path, const std::chrono::milliseconds timeout)
    : socket_path_(std::move(socket_path)), timeout_(timeout) {}

model::energy_sample RemoteBudget::sample() {
  const auto result = call(rpc::BudgetMethod::sample, 0.0);
  if (!result.has_value()) {
    return empty_sample();
  }

  model::energy_sample sample{};
  try {
    sample = rpc::sample_from_json(*result);
  } catch (const std::exception& ex) {
    note_transport(false, std::string("malformed sample: ") + ex.what());
    return empty_sample();
  }

  if (!std::isfinite(sample.bucket_joules) || sample.bucket_joules < 0.0 ||
      sample.integrity_hash != core::sample_digest(sample.timestamp, sample.bucket_joules)) {
    ++rejected_samples_;
    std::cerr << "[budget] sample integrity check failed; treating bucket as empty\n";
    return empty_sample();
  }

  if (last_sample_ts_.has_value() && sample.timestamp <= *last_sample_ts_) {
    ++rejected_samples_;
    std::cerr << "[budget] stale or replayed sample (ts=" << sample.timestamp << "); treating bucket as empty\n";
    return empty_sample();
  }

  last_sample_ts_ = sample.timestamp;
  return sample;
}

model::take_result RemoteBudget::take(const double joules) {
  const auto result = call(rpc::BudgetMethod::take, joules);
  if (!result.has_value()) {
    return model::take_result{false, 0.0};
  }

  try {
    return rpc::take_from_json(*result);
  } catch (const std::exception& ex) {
    note_transport(false, std::string("malformed take response: ") + ex.what());
    return model::take_result{false, 0.0};
  }
}

std::optional<nlohmann::json> RemoteBudget::call(const rpc::BudgetMethod method, const double joules) {
  const char* name = method == rpc::BudgetMethod::take ? "take" : "sample";
  rpc::UniqueFd fd = rpc::connect_unix(socket_path_, timeout_);
  if (!fd.valid()) {
    note_transport(false, "connect to unix://" + socket_path_ + " failed");
    return std::nullopt;
  }

  const std::uint64_t id = next_id_++;
  if (!rpc::send_line(fd.get(), rpc::encode_request(method, joules, id))) {
    note_transport(false, std::string(name) + " request send failed");
    return std::nullopt;
  }

  std::string line;
  if (!rpc::recv_line(fd.get(), line)) {
    note_transport(false, std::string(name) + " response timed out or was truncated");
    return std::nullopt;
  }

  try {
    nlohmann::json result = rpc::decode_result(line, id);
    note_transport(true, {});
    return result;
  } catch (const rpc::ProtocolError& ex) {
    note_transport(false, std::string(name) + ": " + ex.what() + " (code " + std::to_string(ex.code()) + ")");
    return std::nullopt;
  }
}

void RemoteBudget::note_transport(const bool ok, const std::string& detail) {
  if (!ok) {
    ++transport_errors_;
    if (transport_was_ok_) {
      std::cerr << "[budget] transport failed (" << detail << "); failing closed\n";
      transport_was_ok_ = false;
    }
    return;
  }

  if (!transport_was_ok_) {
    std::cerr << "[budget] transport recovered\n";
    transport_was_ok_ = true;
  }
}

}  // namespace joule_gate::budget
