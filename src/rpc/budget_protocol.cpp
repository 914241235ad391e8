#include "rpc/budget_protocol.hpp"

#include <cmath>
#include <utility>

namespace joule_gate::rpc {

namespace {

constexpr const char* kVersion = "2.0";

std::string dump_line(const nlohmann::json& message) {
  return message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool valid_id(const nlohmann::json& id) {
  return id.is_null() || id.is_string() || id.is_number_integer() || id.is_number_unsigned();
}

double read_joules(const nlohmann::json& request, const nlohmann::json& id, const bool answerable) {
  const auto params_it = request.find("params");
  if (params_it == request.end() || !params_it->is_object()) {
    throw ProtocolError(kInvalidParams, "take expects params {joules}", id, answerable);
  }

  const auto joules_it = params_it->find("joules");
  if (joules_it == params_it->end() || !joules_it->is_number()) {
    throw ProtocolError(kInvalidParams, "joules must be a number", id, answerable);
  }

  const double joules = joules_it->get<double>();
  if (!std::isfinite(joules) || joules < 0.0) {
    throw ProtocolError(kInvalidParams, "joules must be a finite value >= 0", id, answerable);
  }
  return joules;
}

}  // namespace

ProtocolError::ProtocolError(const int code, const std::string& message, nlohmann::json id, const bool answerable)
    : std::runtime_error(message), code_(code), id_(std::move(id)), answerable_(answerable) {}

BudgetRequest decode_request(const std::string& line) {
  nlohmann::json request;
  try {
    request = nlohmann::json::parse(line);
  } catch (const nlohmann::json::parse_error&) {
    throw ProtocolError(kInternalError, "unparsable request");
  }
  if (!request.is_object()) {
    throw ProtocolError(kInvalidParams, "request must be a JSON object");
  }

  BudgetRequest decoded{};
  const auto id_it = request.find("id");
  if (id_it != request.end()) {
    if (!valid_id(*id_it)) {
      throw ProtocolError(kInvalidParams, "id must be a string, an integer or null");
    }
    decoded.id = *id_it;
  }
  const nlohmann::json reply_id = decoded.id.value_or(nullptr);
  const bool answerable = decoded.id.has_value();

  const auto version_it = request.find("jsonrpc");
  if (version_it == request.end() || *version_it != kVersion) {
    throw ProtocolError(kInvalidParams, "jsonrpc must be \"2.0\"", reply_id, answerable);
  }

  const auto method_it = request.find("method");
  if (method_it == request.end() || !method_it->is_string()) {
    throw ProtocolError(kInvalidParams, "method must be a string", reply_id, answerable);
  }

  const std::string& method = method_it->get_ref<const std::string&>();
  if (method == "sample") {
    decoded.method = BudgetMethod::sample;
  } else if (method == "take") {
    decoded.method = BudgetMethod::take;
    decoded.joules = read_joules(request, reply_id, answerable);
  } else {
    throw ProtocolError(kMethodNotFound, "method not found", reply_id, answerable);
  }
  return decoded;
}

std::string encode_result(const nlohmann::json& id, const nlohmann::json& result) {
  return dump_line(nlohmann::json{{"jsonrpc", kVersion}, {"id", id}, {"result", result}});
}

std::string encode_error(const nlohmann::json& id, const int code, const std::string& message) {
  return dump_line(
      nlohmann::json{{"jsonrpc", kVersion}, {"id", id}, {"error", {{"code", code}, {"message", message}}}});
}

std::string encode_request(const BudgetMethod method, const double joules, const std::uint64_t id) {
  nlohmann::json request{{"jsonrpc", kVersion}, {"id", id}};
  if (method == BudgetMethod::take) {
    request["method"] = "take";
    request["params"] = {{"joules", joules}};
  } else {
    request["method"] = "sample";
  }
  return dump_line(request);
}

nlohmann::json decode_result(const std::string& line, const std::uint64_t expected_id) {
  nlohmann::json response;
  try {
    response = nlohmann::json::parse(line);
  } catch (const nlohmann::json::parse_error&) {
    throw ProtocolError(kInternalError, "response is not JSON");
  }
  if (!response.is_object() || response.value("jsonrpc", std::string{}) != kVersion) {
    throw ProtocolError(kInternalError, "response is not a JSON-RPC 2.0 object");
  }

  const auto id_it = response.find("id");
  if (id_it == response.end() || *id_it != nlohmann::json(expected_id)) {
    throw ProtocolError(kInternalError, "response id mismatch");
  }

  const auto error_it = response.find("error");
  if (error_it != response.end()) {
    const int code = error_it->is_object() ? error_it->value("code", kInternalError) : kInternalError;
    const std::string message =
        error_it->is_object() ? error_it->value("message", std::string{"error"}) : std::string{"error"};
    throw ProtocolError(code, message, *id_it);
  }

  const auto result_it = response.find("result");
  if (result_it == response.end() || !result_it->is_object()) {
    throw ProtocolError(kInternalError, "response has no result object");
  }
  return *result_it;
}

nlohmann::json sample_to_json(const model::energy_sample& sample) {
  return nlohmann::json{{"ts", sample.timestamp},
                        {"bucket_j", sample.bucket_joules},
                        {"cpu_w", sample.cpu_power_w},
                        {"gpu_w", sample.gpu_power_w},
                        {"idle_cpu_w", sample.idle_cpu_w},
                        {"idle_gpu_w", sample.idle_gpu_w},
                        {"net_w", sample.net_power_w},
                        {"hash", sample.integrity_hash}};
}

model::energy_sample sample_from_json(const nlohmann::json& value) {
  if (!value.is_object()) {
    throw std::invalid_argument("sample must be a JSON object");
  }

  model::energy_sample sample{};
  sample.timestamp = value.at("ts").get<double>();
  sample.bucket_joules = value.at("bucket_j").get<double>();
  sample.cpu_power_w = value.value("cpu_w", 0.0);
  sample.gpu_power_w = value.value("gpu_w", 0.0);
  sample.idle_cpu_w = value.value("idle_cpu_w", 0.0);
  sample.idle_gpu_w = value.value("idle_gpu_w", 0.0);
  sample.net_power_w = value.value("net_w", 0.0);
  sample.integrity_hash = value.at("hash").get<std::string>();
  return sample;
}

nlohmann::json take_to_json(const model::take_result& result) {
  return nlohmann::json{{"ok", result.ok}, {"remaining_j", result.remaining_j}};
}

model::take_result take_from_json(const nlohmann::json& value) {
  const auto ok_it = value.find("ok");
  const auto remaining_it = value.find("remaining_j");
  if (ok_it == value.end() || !ok_it->is_boolean() || remaining_it == value.end() || !remaining_it->is_number()) {
    throw std::invalid_argument("take result needs {ok, remaining_j}");
  }
  return model::take_result{ok_it->get<bool>(), remaining_it->get<double>()};
}

}  // namespace joule_gate::rpc
