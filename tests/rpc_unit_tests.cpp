#include <atomic>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <utility>

#include <unistd.h>

#include <nlohmann/json.hpp>

#include "budget/budget_service.hpp"
#include "budget/remote_budget.hpp"
#include "core/digest.hpp"
#include "model/energy_sample.hpp"
#include "rpc/budget_server.hpp"
#include "rpc/budget_protocol.hpp"

using joule_gate::budget::BudgetOptions;
using joule_gate::budget::BudgetService;
using joule_gate::budget::BudgetSource;
using joule_gate::budget::RemoteBudget;
using joule_gate::model::energy_sample;
using joule_gate::model::power_reading;
using joule_gate::model::take_result;
using joule_gate::rpc::BudgetMethod;
using joule_gate::rpc::BudgetRequest;
using joule_gate::rpc::BudgetServer;
using joule_gate::rpc::ProtocolError;

namespace {

bool almost_equal(double a, double b, double eps = 1e-6) { return std::fabs(a - b) <= eps; }

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

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

// Serves the same sample forever, as a replaying or frozen peer would.
class FrozenSource final : public BudgetSource {
 public:
  explicit FrozenSource(energy_sample sample) : sample_(std::move(sample)) {}

  energy_sample sample() override { return sample_; }
  take_result take(double) override { return take_result{false, sample_.bucket_joules}; }

 private:
  energy_sample sample_;
};

std::string socket_path_for(const char* name) {
  return (std::filesystem::temp_directory_path() /
          (std::string("joule-") + name + "-" + std::to_string(::getpid()) + ".sock"))
      .string();
}

class ServerThread {
 public:
  ServerThread(BudgetSource& source, std::string path) : server_(source), path_(std::move(path)) {
    thread_ = std::thread([this]() { server_.serve(path_, stop_); });
    for (int i = 0; i < 200 && !std::filesystem::exists(path_); ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }

  ~ServerThread() {
    stop_.store(true);
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  ServerThread(const ServerThread&) = delete;
  ServerThread& operator=(const ServerThread&) = delete;

 private:
  BudgetServer server_;
  std::string path_;
  std::atomic<bool> stop_{false};
  std::thread thread_;
};

int test_handle_line_sample() {
  BudgetService budget{charging_options()};
  fund(budget, 50.0);
  BudgetServer server{budget};

  const auto response = nlohmann::json::parse(server.handle_line(R"({"jsonrpc":"2.0","id":1,"method":"sample"})"));
  if (response.value("id", 0) != 1 || !response.contains("result")) {
    return fail("test_handle_line_sample", "sample should answer with a result");
  }

  const energy_sample sample = joule_gate::rpc::sample_from_json(response["result"]);
  if (!almost_equal(sample.bucket_joules, 50.0)) {
    return fail("test_handle_line_sample", "sample should report the 50 J bucket");
  }
  if (sample.integrity_hash != joule_gate::core::sample_digest(sample.timestamp, sample.bucket_joules)) {
    return fail("test_handle_line_sample", "hash must survive the wire");
  }
  return 0;
}

int test_handle_line_take() {
  BudgetService budget{charging_options()};
  fund(budget, 50.0);
  BudgetServer server{budget};

  auto response = nlohmann::json::parse(
      server.handle_line(R"({"jsonrpc":"2.0","id":"a","method":"take","params":{"joules":20}})"));
  if (!response["result"].value("ok", false) || !almost_equal(response["result"].value("remaining_j", -1.0), 30.0)) {
    return fail("test_handle_line_take", "take(20) on 50 J should answer ok with 30 J left");
  }

  response = nlohmann::json::parse(
      server.handle_line(R"({"jsonrpc":"2.0","id":"b","method":"take","params":{"joules":40}})"));
  if (response["result"].value("ok", true) || !almost_equal(response["result"].value("remaining_j", -1.0), 30.0)) {
    return fail("test_handle_line_take", "take(40) on 30 J should be refused");
  }
  return 0;
}

int test_handle_line_errors() {
  BudgetService budget{charging_options()};
  fund(budget, 10.0);
  BudgetServer server{budget};

  auto response = nlohmann::json::parse(
      server.handle_line(R"({"jsonrpc":"2.0","id":2,"method":"take","params":{"joules":-5}})"));
  if (response["error"].value("code", 0) != joule_gate::rpc::kInvalidParams) {
    return fail("test_handle_line_errors", "negative joules should be invalid params");
  }

  response = nlohmann::json::parse(server.handle_line(R"({"jsonrpc":"2.0","id":3,"method":"take","params":{}})"));
  if (response["error"].value("code", 0) != joule_gate::rpc::kInvalidParams) {
    return fail("test_handle_line_errors", "missing joules should be invalid params");
  }

  response = nlohmann::json::parse(server.handle_line(R"({"jsonrpc":"2.0","id":4,"method":"drain"})"));
  if (response["error"].value("code", 0) != joule_gate::rpc::kMethodNotFound) {
    return fail("test_handle_line_errors", "unknown method should be method not found");
  }

  response = nlohmann::json::parse(server.handle_line("{not json"));
  if (response["error"].value("code", 0) != joule_gate::rpc::kInternalError || !response["id"].is_null()) {
    return fail("test_handle_line_errors", "unparsable line should be an internal error with null id");
  }

  if (!server.handle_line(R"({"jsonrpc":"2.0","method":"take","params":{"joules":1}})").empty()) {
    return fail("test_handle_line_errors", "notifications get no response");
  }
  if (!almost_equal(budget.sample().bucket_joules, 9.0)) {
    return fail("test_handle_line_errors", "a notification take still debits");
  }
  return 0;
}

int test_run_answers_each_line() {
  BudgetService budget{charging_options()};
  fund(budget, 5.0);
  BudgetServer server{budget};

  std::istringstream in(
      "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"sample\"}\n\n"
      "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"take\",\"params\":{\"joules\":5}}\n");
  std::ostringstream out;
  std::ostringstream err;
  if (server.run(in, out, err) != 0) {
    return fail("test_run_answers_each_line", "run should end cleanly at EOF");
  }

  std::istringstream lines(out.str());
  std::string line;
  int count = 0;
  while (std::getline(lines, line)) {
    ++count;
  }
  if (count != 2 || !almost_equal(budget.sample().bucket_joules, 0.0)) {
    return fail("test_run_answers_each_line", "expected two responses and an emptied bucket");
  }
  return 0;
}

int test_remote_budget_round_trip() {
  BudgetService budget{charging_options()};
  fund(budget, 50.0);
  const std::string path = socket_path_for("round-trip");
  ServerThread server(budget, path);

  RemoteBudget remote(path, std::chrono::milliseconds(500));
  if (!almost_equal(remote.sample().bucket_joules, 50.0)) {
    return fail("test_remote_budget_round_trip", "remote sample should see 50 J");
  }

  const take_result result = remote.take(20.0);
  if (!result.ok || !almost_equal(result.remaining_j, 30.0)) {
    return fail("test_remote_budget_round_trip", "remote take(20) should leave 30 J");
  }

  std::this_thread::sleep_for(std::chrono::milliseconds(5));
  if (!almost_equal(remote.sample().bucket_joules, 30.0)) {
    return fail("test_remote_budget_round_trip", "second sample should see 30 J");
  }
  if (remote.transport_errors() != 0 || remote.rejected_samples() != 0) {
    return fail("test_remote_budget_round_trip", "healthy transport should not count errors");
  }
  return 0;
}

int test_remote_budget_fails_closed_without_agent() {
  RemoteBudget remote("/nonexistent/joule-gate/agent.sock", std::chrono::milliseconds(100));

  if (!almost_equal(remote.sample().bucket_joules, 0.0)) {
    return fail("test_remote_budget_fails_closed_without_agent", "unreachable agent should read as empty bucket");
  }
  const take_result result = remote.take(1.0);
  if (result.ok || !almost_equal(result.remaining_j, 0.0)) {
    return fail("test_remote_budget_fails_closed_without_agent", "unreachable agent should refuse every take");
  }
  if (remote.transport_errors() != 2) {
    return fail("test_remote_budget_fails_closed_without_agent", "both calls should count as transport errors");
  }
  return 0;
}

int test_remote_budget_rejects_replayed_and_forged_samples() {
  energy_sample frozen{};
  frozen.timestamp = 1000.0;
  frozen.bucket_joules = 40.0;
  frozen.integrity_hash = joule_gate::core::sample_digest(frozen.timestamp, frozen.bucket_joules);
  FrozenSource replaying(frozen);

  const std::string replay_path = socket_path_for("replay");
  {
    ServerThread server(replaying, replay_path);
    RemoteBudget remote(replay_path, std::chrono::milliseconds(500));
    if (!almost_equal(remote.sample().bucket_joules, 40.0)) {
      return fail("test_remote_budget_rejects_replayed_and_forged_samples", "first sample should be accepted");
    }
    if (!almost_equal(remote.sample().bucket_joules, 0.0) || remote.rejected_samples() != 1) {
      return fail("test_remote_budget_rejects_replayed_and_forged_samples", "repeated timestamp must be rejected");
    }
  }

  energy_sample forged = frozen;
  forged.bucket_joules = 4000.0;
  FrozenSource forging(forged);
  const std::string forged_path = socket_path_for("forged");
  ServerThread server(forging, forged_path);
  RemoteBudget remote(forged_path, std::chrono::milliseconds(500));
  if (!almost_equal(remote.sample().bucket_joules, 0.0) || remote.rejected_samples() != 1) {
    return fail("test_remote_budget_rejects_replayed_and_forged_samples", "hash mismatch must be rejected");
  }
  return 0;
}

int test_decode_request_yields_typed_calls() {
  BudgetRequest request = joule_gate::rpc::decode_request(R"({"jsonrpc":"2.0","id":"x","method":"sample"})");
  if (request.method != BudgetMethod::sample || !request.id.has_value() || *request.id != "x") {
    return fail("test_decode_request_yields_typed_calls", "sample request should keep its id");
  }

  request = joule_gate::rpc::decode_request(joule_gate::rpc::encode_request(BudgetMethod::take, 12.5, 9));
  if (request.method != BudgetMethod::take || !almost_equal(request.joules, 12.5) || *request.id != 9) {
    return fail("test_decode_request_yields_typed_calls", "take request should carry validated joules");
  }

  request = joule_gate::rpc::decode_request(R"({"jsonrpc":"2.0","method":"take","params":{"joules":3}})");
  if (request.id.has_value()) {
    return fail("test_decode_request_yields_typed_calls", "a request without id is a notification");
  }

  struct Rejected {
    const char* line;
    int code;
    bool answerable;
  };
  const Rejected rejected[] = {
      {R"({"jsonrpc":"2.0","id":7,"method":"drain"})", joule_gate::rpc::kMethodNotFound, true},
      {R"({"jsonrpc":"2.0","id":7,"method":"take","params":{"joules":"5"}})", joule_gate::rpc::kInvalidParams, true},
      {R"({"jsonrpc":"2.0","id":7,"method":"take","params":[5]})", joule_gate::rpc::kInvalidParams, true},
      {R"({"jsonrpc":"1.0","id":7,"method":"sample"})", joule_gate::rpc::kInvalidParams, true},
      {R"({"jsonrpc":"2.0","id":{"n":1},"method":"sample"})", joule_gate::rpc::kInvalidParams, true},
      {R"({"jsonrpc":"2.0","method":"take","params":{"joules":-1}})", joule_gate::rpc::kInvalidParams, false},
      {"[1,2]", joule_gate::rpc::kInvalidParams, true},
      {"{oops", joule_gate::rpc::kInternalError, true},
  };
  for (const Rejected& entry : rejected) {
    try {
      joule_gate::rpc::decode_request(entry.line);
      return fail("test_decode_request_yields_typed_calls", "malformed request should throw");
    } catch (const ProtocolError& ex) {
      if (ex.code() != entry.code || ex.answerable() != entry.answerable) {
        return fail("test_decode_request_yields_typed_calls", "wrong error code or answerability");
      }
    }
  }

  try {
    joule_gate::rpc::decode_request(R"({"jsonrpc":"2.0","id":7,"method":"drain"})");
    return fail("test_decode_request_yields_typed_calls", "unknown method should throw");
  } catch (const ProtocolError& ex) {
    if (ex.id() != 7) {
      return fail("test_decode_request_yields_typed_calls", "errors should echo the request id");
    }
  }
  return 0;
}

int test_decode_result_checks_envelope() {
  const nlohmann::json result =
      joule_gate::rpc::decode_result(joule_gate::rpc::encode_result(3, {{"ok", true}, {"remaining_j", 1.5}}), 3);
  const take_result taken = joule_gate::rpc::take_from_json(result);
  if (!taken.ok || !almost_equal(taken.remaining_j, 1.5)) {
    return fail("test_decode_result_checks_envelope", "well-formed result should decode");
  }

  try {
    joule_gate::rpc::decode_result(joule_gate::rpc::encode_result(4, nlohmann::json::object()), 3);
    return fail("test_decode_result_checks_envelope", "mismatched id should throw");
  } catch (const ProtocolError& ex) {
    if (ex.code() != joule_gate::rpc::kInternalError) {
      return fail("test_decode_result_checks_envelope", "id mismatch is an internal error");
    }
  }

  try {
    joule_gate::rpc::decode_result(joule_gate::rpc::encode_error(3, joule_gate::rpc::kInvalidParams, "bad"), 3);
    return fail("test_decode_result_checks_envelope", "error response should throw");
  } catch (const ProtocolError& ex) {
    if (ex.code() != joule_gate::rpc::kInvalidParams || std::string(ex.what()) != "bad") {
      return fail("test_decode_result_checks_envelope", "server error code and message should be kept");
    }
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_decode_request_yields_typed_calls(); rc != 0) {
    return rc;
  }
  if (int rc = test_decode_result_checks_envelope(); rc != 0) {
    return rc;
  }
  if (int rc = test_handle_line_sample(); rc != 0) {
    return rc;
  }
  if (int rc = test_handle_line_take(); rc != 0) {
    return rc;
  }
  if (int rc = test_handle_line_errors(); rc != 0) {
    return rc;
  }
  if (int rc = test_run_answers_each_line(); rc != 0) {
    return rc;
  }
  if (int rc = test_remote_budget_round_trip(); rc != 0) {
    return rc;
  }
  if (int rc = test_remote_budget_fails_closed_without_agent(); rc != 0) {
    return rc;
  }
  if (int rc = test_remote_budget_rejects_replayed_and_forged_samples(); rc != 0) {
    return rc;
  }

  std::cout << "[PASS] rpc unit tests\n";
  return 0;
}
