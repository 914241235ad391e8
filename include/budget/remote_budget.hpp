#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "budget/budget_source.hpp"
#include "rpc/budget_protocol.hpp"

namespace joule_gate::budget {

// Client for a budget served by rpc::BudgetServer. Fails closed: any
// transport or protocol problem reads as an empty bucket and a refused take.
class RemoteBudget final : public BudgetSource {
 public:
  RemoteBudget(std::string socket_path, std::chrono::milliseconds timeout);

  model::energy_sample sample() override;
  model::take_result take(double joules) override;

  [[nodiscard]] std::uint64_t transport_errors() const noexcept { return transport_errors_; }
  [[nodiscard]] std::uint64_t rejected_samples() const noexcept { return rejected_samples_; }

 private:
  std::optional<nlohmann::json> call(rpc::BudgetMethod method, double joules);
  void note_transport(bool ok, const std::string& detail);

  std::string socket_path_;
  std::chrono::milliseconds timeout_;
  std::uint64_t next_id_{1};
  std::optional<double> last_sample_ts_{};
  bool transport_was_ok_{true};
  std::uint64_t transport_errors_{0};
  std::uint64_t rejected_samples_{0};
};

}  // namespace joule_gate::budget
