#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

#include "budget/budget_source.hpp"
#include "ledger/receipt_ledger.hpp"
#include "model/receipt.hpp"
#include "sched/backoff.hpp"
#include "sched/selection_policy.hpp"
#include "sched/task.hpp"

namespace joule_gate::sched {

enum class SchedulerState {
  idle_wait,
  executing,
};

enum class IterationOutcome {
  idle,
  backoff,
  executed,
};

struct SchedulerOptions {
  std::chrono::milliseconds idle_delay{300};
  std::chrono::milliseconds ledger_retry_delay{500};
  // 0 retries the ledger write until it succeeds.
  std::uint32_t ledger_max_attempts{0};
};

struct SchedulerStats {
  std::uint64_t polls{0};
  std::uint64_t idle_waits{0};
  std::uint64_t debit_failures{0};
  std::uint64_t executions{0};
  std::uint64_t task_failures{0};
  std::uint64_t ledger_retries{0};
};

// Poll, select, debit, execute, record. Single-threaded; a task runs to
// completion and its receipt is durable before the next poll.
class Scheduler {
 public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  Scheduler(budget::BudgetSource& budget, ledger::ReceiptLedger& ledger, SelectionPolicy policy,
            std::unique_ptr<BackoffPolicy> backoff, SchedulerOptions options = {}, Sleeper sleeper = {});

  IterationOutcome run_once();

  // Iterates until `stop` is set. Only a configured ledger escalation
  // (LedgerError) leaves this function by exception.
  void run(const std::atomic<bool>& stop);

  [[nodiscard]] SchedulerState state() const noexcept { return state_; }
  [[nodiscard]] const SchedulerStats& stats() const noexcept { return stats_; }
  [[nodiscard]] std::uint64_t last_receipt_id() const noexcept { return last_receipt_id_; }

 private:
  model::receipt_fields execute(Task& task);
  std::uint64_t record(const model::receipt_fields& fields);

  budget::BudgetSource& budget_;
  ledger::ReceiptLedger& ledger_;
  SelectionPolicy policy_;
  std::unique_ptr<BackoffPolicy> backoff_;
  SchedulerOptions options_;
  Sleeper sleeper_;

  SchedulerState state_{SchedulerState::idle_wait};
  SchedulerStats stats_{};
  std::uint32_t consecutive_debit_failures_{0};
  std::uint64_t last_receipt_id_{0};
};

}  // namespace joule_gate::sched
