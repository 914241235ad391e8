#include "sched/scheduler.hpp"

#include <cmath>
#include <exception>
#include <iomanip>
#include <iostream>
#include <thread>
#include <utility>

#include "core/timestamp.hpp"

namespace joule_gate::sched {

namespace {

double sanitize_delta(const double value) { return std::isfinite(value) && value > 0.0 ? value : 0.0; }

double sanitize_value(const double value) { return std::isfinite(value) ? value : 0.0; }

nlohmann::json object_metadata(const nlohmann::json& metadata) {
  if (metadata.is_object()) {
    return metadata;
  }
  if (metadata.is_null()) {
    return nlohmann::json::object();
  }
  return nlohmann::json{{"value", metadata}};
}

}  // namespace

Scheduler::Scheduler(budget::BudgetSource& budget, ledger::ReceiptLedger& ledger, SelectionPolicy policy,
                     std::unique_ptr<BackoffPolicy> backoff, SchedulerOptions options, Sleeper sleeper)
    : budget_(budget),
      ledger_(ledger),
      policy_(std::move(policy)),
      backoff_(std::move(backoff)),
      options_(options),
      sleeper_(std::move(sleeper)) {
  if (backoff_ == nullptr) {
    backoff_ = std::make_unique<FixedBackoff>(std::chrono::milliseconds(200));
  }
  if (!sleeper_) {
    sleeper_ = [](const std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
  }
}

IterationOutcome Scheduler::run_once() {
  state_ = SchedulerState::idle_wait;
  ++stats_.polls;

  const model::energy_sample sample = budget_.sample();
  const std::shared_ptr<Task> task = policy_.select(sample.bucket_joules);
  if (task == nullptr) {
    ++stats_.idle_waits;
    sleeper_(options_.idle_delay);
    return IterationOutcome::idle;
  }

  const double cost_j = task->estimated_cost_joules();
  const model::take_result debit = budget_.take(cost_j);
  if (!debit.ok) {
    ++stats_.debit_failures;
    ++consecutive_debit_failures_;
    sleeper_(backoff_->delay(consecutive_debit_failures_));
    return IterationOutcome::backoff;
  }
  consecutive_debit_failures_ = 0;

  state_ = SchedulerState::executing;
  const model::receipt_fields fields = execute(*task);
  last_receipt_id_ = record(fields);
  state_ = SchedulerState::idle_wait;

  const bool ok = fields.metadata.value("ok", false);
  std::cerr << "[scheduler] " << fields.task_name << " -> delta=" << std::fixed << std::setprecision(4)
            << fields.delta << std::defaultfloat << " | ok=" << (ok ? "true" : "false") << " | joule=" << cost_j
            << " | remaining_j=" << debit.remaining_j << " | receipt=#" << last_receipt_id_
            << " hash=" << fields.content_hash.substr(0, 8) << '\n';
  return IterationOutcome::executed;
}

void Scheduler::run(const std::atomic<bool>& stop) {
  while (!stop.load()) {
    try {
      run_once();
    } catch (const ledger::LedgerError&) {
      throw;
    } catch (const std::exception& ex) {
      std::cerr << "[scheduler] iteration failed: " << ex.what() << '\n';
      state_ = SchedulerState::idle_wait;
      sleeper_(options_.idle_delay);
    }
  }
}

model::receipt_fields Scheduler::execute(Task& task) {
  ++stats_.executions;

  model::receipt_fields fields{};
  fields.task_name = task.name();
  fields.joules_charged = task.estimated_cost_joules();

  const auto started = std::chrono::steady_clock::now();
  try {
    model::task_result result = task.run();
    fields.delta = sanitize_delta(result.delta);
    fields.loss = sanitize_value(result.loss);
    fields.content_hash = std::move(result.content_hash);
    fields.metadata = object_metadata(result.metadata);
    fields.metadata["ok"] = result.ok;
    if (!result.ok) {
      ++stats_.task_failures;
    }
  } catch (const std::exception& ex) {
    ++stats_.task_failures;
    std::cerr << "[scheduler] task " << task.name() << " failed: " << ex.what() << '\n';
    fields.metadata = nlohmann::json{{"ok", false}, {"error", ex.what()}};
  } catch (...) {
    ++stats_.task_failures;
    std::cerr << "[scheduler] task " << task.name() << " failed with a non-standard exception\n";
    fields.metadata = nlohmann::json{{"ok", false}, {"error", "non-standard exception"}};
  }
  fields.duration_sec = core::seconds_between(started, std::chrono::steady_clock::now());
  return fields;
}

std::uint64_t Scheduler::record(const model::receipt_fields& fields) {
  // The energy is already spent, so the receipt is never dropped.
  std::uint32_t attempts = 0;
  while (true) {
    ++attempts;
    try {
      return ledger_.add(fields);
    } catch (const ledger::LedgerError& ex) {
      std::cerr << "[ledger] write failed (attempt " << attempts << "): " << ex.what() << '\n';
      if (options_.ledger_max_attempts != 0 && attempts >= options_.ledger_max_attempts) {
        model::receipt unrecorded{};
        unrecorded.timestamp = core::unix_seconds_now();
        unrecorded.fields = fields;
        std::cerr << "[ledger] giving up; unrecorded receipt: " << model::to_json_line(unrecorded) << '\n';
        throw;
      }
      ++stats_.ledger_retries;
      sleeper_(options_.ledger_retry_delay);
    }
  }
}

}  // namespace joule_gate::sched
