#pragma once

#include <optional>
#include <string>

#include "merge/merge_gate.hpp"
#include "model/receipt.hpp"
#include "sched/task.hpp"

namespace joule_gate::sched {

struct CommandTaskOptions {
  std::string name;
  double cost_j{0.0};
  std::string command;
  std::string candidates_dir{};
};

struct ParsedTaskOutput {
  model::task_result result{};
  std::optional<merge::MergeCandidate> candidate{};
};

// Interprets the last non-empty line of a payload's stdout:
// {"ok", "delta", "loss", "hash", "meta", "candidate": {"path", "identity", "delta", "secondary_gain"}}.
// Throws TaskError when there is no JSON object to read.
ParsedTaskOutput parse_task_output(const std::string& output);

// Runs an external payload through /bin/sh -c and reads its result from
// stdout. With a merge gate, a reported candidate is promoted or discarded
// before run() returns and the decision replaces the payload's own verdict.
class CommandTask final : public Task {
 public:
  explicit CommandTask(CommandTaskOptions options, merge::MergeGate* gate = nullptr);

  const std::string& name() const override { return options_.name; }
  double estimated_cost_joules() const override { return options_.cost_j; }
  model::task_result run() override;

 private:
  std::string execute_command() const;

  CommandTaskOptions options_;
  merge::MergeGate* gate_{nullptr};
};

}  // namespace joule_gate::sched
