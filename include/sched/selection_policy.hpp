#pragma once

#include <memory>
#include <vector>

#include "sched/task.hpp"

namespace joule_gate::sched {

struct PolicyEntry {
  double min_budget_j{0.0};
  std::shared_ptr<Task> task{};
};

// Threshold table, kept sorted from the highest threshold down. select()
// returns the task of the first threshold the budget meets.
class SelectionPolicy {
 public:
  SelectionPolicy() = default;
  explicit SelectionPolicy(std::vector<PolicyEntry> entries);

  void add(double min_budget_j, std::shared_ptr<Task> task);

  [[nodiscard]] std::shared_ptr<Task> select(double budget_j) const;

  [[nodiscard]] const std::vector<PolicyEntry>& entries() const noexcept { return entries_; }
  [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

 private:
  void sort_entries();

  std::vector<PolicyEntry> entries_{};
};

}  // namespace joule_gate::sched
