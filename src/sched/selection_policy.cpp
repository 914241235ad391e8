#include "sched/selection_policy.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace joule_gate::sched {

SelectionPolicy::SelectionPolicy(std::vector<PolicyEntry> entries) : entries_(std::move(entries)) {
  for (const auto& entry : entries_) {
    if (entry.task == nullptr) {
      throw std::invalid_argument("policy entry without a task");
    }
  }
  sort_entries();
}

void SelectionPolicy::add(const double min_budget_j, std::shared_ptr<Task> task) {
  if (task == nullptr) {
    throw std::invalid_argument("policy entry without a task");
  }
  entries_.push_back(PolicyEntry{min_budget_j, std::move(task)});
  sort_entries();
}

std::shared_ptr<Task> SelectionPolicy::select(const double budget_j) const {
  for (const auto& entry : entries_) {
    if (budget_j >= entry.min_budget_j) {
      return entry.task;
    }
  }
  return nullptr;
}

void SelectionPolicy::sort_entries() {
  std::stable_sort(entries_.begin(), entries_.end(),
                   [](const PolicyEntry& a, const PolicyEntry& b) { return a.min_budget_j > b.min_budget_j; });
}

}  // namespace joule_gate::sched
