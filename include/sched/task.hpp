#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <utility>

#include "model/receipt.hpp"

namespace joule_gate::sched {

class TaskError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Opaque unit of work. The cost is a static estimate debited before run().
class Task {
 public:
  virtual const std::string& name() const = 0;
  virtual double estimated_cost_joules() const = 0;
  virtual model::task_result run() = 0;
  virtual ~Task() = default;
};

class CallableTask final : public Task {
 public:
  using Body = std::function<model::task_result()>;

  CallableTask(std::string name, double estimated_cost_joules, Body body)
      : name_(std::move(name)), cost_j_(estimated_cost_joules), body_(std::move(body)) {}

  const std::string& name() const override { return name_; }
  double estimated_cost_joules() const override { return cost_j_; }
  model::task_result run() override { return body_(); }

 private:
  std::string name_;
  double cost_j_{0.0};
  Body body_;
};

}  // namespace joule_gate::sched
