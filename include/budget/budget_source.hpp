#pragma once

#include "model/energy_sample.hpp"

namespace joule_gate::budget {

// What the scheduler sees of the energy budget, local or over the wire.
class BudgetSource {
 public:
  virtual model::energy_sample sample() = 0;
  virtual model::take_result take(double joules) = 0;
  virtual ~BudgetSource() = default;
};

}  // namespace joule_gate::budget
