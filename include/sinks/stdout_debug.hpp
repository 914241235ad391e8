#pragma once

#include "model/energy_sample.hpp"

namespace joule_gate::sinks {

class StdoutDebugSink {
 public:
  void publish(const model::energy_sample& sample) const;
};

}  // namespace joule_gate::sinks
