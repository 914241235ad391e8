#include "sched/backoff.hpp"

#include <algorithm>
#include <stdexcept>

namespace joule_gate::sched {

std::chrono::milliseconds FixedBackoff::delay(const std::uint32_t /*consecutive_failures*/) const { return delay_; }

std::chrono::milliseconds CappedExponentialBackoff::delay(const std::uint32_t consecutive_failures) const {
  if (consecutive_failures <= 1) {
    return std::min(base_, cap_);
  }

  auto current = base_;
  for (std::uint32_t i = 1; i < consecutive_failures && current < cap_; ++i) {
    current *= 2;
  }
  return std::min(current, cap_);
}

std::unique_ptr<BackoffPolicy> make_backoff(const std::string& kind, const std::chrono::milliseconds base,
                                            const std::chrono::milliseconds cap) {
  if (kind == "fixed") {
    return std::make_unique<FixedBackoff>(base);
  }
  if (kind == "exponential") {
    return std::make_unique<CappedExponentialBackoff>(base, cap);
  }
  throw std::invalid_argument("unknown backoff policy: " + kind);
}

}  // namespace joule_gate::sched
