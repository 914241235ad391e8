#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace joule_gate::sched {

// Delay before re-polling after the n-th consecutive refused debit (n >= 1).
class BackoffPolicy {
 public:
  virtual std::chrono::milliseconds delay(std::uint32_t consecutive_failures) const = 0;
  virtual ~BackoffPolicy() = default;
};

class FixedBackoff final : public BackoffPolicy {
 public:
  explicit FixedBackoff(std::chrono::milliseconds delay) noexcept : delay_(delay) {}

  std::chrono::milliseconds delay(std::uint32_t consecutive_failures) const override;

 private:
  std::chrono::milliseconds delay_;
};

// base * 2^(n-1), capped.
class CappedExponentialBackoff final : public BackoffPolicy {
 public:
  CappedExponentialBackoff(std::chrono::milliseconds base, std::chrono::milliseconds cap) noexcept
      : base_(base), cap_(cap) {}

  std::chrono::milliseconds delay(std::uint32_t consecutive_failures) const override;

 private:
  std::chrono::milliseconds base_;
  std::chrono::milliseconds cap_;
};

std::unique_ptr<BackoffPolicy> make_backoff(const std::string& kind, std::chrono::milliseconds base,
                                            std::chrono::milliseconds cap);

}  // namespace joule_gate::sched
