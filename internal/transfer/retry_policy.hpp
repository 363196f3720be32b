#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

#include "config/config.pb.h"

namespace vault::transfer {

/*
  Bounded exponential backoff.

  Attempt k (1-based) that fails waits
      min(initial_backoff * multiplier^(k-1), max_backoff)
  before attempt k+1; after max_attempts failures the operation is
  exhausted.
*/
struct RetryPolicy {
  uint32_t                  max_attempts    = 1;
  std::chrono::milliseconds initial_backoff = std::chrono::milliseconds(0);
  std::chrono::milliseconds max_backoff     = std::chrono::milliseconds(0);
  double                    multiplier      = 1.0;

  static RetryPolicy FromConfig(const vault::runtime::config::PartRetryConfig& config);
  static RetryPolicy FromConfig(const vault::runtime::config::CatalogRetryConfig& config);
};

/*
  Per-operation retry state machine.

      Attempting --failure--> Backoff(delay) --> Attempting
      Attempting --failure (attempts == max)--> Exhausted
*/
class RetryState {
 public:
  explicit RetryState(RetryPolicy policy) : policy_(policy) {
  }

  // Records one failed attempt. Returns the delay before the next attempt,
  // or nullopt when the policy is exhausted.
  std::optional<std::chrono::milliseconds> RecordFailure();

  uint32_t failures() const {
    return failures_;
  }

  bool Exhausted() const {
    return failures_ >= policy_.max_attempts;
  }

 private:
  RetryPolicy policy_;
  uint32_t    failures_ = 0;
};

} // namespace vault::transfer
