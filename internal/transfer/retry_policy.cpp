#include "retry_policy.hpp"

#include <algorithm>
#include <cmath>

#include "internal/util/time.hpp"

namespace vault::transfer {

namespace {

constexpr std::chrono::milliseconds kCatalogMaxBackoff{5000};

} // namespace

RetryPolicy RetryPolicy::FromConfig(const vault::runtime::config::PartRetryConfig& config) {
  RetryPolicy policy;
  policy.max_attempts    = std::max<uint32_t>(1, config.max_attempts());
  policy.initial_backoff = util::ToMillis(config.initial_backoff());
  policy.max_backoff     = util::ToMillis(config.max_backoff());
  policy.multiplier      = config.multiplier() < 1.0 ? 1.0 : config.multiplier();
  return policy;
}

RetryPolicy RetryPolicy::FromConfig(const vault::runtime::config::CatalogRetryConfig& config) {
  RetryPolicy policy;
  policy.max_attempts    = std::max<uint32_t>(1, config.max_attempts());
  policy.initial_backoff = util::ToMillis(config.initial_backoff());
  policy.max_backoff     = kCatalogMaxBackoff;
  policy.multiplier      = 2.0;
  return policy;
}

std::optional<std::chrono::milliseconds> RetryState::RecordFailure() {
  ++failures_;
  if (failures_ >= policy_.max_attempts) {
    return std::nullopt;
  }

  const double scaled = static_cast<double>(policy_.initial_backoff.count()) * std::pow(policy_.multiplier, failures_ - 1);
  const double capped = policy_.max_backoff.count() > 0 ? std::min(scaled, static_cast<double>(policy_.max_backoff.count())) : scaled;
  return std::chrono::milliseconds(static_cast<int64_t>(capped));
}

} // namespace vault::transfer
