#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>

namespace txcoord::retry {

// Built once, before the manager; a manager never changes its policy.
struct RetryPolicy {
  std::uint32_t             max_retries = 3;
  std::chrono::milliseconds base_backoff{100};
  std::chrono::milliseconds max_backoff{5000};

  // Delay before retry number `retry` (1-based): base * 2^(retry-1),
  // capped at max_backoff.
  std::chrono::milliseconds BackoffFor(std::uint32_t retry) const {
    if (retry == 0 || base_backoff.count() <= 0) {
      return std::chrono::milliseconds{0};
    }
    auto delay = base_backoff;
    for (std::uint32_t i = 1; i < retry && delay < max_backoff; ++i) {
      delay *= 2;
    }
    return std::min(delay, max_backoff);
  }
};

} // namespace txcoord::retry
