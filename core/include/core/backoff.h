#pragma once

#include <chrono>
#include <random>

namespace spine::core {

/// Exponential backoff with optional symmetric jitter.
///
/// delay(n) = min(initial * multiplier^n, max), then scaled by a uniform
/// factor in [1 - jitter, 1 + jitter] and clamped to max again.
struct BackoffPolicy {
  std::chrono::milliseconds initial{1000};
  double multiplier = 2.0;
  std::chrono::milliseconds max{30000};
  double jitter = 0.0; // 0.2 = +/-20 %

  /// Un-jittered delay for the zero-based retry `attempt`.
  [[nodiscard]] std::chrono::milliseconds base_delay(int attempt) const;

  /// Jittered delay; `rng` belongs to the caller (never shared across jobs).
  [[nodiscard]] std::chrono::milliseconds delay(int attempt,
                                                std::mt19937 &rng) const;
};

} // namespace spine::core
