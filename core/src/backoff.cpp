#include "core/backoff.h"

#include <algorithm>
#include <cmath>

namespace spine::core {

std::chrono::milliseconds BackoffPolicy::base_delay(int attempt) const {
  if (attempt < 0) {
    attempt = 0;
  }
  const double scaled = static_cast<double>(initial.count()) *
                        std::pow(multiplier, static_cast<double>(attempt));
  const double capped = std::min(scaled, static_cast<double>(max.count()));
  return std::chrono::milliseconds(static_cast<long long>(capped));
}

std::chrono::milliseconds BackoffPolicy::delay(int attempt,
                                               std::mt19937 &rng) const {
  const auto base = base_delay(attempt);
  if (jitter <= 0.0) {
    return base;
  }
  std::uniform_real_distribution<double> factor(1.0 - jitter, 1.0 + jitter);
  const double jittered = static_cast<double>(base.count()) * factor(rng);
  const double clamped =
      std::clamp(jittered, 0.0, static_cast<double>(max.count()));
  return std::chrono::milliseconds(static_cast<long long>(clamped));
}

} // namespace spine::core
