#pragma once
#include <algorithm>
#include <optional>

namespace ignitor::model {

struct EnergyReading {
  double eu{0.0};          // normalized, >= 0
  double required_eu{0.0};
  bool   ready{false};     // eu >= required_eu, recomputed every frame

  // Laser bar fill, clamped to 0..1.
  [[nodiscard]] double fill_ratio() const {
    if (required_eu <= 0.0) return 1.0;
    return std::clamp(eu / required_eu, 0.0, 1.0);
  }
};

struct ReactorSample {
  double plasma_heat{0.0}; // K, >= 0
  double production{0.0};  // EU/t, >= 0
};

// Tri-state flags: nullopt when the adapter is absent or the query failed.
struct ReactorStatus {
  std::optional<bool> ignited;
  std::optional<bool> can_ignite;
};

} // namespace ignitor::model
