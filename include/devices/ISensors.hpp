#pragma once
#include <optional>

namespace ignitor::devices {

// Every query may fail independently; failure is std::nullopt. Values are
// passed through raw (negative or non-finite readings are possible) and
// normalized by the caller.

class IEnergySensor {
public:
  virtual ~IEnergySensor() = default;
  // Stored laser energy in EU.
  [[nodiscard]] virtual std::optional<double> energy() = 0;
};

class IReactorSensor {
public:
  virtual ~IReactorSensor() = default;
  // Plasma temperature in kelvin.
  [[nodiscard]] virtual std::optional<double> plasma_heat() = 0;
  // Energy production in EU per tick.
  [[nodiscard]] virtual std::optional<double> production() = 0;
  [[nodiscard]] virtual std::optional<bool> ignited() = 0;
  [[nodiscard]] virtual std::optional<bool> can_ignite() = 0;
};

} // namespace ignitor::devices
