#pragma once
#include <optional>

#include "app/HistoryBuffer.hpp"
#include "devices/ISensors.hpp"
#include "model/Telemetry.hpp"

namespace ignitor::app {

// Polls the sensors once per frame. Every failed, negative or non-finite
// reading becomes 0.0 right here, field by field, so nothing downstream
// ever handles a sensor fault.
class TelemetrySampler {
public:
  // reactor may be null: the adapter is then absent for the whole session.
  TelemetrySampler(devices::IEnergySensor& laser, devices::IReactorSensor* reactor,
                   double required_eu, HistoryBuffer& power, HistoryBuffer& heat);

  // Fresh read; ready is never carried over from an earlier call.
  [[nodiscard]] model::EnergyReading read_energy();

  // nullopt when no adapter. Otherwise pushes production into the power
  // history and plasma heat into the heat history, in that order.
  [[nodiscard]] std::optional<model::ReactorSample> sample();

  [[nodiscard]] model::ReactorStatus status();

  [[nodiscard]] bool has_reactor() const { return has_reactor_; }
  [[nodiscard]] double required_eu() const { return required_eu_; }

private:
  devices::IEnergySensor& laser_;
  devices::IReactorSensor* reactor_;
  const bool has_reactor_;
  double required_eu_;
  HistoryBuffer& power_;
  HistoryBuffer& heat_;
};

// nullopt, NaN, Inf and negatives -> 0.0
[[nodiscard]] double normalize_reading(std::optional<double> raw);

} // namespace ignitor::app
