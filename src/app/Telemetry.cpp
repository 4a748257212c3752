#include "app/Telemetry.hpp"
#include <cmath>

namespace ignitor::app {

double normalize_reading(std::optional<double> raw) {
  if (!raw || !std::isfinite(*raw) || *raw < 0.0) return 0.0;
  return *raw;
}

TelemetrySampler::TelemetrySampler(devices::IEnergySensor& laser, devices::IReactorSensor* reactor,
                                   double required_eu, HistoryBuffer& power, HistoryBuffer& heat)
    : laser_(laser), reactor_(reactor), has_reactor_(reactor != nullptr),
      required_eu_(required_eu), power_(power), heat_(heat) {}

model::EnergyReading TelemetrySampler::read_energy() {
  model::EnergyReading r{};
  r.eu = normalize_reading(laser_.energy());
  r.required_eu = required_eu_;
  r.ready = r.eu >= required_eu_;
  return r;
}

std::optional<model::ReactorSample> TelemetrySampler::sample() {
  if (!has_reactor_) return std::nullopt;
  model::ReactorSample s{};
  s.plasma_heat = normalize_reading(reactor_->plasma_heat());
  s.production = normalize_reading(reactor_->production());
  power_.push(s.production);
  heat_.push(s.plasma_heat);
  return s;
}

model::ReactorStatus TelemetrySampler::status() {
  if (!has_reactor_) return {};
  return model::ReactorStatus{reactor_->ignited(), reactor_->can_ignite()};
}

} // namespace ignitor::app
