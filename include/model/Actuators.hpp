#pragma once

namespace ignitor::model {

// Latched actuator outputs. The bus always mirrors this struct.
struct ActuatorState {
  bool charging{false};
  bool fuel_open{false};
  bool cavity_open{false};
};

// Where each actuator lives on the bundled bus.
struct BusChannels {
  int side{2};
  int fire{4};
  int charge{1};
  int fuel{10};
  int cavity{12};
};

} // namespace ignitor::model
