#pragma once
#include <chrono>
#include <vector>

#include "app/Actuators.hpp"
#include "app/HistoryBuffer.hpp"
#include "app/Telemetry.hpp"
#include "devices/IBus.hpp"
#include "devices/IDisplay.hpp"
#include "devices/IInputSource.hpp"
#include "devices/ISensors.hpp"
#include "ui/Config.hpp"
#include "ui/Panels.hpp"
#include "ui/Renderer.hpp"

namespace ignitor::app {

class EventLog; // forward decl

// Capabilities the loop drives. All are borrowed; reactor may be null.
struct Peripherals {
  devices::IDisplay& display;
  devices::IInputSource& input;
  devices::IBus& bus;
  devices::IEnergySensor& laser;
  devices::IReactorSensor* reactor{nullptr};
};

// Single-threaded event loop: wait for input with the poll timeout,
// redraw on a timeout, dispatch then redraw on a click, stop on an
// interrupt or the exit button. Owns actuator state and both histories.
class ControlLoop {
public:
  using Sleeper = ActuatorController::Sleeper;

  ControlLoop(Peripherals p, const ui::Config& cfg, ui::Glyphs glyphs,
              EventLog* log = nullptr, Sleeper sleeper = {});
  ControlLoop(const ControlLoop&) = delete;
  ControlLoop& operator=(const ControlLoop&) = delete;

  // Pushes the initial outputs, draws, then loops until stopped or until
  // max_iterations events were handled (0 = no bound). Always ends with
  // every actuator off and the surface cleared. Returns events handled.
  int run(int max_iterations = 0);

  // One frame: fresh energy read, interlock, reactor sample, render.
  void draw();

  // Hit-test against the last frame's regions. A hit on an enabled
  // region runs its command; any hit redraws. Returns true on a hit.
  bool handle_pointer(int x, int y);

  void dispatch(ui::Command command);

  [[nodiscard]] bool running() const { return running_; }
  [[nodiscard]] int frames_drawn() const { return frames_; }
  [[nodiscard]] int ignitions() const { return ignitions_; }
  [[nodiscard]] const std::vector<ui::ButtonRegion>& regions() const { return regions_; }
  [[nodiscard]] const ActuatorController& actuators() const { return actuators_; }
  [[nodiscard]] const HistoryBuffer& power_history() const { return power_; }
  [[nodiscard]] const HistoryBuffer& heat_history() const { return heat_; }

private:
  void clear_surface();

  Peripherals io_;
  const ui::Config& cfg_;
  ui::Glyphs glyphs_;
  EventLog* log_;
  HistoryBuffer power_;
  HistoryBuffer heat_;
  TelemetrySampler sampler_;
  ActuatorController actuators_;
  std::vector<ui::ButtonRegion> regions_;
  bool running_{true};
  bool first_frame_{true};
  int frames_{0};
  int ignitions_{0};
};

} // namespace ignitor::app
