#pragma once
#include <chrono>
#include <functional>
#include <string>

#include "devices/IBus.hpp"
#include "model/Actuators.hpp"
#include "model/Status.hpp"

namespace ignitor::app {

class EventLog; // forward decl

enum class IgniteResult { Fired, InsufficientEnergy, BusFault };

// Drives one channel high for its lifetime and low again on destruction,
// so a pulse always ends low even if the dwell is cut short by an exception.
// Each failed write bumps `faults`.
class PulseHold {
public:
  PulseHold(devices::IBus& bus, int side, int channel, EventLog* log, int& faults);
  ~PulseHold();
  PulseHold(const PulseHold&) = delete;
  PulseHold& operator=(const PulseHold&) = delete;

  [[nodiscard]] bool raised() const { return raised_; }

private:
  devices::IBus& bus_;
  int side_;
  int channel_;
  EventLog* log_;
  int& faults_;
  bool raised_{false};
};

// Owns the latched actuator state, mirrors it to the bus after every
// mutation and posts a status line for every user-visible change.
class ActuatorController {
public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  ActuatorController(devices::IBus& bus, model::BusChannels channels,
                     std::chrono::milliseconds pulse_dwell = std::chrono::milliseconds(300),
                     EventLog* log = nullptr, Sleeper sleeper = {});

  void toggle_charging();
  void toggle_fuel();
  void toggle_cavity();

  // Blocks for the whole dwell when energy_ready; no cancellation.
  // BusFault if the fire channel never went high.
  [[nodiscard]] IgniteResult try_ignite(bool energy_ready);

  // Interlock: once the laser is charged, charging is forced off.
  // Returns true if it tripped this frame.
  bool enforce_interlock(bool energy_ready);

  // Everything off and pushed. Safe to call more than once.
  void shutdown();

  // Push all three latched channels. Failed writes are journaled and
  // counted, never retried.
  void push_outputs();

  void post(std::string text);

  [[nodiscard]] const model::ActuatorState& state() const { return state_; }
  [[nodiscard]] const model::StatusMessage& message() const { return message_; }
  [[nodiscard]] int bus_faults() const { return bus_faults_; }

private:
  devices::IBus& bus_;
  model::BusChannels channels_;
  std::chrono::milliseconds pulse_dwell_;
  EventLog* log_;
  Sleeper sleeper_;
  model::ActuatorState state_{};
  model::StatusMessage message_{};
  int bus_faults_{0};
};

} // namespace ignitor::app
