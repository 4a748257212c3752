#include "app/Actuators.hpp"
#include "app/EventLog.hpp"
#include <thread>

namespace ignitor::app {

static const char* on_off(bool v) { return v ? "ON" : "OFF"; }

PulseHold::PulseHold(devices::IBus& bus, int side, int channel, EventLog* log, int& faults)
    : bus_(bus), side_(side), channel_(channel), log_(log), faults_(faults) {
  raised_ = bus_.set_channel(side_, channel_, 255);
  if (!raised_) {
    ++faults_;
    if (log_) log_->record("bus write failed: fire channel high");
  }
}

PulseHold::~PulseHold() {
  if (!bus_.set_channel(side_, channel_, 0)) {
    ++faults_;
    if (log_) log_->record("bus write failed: fire channel low");
  }
}

ActuatorController::ActuatorController(devices::IBus& bus, model::BusChannels channels,
                                       std::chrono::milliseconds pulse_dwell,
                                       EventLog* log, Sleeper sleeper)
    : bus_(bus), channels_(channels), pulse_dwell_(pulse_dwell), log_(log),
      sleeper_(std::move(sleeper)) {
  if (!sleeper_) {
    sleeper_ = [](std::chrono::milliseconds d){ std::this_thread::sleep_for(d); };
  }
}

void ActuatorController::push_outputs() {
  auto level = [](bool on) -> std::uint8_t { return on ? 255 : 0; };
  bool ok = true;
  ok = bus_.set_channel(channels_.side, channels_.charge, level(state_.charging)) && ok;
  ok = bus_.set_channel(channels_.side, channels_.fuel, level(state_.fuel_open)) && ok;
  ok = bus_.set_channel(channels_.side, channels_.cavity, level(state_.cavity_open)) && ok;
  if (log_) {
    std::string line = std::string("outputs charge=") + on_off(state_.charging) +
                       " fuel=" + on_off(state_.fuel_open) +
                       " cavity=" + on_off(state_.cavity_open);
    if (!ok) line += " (bus write failed)";
    log_->record(line);
  }
  if (!ok) ++bus_faults_;
}

void ActuatorController::post(std::string text) {
  message_.text = std::move(text);
  message_.at = std::chrono::steady_clock::now();
}

void ActuatorController::toggle_charging() {
  state_.charging = !state_.charging;
  push_outputs();
  post(std::string("Charging: ") + on_off(state_.charging));
}

void ActuatorController::toggle_fuel() {
  state_.fuel_open = !state_.fuel_open;
  push_outputs();
  post(std::string("Fuel: ") + on_off(state_.fuel_open));
}

void ActuatorController::toggle_cavity() {
  state_.cavity_open = !state_.cavity_open;
  push_outputs();
  post(std::string("Cavity: ") + on_off(state_.cavity_open));
}

IgniteResult ActuatorController::try_ignite(bool energy_ready) {
  if (!energy_ready) {
    post("Not enough energy.");
    if (log_) log_->record("ignition refused: not enough energy");
    return IgniteResult::InsufficientEnergy;
  }
  bool raised = false;
  {
    PulseHold hold(bus_, channels_.side, channels_.fire, log_, bus_faults_);
    sleeper_(pulse_dwell_);
    raised = hold.raised();
  }
  if (!raised) {
    post("Ignition failed: bus write.");
    return IgniteResult::BusFault;
  }
  if (log_) log_->record("ignition pulse " + std::to_string(pulse_dwell_.count()) + "ms");
  post("Ignition triggered.");
  return IgniteResult::Fired;
}

bool ActuatorController::enforce_interlock(bool energy_ready) {
  if (!(energy_ready && state_.charging)) return false;
  state_.charging = false;
  push_outputs();
  if (log_) log_->record("interlock: laser charged, charging forced off");
  post("Laser charged - charging OFF.");
  return true;
}

void ActuatorController::shutdown() {
  state_ = model::ActuatorState{};
  push_outputs();
  if (log_) log_->record("shutdown: all actuators off");
}

} // namespace ignitor::app
