#include "app/ControlLoop.hpp"
#include "app/EventLog.hpp"

namespace ignitor::app {

ControlLoop::ControlLoop(Peripherals p, const ui::Config& cfg, ui::Glyphs glyphs,
                         EventLog* log, Sleeper sleeper)
    : io_(p), cfg_(cfg), glyphs_(std::move(glyphs)), log_(log),
      power_(static_cast<std::size_t>(cfg.history.max_samples)),
      heat_(static_cast<std::size_t>(cfg.history.max_samples)),
      sampler_(p.laser, p.reactor, cfg.laser.required_eu(), power_, heat_),
      actuators_(p.bus, cfg.bus, std::chrono::milliseconds(cfg.timing.pulse_ms), log,
                 std::move(sleeper)) {}

int ControlLoop::run(int max_iterations) {
  using devices::InputEvent;
  actuators_.push_outputs();
  draw();

  int handled = 0;
  const auto wait = std::chrono::milliseconds(cfg_.timing.poll_ms);
  while (running_ && (max_iterations <= 0 || handled < max_iterations)) {
    InputEvent ev = io_.input.poll(wait);
    ++handled;
    switch (ev.kind) {
      case InputEvent::Kind::Timeout:
        draw();
        break;
      case InputEvent::Kind::Pointer:
        handle_pointer(ev.x, ev.y);
        break;
      case InputEvent::Kind::Interrupt:
        if (log_) log_->record("interrupt received");
        running_ = false;
        break;
    }
  }

  actuators_.shutdown();
  clear_surface();
  return handled;
}

void ControlLoop::draw() {
  // One read per frame: bar, interlock and the Ignite button agree.
  const model::EnergyReading energy = sampler_.read_energy();
  actuators_.enforce_interlock(energy.ready);
  const model::ReactorStatus status = sampler_.status();
  const std::optional<model::ReactorSample> sample = sampler_.sample();

  ui::FrameView view{actuators_.state(), energy, sample, status,
                     power_.snapshot(), heat_.snapshot(), actuators_.message(),
                     std::chrono::steady_clock::now(), first_frame_};
  regions_ = ui::render_dashboard(io_.display, view, cfg_, glyphs_);
  io_.display.present();
  first_frame_ = false;
  ++frames_;
}

bool ControlLoop::handle_pointer(int x, int y) {
  const ui::ButtonRegion* hit = ui::hit_test(regions_, x, y);
  if (!hit) return false;
  // Copy out: draw() below replaces regions_.
  const ui::ButtonRegion region = *hit;
  if (region.enabled) dispatch(region.action);
  draw();
  return true;
}

void ControlLoop::dispatch(ui::Command command) {
  switch (command) {
    case ui::Command::Exit:
      if (log_) log_->record("exit requested");
      running_ = false;
      break;
    case ui::Command::Charge:
      actuators_.toggle_charging();
      break;
    case ui::Command::Ignite: {
      // Energy may have moved since the frame was drawn; decide on a fresh read.
      const model::EnergyReading energy = sampler_.read_energy();
      if (actuators_.try_ignite(energy.ready) == IgniteResult::Fired) ++ignitions_;
      break;
    }
    case ui::Command::Fuel:
      actuators_.toggle_fuel();
      break;
    case ui::Command::Cavity:
      actuators_.toggle_cavity();
      break;
  }
}

void ControlLoop::clear_surface() {
  const auto size = io_.display.resolution();
  io_.display.set_background(cfg_.colors.background);
  io_.display.set_foreground(cfg_.colors.text);
  io_.display.fill(1, 1, size.width, size.height, " ");
  io_.display.present();
}

} // namespace ignitor::app
