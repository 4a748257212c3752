#pragma once

#include <chrono>
#include <deque>
#include <optional>
#include <vector>

#include "devices/IDisplay.hpp"
#include "model/Actuators.hpp"
#include "model/Status.hpp"
#include "model/Telemetry.hpp"
#include "ui/Config.hpp"
#include "ui/Layout.hpp"
#include "ui/Panels.hpp"

namespace ignitor::ui {

enum class Command { Exit, Charge, Ignite, Fuel, Cavity };

struct ButtonRegion {
  Rect bounds;
  bool enabled{true};
  Command action{Command::Exit};
};

// Everything one frame reads. Built fresh by the loop before each draw.
struct FrameView {
  const model::ActuatorState& actuators;
  model::EnergyReading energy;
  std::optional<model::ReactorSample> sample; // nullopt: no reactor adapter
  model::ReactorStatus status;
  const std::deque<double>& power_history;
  const std::deque<double>& heat_history;
  const model::StatusMessage& message;
  std::chrono::steady_clock::time_point now;
  bool first_frame{false};
};

// Draws the whole dashboard and returns this frame's clickable regions.
// The returned set replaces the previous frame's; nothing is kept between
// calls.
[[nodiscard]] std::vector<ButtonRegion> render_dashboard(devices::IDisplay& d, const FrameView& v,
                                                         const Config& cfg, const Glyphs& gl);

// First region containing (x,y), inclusive bounds; nullptr on a miss.
[[nodiscard]] const ButtonRegion* hit_test(const std::vector<ButtonRegion>& regions, int x, int y);

} // namespace ignitor::ui
