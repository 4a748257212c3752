#include "ui/Renderer.hpp"
#include "ui/Formatting.hpp"
#include "util/Units.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace ignitor::ui {

static void draw_title(devices::IDisplay& d, const Layout& l, const Config& cfg, const Glyphs& gl) {
  const auto& pal = cfg.colors;
  d.set_background(pal.background);
  d.set_foreground(pal.text);
  d.fill(1, l.title_row, l.width, 2, " ");
  d.write(2, l.title_row, cfg.ui.title);
  d.write(2, l.rule_row, repeat_str(gl.horizontal, l.width - 4));
}

static void draw_energy_row(devices::IDisplay& d, const Layout& l, const FrameView& v,
                            const Config& cfg, const Glyphs& gl) {
  const auto& pal = cfg.colors;
  const int x1 = l.laser_frame.x1 + 1;
  const int x2 = l.laser_frame.x2 - 1;
  const int y = l.energy_row;

  std::string label = "Laser energy: " + util::format_energy(v.energy.eu) + " / " +
                      std::to_string(cfg.laser.required_meu) + " MEU";

  ColorScope keep(d);
  d.set_background(pal.background);
  d.set_foreground(pal.text);
  d.fill(x1, y, x2 - x1 + 1, 1, " ");
  d.write(x1, y, label);

  const int bar_x = x1 + display_cols(label) + 2;
  if (bar_x >= x2) return;
  const int bar_w = x2 - bar_x + 1;
  const int filled = static_cast<int>(std::floor(bar_w * v.energy.fill_ratio() + 0.5));
  d.set_foreground(v.energy.ready ? pal.active : pal.warn);
  if (filled > 0) d.fill(bar_x, y, filled, 1, gl.block);
}

static void draw_graphs(devices::IDisplay& d, const Layout& l, const FrameView& v,
                        const Config& cfg, const Glyphs& gl) {
  const auto& pal = cfg.colors;
  if (v.sample) {
    draw_graph(d, l.power_frame.inner(), v.power_history, "",
               util::format_energy(v.sample->production), pal.graph_power, pal, gl);
    draw_graph(d, l.heat_frame.inner(), v.heat_history, "",
               util::format_temperature(v.sample->plasma_heat), pal.graph_heat, pal, gl);
    return;
  }
  // Both panels' interiors become one message area.
  const Rect area{l.power_frame.x1 + 1, l.power_frame.y1 + 1, l.heat_frame.x2 - 1, l.heat_frame.y2 - 1};
  if (area.width() <= 0 || area.height() <= 0) return;
  ColorScope keep(d);
  d.set_background(pal.background);
  d.set_foreground(pal.text);
  d.fill(area.x1, area.y1, area.width(), area.height(), " ");
  d.write(area.x1, area.y1, take_cols("No reactor adapter found", area.width()));
}

std::vector<ButtonRegion> render_dashboard(devices::IDisplay& d, const FrameView& v,
                                           const Config& cfg, const Glyphs& gl) {
  const auto size = d.resolution();
  const Layout l = compute_layout(size.width, size.height);
  const auto& pal = cfg.colors;
  const auto& st = v.actuators;

  if (v.first_frame) {
    d.set_background(pal.background);
    d.set_foreground(pal.text);
    d.fill(1, 1, l.width, l.height, " ");
  }

  std::vector<ButtonRegion> regions;
  regions.reserve(5);

  draw_title(d, l, cfg, gl);
  regions.push_back({l.exit_button, true, Command::Exit});
  draw_button(d, l.exit_button, "X", true, pal.text, pal.warn, pal);

  draw_frame(d, l.laser_frame, "Laser", pal, gl);
  draw_frame(d, l.control_frame, "Reactor Control", pal, gl);
  draw_frame(d, l.power_frame, "Power History", pal, gl);
  draw_frame(d, l.heat_frame, "Heat History", pal, gl);

  draw_energy_row(d, l, v, cfg, gl);

  regions.push_back({l.charge_button, true, Command::Charge});
  draw_button(d, l.charge_button, "Charge", true,
              st.charging ? pal.on_text : pal.text,
              st.charging ? pal.active : pal.inactive, pal);

  draw_indicator(d, l.can_ignite_indicator, "Can Ignite", v.status.can_ignite,
                 pal.active, pal.inactive, pal);
  draw_indicator(d, l.ignited_indicator, "Ignited", v.status.ignited, pal.active, pal.warn, pal);

  // Ignition is only offered once the laser holds the required energy.
  const bool ready = v.energy.ready;
  regions.push_back({l.ignite_button, ready, Command::Ignite});
  regions.push_back({l.fuel_button, true, Command::Fuel});
  regions.push_back({l.cavity_button, true, Command::Cavity});

  draw_button(d, l.ignite_button, "Ignite", ready,
              ready ? pal.on_text : pal.text, ready ? pal.ready : pal.button, pal);
  draw_button(d, l.fuel_button, "Fuel", true,
              st.fuel_open ? pal.on_text : pal.text,
              st.fuel_open ? pal.active : pal.inactive, pal);
  draw_button(d, l.cavity_button, "Cavity", true,
              st.cavity_open ? pal.on_text : pal.text,
              st.cavity_open ? pal.active : pal.inactive, pal);

  draw_graphs(d, l, v, cfg, gl);

  d.set_background(pal.background);
  d.set_foreground(pal.text);
  d.fill(1, l.status_row, l.width, 1, " ");
  if (v.message.visible(v.now, std::chrono::seconds(cfg.timing.message_secs)))
    d.write(2, l.status_row, v.message.text);

  return regions;
}

const ButtonRegion* hit_test(const std::vector<ButtonRegion>& regions, int x, int y) {
  auto it = std::find_if(regions.begin(), regions.end(),
                         [&](const ButtonRegion& r) { return r.bounds.contains(x, y); });
  return it == regions.end() ? nullptr : &*it;
}

} // namespace ignitor::ui
