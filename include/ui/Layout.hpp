#pragma once

namespace ignitor::ui {

// Inclusive cell rectangle, 1-based.
struct Rect {
  int x1{0}, y1{0}, x2{0}, y2{0};

  [[nodiscard]] int width() const { return x2 - x1 + 1; }
  [[nodiscard]] int height() const { return y2 - y1 + 1; }
  [[nodiscard]] bool contains(int x, int y) const {
    return x >= x1 && x <= x2 && y >= y1 && y <= y2;
  }
  // One cell in from every edge (frame interior).
  [[nodiscard]] Rect inner() const { return {x1 + 1, y1 + 1, x2 - 1, y2 - 1}; }
};

inline constexpr int kButtonWidth = 12;
inline constexpr int kButtonGap = 2;
inline constexpr int kMinGraphRows = 6;

// Fixed vertical bands, recomputed from the surface size every frame:
//   row 1      title + exit button
//   row 2      rule
//   rows 4-7   Laser frame: energy label + bar, Charge button
//   rows 8-10  Reactor Control frame: Ignite/Fuel/Cavity + indicators
//   rows 11..  Power History and Heat History, splitting the rest evenly
//   last row   status line
struct Layout {
  int width{0};
  int height{0};
  int title_row{1};
  int rule_row{2};
  Rect exit_button;

  Rect laser_frame;
  int energy_row{0};
  Rect charge_button;

  Rect control_frame;
  Rect ignite_button;
  Rect fuel_button;
  Rect cavity_button;
  Rect can_ignite_indicator;
  Rect ignited_indicator;

  Rect power_frame;
  Rect heat_frame;

  int status_row{0};
};

[[nodiscard]] Layout compute_layout(int width, int height);

} // namespace ignitor::ui
