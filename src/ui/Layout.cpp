#include "ui/Layout.hpp"

namespace ignitor::ui {

Layout compute_layout(int width, int height) {
  Layout l{};
  l.width = width;
  l.height = height;

  const int exit_w = 5; // "[ X ]"
  l.exit_button = {width - exit_w + 1, l.title_row, width, l.title_row};

  const int frame_x1 = 2;
  const int frame_x2 = width - 1;

  // top, two inner rows, bottom
  l.laser_frame = {frame_x1, 4, frame_x2, 7};
  l.energy_row = l.laser_frame.y1 + 1;
  const int btn_row = l.laser_frame.y1 + 2;
  const int inner_x1 = frame_x1 + 1;
  const int inner_x2 = frame_x2 - 1;
  l.charge_button = {inner_x1, btn_row, inner_x1 + kButtonWidth - 1, btn_row};

  // top, one inner row, bottom
  l.control_frame = {frame_x1, l.laser_frame.y2 + 1, frame_x2, l.laser_frame.y2 + 3};
  const int ctrl_row = l.control_frame.y1 + 1;

  l.ignite_button = {inner_x1, ctrl_row, inner_x1 + kButtonWidth - 1, ctrl_row};
  const int fuel_x1 = l.ignite_button.x2 + kButtonGap + 1;
  l.fuel_button = {fuel_x1, ctrl_row, fuel_x1 + kButtonWidth - 1, ctrl_row};
  const int cavity_x1 = l.fuel_button.x2 + kButtonGap + 1;
  l.cavity_button = {cavity_x1, ctrl_row, cavity_x1 + kButtonWidth - 1, ctrl_row};

  // Indicators right-aligned in the control frame
  const int ind_x1 = inner_x2 - (2 * kButtonWidth + kButtonGap) + 1;
  l.can_ignite_indicator = {ind_x1, ctrl_row, ind_x1 + kButtonWidth - 1, ctrl_row};
  const int ind2_x1 = ind_x1 + kButtonWidth + kButtonGap;
  l.ignited_indicator = {ind2_x1, ctrl_row, ind2_x1 + kButtonWidth - 1, ctrl_row};

  const int graphs_top = l.control_frame.y2 + 1;
  int graphs_bot = height - 1;
  if (graphs_bot - graphs_top < kMinGraphRows) {
    graphs_bot = graphs_top + kMinGraphRows;
    if (graphs_bot > height - 1) graphs_bot = height - 1;
  }
  const int split = (graphs_top + graphs_bot) / 2;
  l.power_frame = {frame_x1, graphs_top, frame_x2, split};
  l.heat_frame = {frame_x1, split + 1, frame_x2, graphs_bot};

  l.status_row = height;
  return l;
}

} // namespace ignitor::ui
