#include "ui/Panels.hpp"
#include "ui/Formatting.hpp"
#include <algorithm>
#include <cmath>

namespace ignitor::ui {

void draw_frame(devices::IDisplay& d, const Rect& r, std::string_view title,
                const Palette& pal, const Glyphs& gl) {
  const int w = r.width();
  if (w < 2 || r.y2 - r.y1 < 1) return;

  ColorScope keep(d);
  d.set_foreground(pal.text);
  d.set_background(pal.background);

  d.write(r.x1, r.y1, gl.top_left + repeat_str(gl.horizontal, w - 2) + gl.top_right);
  d.write(r.x1, r.y2, gl.bottom_left + repeat_str(gl.horizontal, w - 2) + gl.bottom_right);
  for (int y = r.y1 + 1; y <= r.y2 - 1; ++y) {
    d.write(r.x1, y, gl.vertical);
    d.write(r.x2, y, gl.vertical);
  }

  if (!title.empty() && w > 4) {
    std::string t = " " + std::string(title) + " ";
    d.write(r.x1 + 2, r.y1, take_cols(t, w - 4));
  }
}

void draw_button(devices::IDisplay& d, const Rect& r, std::string_view label, bool enabled,
                 std::uint32_t fg, std::uint32_t bg, const Palette& pal) {
  const int w = r.width();
  if (w < 2) return;

  if (!enabled) {
    fg = pal.disabled_text;
    bg = pal.inactive;
  }

  std::string display = "[" + center_pad(label, w - 2) + "]";
  const int cy = (r.y1 + r.y2) / 2;

  ColorScope keep(d);
  d.set_foreground(fg);
  d.set_background(bg);
  d.fill(r.x1, r.y1, w, r.height(), " ");
  d.write(r.x1, cy, display);
}

void draw_indicator(devices::IDisplay& d, const Rect& r, std::string_view label,
                    std::optional<bool> state, std::uint32_t color_on, std::uint32_t color_off,
                    const Palette& pal) {
  const int w = r.width();
  if (w <= 0) return;

  std::uint32_t fg, bg;
  if (!state) {
    bg = pal.inactive;
    fg = pal.disabled_text;
  } else if (*state) {
    bg = color_on;
    fg = pal.on_text;
  } else {
    bg = color_off;
    fg = pal.text;
  }

  const int cy = (r.y1 + r.y2) / 2;
  ColorScope keep(d);
  d.set_foreground(fg);
  d.set_background(bg);
  d.fill(r.x1, r.y1, w, r.height(), " ");
  d.write(r.x1, cy, center_pad(label, w));
}

std::vector<int> bucket_heights(const std::deque<double>& history, int cols, int usable_rows) {
  std::vector<int> out(static_cast<size_t>(std::max(0, cols)), 0);
  const int n = static_cast<int>(history.size());
  if (n == 0 || cols <= 0) return out;

  double max_val = 0.0;
  for (double v : history) max_val = std::max(max_val, v);
  if (max_val <= 0.0) return out;

  usable_rows = std::max(1, usable_rows);
  const double step = static_cast<double>(n) / static_cast<double>(cols);
  for (int col = 0; col < cols; ++col) {
    int from = static_cast<int>(std::floor(col * step));
    int to = static_cast<int>(std::floor((col + 1) * step)); // exclusive
    if (from >= n) break;
    if (to <= from) to = from + 1;
    if (to > n) to = n;

    double col_max = 0.0;
    for (int i = from; i < to; ++i) col_max = std::max(col_max, history[static_cast<size_t>(i)]);

    double ratio = std::clamp(col_max / max_val, 0.0, 1.0);
    out[static_cast<size_t>(col)] = static_cast<int>(std::floor(ratio * usable_rows + 0.5));
  }
  return out;
}

void draw_graph(devices::IDisplay& d, const Rect& r, const std::deque<double>& history,
                std::string_view label, std::string_view value_text, std::uint32_t color,
                const Palette& pal, const Glyphs& gl) {
  const int w = r.width();
  const int h = r.height();
  if (w <= 0 || h <= 2) return;

  ColorScope keep(d);
  d.set_background(pal.background);
  d.fill(r.x1, r.y1, w, h, " ");

  d.set_foreground(pal.text);
  if (!label.empty()) d.write(r.x1, r.y1, label);
  if (!value_text.empty()) d.write(r.x1 + w - display_cols(value_text), r.y1, value_text);

  auto heights = bucket_heights(history, w, h - 2);
  d.set_foreground(color);
  for (int col = 0; col < w; ++col) {
    int height = heights[static_cast<size_t>(col)];
    if (height > 0) d.fill(r.x1 + col, r.y2 - height + 1, 1, height, gl.block);
  }
}

} // namespace ignitor::ui
