#pragma once

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "devices/IDisplay.hpp"
#include "ui/Config.hpp"
#include "ui/Layout.hpp"

namespace ignitor::ui {

struct Glyphs {
  std::string horizontal{"─"};
  std::string vertical{"│"};
  std::string top_left{"┌"};
  std::string top_right{"┐"};
  std::string bottom_left{"└"};
  std::string bottom_right{"┘"};
  std::string block{"█"};

  static Glyphs unicode() { return Glyphs{}; }
  static Glyphs ascii() { return Glyphs{"-", "|", "+", "+", "+", "+", "#"}; }
};

// Saves the display's current colors and restores them on scope exit.
class ColorScope {
public:
  explicit ColorScope(devices::IDisplay& d)
      : d_(d), fg_(d.foreground()), bg_(d.background()) {}
  ~ColorScope() {
    d_.set_foreground(fg_);
    d_.set_background(bg_);
  }
  ColorScope(const ColorScope&) = delete;
  ColorScope& operator=(const ColorScope&) = delete;

private:
  devices::IDisplay& d_;
  std::uint32_t fg_;
  std::uint32_t bg_;
};

// Single-line box with the title inset two cells from the left corner.
void draw_frame(devices::IDisplay& d, const Rect& r, std::string_view title,
                const Palette& pal, const Glyphs& gl);

// Solid block with "[ label ]" on the middle row, brackets on the exact
// edges. Disabled buttons ignore fg/bg and use the disabled palette.
void draw_button(devices::IDisplay& d, const Rect& r, std::string_view label, bool enabled,
                 std::uint32_t fg, std::uint32_t bg, const Palette& pal);

// Colored label block without brackets. Unknown state is drawn disabled.
void draw_indicator(devices::IDisplay& d, const Rect& r, std::string_view label,
                    std::optional<bool> state, std::uint32_t color_on, std::uint32_t color_off,
                    const Palette& pal);

// Max-pooling downsample of history into cols bottom-anchored columns:
// sample range [floor(c*n/cols), floor((c+1)*n/cols)) per column (at least
// one sample), height round(usable_rows * colMax / globalMax). All zero
// when history is empty or its maximum is <= 0.
[[nodiscard]] std::vector<int> bucket_heights(const std::deque<double>& history, int cols,
                                              int usable_rows);

// Clears r, prints label top-left and value_text top-right, then the bar
// chart along the bottom (usable height is r.height() - 2).
void draw_graph(devices::IDisplay& d, const Rect& r, const std::deque<double>& history,
                std::string_view label, std::string_view value_text, std::uint32_t color,
                const Palette& pal, const Glyphs& gl);

} // namespace ignitor::ui
