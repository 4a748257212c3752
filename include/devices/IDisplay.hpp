#pragma once
#include <cstdint>
#include <string_view>

namespace ignitor::devices {

struct Size {
  int width{0};
  int height{0};
};

// Character-grid display surface. Coordinates are 1-based: (1,1) is the
// top-left cell, matching terminal cursor addressing and mouse reports.
// Colors are 0xRRGGBB.
class IDisplay {
public:
  virtual ~IDisplay() = default;

  [[nodiscard]] virtual Size resolution() const = 0;

  virtual void set_foreground(std::uint32_t rgb) = 0;
  virtual void set_background(std::uint32_t rgb) = 0;
  [[nodiscard]] virtual std::uint32_t foreground() const = 0;
  [[nodiscard]] virtual std::uint32_t background() const = 0;

  // Fill a w*h block with one glyph (a single UTF-8 codepoint) in the
  // current colors. Cells outside the surface are clipped.
  virtual void fill(int x, int y, int w, int h, std::string_view glyph) = 0;

  // Write text left to right starting at (x,y), one codepoint per cell.
  virtual void write(int x, int y, std::string_view text) = 0;

  // Make the drawn frame visible. Default: drawing is already visible.
  virtual void present() {}
};

} // namespace ignitor::devices
