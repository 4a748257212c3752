#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "devices/IDisplay.hpp"

namespace ignitor::ui {

struct Cell {
  std::string glyph{" "};
  std::uint32_t fg{0xFFFFFF};
  std::uint32_t bg{0x000000};
};

// In-memory character grid implementing the display contract. The
// terminal display presents it; tests read it back cell by cell.
class CellGrid : public devices::IDisplay {
public:
  CellGrid(int width, int height);

  [[nodiscard]] devices::Size resolution() const override { return {width_, height_}; }

  void set_foreground(std::uint32_t rgb) override { fg_ = rgb; }
  void set_background(std::uint32_t rgb) override { bg_ = rgb; }
  [[nodiscard]] std::uint32_t foreground() const override { return fg_; }
  [[nodiscard]] std::uint32_t background() const override { return bg_; }

  void fill(int x, int y, int w, int h, std::string_view glyph) override;
  void write(int x, int y, std::string_view text) override;

  // Resize and blank every cell.
  void resize(int width, int height);

  [[nodiscard]] bool in_bounds(int x, int y) const {
    return x >= 1 && y >= 1 && x <= width_ && y <= height_;
  }
  // 1-based; out-of-range coordinates return a blank cell.
  [[nodiscard]] const Cell& cell(int x, int y) const;
  // Concatenated glyphs of one row (tests and diagnostics).
  [[nodiscard]] std::string row_text(int y) const;

protected:
  int width_;
  int height_;
  std::uint32_t fg_{0xFFFFFF};
  std::uint32_t bg_{0x000000};
  std::vector<Cell> cells_;
};

} // namespace ignitor::ui
