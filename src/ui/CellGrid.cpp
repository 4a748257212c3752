#include "ui/CellGrid.hpp"
#include "ui/Formatting.hpp"
#include <algorithm>

namespace ignitor::ui {

CellGrid::CellGrid(int width, int height)
    : width_(std::max(0, width)), height_(std::max(0, height)),
      cells_(static_cast<size_t>(width_) * static_cast<size_t>(height_)) {}

void CellGrid::resize(int width, int height) {
  width_ = std::max(0, width);
  height_ = std::max(0, height);
  cells_.assign(static_cast<size_t>(width_) * static_cast<size_t>(height_), Cell{});
}

void CellGrid::fill(int x, int y, int w, int h, std::string_view glyph) {
  if (w <= 0 || h <= 0) return;
  std::string g = glyph.empty() ? std::string(" ") : take_cols(glyph, 1);
  int x0 = std::max(1, x), y0 = std::max(1, y);
  int x1 = std::min(width_, x + w - 1), y1 = std::min(height_, y + h - 1);
  for (int row = y0; row <= y1; ++row) {
    for (int col = x0; col <= x1; ++col) {
      auto& c = cells_[static_cast<size_t>(row - 1) * width_ + (col - 1)];
      c.glyph = g;
      c.fg = fg_;
      c.bg = bg_;
    }
  }
}

void CellGrid::write(int x, int y, std::string_view text) {
  if (y < 1 || y > height_) return;
  int col = x;
  for (auto& g : split_cols(text)) {
    if (col > width_) break;
    if (col >= 1) {
      auto& c = cells_[static_cast<size_t>(y - 1) * width_ + (col - 1)];
      c.glyph = std::move(g);
      c.fg = fg_;
      c.bg = bg_;
    }
    ++col;
  }
}

const Cell& CellGrid::cell(int x, int y) const {
  static const Cell blank{};
  if (!in_bounds(x, y)) return blank;
  return cells_[static_cast<size_t>(y - 1) * width_ + (x - 1)];
}

std::string CellGrid::row_text(int y) const {
  std::string out;
  if (y < 1 || y > height_) return out;
  for (int x = 1; x <= width_; ++x) out += cell(x, y).glyph;
  return out;
}

} // namespace ignitor::ui
