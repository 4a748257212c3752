#include "ui/TerminalDisplay.hpp"
#include "ui/Terminal.hpp"
#include <unistd.h>

namespace ignitor::ui {

TerminalDisplay::TerminalDisplay() : CellGrid(term_cols(), term_rows()) {}

std::string TerminalDisplay::encode_frame() const {
  std::string out;
  out.reserve(static_cast<size_t>(width_) * static_cast<size_t>(height_) * 4 + 64);
  for (int y = 1; y <= height_; ++y) {
    out += cursor_to(1, y);
    bool first = true;
    std::uint32_t fg = 0, bg = 0;
    for (int x = 1; x <= width_; ++x) {
      const Cell& c = cell(x, y);
      if (first || c.fg != fg) { out += sgr_fg(c.fg); fg = c.fg; }
      if (first || c.bg != bg) { out += sgr_bg(c.bg); bg = c.bg; }
      first = false;
      out += c.glyph;
    }
  }
  out += sgr_reset();
  return out;
}

void TerminalDisplay::present() {
  if (!tty_stdout()) return;
  std::string frame;
  if (clear_pending_) {
    frame = "\x1B[0m\x1B[2J";
    clear_pending_ = false;
  }
  frame += encode_frame();
  best_effort_write(STDOUT_FILENO, frame.data(), frame.size());

  const int cols = term_cols();
  const int rows = term_rows();
  if (cols != width_ || rows != height_) {
    resize(cols, rows);
    clear_pending_ = true;
  }
}

} // namespace ignitor::ui
