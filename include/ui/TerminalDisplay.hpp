#pragma once
#include <string>

#include "ui/CellGrid.hpp"

namespace ignitor::ui {

// Cell grid presented to stdout as one truecolor frame per present().
// The grid follows the terminal size; a size change blanks it and the
// next frame is drawn from scratch.
class TerminalDisplay : public CellGrid {
public:
  TerminalDisplay();

  void present() override;

  // Serialize the grid as cursor moves + SGR runs (no terminal I/O).
  [[nodiscard]] std::string encode_frame() const;

private:
  bool clear_pending_{true};
};

} // namespace ignitor::ui
