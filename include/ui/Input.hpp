#pragma once
#include <cstddef>
#include <deque>
#include <vector>

#include "devices/IInputSource.hpp"

namespace ignitor::ui {

// Decode a chunk of raw stdin bytes. Left-button SGR mouse presses
// (ESC [ < b ; x ; y M) become Pointer events, q/Q becomes Interrupt,
// everything else (releases, motion, wheel, other keys) is dropped.
// A report cut off by the end of buf is not decoded; if `unfinished` is
// given it receives the length of that trailing fragment (0 if none).
[[nodiscard]] std::vector<devices::InputEvent> decode_input(const unsigned char* buf, std::size_t n,
                                                            std::size_t* unfinished = nullptr);

// Input source over the controlling terminal's stdin.
class TerminalInput : public devices::IInputSource {
public:
  [[nodiscard]] devices::InputEvent poll(std::chrono::milliseconds max_wait) override;

private:
  std::deque<devices::InputEvent> pending_;
  std::vector<unsigned char> carry_; // unfinished report from the last read
  bool eof_{false};
};

} // namespace ignitor::ui
