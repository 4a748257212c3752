#pragma once
#include <chrono>

namespace ignitor::devices {

struct InputEvent {
  enum class Kind { Timeout, Pointer, Interrupt };
  Kind kind{Kind::Timeout};
  int x{0};
  int y{0};

  static InputEvent timeout() { return {}; }
  static InputEvent pointer(int x, int y) { return {Kind::Pointer, x, y}; }
  static InputEvent interrupt() { return {Kind::Interrupt, 0, 0}; }
};

class IInputSource {
public:
  virtual ~IInputSource() = default;
  // Block for at most max_wait and return the next event, or Timeout.
  [[nodiscard]] virtual InputEvent poll(std::chrono::milliseconds max_wait) = 0;
};

} // namespace ignitor::devices
