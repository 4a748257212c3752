#pragma once
#include <cstdint>

namespace ignitor::devices {

// Bundled discrete output bus: several 8-bit channels share one side.
class IBus {
public:
  virtual ~IBus() = default;

  // Drive channel on side to value. Return false if the write did not land.
  [[nodiscard]] virtual bool set_channel(int side, int channel, std::uint8_t value) = 0;

  // Short backend name for diagnostics and the event journal
  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace ignitor::devices
