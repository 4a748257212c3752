#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <termios.h>

namespace ignitor::ui {

// Terminal state management
extern std::atomic<bool> g_stop;
extern std::atomic<bool> g_alt_in_use;
extern std::atomic<bool> g_mouse_in_use;

void restore_terminal_minimal();
void on_signal(int);
void on_atexit_restore();

// Terminal capability detection
[[nodiscard]] bool tty_stdout();
[[nodiscard]] bool use_unicode();
[[nodiscard]] int term_cols();
[[nodiscard]] int term_rows();

// 24-bit SGR for a 0xRRGGBB color
[[nodiscard]] std::string sgr_fg(std::uint32_t rgb);
[[nodiscard]] std::string sgr_bg(std::uint32_t rgb);
[[nodiscard]] std::string sgr_reset();
[[nodiscard]] std::string cursor_to(int x, int y);

// Best-effort terminal write (async-signal-safe)
void best_effort_write(int fd, const char* buf, size_t len);

// RAII guards for terminal state
class RawTermGuard {
  bool active_{false};
  termios old_{};
  int old_flags_{0};
public:
  RawTermGuard();
  ~RawTermGuard();
};

class CursorGuard {
  bool active_{false};
public:
  CursorGuard();
  ~CursorGuard();
};

class AltScreenGuard {
  bool active_{false};
public:
  explicit AltScreenGuard(bool enable);
  ~AltScreenGuard();
};

// Button-press reporting in SGR extended coordinates (?1000 + ?1006).
class MouseGuard {
  bool active_{false};
public:
  MouseGuard();
  ~MouseGuard();
};

} // namespace ignitor::ui
