#include "ui/Terminal.hpp"
#include <unistd.h>
#include <termios.h>
#include <sys/ioctl.h>
#include <fcntl.h>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace ignitor::ui {

std::atomic<bool> g_stop{false};
std::atomic<bool> g_alt_in_use{false};
std::atomic<bool> g_mouse_in_use{false};

void best_effort_write(int fd, const char* buf, size_t len) {
  while (len > 0) {
    ssize_t n = ::write(fd, buf, len);
    if (n <= 0) return; // terminal gone; nothing left to restore into
    buf += n;
    len -= static_cast<size_t>(n);
  }
}

void restore_terminal_minimal() {
  // Async-signal-safe: mouse off, leave alt screen, show cursor, reset SGR
  const char* mouse_off = "\x1B[?1006l\x1B[?1000l";
  const char* alt_off = "\x1B[?1049l";
  const char* show_cur = "\x1B[?25h";
  const char* reset = "\x1B[0m";
  if (g_mouse_in_use.load()) best_effort_write(STDOUT_FILENO, mouse_off, std::char_traits<char>::length(mouse_off));
  if (g_alt_in_use.load()) best_effort_write(STDOUT_FILENO, alt_off, std::char_traits<char>::length(alt_off));
  best_effort_write(STDOUT_FILENO, show_cur, std::char_traits<char>::length(show_cur));
  best_effort_write(STDOUT_FILENO, reset, std::char_traits<char>::length(reset));
}

// Only raises the flag; the loop notices it within one poll period and
// runs the normal shutdown path (outputs off, guards unwound).
void on_signal(int) { g_stop.store(true); }

void on_atexit_restore() {
  std::fflush(stdout);
  restore_terminal_minimal();
  if (::isatty(STDOUT_FILENO) == 1) {
    tcdrain(STDOUT_FILENO);
  }
}

bool tty_stdout() {
  return ::isatty(STDOUT_FILENO) == 1;
}

bool use_unicode() {
  const char* lc = std::getenv("LC_ALL");
  if (!lc || !*lc) lc = std::getenv("LC_CTYPE");
  if (!lc || !*lc) lc = std::getenv("LANG");
  if (!lc || !*lc) return false;
  std::string s = lc;
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s.find("utf") != std::string::npos;
}

int term_cols() {
  struct winsize ws{};
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
    return ws.ws_col;
  const char* env = std::getenv("COLUMNS");
  if (env) { int c = std::atoi(env); if (c > 0) return c; }
  return 80;
}

int term_rows() {
  struct winsize ws{};
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0)
    return ws.ws_row;
  const char* env = std::getenv("LINES");
  if (env) { int r = std::atoi(env); if (r > 0) return r; }
  return 24;
}

static std::string sgr_rgb(const char* lead, std::uint32_t rgb) {
  return std::string("\x1B[") + lead + ";2;" + std::to_string((rgb >> 16) & 0xFF) + ";" +
         std::to_string((rgb >> 8) & 0xFF) + ";" + std::to_string(rgb & 0xFF) + "m";
}

std::string sgr_fg(std::uint32_t rgb) { return sgr_rgb("38", rgb); }
std::string sgr_bg(std::uint32_t rgb) { return sgr_rgb("48", rgb); }
std::string sgr_reset() { return "\x1B[0m"; }

std::string cursor_to(int x, int y) {
  return "\x1B[" + std::to_string(y) + ";" + std::to_string(x) + "H";
}

// RAII guards for terminal state
RawTermGuard::RawTermGuard() {
  if (::isatty(STDIN_FILENO) == 1) {
    if (tcgetattr(STDIN_FILENO, &old_) == 0) {
      termios neo = old_;
      neo.c_lflag &= ~(ICANON | ECHO);
      neo.c_cc[VMIN] = 0;
      neo.c_cc[VTIME] = 0;
      if (tcsetattr(STDIN_FILENO, TCSANOW, &neo) != 0) {
        std::fprintf(stderr, "ignitor: could not enter raw mode\n");
        return;
      }
      old_flags_ = fcntl(STDIN_FILENO, F_GETFL, 0);
      if (old_flags_ >= 0) fcntl(STDIN_FILENO, F_SETFL, old_flags_ | O_NONBLOCK);
      active_ = true;
    }
  }
}

RawTermGuard::~RawTermGuard() {
  if (active_) {
    tcsetattr(STDIN_FILENO, TCSANOW, &old_);
    if (old_flags_ >= 0) fcntl(STDIN_FILENO, F_SETFL, old_flags_);
  }
}

CursorGuard::CursorGuard() {
  if (tty_stdout()) {
    best_effort_write(STDOUT_FILENO, "\x1B[?25l", 6);
    active_ = true;
  }
}

CursorGuard::~CursorGuard() {
  if (active_) best_effort_write(STDOUT_FILENO, "\x1B[?25h", 6);
}

AltScreenGuard::AltScreenGuard(bool enable) {
  if (enable && tty_stdout()) {
    best_effort_write(STDOUT_FILENO, "\x1B[?1049h", 8);
    active_ = true;
    g_alt_in_use.store(true);
  }
}

AltScreenGuard::~AltScreenGuard() {
  if (active_) {
    best_effort_write(STDOUT_FILENO, "\x1B[?1049l", 8);
    g_alt_in_use.store(false);
  }
}

MouseGuard::MouseGuard() {
  if (tty_stdout()) {
    best_effort_write(STDOUT_FILENO, "\x1B[?1000h\x1B[?1006h", 16);
    active_ = true;
    g_mouse_in_use.store(true);
  }
}

MouseGuard::~MouseGuard() {
  if (active_) {
    best_effort_write(STDOUT_FILENO, "\x1B[?1006l\x1B[?1000l", 16);
    g_mouse_in_use.store(false);
  }
}

} // namespace ignitor::ui
