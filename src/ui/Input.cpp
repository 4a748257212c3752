#include "ui/Input.hpp"
#include "ui/Terminal.hpp"
#include <unistd.h>
#include <poll.h>
#include <cerrno>
#include <thread>

namespace ignitor::ui {

using devices::InputEvent;

static constexpr std::size_t kMaxCarry = 32;

// Parses the decimal at buf[k], advancing k. False if no digit is there.
static bool read_num(const unsigned char* buf, std::size_t n, std::size_t& k, int& out) {
  if (k >= n || buf[k] < '0' || buf[k] > '9') return false;
  int v = 0;
  while (k < n && buf[k] >= '0' && buf[k] <= '9') {
    if (v < 100000) v = v * 10 + (buf[k] - '0');
    ++k;
  }
  out = v;
  return true;
}

std::vector<InputEvent> decode_input(const unsigned char* buf, std::size_t n, std::size_t* unfinished) {
  std::vector<InputEvent> out;
  std::size_t tail = 0;
  std::size_t k = 0;
  while (k < n) {
    unsigned char c = buf[k++];
    if (c == 'q' || c == 'Q') {
      out.push_back(InputEvent::interrupt());
    } else if (c == 0x1B) {
      const std::size_t start = k - 1;
      std::size_t p = k;
      if (p >= n) { tail = n - start; break; }
      if (buf[p++] != '[') continue;
      if (p >= n) { tail = n - start; break; }
      if (buf[p++] != '<') continue;
      int v[3] = {0, 0, 0};
      bool cut = false, bad = false;
      for (int i = 0; i < 3; ++i) {
        if (p >= n) { cut = true; break; }
        if (!read_num(buf, n, p, v[i])) { bad = true; break; }
        if (p >= n) { cut = true; break; }
        if (i < 2 && buf[p++] != ';') { bad = true; break; }
      }
      if (cut) { tail = n - start; break; }
      if (bad) continue;
      unsigned char fin = buf[p++];
      k = p;
      if (fin != 'M') continue;                       // 'm' is a release
      if ((v[0] & 3) != 0 || (v[0] & (32 | 64))) continue; // left press only, no motion/wheel
      out.push_back(InputEvent::pointer(v[1], v[2]));
    }
  }
  if (unfinished) *unfinished = tail;
  return out;
}

InputEvent TerminalInput::poll(std::chrono::milliseconds max_wait) {
  if (g_stop.load()) return InputEvent::interrupt();
  if (!pending_.empty()) {
    auto ev = pending_.front();
    pending_.pop_front();
    return ev;
  }
  if (eof_) {
    // stdin is gone; keep the redraw cadence without spinning
    std::this_thread::sleep_for(max_wait);
    return g_stop.load() ? InputEvent::interrupt() : InputEvent::timeout();
  }

  struct pollfd pfd{.fd = STDIN_FILENO, .events = POLLIN, .revents = 0};
  int rv = ::poll(&pfd, 1, static_cast<int>(max_wait.count()));
  if (g_stop.load()) return InputEvent::interrupt();
  if (rv <= 0) return InputEvent::timeout(); // deadline, or EINTR from a signal
  if (pfd.revents & (POLLHUP | POLLERR | POLLNVAL)) {
    if (!(pfd.revents & POLLIN)) { eof_ = true; return InputEvent::timeout(); }
  }

  unsigned char buf[64];
  ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
  if (n == 0) { eof_ = true; return InputEvent::timeout(); }
  if (n < 0) {
    if (errno != EAGAIN && errno != EINTR) eof_ = true;
    return InputEvent::timeout();
  }
  std::vector<unsigned char> bytes;
  bytes.swap(carry_);
  bytes.insert(bytes.end(), buf, buf + n);
  std::size_t tail = 0;
  for (const auto& ev : decode_input(bytes.data(), bytes.size(), &tail)) pending_.push_back(ev);
  // An SGR report is at most ~20 bytes; anything longer is noise.
  if (tail > 0 && tail <= kMaxCarry) carry_.assign(bytes.end() - static_cast<std::ptrdiff_t>(tail), bytes.end());
  if (pending_.empty()) return InputEvent::timeout();
  auto ev = pending_.front();
  pending_.pop_front();
  return ev;
}

} // namespace ignitor::ui
