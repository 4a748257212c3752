#include "app/EventLog.hpp"
#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>

namespace ignitor::app {

EventLog::EventLog(std::filesystem::path log_dir) : log_dir_(std::move(log_dir)) {
  std::error_code ec;
  std::filesystem::create_directories(log_dir_, ec);
  if (ec) {
    std::fprintf(stderr, "ignitor: EventLog: failed to create %s: %s\n",
                 log_dir_.c_str(), ec.message().c_str());
  }
}

EventLog::~EventLog() {
  if (file_.is_open()) {
    file_.flush();
    file_.close();
  }
}

void EventLog::record(std::string_view event) {
  auto now = std::chrono::system_clock::now();
  auto required_path = chunk_path();

  // Rotate on hour boundary
  if (required_path != current_path_ || !file_.is_open()) {
    if (file_.is_open()) {
      file_.flush();
      file_.close();
    }
    file_.clear();
    file_.open(required_path, std::ios::app);
    if (!file_) {
      if (!open_failed_reported_) {
        std::fprintf(stderr, "ignitor: EventLog: failed to open %s: %s\n",
                     required_path.c_str(), std::strerror(errno));
        open_failed_reported_ = true;
      }
      current_path_.clear();
      return;
    }
    current_path_ = required_path;
    open_failed_reported_ = false;
  }

  auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      now.time_since_epoch()).count();
  char ts_buf[32];
  auto [ptr, ec] = std::to_chars(ts_buf, ts_buf + sizeof(ts_buf), epoch_ms);
  if (ec != std::errc{}) return;

  file_.write(ts_buf, ptr - ts_buf);
  file_.put(' ');
  file_.write(event.data(), static_cast<std::streamsize>(event.size()));
  file_.put('\n');
  file_.flush();
}

std::filesystem::path EventLog::chunk_path() const {
  auto now = std::chrono::system_clock::now();
  auto now_t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  ::localtime_r(&now_t, &tm);

  char buf[64];
  std::snprintf(buf, sizeof(buf), "ignitor_%04d-%02d-%02d_%02d.log",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour);

  return log_dir_ / buf;
}

} // namespace ignitor::app
