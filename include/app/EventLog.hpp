#pragma once

#include <filesystem>
#include <fstream>
#include <string_view>

namespace ignitor::app {

// Append-only event journal, one line per event:
//   <epoch_ms> <event text>
// Files are hourly chunks (ignitor_YYYY-MM-DD_HH.log) under log_dir.
// Written synchronously by the control thread.
class EventLog {
public:
  explicit EventLog(std::filesystem::path log_dir);
  ~EventLog();
  EventLog(const EventLog&) = delete;
  EventLog& operator=(const EventLog&) = delete;

  void record(std::string_view event);

  [[nodiscard]] std::filesystem::path chunk_path() const;

private:
  std::filesystem::path log_dir_;
  std::filesystem::path current_path_;
  std::ofstream file_;
  bool open_failed_reported_{false};
};

} // namespace ignitor::app
