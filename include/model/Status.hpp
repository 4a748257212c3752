#pragma once
#include <chrono>
#include <string>

namespace ignitor::model {

// Last user-facing feedback line. Overwritten, never appended.
struct StatusMessage {
  std::string text;
  std::chrono::steady_clock::time_point at{};

  [[nodiscard]] bool visible(std::chrono::steady_clock::time_point now,
                             std::chrono::seconds ttl = std::chrono::seconds(8)) const {
    return !text.empty() && now - at < ttl;
  }
};

} // namespace ignitor::model
