#pragma once
#include <cstddef>
#include <deque>
#include <optional>

namespace ignitor::app {

// Fixed-capacity sample history: append at the back, evict the oldest.
// Insertion order equals sampling order; size() never exceeds capacity().
class HistoryBuffer {
public:
  explicit HistoryBuffer(std::size_t capacity);

  void push(double sample);

  // Read-only view, oldest first.
  [[nodiscard]] const std::deque<double>& snapshot() const { return samples_; }
  [[nodiscard]] std::optional<double> latest() const;

  [[nodiscard]] std::size_t size() const { return samples_.size(); }
  [[nodiscard]] std::size_t capacity() const { return capacity_; }
  [[nodiscard]] bool empty() const { return samples_.empty(); }

private:
  std::size_t capacity_;
  std::deque<double> samples_;
};

} // namespace ignitor::app
