#include "app/HistoryBuffer.hpp"
#include <algorithm>

namespace ignitor::app {

HistoryBuffer::HistoryBuffer(std::size_t capacity) : capacity_(std::max<std::size_t>(1, capacity)) {}

void HistoryBuffer::push(double sample) {
  samples_.push_back(sample);
  while (samples_.size() > capacity_) samples_.pop_front();
}

std::optional<double> HistoryBuffer::latest() const {
  if (samples_.empty()) return std::nullopt;
  return samples_.back();
}

} // namespace ignitor::app
