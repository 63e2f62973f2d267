/**
 * @file LoopDetector.cpp
 * @brief Implementation of LoopDetector.
 */

#include "LoopDetector.hpp"

#include <spdlog/spdlog.h>

LoopDetector::LoopDetector(LoopDetectorOptions options) : options_(options) {
  if (options_.window <= std::chrono::milliseconds::zero()) {
    options_.window = std::chrono::milliseconds(1000);
  }
  reset_timer_ = std::make_unique<PeriodicTimer>(options_.window, [this]() { Reset(); });
}

bool LoopDetector::Record(std::string_view event_type) {
  int count = 0;
  {
    std::lock_guard<std::mutex> lock(counters_mutex_);
    count = ++counters_[std::string(event_type)];
  }

  if (count <= options_.threshold) {
    return false;
  }

  spdlog::warn("EventBus: potential event loop detected for '{}' ({} publishes within {} ms)", event_type, count,
               options_.window.count());

  if (options_.strict) {
    throw EventLoopDetectedException(std::string(event_type), options_.threshold);
  }
  return true;
}

int LoopDetector::Count(std::string_view event_type) const {
  std::lock_guard<std::mutex> lock(counters_mutex_);
  auto it = counters_.find(std::string(event_type));
  return it == counters_.end() ? 0 : it->second;
}

void LoopDetector::Reset() {
  std::lock_guard<std::mutex> lock(counters_mutex_);
  counters_.clear();
}
