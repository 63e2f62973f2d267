/**
 * @file LoopDetector.hpp
 * @brief Per-event-type publish counter that flags runaway publish storms.
 * @details Every Record() increments the counter of its event type. Once a counter exceeds the
 *          threshold a warning is logged; in strict mode Record() throws instead. A
 *          PeriodicTimer clears every counter once per window, whether or not anything is being
 *          published, so a count never spans more than one window.
 */

#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>

#include "PeriodicTimer.hpp"

class EventLoopDetectedException : public std::runtime_error {
 public:
  EventLoopDetectedException(std::string event_type, int threshold)
      : std::runtime_error("Event loop detected: " + event_type + " exceeded threshold of " + std::to_string(threshold)),
        event_type_(std::move(event_type)) {
  }

  const std::string& EventTypeName() const {
    return event_type_;
  }

 private:
  std::string event_type_;
};

struct LoopDetectorOptions {
  int threshold = 10;
  std::chrono::milliseconds window{1000};
  bool strict = false;
};

class LoopDetector {
 public:
  explicit LoopDetector(LoopDetectorOptions options = {});

  /**
   * @brief Counts one publish of event_type.
   * @return true if the counter is above the threshold (a storm warning was logged).
   * @throws EventLoopDetectedException above the threshold in strict mode.
   */
  bool Record(std::string_view event_type);

  int Count(std::string_view event_type) const;

  // Clears every counter. The timer calls it once per window.
  void Reset();

  const LoopDetectorOptions& Options() const {
    return options_;
  }

  LoopDetector(const LoopDetector&) = delete;
  LoopDetector& operator=(const LoopDetector&) = delete;

 private:
  LoopDetectorOptions options_;
  mutable std::mutex counters_mutex_;
  std::unordered_map<std::string, int> counters_;
  std::unique_ptr<PeriodicTimer> reset_timer_;  // last member, stops before counters_ goes away
};
