/**
 * @file DispatchQueue.hpp
 * @brief FIFO buffer of events waiting to be delivered.
 * @note Not synchronized; EventBus guards it together with its draining flag.
 */

#pragma once

#include <deque>
#include <optional>
#include <string>

#include "EventTypes.hpp"

struct PendingEvent {
  std::string event_type;
  EventPayload payload;
  uint64_t sequence = 0;  // publish order, starting at 1
};

class DispatchQueue {
 public:
  uint64_t Push(std::string event_type, EventPayload payload) {
    uint64_t sequence = ++last_sequence_;
    pending_.push_back(PendingEvent{std::move(event_type), std::move(payload), sequence});
    return sequence;
  }

  std::optional<PendingEvent> Pop() {
    if (pending_.empty()) {
      return std::nullopt;
    }
    PendingEvent next = std::move(pending_.front());
    pending_.pop_front();
    return next;
  }

  bool Empty() const {
    return pending_.empty();
  }

  size_t Size() const {
    return pending_.size();
  }

 private:
  std::deque<PendingEvent> pending_;
  uint64_t last_sequence_ = 0;
};
