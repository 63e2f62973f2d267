/**
 * @file HandlerRegistration.hpp
 * @brief Batch subscription with a single disposer.
 * @details RegisterHandlers() subscribes every entry in order and returns a HandlerSet.
 *          Dispose() only unsubscribes, exactly like EventHandle::Unsubscribe(): an event whose
 *          subscriber snapshot was taken before the call is still delivered to the set.
 *          Close() (also run by the destructor) disposes the set, then shuts its invocation gate:
 *          invocations that have not started are skipped and the call blocks until the set's
 *          invocations running on other threads have returned. Handlers capturing [this] are
 *          therefore safe once their owner has closed the set.
 *
 * @note priority is recorded for introspection only. It never reorders delivery: the bus
 *       dispatches in global FIFO order of publish time, and within one event in registration
 *       order.
 *
 * @code{.cpp}
 * auto handlers = RegisterHandlers(*bus, {
 *   MakeRegistration<CharacterPromotedEvent>(OnPromoted, EventPriority::Normal),
 *   MakeRegistration<CharacterDeletedEvent>(OnDeleted, EventPriority::High),
 * });
 * handlers.Dispose();
 * @endcode
 */

#pragma once

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "EventBus.hpp"
#include "EventTypes.hpp"

struct HandlerRegistration {
  std::string event_type;
  EventHandler handler;
  EventPriority priority = EventPriority::Normal;
};

template <typename E>
  requires CatalogEvent<E>
HandlerRegistration MakeRegistration(std::function<void(const E&)> handler, EventPriority priority = E::DeclaredPriority) {
  return HandlerRegistration{
    std::string(E::EventName),
    [handler = std::move(handler)](const EventPayload& payload) { handler(std::get<E>(payload)); },
    priority};
}

// Counts the invocations of one HandlerSet running on pool threads.
class InvocationGate {
 public:
  // false once the gate is closed.
  bool Enter();
  void Leave();

  // Rejects new entries and waits for running ones. Entries made by the calling thread are not
  // waited for, so a handler may close its own set.
  void Close();

  bool IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable idle_;
  std::vector<std::thread::id> running_;
  bool closed_ = false;
};

class HandlerSet {
 public:
  HandlerSet() : gate_(std::make_shared<InvocationGate>()) {
  }

  ~HandlerSet() {
    Close();
  }

  void Add(EventHandle handle, EventPriority priority) {
    std::lock_guard<std::mutex> lock(handles_mutex_);
    handles_.push_back(std::move(handle));
    priorities_.push_back(priority);
  }

  // Unsubscribes every entry. Idempotent.
  void Dispose();

  // Dispose() plus a closed gate; returns once no invocation of the set is running elsewhere.
  void Close();

  bool IsDisposed() const {
    std::lock_guard<std::mutex> lock(handles_mutex_);
    return disposed_;
  }

  bool IsClosed() const {
    return !gate_ || gate_->IsClosed();
  }

  size_t Size() const {
    std::lock_guard<std::mutex> lock(handles_mutex_);
    return handles_.size();
  }

  std::vector<EventPriority> Priorities() const {
    std::lock_guard<std::mutex> lock(handles_mutex_);
    return priorities_;
  }

  std::shared_ptr<InvocationGate> GetGate() const {
    return gate_;
  }

  HandlerSet(HandlerSet&& other) noexcept;
  HandlerSet& operator=(HandlerSet&& other) noexcept;

  HandlerSet(const HandlerSet&) = delete;
  HandlerSet& operator=(const HandlerSet&) = delete;

 private:
  std::shared_ptr<InvocationGate> gate_;
  mutable std::mutex handles_mutex_;
  std::vector<EventHandle> handles_;
  std::vector<EventPriority> priorities_;
  bool disposed_ = false;
};

/**
 * @brief Subscribes every registration in order.
 * @return One HandlerSet whose Dispose() unsubscribes all of them.
 */
HandlerSet RegisterHandlers(EventBus& bus, std::vector<HandlerRegistration> registrations);
