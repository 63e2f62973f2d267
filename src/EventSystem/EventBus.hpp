/**
 * @file EventBus.hpp
 * @brief Buffered, type-safe publish/subscribe bus for character events.
 * @details Publish() never blocks: it stamps the event, runs loop detection, appends the event to
 *          the DispatchQueue and starts a drain if none is running. The drain delivers one event at
 *          a time in publish order. For each event it snapshots the current subscribers, fans
 *          every invocation out as a Task on the ThreadPool, and joins them in one continuation
 *          that removes one-shot subscriptions and moves on to the next event. Each continuation
 *          is a fresh pool job, so the drain yields to other work between events.
 *
 * Key Features:
 * - Compile-time checked payloads (EventPayload variant, no std::any)
 * - Strict FIFO delivery across the whole bus
 * - Per-invocation failure isolation: a throwing handler is logged, siblings still run
 * - One-shot subscriptions
 * - PublishAsync() returns a Task completed by the drain loop when the bus goes idle
 *
 * @warning Create the bus with std::make_shared; publishing relies on shared_from_this().
 *          Handlers must not Wait() on PublishAsync() completions from inside the pool: the
 *          completion needs the handler's own event to finish first.
 *
 * @code{.cpp}
 * ThreadPool pool(4);
 * auto bus = std::make_shared<EventBus>(pool);
 *
 * auto handle = bus->Subscribe<CharacterPromotedEvent>([](const CharacterPromotedEvent& event) {
 *   spdlog::info("{} promoted", event.character_id);
 * });
 *
 * bus->Publish(CharacterPromotedEvent{.character_id = "c1", .from_type = CharacterType::Mob,
 *                                     .to_type = CharacterType::Sub});
 * bus->PublishAsync(CharacterDeletedEvent{.character_id = "c2"})->Wait();
 *
 * handle.Unsubscribe();
 * @endcode
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "DispatchQueue.hpp"
#include "Event.hpp"
#include "EventTypes.hpp"
#include "LoopDetector.hpp"
#include "SubscriptionRegistry.hpp"
#include "Task.hpp"
#include "ThreadPool.hpp"

class EventBus;

class EventHandle {
 public:
  EventHandle() = default;
  EventHandle(std::weak_ptr<EventBus> bus, std::string event_type, uint64_t handler_id)
      : bus_(std::move(bus)), event_type_(std::move(event_type)), handler_id_(handler_id) {
  }

  // Safe to call more than once, and after the bus is gone.
  void Unsubscribe();

  bool IsActive() const;

  const std::string& EventTypeName() const {
    return event_type_;
  }

  uint64_t Id() const {
    return handler_id_;
  }

  EventHandle(EventHandle&&) = default;
  EventHandle& operator=(EventHandle&&) = default;

  EventHandle(const EventHandle&) = delete;
  EventHandle& operator=(const EventHandle&) = delete;

 private:
  std::weak_ptr<EventBus> bus_;
  std::string event_type_;
  uint64_t handler_id_ = 0;
};

struct EventBusConfig {
  LoopDetectorOptions loop_detection;
};

struct EventBusStats {
  uint64_t published = 0;
  uint64_t delivered = 0;
  uint64_t handler_failures = 0;
};

class EventBus : public std::enable_shared_from_this<EventBus> {
 public:
  explicit EventBus(ThreadPool& pool, EventBusConfig config = {});

  template <typename E>
    requires CatalogEvent<E>
  void Publish(E event) {
    Publish(EventPayload{std::move(event)});
  }

  /**
   * @brief Queues an event for delivery and returns immediately.
   * @throws EventLoopDetectedException in strict mode when the event type storms; the event is
   *         not queued in that case.
   */
  void Publish(EventPayload payload);

  template <typename E>
    requires CatalogEvent<E>
  TaskPtr PublishAsync(E event) {
    return PublishAsync(EventPayload{std::move(event)});
  }

  /**
   * @brief Like Publish(), but returns a task that completes once the queue has fully drained,
   *        i.e. this event and everything published after it, cascades included, was delivered.
   */
  TaskPtr PublishAsync(EventPayload payload);

  // Completes the next time the bus has nothing queued and nothing in flight.
  TaskPtr WhenIdle();

  template <typename E>
    requires CatalogEvent<E>
  EventHandle Subscribe(std::function<void(const E&)> handler) {
    return Subscribe(std::string(E::EventName), WrapTyped<E>(std::move(handler)), false);
  }

  // Fires once, then removes itself after the handler has run.
  template <typename E>
    requires CatalogEvent<E>
  EventHandle SubscribeOnce(std::function<void(const E&)> handler) {
    return Subscribe(std::string(E::EventName), WrapTyped<E>(std::move(handler)), true);
  }

  EventHandle Subscribe(std::string event_type, EventHandler handler, bool once = false);

  void Unsubscribe(const EventHandle& handle);

  size_t SubscriberCount(std::string_view event_type) const;
  bool IsSubscribed(const EventHandle& handle) const;
  bool IsIdle() const;
  EventBusStats Stats() const;

  const LoopDetector& GetLoopDetector() const {
    return loop_detector_;
  }

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

 private:
  template <typename E>
  static EventHandler WrapTyped(std::function<void(const E&)> handler) {
    return [handler = std::move(handler)](const EventPayload& payload) { handler(std::get<E>(payload)); };
  }

  void Enqueue(EventPayload payload, TaskPtr completion);
  void ScheduleDrain();
  void DrainNext();
  void Deliver(PendingEvent pending);
  void InvokeHandler(const PendingEvent& event, const Subscription& subscription);

  ThreadPool& pool_;
  SubscriptionRegistry registry_;
  LoopDetector loop_detector_;

  mutable std::mutex state_mutex_;
  DispatchQueue queue_;
  bool draining_ = false;
  std::vector<TaskPtr> idle_waiters_;

  std::atomic<uint64_t> published_{0};
  std::atomic<uint64_t> delivered_{0};
  std::atomic<uint64_t> handler_failures_{0};
};
