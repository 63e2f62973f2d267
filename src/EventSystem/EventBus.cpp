/**
 * @file EventBus.cpp
 * @brief Implementation of EventBus and EventHandle.
 */

#include "EventBus.hpp"

#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

#include "TaskExtensions.hpp"

void EventHandle::Unsubscribe() {
  if (auto bus = bus_.lock()) {
    bus->Unsubscribe(*this);
  }
}

bool EventHandle::IsActive() const {
  if (auto bus = bus_.lock()) {
    return bus->IsSubscribed(*this);
  }
  return false;
}

EventBus::EventBus(ThreadPool& pool, EventBusConfig config)
    : pool_(pool), loop_detector_(config.loop_detection) {
}

void EventBus::Publish(EventPayload payload) {
  Enqueue(std::move(payload), nullptr);
}

TaskPtr EventBus::PublishAsync(EventPayload payload) {
  auto completion = MakeTask([]() {});
  Enqueue(std::move(payload), completion);
  return completion;
}

TaskPtr EventBus::WhenIdle() {
  auto completion = MakeTask([]() {});
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (draining_ || !queue_.Empty()) {
      idle_waiters_.push_back(completion);
      return completion;
    }
  }
  completion->TrySchedule(pool_);
  return completion;
}

EventHandle EventBus::Subscribe(std::string event_type, EventHandler handler, bool once) {
  uint64_t handler_id = registry_.Add(event_type, std::move(handler), once);
  spdlog::debug("EventBus: subscription #{} added for '{}'{}", handler_id, event_type, once ? " (once)" : "");
  return EventHandle(weak_from_this(), std::move(event_type), handler_id);
}

void EventBus::Unsubscribe(const EventHandle& handle) {
  if (registry_.Remove(handle.EventTypeName(), handle.Id())) {
    spdlog::debug("EventBus: subscription #{} removed from '{}'", handle.Id(), handle.EventTypeName());
  }
}

size_t EventBus::SubscriberCount(std::string_view event_type) const {
  return registry_.Count(event_type);
}

bool EventBus::IsSubscribed(const EventHandle& handle) const {
  return registry_.Contains(handle.EventTypeName(), handle.Id());
}

bool EventBus::IsIdle() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return !draining_ && queue_.Empty();
}

EventBusStats EventBus::Stats() const {
  EventBusStats stats;
  stats.published = published_.load(std::memory_order_relaxed);
  stats.delivered = delivered_.load(std::memory_order_relaxed);
  stats.handler_failures = handler_failures_.load(std::memory_order_relaxed);
  return stats;
}

void EventBus::Enqueue(EventPayload payload, TaskPtr completion) {
  StampIfMissing(payload);
  std::string event_type(EventNameOf(payload));

  loop_detector_.Record(event_type);  // throws in strict mode, before anything is queued

  bool start_drain = false;
  uint64_t sequence = 0;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    sequence = queue_.Push(event_type, std::move(payload));
    if (completion) {
      idle_waiters_.push_back(std::move(completion));
    }
    if (!draining_) {
      draining_ = true;
      start_drain = true;
    }
  }

  published_.fetch_add(1, std::memory_order_relaxed);
  spdlog::trace("EventBus: queued '{}' (#{})", event_type, sequence);

  if (start_drain) {
    ScheduleDrain();
  }
}

void EventBus::ScheduleDrain() {
  auto self = shared_from_this();
  pool_.Enqueue([self]() { self->DrainNext(); });
}

void EventBus::DrainNext() {
  std::optional<PendingEvent> next;
  std::vector<TaskPtr> waiters;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    next = queue_.Pop();
    if (!next) {
      draining_ = false;
      waiters.swap(idle_waiters_);
    }
  }

  if (!next) {
    for (auto& waiter : waiters) {
      waiter->TrySchedule(pool_);
    }
    return;
  }

  Deliver(std::move(*next));
}

void EventBus::Deliver(PendingEvent pending) {
  auto event = std::make_shared<const PendingEvent>(std::move(pending));

  // Subscriptions added or removed from here on apply to the next event.
  std::vector<Subscription> subscribers = registry_.Snapshot(event->event_type);

  std::vector<uint64_t> once_ids;
  std::vector<TaskPtr> invocations;
  invocations.reserve(subscribers.size());

  auto self = shared_from_this();
  for (auto& subscription : subscribers) {
    if (subscription.once) {
      once_ids.push_back(subscription.id);
    }
    invocations.push_back(MakeTask([self, event, subscription = std::move(subscription)]() {
      self->InvokeHandler(*event, subscription);
    }));
  }

  spdlog::trace("EventBus: delivering '{}' (#{}, {}) to {} subscriber(s)", event->event_type, event->sequence,
                ToString(PriorityOf(event->payload)), invocations.size());

  auto join = MakeTask([self, event, once_ids = std::move(once_ids)]() {
    for (uint64_t id : once_ids) {
      self->registry_.Remove(event->event_type, id);
    }
    self->delivered_.fetch_add(1, std::memory_order_relaxed);
    self->DrainNext();
  });

  WhenAll(pool_, invocations, join);
}

void EventBus::InvokeHandler(const PendingEvent& event, const Subscription& subscription) {
  try {
    subscription.handler(event.payload);
  } catch (const std::exception& e) {
    handler_failures_.fetch_add(1, std::memory_order_relaxed);
    spdlog::error("EventBus: handler #{} failed for '{}': {}", subscription.id, event.event_type, e.what());
  } catch (...) {
    handler_failures_.fetch_add(1, std::memory_order_relaxed);
    spdlog::error("EventBus: handler #{} failed for '{}' with a non-standard exception", subscription.id,
                  event.event_type);
  }
}
