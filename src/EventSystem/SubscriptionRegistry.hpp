/**
 * @file SubscriptionRegistry.hpp
 * @brief Event type -> ordered list of live subscriptions.
 * @details The registry is the only mutable state shared between publishers, subscribers and
 *          the drain loop. All access goes through the internal mutex; the drain loop works on
 *          copies returned by Snapshot(), so changes made while an event is being delivered
 *          apply from the next event onward.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "EventTypes.hpp"

using EventHandler = std::function<void(const EventPayload&)>;

struct Subscription {
  uint64_t id = 0;
  std::string event_type;
  EventHandler handler;
  bool once = false;
};

class SubscriptionRegistry {
 public:
  SubscriptionRegistry() = default;

  // Returns the new subscription id. Ids are unique for the lifetime of the registry.
  uint64_t Add(std::string event_type, EventHandler handler, bool once);

  // Returns false if the subscription was already gone. Drops the bucket once it is empty.
  bool Remove(std::string_view event_type, uint64_t id);

  // Subscriptions of event_type in registration order.
  std::vector<Subscription> Snapshot(std::string_view event_type) const;

  size_t Count(std::string_view event_type) const;
  bool Contains(std::string_view event_type, uint64_t id) const;

  SubscriptionRegistry(const SubscriptionRegistry&) = delete;
  SubscriptionRegistry& operator=(const SubscriptionRegistry&) = delete;

 private:
  mutable std::mutex mutex_;
  uint64_t next_id_{1};
  std::unordered_map<std::string, std::vector<Subscription>> buckets_;
};
