#include "SubscriptionRegistry.hpp"

#include <algorithm>

uint64_t SubscriptionRegistry::Add(std::string event_type, EventHandler handler, bool once) {
  std::lock_guard<std::mutex> lock(mutex_);
  uint64_t id = next_id_++;
  auto& bucket = buckets_[event_type];
  bucket.push_back(Subscription{id, std::move(event_type), std::move(handler), once});
  return id;
}

bool SubscriptionRegistry::Remove(std::string_view event_type, uint64_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto bucket_it = buckets_.find(std::string(event_type));
  if (bucket_it == buckets_.end()) {
    return false;
  }

  auto& bucket = bucket_it->second;
  auto it = std::find_if(bucket.begin(), bucket.end(), [id](const Subscription& sub) { return sub.id == id; });
  if (it == bucket.end()) {
    return false;
  }

  bucket.erase(it);
  if (bucket.empty()) {
    buckets_.erase(bucket_it);  // remove the event type if no handler registered
  }
  return true;
}

std::vector<Subscription> SubscriptionRegistry::Snapshot(std::string_view event_type) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = buckets_.find(std::string(event_type));
  if (it == buckets_.end()) {
    return {};
  }
  return it->second;  // copy, prevents long lock holds during delivery
}

size_t SubscriptionRegistry::Count(std::string_view event_type) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = buckets_.find(std::string(event_type));
  return it == buckets_.end() ? 0 : it->second.size();
}

bool SubscriptionRegistry::Contains(std::string_view event_type, uint64_t id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = buckets_.find(std::string(event_type));
  if (it == buckets_.end()) {
    return false;
  }
  return std::any_of(it->second.begin(), it->second.end(), [id](const Subscription& sub) { return sub.id == id; });
}
