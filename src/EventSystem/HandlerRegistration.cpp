#include "HandlerRegistration.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace {

class GateEntry {
 public:
  explicit GateEntry(InvocationGate& gate) : gate_(gate) {
  }

  ~GateEntry() {
    gate_.Leave();
  }

  GateEntry(const GateEntry&) = delete;
  GateEntry& operator=(const GateEntry&) = delete;

 private:
  InvocationGate& gate_;
};

}  // namespace

bool InvocationGate::Enter() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    return false;
  }
  running_.push_back(std::this_thread::get_id());
  return true;
}

void InvocationGate::Leave() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find(running_.begin(), running_.end(), std::this_thread::get_id());
    if (it != running_.end()) {
      running_.erase(it);
    }
  }
  idle_.notify_all();
}

void InvocationGate::Close() {
  const auto self = std::this_thread::get_id();
  std::unique_lock<std::mutex> lock(mutex_);
  closed_ = true;
  idle_.wait(lock, [&]() {
    return std::all_of(running_.begin(), running_.end(), [self](std::thread::id id) { return id == self; });
  });
}

HandlerSet::HandlerSet(HandlerSet&& other) noexcept {
  std::lock_guard<std::mutex> lock(other.handles_mutex_);
  gate_ = std::move(other.gate_);
  handles_ = std::move(other.handles_);
  priorities_ = std::move(other.priorities_);
  disposed_ = other.disposed_;
}

HandlerSet& HandlerSet::operator=(HandlerSet&& other) noexcept {
  if (this != &other) {
    Close();
    std::scoped_lock lock(handles_mutex_, other.handles_mutex_);
    gate_ = std::move(other.gate_);
    handles_ = std::move(other.handles_);
    priorities_ = std::move(other.priorities_);
    disposed_ = other.disposed_;
  }
  return *this;
}

void HandlerSet::Dispose() {
  std::vector<EventHandle> handles;
  {
    std::lock_guard<std::mutex> lock(handles_mutex_);
    handles.swap(handles_);
    priorities_.clear();
    disposed_ = true;
  }

  for (auto& handle : handles) {
    handle.Unsubscribe();
  }
}

void HandlerSet::Close() {
  Dispose();
  if (gate_) {
    gate_->Close();
  }
}

HandlerSet RegisterHandlers(EventBus& bus, std::vector<HandlerRegistration> registrations) {
  HandlerSet handlers;
  std::shared_ptr<InvocationGate> gate = handlers.GetGate();

  for (auto& registration : registrations) {
    auto gated = [gate, handler = std::move(registration.handler)](const EventPayload& payload) {
      if (!gate->Enter()) {
        return;
      }
      GateEntry entry(*gate);
      handler(payload);
    };

    spdlog::debug("RegisterHandlers: '{}' at priority {}", registration.event_type, ToString(registration.priority));
    handlers.Add(bus.Subscribe(std::move(registration.event_type), std::move(gated)), registration.priority);
  }

  return handlers;
}
