/**
 * @file Event.hpp
 * @brief Type-safe event base class using CRTP pattern.
 * @details Every event struct inherits from Event<Derived>, names itself through EventName and
 *          declares its priority through DeclaredPriority. The base carries the timestamp;
 *          a default-constructed timestamp means "not set" and is stamped by EventBus::Publish.
 *
 * @code{.cpp}
 * struct CharacterDeletedEvent : Event<CharacterDeletedEvent> {
 *   static constexpr std::string_view EventName = "character.deleted";
 *   static constexpr EventPriority DeclaredPriority = EventPriority::High;
 *   std::string character_id;
 *   std::string character_name;
 * };
 *
 * bus->Publish(CharacterDeletedEvent{.character_id = "c1", .character_name = "Aki"});
 * @endcode
 */
#pragma once

#include <chrono>
#include <concepts>
#include <cstdint>
#include <string_view>
#include <type_traits>

using EventClock = std::chrono::system_clock;
using Timestamp = EventClock::time_point;

// Informational only. Delivery order is always global FIFO by publish time.
enum class EventPriority : uint8_t { Lowest, Low, Normal, High, Highest, Critical };

constexpr std::string_view ToString(EventPriority priority) {
  switch (priority) {
    case EventPriority::Lowest:
      return "LOWEST";
    case EventPriority::Low:
      return "LOW";
    case EventPriority::Normal:
      return "NORMAL";
    case EventPriority::High:
      return "HIGH";
    case EventPriority::Highest:
      return "HIGHEST";
    case EventPriority::Critical:
      return "CRITICAL";
  }
  return "NORMAL";
}

template <typename Derived>
struct Event {
  Timestamp timestamp{};

  bool HasTimestamp() const {
    return timestamp != Timestamp{};
  }
};

template <typename T>
concept EventType = requires {
  { T::EventName } -> std::convertible_to<std::string_view>;
  { T::DeclaredPriority } -> std::convertible_to<EventPriority>;
} && std::is_base_of_v<Event<T>, T>;
