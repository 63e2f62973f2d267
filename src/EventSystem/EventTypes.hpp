/**
 * @file EventTypes.hpp
 * @brief Closed catalog of character and relationship events.
 * @details Each struct is the field contract for one event name. EventPayload is the tagged
 *          union the bus queues and delivers; adding an event means adding a struct here and
 *          listing it in EventPayload. Optional fields may be added freely, renaming an event or
 *          removing a field breaks subscribers at compile time.
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

#include "Character.hpp"
#include "Event.hpp"
#include "Relationship.hpp"

// ===== Character events =====

struct CharacterCreatedEvent : Event<CharacterCreatedEvent> {
  static constexpr std::string_view EventName = "character.created";
  static constexpr EventPriority DeclaredPriority = EventPriority::High;
  Character character;
};

struct CharacterUpdatedEvent : Event<CharacterUpdatedEvent> {
  static constexpr std::string_view EventName = "character.updated";
  static constexpr EventPriority DeclaredPriority = EventPriority::Normal;
  std::string character_id;
  Character character;                // snapshot after the update
  CharacterUpdate changes;            // fields the producer touched
  std::optional<Character> previous;  // snapshot before the update
};

struct CharacterDeletedEvent : Event<CharacterDeletedEvent> {
  static constexpr std::string_view EventName = "character.deleted";
  static constexpr EventPriority DeclaredPriority = EventPriority::High;
  std::string character_id;
  std::string character_name;
};

struct CharacterPromotedEvent : Event<CharacterPromotedEvent> {
  static constexpr std::string_view EventName = "character.promoted";
  static constexpr EventPriority DeclaredPriority = EventPriority::Normal;
  std::string character_id;
  CharacterType from_type = CharacterType::Mob;
  CharacterType to_type = CharacterType::Mob;
  std::string reason;
};

struct CharacterDemotedEvent : Event<CharacterDemotedEvent> {
  static constexpr std::string_view EventName = "character.demoted";
  static constexpr EventPriority DeclaredPriority = EventPriority::Normal;
  std::string character_id;
  CharacterType from_type = CharacterType::Mob;
  CharacterType to_type = CharacterType::Mob;
  std::string reason;
};

struct CharacterStateChangedEvent : Event<CharacterStateChangedEvent> {
  static constexpr std::string_view EventName = "character.state_changed";
  static constexpr EventPriority DeclaredPriority = EventPriority::Normal;
  std::string character_id;
  CharacterState state;
  std::optional<CharacterState> previous_state;
  std::string change_type;
};

struct CharacterAppearanceEvent : Event<CharacterAppearanceEvent> {
  static constexpr std::string_view EventName = "character.appearance";
  static constexpr EventPriority DeclaredPriority = EventPriority::Normal;
  std::string character_id;
  int chapter_number = 0;
  double significance = 0.0;
  std::string summary;
};

struct DevelopmentStageChangedEvent : Event<DevelopmentStageChangedEvent> {
  static constexpr std::string_view EventName = "development.stage_changed";
  static constexpr EventPriority DeclaredPriority = EventPriority::Normal;
  std::string character_id;
  int old_stage = 0;
  int new_stage = 0;
  std::string reason;
  std::optional<int> chapter_number;
};

struct ConsistencyViolationEvent : Event<ConsistencyViolationEvent> {
  static constexpr std::string_view EventName = "consistency.violation";
  static constexpr EventPriority DeclaredPriority = EventPriority::High;
  std::string character_id;
  std::string violation_type;
  std::string description;
  double severity = 0.0;  // 0..1
  std::string suggested_fix;
};

// ===== Relationship events =====

struct RelationshipCreatedEvent : Event<RelationshipCreatedEvent> {
  static constexpr std::string_view EventName = "relationship.created";
  static constexpr EventPriority DeclaredPriority = EventPriority::Normal;
  std::string source_id;
  std::string target_id;
  Relationship relationship;
};

struct RelationshipUpdatedEvent : Event<RelationshipUpdatedEvent> {
  static constexpr std::string_view EventName = "relationship.updated";
  static constexpr EventPriority DeclaredPriority = EventPriority::Normal;
  std::string source_id;
  std::string target_id;
  Relationship relationship;
  std::optional<Relationship> previous_relationship;
};

struct RelationshipDeletedEvent : Event<RelationshipDeletedEvent> {
  static constexpr std::string_view EventName = "relationship.deleted";
  static constexpr EventPriority DeclaredPriority = EventPriority::Normal;
  std::string source_id;
  std::string target_id;
  std::optional<RelationshipType> relation_type;
  std::string reason;
};

struct RelationshipStrengthenedEvent : Event<RelationshipStrengthenedEvent> {
  static constexpr std::string_view EventName = "relationship.strengthened";
  static constexpr EventPriority DeclaredPriority = EventPriority::Normal;
  std::string source_id;
  std::string target_id;
  RelationshipType relation_type = RelationshipType::Neutral;
  double previous_strength = 0.0;
  double new_strength = 0.0;
  std::string reason;
};

struct RelationshipWeakenedEvent : Event<RelationshipWeakenedEvent> {
  static constexpr std::string_view EventName = "relationship.weakened";
  static constexpr EventPriority DeclaredPriority = EventPriority::Normal;
  std::string source_id;
  std::string target_id;
  RelationshipType relation_type = RelationshipType::Neutral;
  double previous_strength = 0.0;
  double new_strength = 0.0;
  std::string reason;
};

// Published by the relationship cascade when a storage call fails inside a handler.
struct RelationshipErrorEvent : Event<RelationshipErrorEvent> {
  static constexpr std::string_view EventName = "error.relationship";
  static constexpr EventPriority DeclaredPriority = EventPriority::High;
  std::string operation;
  std::string source_id;
  std::string target_id;
  std::string message;
};

// ===== Tagged union =====

using EventPayload = std::variant<CharacterCreatedEvent,
                                  CharacterUpdatedEvent,
                                  CharacterDeletedEvent,
                                  CharacterPromotedEvent,
                                  CharacterDemotedEvent,
                                  CharacterStateChangedEvent,
                                  CharacterAppearanceEvent,
                                  DevelopmentStageChangedEvent,
                                  ConsistencyViolationEvent,
                                  RelationshipCreatedEvent,
                                  RelationshipUpdatedEvent,
                                  RelationshipDeletedEvent,
                                  RelationshipStrengthenedEvent,
                                  RelationshipWeakenedEvent,
                                  RelationshipErrorEvent>;

template <typename E, typename Variant>
struct IsVariantAlternative;

template <typename E, typename... Ts>
struct IsVariantAlternative<E, std::variant<Ts...>> : std::bool_constant<(std::is_same_v<E, Ts> || ...)> {};

template <typename E>
concept CatalogEvent = EventType<E> && IsVariantAlternative<E, EventPayload>::value;

inline std::string_view EventNameOf(const EventPayload& payload) {
  return std::visit([](const auto& event) { return std::decay_t<decltype(event)>::EventName; }, payload);
}

inline EventPriority PriorityOf(const EventPayload& payload) {
  return std::visit([](const auto& event) { return std::decay_t<decltype(event)>::DeclaredPriority; }, payload);
}

// Returns true if the timestamp was missing and has been set to now.
inline bool StampIfMissing(EventPayload& payload, Timestamp now = EventClock::now()) {
  return std::visit(
    [now](auto& event) {
      if (event.HasTimestamp()) {
        return false;
      }
      event.timestamp = now;
      return true;
    },
    payload);
}
