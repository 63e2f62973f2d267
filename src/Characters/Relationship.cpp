/**
 * @file Relationship.cpp
 * @brief Relationship type names, mutual-type table and history recording.
 */

#include "Relationship.hpp"

#include <array>
#include <utility>

namespace {

constexpr std::array<std::pair<RelationshipType, std::string_view>, 14> kTypeNames{{
  {RelationshipType::Friend, "FRIEND"},
  {RelationshipType::Enemy, "ENEMY"},
  {RelationshipType::Rival, "RIVAL"},
  {RelationshipType::Mentor, "MENTOR"},
  {RelationshipType::Student, "STUDENT"},
  {RelationshipType::Parent, "PARENT"},
  {RelationshipType::Child, "CHILD"},
  {RelationshipType::Leader, "LEADER"},
  {RelationshipType::Follower, "FOLLOWER"},
  {RelationshipType::Protector, "PROTECTOR"},
  {RelationshipType::Protected, "PROTECTED"},
  {RelationshipType::Lover, "LOVER"},
  {RelationshipType::Colleague, "COLLEAGUE"},
  {RelationshipType::Neutral, "NEUTRAL"},
}};

}  // namespace

std::string_view ToString(RelationshipType type) {
  for (const auto& [value, name] : kTypeNames) {
    if (value == type) {
      return name;
    }
  }
  return "NEUTRAL";
}

std::optional<RelationshipType> ParseRelationshipType(std::string_view text) {
  for (const auto& [value, name] : kTypeNames) {
    if (name == text) {
      return value;
    }
  }
  return std::nullopt;
}

RelationshipType MutualTypeOf(RelationshipType type) {
  switch (type) {
    case RelationshipType::Parent:
      return RelationshipType::Child;
    case RelationshipType::Child:
      return RelationshipType::Parent;
    case RelationshipType::Mentor:
      return RelationshipType::Student;
    case RelationshipType::Student:
      return RelationshipType::Mentor;
    case RelationshipType::Leader:
      return RelationshipType::Follower;
    case RelationshipType::Follower:
      return RelationshipType::Leader;
    case RelationshipType::Protector:
      return RelationshipType::Protected;
    case RelationshipType::Protected:
      return RelationshipType::Protector;
    case RelationshipType::Friend:
    case RelationshipType::Enemy:
    case RelationshipType::Rival:
    case RelationshipType::Lover:
    case RelationshipType::Colleague:
    case RelationshipType::Neutral:
      return type;
  }
  return RelationshipType::Neutral;
}

void Relationship::AppendDescription(std::string_view note) {
  if (note.empty()) {
    return;
  }
  if (description_.empty()) {
    description_ = std::string(note);
  } else {
    description_ += "; ";
    description_ += note;
  }
}

void Relationship::RecordChange(RelationshipType new_type, double new_strength, std::string reason) {
  RelationshipChange change;
  change.timestamp = EventClock::now();
  change.previous_type = type_;
  change.previous_strength = strength_;
  change.new_type = new_type;
  change.new_strength = ClampStrength(new_strength);
  change.reason = std::move(reason);

  type_ = new_type;
  strength_ = change.new_strength;
  history_.push_back(std::move(change));
}
