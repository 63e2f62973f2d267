/**
 * @file Relationship.hpp
 * @brief Directed relationship between two characters and its mutual-type table.
 * @details A Relationship is held by its source character and points at target_id.
 *          strength is kept in [0, 1] by SetStrength; history only grows through RecordChange.
 */

#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "Event.hpp"

enum class RelationshipType : uint8_t {
  Friend,
  Enemy,
  Rival,
  Mentor,
  Student,
  Parent,
  Child,
  Leader,
  Follower,
  Protector,
  Protected,
  Lover,
  Colleague,
  Neutral,
};

std::string_view ToString(RelationshipType type);
std::optional<RelationshipType> ParseRelationshipType(std::string_view text);

/**
 * @brief Inverse type the target must hold towards the source.
 * @details PARENT/CHILD, MENTOR/STUDENT, LEADER/FOLLOWER and PROTECTOR/PROTECTED mirror each
 *          other; every other type maps to itself.
 */
RelationshipType MutualTypeOf(RelationshipType type);

inline double ClampStrength(double strength) {
  return std::clamp(strength, 0.0, 1.0);
}

struct RelationshipChange {
  Timestamp timestamp{};
  RelationshipType previous_type = RelationshipType::Neutral;
  double previous_strength = 0.0;
  RelationshipType new_type = RelationshipType::Neutral;
  double new_strength = 0.0;
  std::string reason;

  bool operator==(const RelationshipChange&) const = default;
};

class Relationship {
 public:
  Relationship() = default;
  Relationship(std::string target_id, RelationshipType type, double strength, std::string description = {})
      : target_id_(std::move(target_id)),
        type_(type),
        strength_(ClampStrength(strength)),
        description_(std::move(description)) {
  }

  const std::string& TargetId() const {
    return target_id_;
  }
  RelationshipType Type() const {
    return type_;
  }
  double Strength() const {
    return strength_;
  }
  const std::string& Description() const {
    return description_;
  }
  const std::vector<RelationshipChange>& History() const {
    return history_;
  }

  void SetTargetId(std::string target_id) {
    target_id_ = std::move(target_id);
  }
  void SetStrength(double strength) {
    strength_ = ClampStrength(strength);
  }
  void SetDescription(std::string description) {
    description_ = std::move(description);
  }

  // Appends "; note" to the description, or sets it when empty.
  void AppendDescription(std::string_view note);

  // Applies type/strength and appends one history entry describing the transition.
  void RecordChange(RelationshipType new_type, double new_strength, std::string reason);

  // Type and strength only; description and history do not count as a change.
  bool SameStateAs(const Relationship& other) const {
    return type_ == other.type_ && strength_ == other.strength_;
  }

  bool operator==(const Relationship& other) const = default;

 private:
  std::string target_id_;
  RelationshipType type_ = RelationshipType::Neutral;
  double strength_ = 0.0;
  std::string description_;
  std::vector<RelationshipChange> history_;
};

// Storage view of one directed edge.
struct RelationshipRecord {
  std::string source_id;
  Relationship relationship;
};
