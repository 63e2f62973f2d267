/**
 * @file Character.hpp
 * @brief Character snapshot carried by character events and kept by the character repository.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "Relationship.hpp"

enum class CharacterType : uint8_t { Main, Sub, Mob };

std::string_view ToString(CharacterType type);
std::optional<CharacterType> ParseCharacterType(std::string_view text);

// MOB -> SUB, MOB -> MAIN and SUB -> MAIN are promotions; any other type change is a demotion.
bool IsPromotion(CharacterType from, CharacterType to);

enum class EmotionalState : uint8_t {
  Neutral,
  Happy,
  Sad,
  Angry,
  Fearful,
  Excited,
  Confused,
  Determined,
  Concerned,
};

std::string_view ToString(EmotionalState state);

// Development stages run from 0 (introduction) upwards; stage 4 is the transformation stage.
inline constexpr int kIntroductionStage = 0;
inline constexpr int kTransformationStage = 4;

struct CharacterState {
  bool is_active = true;
  int development_stage = kIntroductionStage;
  EmotionalState emotional_state = EmotionalState::Neutral;
  std::string development;
  std::string location;
  double health = 1.0;

  bool operator==(const CharacterState&) const = default;
};

struct Character {
  std::string id;
  std::string name;
  CharacterType type = CharacterType::Mob;
  CharacterState state;
  std::vector<Relationship> relationships;
  std::optional<int> first_appearance;
  double significance = 0.3;

  const Relationship* FindRelationship(std::string_view target_id) const {
    for (const auto& relationship : relationships) {
      if (relationship.TargetId() == target_id) {
        return &relationship;
      }
    }
    return nullptr;
  }
};

// Partial update applied by CharacterService::UpdateCharacter; unset fields are left alone.
struct CharacterUpdate {
  std::optional<std::string> name;
  std::optional<CharacterType> type;
  std::optional<CharacterState> state;
  std::optional<std::vector<Relationship>> relationships;
};
