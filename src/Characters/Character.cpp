#include "Character.hpp"

std::string_view ToString(CharacterType type) {
  switch (type) {
    case CharacterType::Main:
      return "MAIN";
    case CharacterType::Sub:
      return "SUB";
    case CharacterType::Mob:
      return "MOB";
  }
  return "MOB";
}

std::optional<CharacterType> ParseCharacterType(std::string_view text) {
  if (text == "MAIN") return CharacterType::Main;
  if (text == "SUB") return CharacterType::Sub;
  if (text == "MOB") return CharacterType::Mob;
  return std::nullopt;
}

bool IsPromotion(CharacterType from, CharacterType to) {
  return (from == CharacterType::Mob && (to == CharacterType::Sub || to == CharacterType::Main)) ||
         (from == CharacterType::Sub && to == CharacterType::Main);
}

std::string_view ToString(EmotionalState state) {
  switch (state) {
    case EmotionalState::Neutral:
      return "NEUTRAL";
    case EmotionalState::Happy:
      return "HAPPY";
    case EmotionalState::Sad:
      return "SAD";
    case EmotionalState::Angry:
      return "ANGRY";
    case EmotionalState::Fearful:
      return "FEARFUL";
    case EmotionalState::Excited:
      return "EXCITED";
    case EmotionalState::Confused:
      return "CONFUSED";
    case EmotionalState::Determined:
      return "DETERMINED";
    case EmotionalState::Concerned:
      return "CONCERNED";
  }
  return "NEUTRAL";
}
