/**
 * @file CharacterChangeHandler.cpp
 * @brief Implementation of CharacterChangeHandler.
 */

#include "CharacterChangeHandler.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

const Relationship* FindByTarget(const std::vector<Relationship>& relationships, const std::string& target_id) {
  for (const auto& relationship : relationships) {
    if (relationship.TargetId() == target_id) {
      return &relationship;
    }
  }
  return nullptr;
}

}  // namespace

void CharacterChangeHandler::Initialize() {
  if (IsInitialized()) {
    return;
  }

  handlers_ = RegisterHandlers(
    *bus_,
    {
      MakeRegistration<CharacterCreatedEvent>([this](const auto& e) { HandleCharacterCreated(e); }),
      MakeRegistration<CharacterUpdatedEvent>([this](const auto& e) { HandleCharacterUpdated(e); }),
      MakeRegistration<CharacterDeletedEvent>([this](const auto& e) { HandleCharacterDeleted(e); }),
      MakeRegistration<CharacterPromotedEvent>([this](const auto& e) { HandleCharacterPromoted(e); }),
      MakeRegistration<CharacterDemotedEvent>([this](const auto& e) { HandleCharacterDemoted(e); }),
      MakeRegistration<CharacterStateChangedEvent>([this](const auto& e) { HandleCharacterStateChanged(e); }),
      MakeRegistration<CharacterAppearanceEvent>([this](const auto& e) { HandleCharacterAppearance(e); }),
      MakeRegistration<DevelopmentStageChangedEvent>([this](const auto& e) { HandleDevelopmentStageChanged(e); }),
      MakeRegistration<ConsistencyViolationEvent>([this](const auto& e) { HandleConsistencyViolation(e); }),
    });

  spdlog::debug("CharacterChangeHandler: {} event handlers registered", handlers_.Size());
}

void CharacterChangeHandler::Dispose() {
  handlers_.Dispose();
}

void CharacterChangeHandler::HandleCharacterCreated(const CharacterCreatedEvent& event) {
  const Character& character = event.character;
  spdlog::info("Character created: {} ({})", character.name, character.id);

  if (character.first_appearance) {
    bus_->Publish(CharacterAppearanceEvent{
      .character_id = character.id,
      .chapter_number = *character.first_appearance,
      .significance = character.significance,
      .summary = fmt::format("Initial appearance of {}", character.name),
    });
  }

  for (const auto& relationship : character.relationships) {
    bus_->Publish(RelationshipCreatedEvent{
      .source_id = character.id,
      .target_id = relationship.TargetId(),
      .relationship = relationship,
    });
  }
}

void CharacterChangeHandler::HandleCharacterUpdated(const CharacterUpdatedEvent& event) {
  const std::string& character_id = event.character_id;
  const Character* previous = event.previous ? &*event.previous : nullptr;
  spdlog::info("Character updated: {}", character_id);

  // 1. type change: promotion or demotion
  if (event.changes.type && previous && previous->type != *event.changes.type) {
    PublishTypeChange(character_id, previous->type, *event.changes.type);
  }

  // 2. state change
  if (event.changes.state && (!previous || previous->state != *event.changes.state)) {
    const CharacterState* previous_state = previous ? &previous->state : nullptr;
    bus_->Publish(CharacterStateChangedEvent{
      .character_id = character_id,
      .state = *event.changes.state,
      .previous_state = previous ? std::optional<CharacterState>(previous->state) : std::nullopt,
      .change_type = DescribeStateChange(previous_state, *event.changes.state),
    });
  }

  // 3. relationship list change
  if (event.changes.relationships) {
    static const std::vector<Relationship> kNone;
    PublishRelationshipDiff(character_id, previous ? previous->relationships : kNone, *event.changes.relationships);
  }
}

void CharacterChangeHandler::PublishTypeChange(const std::string& character_id, CharacterType from, CharacterType to) {
  if (IsPromotion(from, to)) {
    bus_->Publish(CharacterPromotedEvent{
      .character_id = character_id,
      .from_type = from,
      .to_type = to,
      .reason = fmt::format("Character promoted from {} to {}", ToString(from), ToString(to)),
    });
  } else {
    bus_->Publish(CharacterDemotedEvent{
      .character_id = character_id,
      .from_type = from,
      .to_type = to,
      .reason = fmt::format("Character demoted from {} to {}", ToString(from), ToString(to)),
    });
  }
}

void CharacterChangeHandler::PublishRelationshipDiff(const std::string& character_id,
                                                     const std::vector<Relationship>& previous,
                                                     const std::vector<Relationship>& current) {
  for (const auto& relationship : current) {
    const Relationship* before = FindByTarget(previous, relationship.TargetId());

    if (!before) {
      bus_->Publish(RelationshipCreatedEvent{
        .source_id = character_id,
        .target_id = relationship.TargetId(),
        .relationship = relationship,
      });
    } else if (!before->SameStateAs(relationship)) {
      bus_->Publish(RelationshipUpdatedEvent{
        .source_id = character_id,
        .target_id = relationship.TargetId(),
        .relationship = relationship,
        .previous_relationship = *before,
      });
    }
  }

  for (const auto& before : previous) {
    if (!FindByTarget(current, before.TargetId())) {
      bus_->Publish(RelationshipDeletedEvent{
        .source_id = character_id,
        .target_id = before.TargetId(),
        .relation_type = before.Type(),
        .reason = "Removed from character relationship list",
      });
    }
  }
}

void CharacterChangeHandler::HandleCharacterDeleted(const CharacterDeletedEvent& event) {
  spdlog::info("Character deleted: {} ({})", event.character_name, event.character_id);
}

void CharacterChangeHandler::HandleCharacterPromoted(const CharacterPromotedEvent& event) {
  spdlog::info("Character promoted: {} ({} -> {}){}", event.character_id, ToString(event.from_type),
               ToString(event.to_type), event.reason.empty() ? "" : ": " + event.reason);
}

void CharacterChangeHandler::HandleCharacterDemoted(const CharacterDemotedEvent& event) {
  spdlog::info("Character demoted: {} ({} -> {}){}", event.character_id, ToString(event.from_type),
               ToString(event.to_type), event.reason.empty() ? "" : ": " + event.reason);
}

void CharacterChangeHandler::HandleCharacterStateChanged(const CharacterStateChangedEvent& event) {
  spdlog::info("Character state changed: {} ({})", event.character_id, event.change_type);
  if (!event.previous_state) {
    return;
  }

  const CharacterState& before = *event.previous_state;
  const CharacterState& after = event.state;

  if (before.development_stage != after.development_stage) {
    bus_->Publish(DevelopmentStageChangedEvent{
      .character_id = event.character_id,
      .old_stage = before.development_stage,
      .new_stage = after.development_stage,
      .reason = after.development.empty() ? "Character development progression" : after.development,
    });
  }

  if (before.emotional_state != after.emotional_state) {
    spdlog::info("Character emotional state changed: {} ({} -> {})", event.character_id,
                 ToString(before.emotional_state), ToString(after.emotional_state));
  }

  if (before.is_active != after.is_active) {
    spdlog::info("Character active state changed: {} ({} -> {})", event.character_id, before.is_active,
                 after.is_active);
  }

  if (before.health != after.health) {
    spdlog::info("Character health status changed: {} ({:.2f} -> {:.2f})", event.character_id, before.health,
                 after.health);
  }
}

void CharacterChangeHandler::HandleCharacterAppearance(const CharacterAppearanceEvent& event) {
  spdlog::info("Character appearance: {} in chapter {}{}", event.character_id, event.chapter_number,
               event.summary.empty() ? "" : " - " + event.summary);
  if (event.significance > 0.7) {
    spdlog::info("High significance appearance ({:.2f}) for character {}", event.significance, event.character_id);
  }
}

void CharacterChangeHandler::HandleDevelopmentStageChanged(const DevelopmentStageChangedEvent& event) {
  spdlog::info("Character development stage changed: {} ({} -> {}): {}", event.character_id, event.old_stage,
               event.new_stage, event.reason);

  if (event.new_stage > event.old_stage) {
    if (event.new_stage == kTransformationStage) {
      spdlog::info("Character {} has reached the transformation stage", event.character_id);
    }
  } else if (event.new_stage < event.old_stage) {
    spdlog::info("Character {} has regressed to a lower development stage", event.character_id);
  }
}

void CharacterChangeHandler::HandleConsistencyViolation(const ConsistencyViolationEvent& event) {
  if (event.severity > 0.8) {
    spdlog::error("Critical consistency violation for character {}: {} (severity {:.2f})", event.character_id,
                  event.description, event.severity);
  } else if (event.severity > 0.5) {
    spdlog::warn("Moderate consistency violation for character {}: {} (severity {:.2f})", event.character_id,
                 event.description, event.severity);
  } else {
    spdlog::info("Minor consistency violation for character {}: {} (severity {:.2f})", event.character_id,
                 event.description, event.severity);
  }
}

std::string CharacterChangeHandler::DescribeStateChange(const CharacterState* previous, const CharacterState& current) {
  if (!previous) {
    return "state";
  }
  if (previous->development_stage != current.development_stage) return "development_stage";
  if (previous->emotional_state != current.emotional_state) return "emotional_state";
  if (previous->is_active != current.is_active) return "is_active";
  if (previous->health != current.health) return "health";
  if (previous->location != current.location) return "location";
  if (previous->development != current.development) return "development";
  return "state";
}
