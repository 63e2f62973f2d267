#include "RelationshipService.hpp"

#include <spdlog/spdlog.h>

#include "Errors.hpp"

Relationship RelationshipService::UpdateRelationship(const std::string& source_id, const std::string& target_id,
                                                     RelationshipType type, double strength,
                                                     const std::string& description) {
  if (source_id.empty() || target_id.empty()) {
    throw CharacterError("Relationship requires both a source and a target id");
  }
  if (source_id == target_id) {
    throw CharacterError("A character cannot have a relationship with itself: " + source_id);
  }
  if (strength < 0.0 || strength > 1.0) {
    throw CharacterError("Relationship strength must be within [0, 1]");
  }

  RequireCharacter(source_id);
  RequireCharacter(target_id);

  Relationship relationship(target_id, type, strength, description);
  auto existing = relationships_.GetRelationship(source_id, target_id);

  if (existing) {
    if (description.empty()) {
      relationship.SetDescription(existing->Description());
    }
    bus_->Publish(RelationshipUpdatedEvent{
      .source_id = source_id,
      .target_id = target_id,
      .relationship = relationship,
      .previous_relationship = *existing,
    });
  } else {
    bus_->Publish(RelationshipCreatedEvent{
      .source_id = source_id,
      .target_id = target_id,
      .relationship = relationship,
    });
  }

  spdlog::debug("RelationshipService: {} -> {} set to {} ({:.2f})", source_id, target_id, ToString(type), strength);
  return relationship;
}

void RelationshipService::RemoveRelationship(const std::string& source_id, const std::string& target_id,
                                             const std::string& reason) {
  auto existing = relationships_.GetRelationship(source_id, target_id);
  if (!existing) {
    throw NotFoundError("Relationship", source_id + "-" + target_id);
  }

  bus_->Publish(RelationshipDeletedEvent{
    .source_id = source_id,
    .target_id = target_id,
    .relation_type = existing->Type(),
    .reason = reason,
  });
}

std::vector<Relationship> RelationshipService::GetCharacterRelationships(const std::string& character_id) {
  RequireCharacter(character_id);

  std::vector<Relationship> result;
  for (auto& record : relationships_.GetAllRelationships()) {
    if (record.source_id == character_id) {
      result.push_back(std::move(record.relationship));
    }
  }
  return result;
}

std::vector<Character> RelationshipService::GetConnectedCharacters(const std::string& character_id) {
  std::vector<Character> connected;
  for (const auto& relationship : GetCharacterRelationships(character_id)) {
    if (relationship.Type() == RelationshipType::Neutral && relationship.Strength() == 0.0) {
      continue;
    }
    if (auto character = characters_.GetCharacter(relationship.TargetId())) {
      connected.push_back(std::move(*character));
    }
  }
  return connected;
}

void RelationshipService::RequireCharacter(const std::string& id) {
  if (!characters_.GetCharacter(id)) {
    throw NotFoundError("Character", id);
  }
}
