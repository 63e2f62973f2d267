/**
 * @file RelationshipService.hpp
 * @brief Direct API for relationships between two known characters.
 * @details Input errors are thrown to the caller. Storage writes, mutual records and the graph
 *          are left to RelationshipChangeHandler, which reacts to the events published here.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "Character.hpp"
#include "EventBus.hpp"
#include "Relationship.hpp"
#include "Repository.hpp"

class RelationshipService {
 public:
  RelationshipService(std::shared_ptr<EventBus> bus, ICharacterRepository& characters,
                      IRelationshipRepository& relationships)
      : bus_(std::move(bus)), characters_(characters), relationships_(relationships) {
  }

  /**
   * @brief Sets the source -> target relationship and publishes relationship.created, or
   *        relationship.updated when a record already exists.
   * @throws CharacterError for empty ids, source == target, or strength outside [0, 1].
   * @throws NotFoundError if either character is unknown.
   */
  Relationship UpdateRelationship(const std::string& source_id, const std::string& target_id, RelationshipType type,
                                  double strength, const std::string& description = {});

  // Publishes relationship.deleted. @throws NotFoundError if no record exists.
  void RemoveRelationship(const std::string& source_id, const std::string& target_id,
                          const std::string& reason = {});

  // Outgoing records of @p character_id, soft-deleted ones included.
  std::vector<Relationship> GetCharacterRelationships(const std::string& character_id);

  // Characters reachable through an outgoing relationship that is not NEUTRAL at strength 0.
  std::vector<Character> GetConnectedCharacters(const std::string& character_id);

 private:
  void RequireCharacter(const std::string& id);

  std::shared_ptr<EventBus> bus_;
  ICharacterRepository& characters_;
  IRelationshipRepository& relationships_;
};
