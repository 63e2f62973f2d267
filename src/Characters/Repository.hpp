/**
 * @file Repository.hpp
 * @brief Storage collaborator interfaces used by services and cascading handlers.
 * @details Implementations may throw from any method; the relationship cascade catches and
 *          reports those failures, services let them reach the caller.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "Character.hpp"
#include "Relationship.hpp"
#include "RelationshipGraph.hpp"

class ICharacterRepository {
 public:
  virtual ~ICharacterRepository() = default;

  virtual void SaveCharacter(const Character& character) = 0;
  virtual std::optional<Character> GetCharacter(const std::string& id) = 0;
  virtual std::vector<Character> GetAllCharacters() = 0;
  virtual bool DeleteCharacter(const std::string& id) = 0;
};

class IRelationshipRepository {
 public:
  virtual ~IRelationshipRepository() = default;

  // Inserts or replaces the source -> target record.
  virtual void SaveRelationship(const std::string& source_id, const std::string& target_id,
                                const Relationship& relationship) = 0;
  virtual std::optional<Relationship> GetRelationship(const std::string& source_id, const std::string& target_id) = 0;
  virtual std::vector<RelationshipRecord> GetAllRelationships() = 0;
  virtual void SaveRelationshipGraph(const RelationshipGraph& graph) = 0;
};
