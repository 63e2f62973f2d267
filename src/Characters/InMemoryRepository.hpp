/**
 * @file InMemoryRepository.hpp
 * @brief Mutex-guarded in-process storage for characters, relationships and the graph.
 * @details Backs the demo and the tests. SetFailRelationshipSaves() makes every
 *          SaveRelationship() throw, to exercise the cascade's failure path.
 */

#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "Repository.hpp"

class InMemoryRepository : public ICharacterRepository, public IRelationshipRepository {
 public:
  InMemoryRepository() = default;

  void SaveCharacter(const Character& character) override;
  std::optional<Character> GetCharacter(const std::string& id) override;
  std::vector<Character> GetAllCharacters() override;
  bool DeleteCharacter(const std::string& id) override;

  void SaveRelationship(const std::string& source_id, const std::string& target_id,
                        const Relationship& relationship) override;
  std::optional<Relationship> GetRelationship(const std::string& source_id, const std::string& target_id) override;
  std::vector<RelationshipRecord> GetAllRelationships() override;
  void SaveRelationshipGraph(const RelationshipGraph& graph) override;

  RelationshipGraph LastGraph() const;
  size_t GraphSaveCount() const;
  size_t RelationshipCount() const;

  void SetFailRelationshipSaves(bool fail) {
    fail_relationship_saves_.store(fail, std::memory_order_release);
  }

  InMemoryRepository(const InMemoryRepository&) = delete;
  InMemoryRepository& operator=(const InMemoryRepository&) = delete;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, Character> characters_;
  std::map<std::pair<std::string, std::string>, Relationship> relationships_;  // (source, target)
  RelationshipGraph graph_;
  size_t graph_saves_ = 0;
  std::atomic<bool> fail_relationship_saves_{false};
};
