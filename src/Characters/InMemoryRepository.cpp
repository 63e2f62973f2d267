#include "InMemoryRepository.hpp"

#include <stdexcept>

void InMemoryRepository::SaveCharacter(const Character& character) {
  std::lock_guard<std::mutex> lock(mutex_);
  characters_[character.id] = character;
}

std::optional<Character> InMemoryRepository::GetCharacter(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = characters_.find(id);
  if (it == characters_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<Character> InMemoryRepository::GetAllCharacters() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Character> characters;
  characters.reserve(characters_.size());
  for (const auto& [id, character] : characters_) {
    characters.push_back(character);
  }
  return characters;
}

bool InMemoryRepository::DeleteCharacter(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return characters_.erase(id) > 0;
}

void InMemoryRepository::SaveRelationship(const std::string& source_id, const std::string& target_id,
                                          const Relationship& relationship) {
  if (fail_relationship_saves_.load(std::memory_order_acquire)) {
    throw std::runtime_error("relationship store unavailable");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  relationships_[{source_id, target_id}] = relationship;
}

std::optional<Relationship> InMemoryRepository::GetRelationship(const std::string& source_id,
                                                                const std::string& target_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = relationships_.find({source_id, target_id});
  if (it == relationships_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<RelationshipRecord> InMemoryRepository::GetAllRelationships() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<RelationshipRecord> records;
  records.reserve(relationships_.size());
  for (const auto& [key, relationship] : relationships_) {
    records.push_back(RelationshipRecord{key.first, relationship});
  }
  return records;
}

void InMemoryRepository::SaveRelationshipGraph(const RelationshipGraph& graph) {
  std::lock_guard<std::mutex> lock(mutex_);
  graph_ = graph;
  ++graph_saves_;
}

RelationshipGraph InMemoryRepository::LastGraph() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return graph_;
}

size_t InMemoryRepository::GraphSaveCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return graph_saves_;
}

size_t InMemoryRepository::RelationshipCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return relationships_.size();
}
