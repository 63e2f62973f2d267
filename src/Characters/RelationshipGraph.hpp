/**
 * @file RelationshipGraph.hpp
 * @brief Denormalized nodes/edges view of every stored relationship.
 * @details The graph is never edited by hand. RelationshipGraphProjector rebuilds it from the
 *          full relationship set after each committed relationship mutation.
 */

#pragma once

#include <set>
#include <string>
#include <vector>

#include "Relationship.hpp"

class IRelationshipRepository;

struct RelationshipEdge {
  std::string source;
  std::string target;
  RelationshipType type = RelationshipType::Neutral;
  double strength = 0.0;

  bool operator==(const RelationshipEdge&) const = default;
};

struct RelationshipGraph {
  std::set<std::string> nodes;
  std::vector<RelationshipEdge> edges;

  const RelationshipEdge* FindEdge(const std::string& source, const std::string& target) const {
    for (const auto& edge : edges) {
      if (edge.source == source && edge.target == target) {
        return &edge;
      }
    }
    return nullptr;
  }
};

class RelationshipGraphProjector {
 public:
  explicit RelationshipGraphProjector(IRelationshipRepository& repository) : repository_(repository) {
  }

  // Edges keep the order of records; nodes are every source and target id.
  static RelationshipGraph Build(const std::vector<RelationshipRecord>& records);

  /**
   * @brief Reads every relationship from storage, builds the graph and saves it back.
   * @return false if reading or saving failed; the failure is logged, never thrown.
   */
  bool Rebuild();

  RelationshipGraphProjector(const RelationshipGraphProjector&) = delete;
  RelationshipGraphProjector& operator=(const RelationshipGraphProjector&) = delete;

 private:
  IRelationshipRepository& repository_;
};
