#include "RelationshipGraph.hpp"

#include <exception>

#include <spdlog/spdlog.h>

#include "Repository.hpp"

RelationshipGraph RelationshipGraphProjector::Build(const std::vector<RelationshipRecord>& records) {
  RelationshipGraph graph;
  graph.edges.reserve(records.size());

  for (const auto& record : records) {
    const auto& relationship = record.relationship;
    graph.nodes.insert(record.source_id);
    graph.nodes.insert(relationship.TargetId());
    graph.edges.push_back(
      RelationshipEdge{record.source_id, relationship.TargetId(), relationship.Type(), relationship.Strength()});
  }

  return graph;
}

bool RelationshipGraphProjector::Rebuild() {
  try {
    RelationshipGraph graph = Build(repository_.GetAllRelationships());
    repository_.SaveRelationshipGraph(graph);
    spdlog::debug("RelationshipGraph: rebuilt with {} node(s), {} edge(s)", graph.nodes.size(), graph.edges.size());
    return true;
  } catch (const std::exception& e) {
    spdlog::error("RelationshipGraph: failed to update relationship graph: {}", e.what());
    return false;
  }
}
