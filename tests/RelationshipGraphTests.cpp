#include <set>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include "Character.hpp"
#include "InMemoryRepository.hpp"
#include "Relationship.hpp"
#include "RelationshipGraph.hpp"

TEST_CASE("Build turns every record into one edge", "[graph]") {
  std::vector<RelationshipRecord> records{
    {"aria", Relationship("bram", RelationshipType::Friend, 0.6)},
    {"bram", Relationship("aria", RelationshipType::Friend, 0.48)},
    {"bram", Relationship("cole", RelationshipType::Enemy, 0.9)},
  };

  const RelationshipGraph graph = RelationshipGraphProjector::Build(records);

  CHECK(graph.nodes == std::set<std::string>{"aria", "bram", "cole"});
  REQUIRE(graph.edges.size() == 3);
  CHECK(graph.edges[2].source == "bram");
  CHECK(graph.edges[2].target == "cole");
  CHECK(graph.edges[2].type == RelationshipType::Enemy);
  CHECK(graph.FindEdge("cole", "bram") == nullptr);
}

TEST_CASE("Rebuild saves the projection of what storage holds", "[graph]") {
  InMemoryRepository repository;
  repository.SaveRelationship("aria", "bram", Relationship("bram", RelationshipType::Mentor, 0.5));

  RelationshipGraphProjector projector(repository);
  CHECK(projector.Rebuild());

  CHECK(repository.GraphSaveCount() == 1);
  const RelationshipGraph graph = repository.LastGraph();
  REQUIRE(graph.edges.size() == 1);
  CHECK(graph.edges[0].strength == Approx(0.5));
}

TEST_CASE("Mutual types mirror the asymmetric pairs", "[relationship]") {
  CHECK(MutualTypeOf(RelationshipType::Parent) == RelationshipType::Child);
  CHECK(MutualTypeOf(RelationshipType::Child) == RelationshipType::Parent);
  CHECK(MutualTypeOf(RelationshipType::Mentor) == RelationshipType::Student);
  CHECK(MutualTypeOf(RelationshipType::Student) == RelationshipType::Mentor);
  CHECK(MutualTypeOf(RelationshipType::Leader) == RelationshipType::Follower);
  CHECK(MutualTypeOf(RelationshipType::Protected) == RelationshipType::Protector);
  CHECK(MutualTypeOf(RelationshipType::Rival) == RelationshipType::Rival);
  CHECK(MutualTypeOf(RelationshipType::Neutral) == RelationshipType::Neutral);
}

TEST_CASE("Relationship types round-trip through their names", "[relationship]") {
  CHECK(ToString(RelationshipType::Protector) == "PROTECTOR");
  CHECK(ParseRelationshipType("STUDENT") == RelationshipType::Student);
  CHECK_FALSE(ParseRelationshipType("STRANGER").has_value());
}

TEST_CASE("RecordChange keeps an append-only history and clamps strength", "[relationship]") {
  Relationship relationship("bram", RelationshipType::Friend, 0.4);
  relationship.RecordChange(RelationshipType::Friend, 1.7, "Saved his life");
  relationship.RecordChange(RelationshipType::Rival, 0.3, "Competition");

  CHECK(relationship.Strength() == Approx(0.3));
  CHECK(relationship.Type() == RelationshipType::Rival);
  REQUIRE(relationship.History().size() == 2);
  CHECK(relationship.History()[0].previous_strength == Approx(0.4));
  CHECK(relationship.History()[0].new_strength == Approx(1.0));
  CHECK(relationship.History()[1].previous_type == RelationshipType::Friend);
  CHECK(relationship.History()[1].reason == "Competition");
}

TEST_CASE("Promotion follows MOB < SUB < MAIN", "[character]") {
  CHECK(IsPromotion(CharacterType::Mob, CharacterType::Sub));
  CHECK(IsPromotion(CharacterType::Mob, CharacterType::Main));
  CHECK(IsPromotion(CharacterType::Sub, CharacterType::Main));
  CHECK_FALSE(IsPromotion(CharacterType::Main, CharacterType::Sub));
  CHECK_FALSE(IsPromotion(CharacterType::Sub, CharacterType::Mob));
  CHECK(ParseCharacterType("SUB") == CharacterType::Sub);
}
