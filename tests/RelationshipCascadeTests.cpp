#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>

#include <catch2/catch.hpp>

#include "TestSupport.hpp"

namespace {

// Relationship reads take long enough for the test to act while a cascade is running.
class SlowRepository : public InMemoryRepository {
 public:
  std::optional<Relationship> GetRelationship(const std::string& source_id, const std::string& target_id) override {
    reading = true;
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    return InMemoryRepository::GetRelationship(source_id, target_id);
  }

  std::atomic<bool> reading{false};
};

}  // namespace

TEST_CASE("A new relationship creates its mutual counterpart", "[cascade][relationship]") {
  StoryFixture story;
  story.AddCast({"aria", "bram"});

  story.relationships.UpdateRelationship("aria", "bram", RelationshipType::Friend, 0.6);
  story.Settle();

  auto forward = story.repository.GetRelationship("aria", "bram");
  auto reverse = story.repository.GetRelationship("bram", "aria");
  REQUIRE(forward.has_value());
  REQUIRE(reverse.has_value());
  CHECK(forward->Type() == RelationshipType::Friend);
  CHECK(forward->Strength() == Approx(0.6));
  CHECK(reverse->Type() == RelationshipType::Friend);
  CHECK(reverse->Strength() == Approx(0.48));
  CHECK(reverse->TargetId() == "aria");

  const RelationshipGraph graph = story.repository.LastGraph();
  CHECK(graph.nodes.size() == 2);
  CHECK(graph.edges.size() == 2);
  REQUIRE(graph.FindEdge("bram", "aria") != nullptr);
  CHECK(graph.FindEdge("bram", "aria")->strength == Approx(0.48));
}

TEST_CASE("Strengthening a mentorship keeps the student side", "[cascade][relationship]") {
  StoryFixture story;
  story.AddCast({"bram", "aria"});
  Recorder<RelationshipStrengthenedEvent> strengthened;
  Recorder<RelationshipWeakenedEvent> weakened;
  auto s = strengthened.SubscribeTo(*story.bus);
  auto w = weakened.SubscribeTo(*story.bus);

  story.relationships.UpdateRelationship("bram", "aria", RelationshipType::Mentor, 0.5);
  story.Settle();
  story.relationships.UpdateRelationship("bram", "aria", RelationshipType::Mentor, 0.8);
  story.Settle();

  auto events = strengthened.Events();
  REQUIRE(events.size() == 1);
  CHECK(events[0].previous_strength == Approx(0.5));
  CHECK(events[0].new_strength == Approx(0.8));
  CHECK(events[0].relation_type == RelationshipType::Mentor);
  CHECK(weakened.Size() == 0);

  auto mentor = story.repository.GetRelationship("bram", "aria");
  auto student = story.repository.GetRelationship("aria", "bram");
  REQUIRE(mentor.has_value());
  REQUIRE(student.has_value());
  CHECK(mentor->Strength() == Approx(0.8));
  CHECK(mentor->History().size() == 2);
  CHECK(student->Type() == RelationshipType::Student);
  CHECK(student->Strength() == Approx(0.4));
}

TEST_CASE("Lowering strength publishes relationship.weakened", "[cascade][relationship]") {
  StoryFixture story;
  story.AddCast({"aria", "cole"});
  Recorder<RelationshipWeakenedEvent> weakened;
  auto w = weakened.SubscribeTo(*story.bus);

  story.relationships.UpdateRelationship("aria", "cole", RelationshipType::Friend, 0.6);
  story.Settle();
  story.relationships.UpdateRelationship("aria", "cole", RelationshipType::Friend, 0.05);
  story.Settle();

  auto events = weakened.Events();
  REQUIRE(events.size() == 1);
  CHECK(events[0].previous_strength == Approx(0.6));
  CHECK(events[0].new_strength == Approx(0.05));
  CHECK(story.repository.GetRelationship("aria", "cole")->Strength() == Approx(0.05));
}

TEST_CASE("An update at the same strength publishes no strength event", "[cascade][relationship]") {
  StoryFixture story;
  story.AddCast({"aria", "bram"});
  Recorder<RelationshipStrengthenedEvent> strengthened;
  Recorder<RelationshipWeakenedEvent> weakened;
  auto s = strengthened.SubscribeTo(*story.bus);
  auto w = weakened.SubscribeTo(*story.bus);

  story.relationships.UpdateRelationship("aria", "bram", RelationshipType::Friend, 0.6);
  story.Settle();
  story.relationships.UpdateRelationship("aria", "bram", RelationshipType::Rival, 0.6, "Competing for the crown");
  story.Settle();

  CHECK(strengthened.Size() == 0);
  CHECK(weakened.Size() == 0);
  CHECK(story.repository.GetRelationship("aria", "bram")->Type() == RelationshipType::Rival);
}

TEST_CASE("Changing the type retypes the reverse record", "[cascade][relationship]") {
  StoryFixture story;
  story.AddCast({"mara", "aria"});

  story.relationships.UpdateRelationship("mara", "aria", RelationshipType::Friend, 0.6);
  story.Settle();
  story.relationships.UpdateRelationship("mara", "aria", RelationshipType::Parent, 0.6);
  story.Settle();

  auto reverse = story.repository.GetRelationship("aria", "mara");
  REQUIRE(reverse.has_value());
  CHECK(reverse->Type() == RelationshipType::Child);
  CHECK(reverse->Strength() == Approx(0.48));
  CHECK(reverse->History().back().previous_type == RelationshipType::Friend);
  CHECK(story.bus->IsIdle());
}

TEST_CASE("Deleting a relationship resets both directions to neutral", "[cascade][relationship]") {
  StoryFixture story;
  story.AddCast({"aria", "cole"});

  story.relationships.UpdateRelationship("aria", "cole", RelationshipType::Friend, 0.6);
  story.Settle();
  story.relationships.RemoveRelationship("aria", "cole", "Betrayal");
  story.Settle();

  CHECK(story.repository.RelationshipCount() == 2);
  for (const auto& [source, target] : {std::pair{"aria", "cole"}, std::pair{"cole", "aria"}}) {
    auto record = story.repository.GetRelationship(source, target);
    REQUIRE(record.has_value());
    CHECK(record->Type() == RelationshipType::Neutral);
    CHECK(record->Strength() == 0.0);
    CHECK(record->History().back().reason == "Betrayal");
  }

  const RelationshipGraph graph = story.repository.LastGraph();
  CHECK(graph.edges.size() == 2);
  CHECK(graph.FindEdge("aria", "cole")->type == RelationshipType::Neutral);
}

TEST_CASE("A deleted pair can be created again", "[cascade][relationship]") {
  StoryFixture story;
  story.AddCast({"aria", "cole"});

  story.relationships.UpdateRelationship("aria", "cole", RelationshipType::Friend, 0.6);
  story.Settle();
  story.relationships.RemoveRelationship("aria", "cole");
  story.Settle();
  story.relationships.UpdateRelationship("aria", "cole", RelationshipType::Friend, 0.3);
  story.Settle();

  auto record = story.repository.GetRelationship("aria", "cole");
  REQUIRE(record.has_value());
  CHECK(record->Type() == RelationshipType::Friend);
  CHECK(record->Strength() == Approx(0.3));
  CHECK(record->History().size() == 3);
}

TEST_CASE("Deleting an unknown relationship changes nothing", "[cascade][relationship]") {
  StoryFixture story;

  story.bus->Publish(RelationshipDeletedEvent{.source_id = "ghost", .target_id = "aria"});
  story.Settle();

  CHECK(story.repository.RelationshipCount() == 0);
}

TEST_CASE("Storage failures are reported and the cascade terminates", "[cascade][relationship]") {
  StoryFixture story;
  story.AddCast({"aria", "bram"});
  Recorder<RelationshipErrorEvent> errors;
  auto e = errors.SubscribeTo(*story.bus);

  story.repository.SetFailRelationshipSaves(true);
  story.relationships.UpdateRelationship("aria", "bram", RelationshipType::Friend, 0.6);
  story.Settle();

  auto events = errors.Events();
  REQUIRE_FALSE(events.empty());
  CHECK(events[0].operation == "save");
  CHECK(events[0].source_id == "aria");
  CHECK(events[0].message.find("relationship store unavailable") != std::string::npos);

  CHECK(story.repository.RelationshipCount() == 0);
  CHECK(story.repository.GraphSaveCount() > 0);
  CHECK(story.repository.LastGraph().edges.empty());
  CHECK(story.bus->IsIdle());
}

TEST_CASE("A strength event for an unknown pair is reported", "[cascade][relationship]") {
  StoryFixture story;
  Recorder<RelationshipErrorEvent> errors;
  auto e = errors.SubscribeTo(*story.bus);

  story.bus->Publish(RelationshipStrengthenedEvent{
    .source_id = "ghost",
    .target_id = "aria",
    .relation_type = RelationshipType::Friend,
    .previous_strength = 0.2,
    .new_strength = 0.4,
  });
  story.Settle();

  auto events = errors.Events();
  REQUIRE(events.size() == 1);
  CHECK(events[0].operation == "strengthen");
  CHECK(story.repository.RelationshipCount() == 0);
}

TEST_CASE("Mutual updates can be switched off", "[cascade][relationship]") {
  StoryFixture story(RelationshipChangeHandlerOptions{.update_mutual_relationships = false});
  story.AddCast({"aria", "bram"});

  story.relationships.UpdateRelationship("aria", "bram", RelationshipType::Protector, 0.7);
  story.Settle();

  CHECK(story.repository.GetRelationship("aria", "bram").has_value());
  CHECK_FALSE(story.repository.GetRelationship("bram", "aria").has_value());
  CHECK(story.repository.LastGraph().edges.size() == 1);
}

TEST_CASE("The mutual strength factor is configurable", "[cascade][relationship]") {
  StoryFixture story(RelationshipChangeHandlerOptions{.mutual_strength_factor = 0.5});
  story.AddCast({"aria", "bram"});
  REQUIRE(story.relationship_handler.Options().mutual_strength_factor == Approx(0.5));

  story.relationships.UpdateRelationship("aria", "bram", RelationshipType::Leader, 0.8);
  story.Settle();

  auto reverse = story.repository.GetRelationship("bram", "aria");
  REQUIRE(reverse.has_value());
  CHECK(reverse->Type() == RelationshipType::Follower);
  CHECK(reverse->Strength() == Approx(0.4));
}

TEST_CASE("A character update cascades into stored relationships", "[cascade][relationship][character]") {
  StoryFixture story;
  story.AddCast({"bram"});

  story.characters.CreateCharacter(Character{.id = "aria", .name = "Aria"});
  story.characters.UpdateCharacter(
    "aria", CharacterUpdate{.relationships = std::vector<Relationship>{Relationship("bram", RelationshipType::Lover, 0.9)}});
  story.Settle();

  auto reverse = story.repository.GetRelationship("bram", "aria");
  REQUIRE(reverse.has_value());
  CHECK(reverse->Type() == RelationshipType::Lover);
  CHECK(reverse->Strength() == Approx(0.72));
}

TEST_CASE("Destroying the relationship handler waits for its running cascade", "[cascade][relationship]") {
  BusFixture fixture;
  SlowRepository repository;
  auto handler = std::make_unique<RelationshipChangeHandler>(
    fixture.bus, repository, RelationshipChangeHandlerOptions{.update_mutual_relationships = false});
  handler->Initialize();

  fixture.bus->Publish(RelationshipCreatedEvent{
    .source_id = "aria",
    .target_id = "bram",
    .relationship = Relationship("bram", RelationshipType::Friend, 0.5),
  });

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (!repository.reading && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  REQUIRE(repository.reading);

  handler.reset();
  CHECK(repository.RelationshipCount() == 1);
  fixture.Settle();
}
