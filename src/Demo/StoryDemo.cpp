/**
 * @file StoryDemo.cpp
 * @brief Walks a small cast through the character and relationship cascades.
 * @details Each step goes through a service, waits for the bus to drain, then logs what storage
 *          and the graph ended up holding.
 */

#include <memory>

#include <spdlog/spdlog.h>

#include "CharacterChangeHandler.hpp"
#include "CharacterService.hpp"
#include "EventBus.hpp"
#include "EventSystemConfig.hpp"
#include "InMemoryRepository.hpp"
#include "RelationshipChangeHandler.hpp"
#include "RelationshipService.hpp"
#include "ThreadPool.hpp"

namespace StoryDemo {

namespace {

void LogGraph(InMemoryRepository& repository) {
  const RelationshipGraph graph = repository.LastGraph();
  spdlog::info("Graph: {} nodes, {} edges", graph.nodes.size(), graph.edges.size());
  for (const auto& edge : graph.edges) {
    spdlog::info("  {} -> {} {} ({:.2f})", edge.source, edge.target, ToString(edge.type), edge.strength);
  }
}

void Settle(EventBus& bus) {
  bus.WhenIdle()->Wait();
}

}  // namespace

void Run(const EventSystemConfig& config) {
  ThreadPool pool(config.worker_threads);
  auto bus = std::make_shared<EventBus>(pool, config.event_bus);
  InMemoryRepository repository;

  CharacterChangeHandler character_handler(bus);
  RelationshipChangeHandler relationship_handler(bus, repository, config.relationships);
  character_handler.Initialize();
  relationship_handler.Initialize();

  auto errors = bus->Subscribe<RelationshipErrorEvent>([](const RelationshipErrorEvent& event) {
    spdlog::warn("Relationship error during {}: {}", event.operation, event.message);
  });

  CharacterService characters(bus, repository);
  RelationshipService relationships(bus, repository, repository);

  spdlog::info("Step 1: the cast arrives");
  characters.CreateCharacter(Character{.id = "aria", .name = "Aria", .type = CharacterType::Main, .first_appearance = 1});
  characters.CreateCharacter(Character{.id = "bram", .name = "Bram", .type = CharacterType::Sub});
  characters.CreateCharacter(Character{.id = "cole", .name = "Cole"});
  Settle(*bus);

  spdlog::info("Step 2: Bram takes Aria under his wing");
  relationships.UpdateRelationship("bram", "aria", RelationshipType::Mentor, 0.5, "Sword training");
  relationships.UpdateRelationship("aria", "cole", RelationshipType::Friend, 0.6);
  Settle(*bus);
  LogGraph(repository);

  spdlog::info("Step 3: the training pays off");
  relationships.UpdateRelationship("bram", "aria", RelationshipType::Mentor, 0.8);
  Settle(*bus);

  spdlog::info("Step 4: Cole earns a bigger role and grows");
  CharacterState grown;
  grown.development_stage = 1;
  grown.emotional_state = EmotionalState::Determined;
  grown.development = "Chooses to follow Aria";
  characters.UpdateCharacter("cole", CharacterUpdate{.type = CharacterType::Sub, .state = grown});
  Settle(*bus);

  spdlog::info("Step 5: Aria and Cole fall out");
  relationships.RemoveRelationship("aria", "cole", "Betrayal in chapter 3");
  Settle(*bus);
  LogGraph(repository);

  const EventBusStats stats = bus->Stats();
  spdlog::info("Bus stats: {} published, {} delivered, {} handler failures", stats.published, stats.delivered,
               stats.handler_failures);

  relationship_handler.Dispose();
  character_handler.Dispose();
  Settle(*bus);
}

}  // namespace StoryDemo
