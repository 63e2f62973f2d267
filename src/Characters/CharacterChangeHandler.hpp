/**
 * @file CharacterChangeHandler.hpp
 * @brief Turns coarse character events into finer-grained ones.
 * @details The handler never touches storage. It diffs the snapshots carried by each event and
 *          republishes what changed:
 *          - character.updated: type change -> character.promoted / character.demoted,
 *            state change -> character.state_changed, relationship list change ->
 *            relationship.created / relationship.updated / relationship.deleted (diffed by target id)
 *          - character.created: character.appearance for a first appearance, relationship.created
 *            for every initial relationship
 *          - character.state_changed: development.stage_changed when the stage moved
 *          Promotion, demotion, deletion, appearance, stage and consistency events are logged.
 *
 *          Dispose() unsubscribes; the destructor additionally waits for invocations already
 *          running on the pool.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "EventBus.hpp"
#include "EventTypes.hpp"
#include "HandlerRegistration.hpp"

class CharacterChangeHandler {
 public:
  explicit CharacterChangeHandler(std::shared_ptr<EventBus> bus) : bus_(std::move(bus)) {
  }

  ~CharacterChangeHandler() {
    handlers_.Close();
  }

  void Initialize();
  void Dispose();

  bool IsInitialized() const {
    return handlers_.Size() > 0;
  }

  void HandleCharacterCreated(const CharacterCreatedEvent& event);
  void HandleCharacterUpdated(const CharacterUpdatedEvent& event);
  void HandleCharacterDeleted(const CharacterDeletedEvent& event);
  void HandleCharacterPromoted(const CharacterPromotedEvent& event);
  void HandleCharacterDemoted(const CharacterDemotedEvent& event);
  void HandleCharacterStateChanged(const CharacterStateChangedEvent& event);
  void HandleCharacterAppearance(const CharacterAppearanceEvent& event);
  void HandleDevelopmentStageChanged(const DevelopmentStageChangedEvent& event);
  void HandleConsistencyViolation(const ConsistencyViolationEvent& event);

  // Name of the first state field that differs, "state" if none does.
  static std::string DescribeStateChange(const CharacterState* previous, const CharacterState& current);

  CharacterChangeHandler(const CharacterChangeHandler&) = delete;
  CharacterChangeHandler& operator=(const CharacterChangeHandler&) = delete;

 private:
  void PublishTypeChange(const std::string& character_id, CharacterType from, CharacterType to);
  void PublishRelationshipDiff(const std::string& character_id, const std::vector<Relationship>& previous,
                               const std::vector<Relationship>& current);

  std::shared_ptr<EventBus> bus_;
  HandlerSet handlers_;
};
