/**
 * @file RelationshipChangeHandler.hpp
 * @brief Keeps both directions of every relationship and the relationship graph consistent.
 * @details Reacts to relationship.created/updated/deleted/strengthened/weakened:
 *          - created/updated: persist the record, then mirror it onto the target
 *            (MutualTypeOf; a missing reverse record is created at mutual_strength_factor of
 *            the forward strength, a reverse record of the wrong type is retyped)
 *          - updated: a strength increase publishes relationship.strengthened, a decrease
 *            relationship.weakened; equal strength publishes nothing
 *          - deleted: soft reset of both directions to NEUTRAL / 0, history kept
 *          - strengthened/weakened: bring the stored strength in line with the event
 *          Every committed mutation ends with a graph rebuild from the full stored set.
 *          A mutual event is only published once its record was written; with auto_save off
 *          no mirroring happens at all.
 *
 *          Storage failures are caught, logged and published as error.relationship; the
 *          cascade carries on. The graph is always rebuilt from what storage returns, so it never
 *          shows a write that failed.
 *
 *          The destructor skips invocations that have not started and waits for running ones.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>

#include "EventBus.hpp"
#include "EventTypes.hpp"
#include "HandlerRegistration.hpp"
#include "RelationshipGraph.hpp"
#include "Repository.hpp"

struct RelationshipChangeHandlerOptions {
  bool auto_save = true;
  bool update_mutual_relationships = true;
  double mutual_strength_factor = 0.8;
};

class RelationshipChangeHandler {
 public:
  RelationshipChangeHandler(std::shared_ptr<EventBus> bus, IRelationshipRepository& repository,
                            RelationshipChangeHandlerOptions options = {})
      : bus_(std::move(bus)), repository_(repository), projector_(repository), options_(options) {
  }

  ~RelationshipChangeHandler() {
    handlers_.Close();
  }

  void Initialize();
  void Dispose();

  void HandleRelationshipCreated(const RelationshipCreatedEvent& event);
  void HandleRelationshipUpdated(const RelationshipUpdatedEvent& event);
  void HandleRelationshipDeleted(const RelationshipDeletedEvent& event);
  void HandleRelationshipStrengthened(const RelationshipStrengthenedEvent& event);
  void HandleRelationshipWeakened(const RelationshipWeakenedEvent& event);

  const RelationshipChangeHandlerOptions& Options() const {
    return options_;
  }

  RelationshipChangeHandler(const RelationshipChangeHandler&) = delete;
  RelationshipChangeHandler& operator=(const RelationshipChangeHandler&) = delete;

 private:
  // Stored record with incoming type/strength applied; history grows only when they differ.
  Relationship MergeWithStored(const std::string& source_id, const std::string& target_id,
                               const Relationship& incoming, const std::string& reason);

  // Returns false if the save failed (already reported).
  bool Persist(const std::string& operation, const std::string& source_id, const std::string& target_id,
               const Relationship& relationship);

  void SyncMutualRelationship(const std::string& source_id, const std::string& target_id,
                              const Relationship& relationship);

  void ApplyStrength(const std::string& operation, const std::string& source_id, const std::string& target_id,
                     double new_strength, const std::string& reason);

  void ReportFailure(const std::string& operation, const std::string& source_id, const std::string& target_id,
                     const std::string& message);

  std::shared_ptr<EventBus> bus_;
  IRelationshipRepository& repository_;
  RelationshipGraphProjector projector_;
  RelationshipChangeHandlerOptions options_;
  HandlerSet handlers_;
};
