/**
 * @file RelationshipChangeHandler.cpp
 * @brief Implementation of RelationshipChangeHandler.
 */

#include "RelationshipChangeHandler.hpp"

#include <exception>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "Errors.hpp"

namespace {

constexpr double kDissolvedThreshold = 0.1;

}  // namespace

void RelationshipChangeHandler::Initialize() {
  if (handlers_.Size() > 0) {
    return;
  }

  handlers_ = RegisterHandlers(
    *bus_,
    {
      MakeRegistration<RelationshipCreatedEvent>([this](const auto& e) { HandleRelationshipCreated(e); }),
      MakeRegistration<RelationshipUpdatedEvent>([this](const auto& e) { HandleRelationshipUpdated(e); }),
      MakeRegistration<RelationshipDeletedEvent>([this](const auto& e) { HandleRelationshipDeleted(e); }),
      MakeRegistration<RelationshipStrengthenedEvent>([this](const auto& e) { HandleRelationshipStrengthened(e); }),
      MakeRegistration<RelationshipWeakenedEvent>([this](const auto& e) { HandleRelationshipWeakened(e); }),
    });

  spdlog::debug("RelationshipChangeHandler: relationship change event handlers registered");
}

void RelationshipChangeHandler::Dispose() {
  handlers_.Dispose();
}

void RelationshipChangeHandler::HandleRelationshipCreated(const RelationshipCreatedEvent& event) {
  spdlog::info("Relationship created: {} -> {} ({})", event.source_id, event.target_id,
               ToString(event.relationship.Type()));

  Relationship relationship = event.relationship;
  if (options_.auto_save) {
    try {
      relationship = MergeWithStored(event.source_id, event.target_id, event.relationship, "Relationship created");
    } catch (const std::exception& e) {
      ReportFailure("load", event.source_id, event.target_id, e.what());
    }
    Persist("save", event.source_id, event.target_id, relationship);
  }

  if (options_.update_mutual_relationships) {
    SyncMutualRelationship(event.source_id, event.target_id, relationship);
  }

  projector_.Rebuild();
}

void RelationshipChangeHandler::HandleRelationshipUpdated(const RelationshipUpdatedEvent& event) {
  spdlog::info("Relationship updated: {} -> {} ({})", event.source_id, event.target_id,
               ToString(event.relationship.Type()));

  std::optional<double> previous_strength;
  if (event.previous_relationship) {
    previous_strength = event.previous_relationship->Strength();
  }

  Relationship relationship = event.relationship;
  if (options_.auto_save) {
    try {
      if (!previous_strength) {
        if (auto stored = repository_.GetRelationship(event.source_id, event.target_id)) {
          previous_strength = stored->Strength();
        }
      }
      relationship = MergeWithStored(event.source_id, event.target_id, event.relationship, "Relationship updated");
    } catch (const std::exception& e) {
      ReportFailure("load", event.source_id, event.target_id, e.what());
    }
    Persist("update", event.source_id, event.target_id, relationship);
  }

  if (event.previous_relationship && event.previous_relationship->Type() != relationship.Type()) {
    spdlog::info("Relationship type changed: {} -> {}", ToString(event.previous_relationship->Type()),
                 ToString(relationship.Type()));
  }

  if (options_.update_mutual_relationships) {
    SyncMutualRelationship(event.source_id, event.target_id, relationship);
  }

  if (previous_strength && *previous_strength != relationship.Strength()) {
    if (relationship.Strength() > *previous_strength) {
      bus_->Publish(RelationshipStrengthenedEvent{
        .source_id = event.source_id,
        .target_id = event.target_id,
        .relation_type = relationship.Type(),
        .previous_strength = *previous_strength,
        .new_strength = relationship.Strength(),
        .reason = "Updated from relationship update",
      });
    } else {
      bus_->Publish(RelationshipWeakenedEvent{
        .source_id = event.source_id,
        .target_id = event.target_id,
        .relation_type = relationship.Type(),
        .previous_strength = *previous_strength,
        .new_strength = relationship.Strength(),
        .reason = "Updated from relationship update",
      });
    }
  }

  projector_.Rebuild();
}

void RelationshipChangeHandler::HandleRelationshipDeleted(const RelationshipDeletedEvent& event) {
  spdlog::info("Relationship deleted: {} -> {} ({})", event.source_id, event.target_id,
               event.relation_type ? ToString(*event.relation_type) : "unknown");

  std::optional<Relationship> stored;
  try {
    stored = repository_.GetRelationship(event.source_id, event.target_id);
  } catch (const std::exception& e) {
    ReportFailure("delete", event.source_id, event.target_id, e.what());
    return;
  }

  if (!stored) {
    spdlog::warn("Relationship not found for deletion: {} -> {}", event.source_id, event.target_id);
    return;
  }

  const std::string reason = event.reason.empty() ? "Relationship deleted" : event.reason;

  // Soft reset: the record stays, history keeps the transition.
  Relationship neutral = *stored;
  neutral.SetDescription("Relationship reset to neutral");
  neutral.RecordChange(RelationshipType::Neutral, 0.0, reason);

  if (options_.auto_save) {
    Persist("delete", event.source_id, event.target_id, neutral);
  }

  if (options_.update_mutual_relationships && options_.auto_save) {
    try {
      auto reverse = repository_.GetRelationship(event.target_id, event.source_id);
      Relationship mutual = reverse ? *reverse : Relationship(event.source_id, RelationshipType::Neutral, 0.0);
      mutual.SetDescription("Relationship reset to neutral (mutual update)");
      mutual.RecordChange(RelationshipType::Neutral, 0.0, reason);
      Persist("delete", event.target_id, event.source_id, mutual);
    } catch (const std::exception& e) {
      ReportFailure("delete", event.target_id, event.source_id, e.what());
    }
  }

  projector_.Rebuild();
}

void RelationshipChangeHandler::HandleRelationshipStrengthened(const RelationshipStrengthenedEvent& event) {
  spdlog::info("Relationship strengthened: {} -> {} ({}, {:.2f} -> {:.2f})", event.source_id, event.target_id,
               ToString(event.relation_type), event.previous_strength, event.new_strength);

  ApplyStrength("strengthen", event.source_id, event.target_id, event.new_strength, event.reason);
}

void RelationshipChangeHandler::HandleRelationshipWeakened(const RelationshipWeakenedEvent& event) {
  spdlog::info("Relationship weakened: {} -> {} ({}, {:.2f} -> {:.2f})", event.source_id, event.target_id,
               ToString(event.relation_type), event.previous_strength, event.new_strength);

  ApplyStrength("weaken", event.source_id, event.target_id, event.new_strength, event.reason);

  if (event.new_strength < kDissolvedThreshold) {
    spdlog::info("Relationship almost dissolved: {} -> {}", event.source_id, event.target_id);
  }
}

Relationship RelationshipChangeHandler::MergeWithStored(const std::string& source_id, const std::string& target_id,
                                                        const Relationship& incoming, const std::string& reason) {
  auto stored = repository_.GetRelationship(source_id, target_id);
  Relationship merged = stored ? *stored : Relationship(target_id, RelationshipType::Neutral, 0.0);

  merged.SetTargetId(target_id);
  if (!incoming.Description().empty()) {
    merged.SetDescription(incoming.Description());
  }
  if (!stored || !stored->SameStateAs(incoming)) {
    merged.RecordChange(incoming.Type(), incoming.Strength(), reason);
  }
  return merged;
}

bool RelationshipChangeHandler::Persist(const std::string& operation, const std::string& source_id,
                                        const std::string& target_id, const Relationship& relationship) {
  try {
    repository_.SaveRelationship(source_id, target_id, relationship);
    spdlog::debug("Relationship saved: {} -> {} ({}, {:.2f})", source_id, target_id, ToString(relationship.Type()),
                  relationship.Strength());
    return true;
  } catch (const std::exception& e) {
    ReportFailure(operation, source_id, target_id, e.what());
    return false;
  }
}

void RelationshipChangeHandler::SyncMutualRelationship(const std::string& source_id, const std::string& target_id,
                                                       const Relationship& relationship) {
  // The reverse record is read back from storage, so mirroring needs storage to be written.
  if (!options_.auto_save) {
    return;
  }

  const RelationshipType mutual_type = MutualTypeOf(relationship.Type());

  std::optional<Relationship> reverse;
  try {
    reverse = repository_.GetRelationship(target_id, source_id);
  } catch (const std::exception& e) {
    spdlog::error("Failed to update mutual relationship {} -> {}: {}", target_id, source_id, e.what());
    return;
  }

  if (!reverse) {
    Relationship created(source_id, RelationshipType::Neutral, 0.0,
                         fmt::format("Auto-generated mutual relationship for {}", ToString(relationship.Type())));
    created.RecordChange(mutual_type, relationship.Strength() * options_.mutual_strength_factor,
                         "Mutual relationship created");

    if (!Persist("save", target_id, source_id, created)) {
      return;
    }
    spdlog::debug("Created mutual relationship: {} -> {} ({})", target_id, source_id, ToString(mutual_type));

    bus_->Publish(RelationshipCreatedEvent{
      .source_id = target_id,
      .target_id = source_id,
      .relationship = created,
    });
  } else if (reverse->Type() != mutual_type) {
    Relationship updated = *reverse;
    updated.AppendDescription(fmt::format("Auto-updated to {}", ToString(mutual_type)));
    updated.RecordChange(mutual_type, reverse->Strength(), "Mutual relationship type sync");

    if (!Persist("update", target_id, source_id, updated)) {
      return;
    }
    spdlog::debug("Updated mutual relationship type: {} -> {} ({})", target_id, source_id, ToString(mutual_type));

    bus_->Publish(RelationshipUpdatedEvent{
      .source_id = target_id,
      .target_id = source_id,
      .relationship = updated,
      .previous_relationship = *reverse,
    });
  }
}

void RelationshipChangeHandler::ApplyStrength(const std::string& operation, const std::string& source_id,
                                              const std::string& target_id, double new_strength,
                                              const std::string& reason) {
  std::optional<Relationship> stored;
  try {
    stored = repository_.GetRelationship(source_id, target_id);
  } catch (const std::exception& e) {
    ReportFailure(operation, source_id, target_id, e.what());
    return;
  }

  if (!stored) {
    ReportFailure(operation, source_id, target_id, NotFoundError("Relationship", source_id + "-" + target_id).what());
    return;
  }

  if (stored->Strength() == ClampStrength(new_strength)) {
    return;  // already applied by the update that produced this event
  }

  stored->RecordChange(stored->Type(), new_strength, reason.empty() ? "Strength changed" : reason);
  if (options_.auto_save && Persist(operation, source_id, target_id, *stored)) {
    projector_.Rebuild();
  }
}

void RelationshipChangeHandler::ReportFailure(const std::string& operation, const std::string& source_id,
                                              const std::string& target_id, const std::string& message) {
  PersistenceError error(operation, "Relationship", fmt::format("{} -> {}: {}", source_id, target_id, message));
  spdlog::error("RelationshipChangeHandler: {}", error.what());

  bus_->Publish(RelationshipErrorEvent{
    .operation = operation,
    .source_id = source_id,
    .target_id = target_id,
    .message = error.what(),
  });
}
