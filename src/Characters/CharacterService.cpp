#include "CharacterService.hpp"

#include <spdlog/spdlog.h>

#include "Errors.hpp"

Character CharacterService::CreateCharacter(Character character) {
  if (character.id.empty()) {
    throw CharacterError("Character id must not be empty");
  }
  if (character.name.empty()) {
    throw CharacterError("Character name must not be empty");
  }
  if (repository_.GetCharacter(character.id)) {
    throw CharacterError("Character already exists: " + character.id);
  }

  repository_.SaveCharacter(character);
  spdlog::debug("CharacterService: created {} ({})", character.name, character.id);

  bus_->Publish(CharacterCreatedEvent{.character = character});
  return character;
}

Character CharacterService::UpdateCharacter(const std::string& id, const CharacterUpdate& update) {
  Character previous = GetCharacter(id);
  Character character = previous;

  if (update.name) {
    if (update.name->empty()) {
      throw CharacterError("Character name must not be empty");
    }
    character.name = *update.name;
  }
  if (update.type) {
    character.type = *update.type;
  }
  if (update.state) {
    character.state = *update.state;
  }
  if (update.relationships) {
    character.relationships = *update.relationships;
  }

  repository_.SaveCharacter(character);

  bus_->Publish(CharacterUpdatedEvent{
    .character_id = id,
    .character = character,
    .changes = update,
    .previous = std::move(previous),
  });
  return character;
}

void CharacterService::DeleteCharacter(const std::string& id) {
  Character character = GetCharacter(id);
  if (!repository_.DeleteCharacter(id)) {
    throw NotFoundError("Character", id);
  }

  bus_->Publish(CharacterDeletedEvent{
    .character_id = id,
    .character_name = character.name,
  });
}

Character CharacterService::GetCharacter(const std::string& id) {
  auto character = repository_.GetCharacter(id);
  if (!character) {
    throw NotFoundError("Character", id);
  }
  return *character;
}

std::vector<Character> CharacterService::ListCharacters() {
  return repository_.GetAllCharacters();
}
