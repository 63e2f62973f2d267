/**
 * @file CharacterService.hpp
 * @brief Write path for characters: validates, stores, then announces the change on the bus.
 * @details The service never runs cascades itself. CharacterChangeHandler picks up the
 *          character.* events it publishes and derives everything else.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "Character.hpp"
#include "EventBus.hpp"
#include "Repository.hpp"

class CharacterService {
 public:
  CharacterService(std::shared_ptr<EventBus> bus, ICharacterRepository& repository)
      : bus_(std::move(bus)), repository_(repository) {
  }

  /**
   * @brief Stores a new character and publishes character.created.
   * @throws CharacterError on an empty id or name, or an id that is already taken.
   */
  Character CreateCharacter(Character character);

  /**
   * @brief Applies the set fields of @p update and publishes character.updated with the
   *        snapshot taken before the change.
   * @throws NotFoundError if @p id is unknown.
   */
  Character UpdateCharacter(const std::string& id, const CharacterUpdate& update);

  // @throws NotFoundError if @p id is unknown.
  void DeleteCharacter(const std::string& id);

  // @throws NotFoundError if @p id is unknown.
  Character GetCharacter(const std::string& id);

  std::vector<Character> ListCharacters();

 private:
  std::shared_ptr<EventBus> bus_;
  ICharacterRepository& repository_;
};
