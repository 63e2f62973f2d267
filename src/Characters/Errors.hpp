/**
 * @file Errors.hpp
 * @brief Exceptions raised by character and relationship operations.
 * @details NotFoundError and CharacterError reach the caller of a direct API call.
 *          PersistenceError describes a storage failure inside a cascade; the relationship
 *          handler logs its message and reports it as an error.relationship event instead of
 *          throwing it.
 */

#pragma once

#include <stdexcept>
#include <string>

class CharacterError : public std::runtime_error {
 public:
  explicit CharacterError(const std::string& message) : std::runtime_error(message) {
  }
};

class NotFoundError : public CharacterError {
 public:
  NotFoundError(std::string entity, std::string id)
      : CharacterError(entity + " not found: " + id), entity_(std::move(entity)), id_(std::move(id)) {
  }

  const std::string& Entity() const {
    return entity_;
  }

  const std::string& Id() const {
    return id_;
  }

 private:
  std::string entity_;
  std::string id_;
};

class PersistenceError : public CharacterError {
 public:
  PersistenceError(const std::string& operation, const std::string& entity, const std::string& message)
      : CharacterError("Failed to " + operation + " " + entity + ": " + message) {
  }
};
