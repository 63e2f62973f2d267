/**
 * @file EventSystemConfig.hpp
 * @brief YAML configuration for the bus, the worker pool, logging and the relationship cascade.
 * @details Every key is optional; a missing key keeps its default. A key of the wrong type or a
 *          value out of range throws ConfigError naming the key.
 *
 * @code{.yaml}
 * log_level: info
 * event_bus:
 *   strict_loop_detection: false
 *   loop_threshold: 10
 *   loop_window_ms: 1000
 *   worker_threads: 4
 * relationships:
 *   auto_save: true
 *   update_mutual_relationships: true
 *   mutual_strength_factor: 0.8
 * @endcode
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

#include <spdlog/common.h>

#include "EventBus.hpp"
#include "RelationshipChangeHandler.hpp"

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& message) : std::runtime_error(message) {
  }
};

struct EventSystemConfig {
  spdlog::level::level_enum log_level = spdlog::level::info;
  std::string log_file;
  size_t worker_threads = 4;
  EventBusConfig event_bus;
  RelationshipChangeHandlerOptions relationships;
};

EventSystemConfig ParseEventSystemConfig(const std::string& yaml_text);
EventSystemConfig LoadEventSystemConfig(const std::string& path);
