#include "EventSystemConfig.hpp"

#include <chrono>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include "Log.hpp"

namespace {

template <typename T>
T Read(const YAML::Node& node, const char* section, const char* key, T fallback) {
  YAML::Node value = node[key];
  if (!value) {
    return fallback;
  }
  try {
    return value.as<T>();
  } catch (const YAML::Exception& e) {
    throw ConfigError(fmt::format("{}.{}: {}", section, key, e.what()));
  }
}

EventSystemConfig FromNode(const YAML::Node& root) {
  EventSystemConfig config;
  if (!root || root.IsNull()) {
    return config;
  }
  if (!root.IsMap()) {
    throw ConfigError("configuration root must be a mapping");
  }

  if (root["log_level"]) {
    const std::string text = Read<std::string>(root, "root", "log_level", "info");
    auto parsed = Log::ParseLevel(text);
    if (!parsed) {
      throw ConfigError("root.log_level: unknown level '" + text + "'");
    }
    config.log_level = *parsed;
  }
  config.log_file = Read<std::string>(root, "root", "log_file", config.log_file);

  if (auto bus = root["event_bus"]) {
    LoopDetectorOptions& loop = config.event_bus.loop_detection;
    loop.strict = Read<bool>(bus, "event_bus", "strict_loop_detection", loop.strict);

    const int threshold = Read<int>(bus, "event_bus", "loop_threshold", loop.threshold);
    if (threshold < 1) {
      throw ConfigError("event_bus.loop_threshold must be at least 1");
    }
    loop.threshold = threshold;

    const long window_ms = Read<long>(bus, "event_bus", "loop_window_ms", static_cast<long>(loop.window.count()));
    if (window_ms < 1) {
      throw ConfigError("event_bus.loop_window_ms must be at least 1");
    }
    loop.window = std::chrono::milliseconds(window_ms);

    const int workers = Read<int>(bus, "event_bus", "worker_threads", static_cast<int>(config.worker_threads));
    if (workers < 1) {
      throw ConfigError("event_bus.worker_threads must be at least 1");
    }
    config.worker_threads = static_cast<size_t>(workers);
  }

  if (auto relationships = root["relationships"]) {
    RelationshipChangeHandlerOptions& options = config.relationships;
    options.auto_save = Read<bool>(relationships, "relationships", "auto_save", options.auto_save);
    options.update_mutual_relationships =
      Read<bool>(relationships, "relationships", "update_mutual_relationships", options.update_mutual_relationships);
    options.mutual_strength_factor =
      Read<double>(relationships, "relationships", "mutual_strength_factor", options.mutual_strength_factor);
    if (options.mutual_strength_factor < 0.0 || options.mutual_strength_factor > 1.0) {
      throw ConfigError("relationships.mutual_strength_factor must be within [0, 1]");
    }
  }

  return config;
}

}  // namespace

EventSystemConfig ParseEventSystemConfig(const std::string& yaml_text) {
  try {
    return FromNode(YAML::Load(yaml_text));
  } catch (const YAML::Exception& e) {
    throw ConfigError(fmt::format("invalid configuration: {}", e.what()));
  }
}

EventSystemConfig LoadEventSystemConfig(const std::string& path) {
  try {
    return FromNode(YAML::LoadFile(path));
  } catch (const YAML::Exception& e) {
    throw ConfigError(fmt::format("cannot load configuration '{}': {}", path, e.what()));
  }
}
