#include <exception>
#include <string>

#include <spdlog/spdlog.h>

#include "EventSystemConfig.hpp"
#include "Log.hpp"

namespace StoryDemo {
void Run(const EventSystemConfig& config);
}

int main(int argc, char** argv) {
  EventSystemConfig config;
  try {
    if (argc > 1) {
      config = LoadEventSystemConfig(argv[1]);
    }
  } catch (const ConfigError& e) {
    Log::Init();
    spdlog::critical("{}", e.what());
    return 1;
  }

  Log::Init(config.log_level, config.log_file);

  try {
    StoryDemo::Run(config);
  } catch (const std::exception& e) {
    spdlog::critical("Story demo failed: {}", e.what());
    return 1;
  }

  spdlog::shutdown();
  return 0;
}
