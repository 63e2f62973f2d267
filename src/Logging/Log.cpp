#include "Log.hpp"

#include <mutex>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {

std::mutex g_logger_mutex;
std::shared_ptr<spdlog::logger> g_logger;

}  // namespace

namespace Log {

void Init(spdlog::level::level_enum level, const std::string& log_file) {
  std::lock_guard<std::mutex> lock(g_logger_mutex);

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (!log_file.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_file, 1 << 20, 4));  // 1MB * 4
  }

  g_logger = std::make_shared<spdlog::logger>("charbus", sinks.begin(), sinks.end());
  g_logger->set_level(level);
  spdlog::set_default_logger(g_logger);
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e][%l][t%t] %v");
  spdlog::debug("Logging started");
}

std::shared_ptr<spdlog::logger> Get() {
  std::lock_guard<std::mutex> lock(g_logger_mutex);
  return g_logger ? g_logger : spdlog::default_logger();
}

void SetLevel(spdlog::level::level_enum level) {
  Get()->set_level(level);
}

std::optional<spdlog::level::level_enum> ParseLevel(std::string_view text) {
  if (text == "trace") return spdlog::level::trace;
  if (text == "debug") return spdlog::level::debug;
  if (text == "info") return spdlog::level::info;
  if (text == "warn" || text == "warning") return spdlog::level::warn;
  if (text == "error") return spdlog::level::err;
  if (text == "critical") return spdlog::level::critical;
  if (text == "off") return spdlog::level::off;
  return std::nullopt;
}

}  // namespace Log
