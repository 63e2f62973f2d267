/**
 * @file Log.hpp
 * @brief Process-wide spdlog setup for the "charbus" logger.
 * @details Init installs the logger as spdlog's default, so components simply call
 *          spdlog::info/warn/error. Without Init, spdlog's built-in default logger is used.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace Log {

// Console sink always; rotating file sink too when log_file is not empty.
void Init(spdlog::level::level_enum level = spdlog::level::info, const std::string& log_file = {});

std::shared_ptr<spdlog::logger> Get();

void SetLevel(spdlog::level::level_enum level);

// Accepts trace, debug, info, warn, warning, error, critical, off.
std::optional<spdlog::level::level_enum> ParseLevel(std::string_view text);

}  // namespace Log
