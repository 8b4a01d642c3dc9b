// hikari - CPU path tracer
// Copyright (c) 2025 hikari Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace hikari::log {

/**
 * @brief Initialize the logging system
 *
 * @param level Log level (trace, debug, info, warn, error, critical)
 */
void init(spdlog::level::level_enum level = spdlog::level::info);

/**
 * @brief Get the default logger, creating it on first use
 *
 * @return std::shared_ptr<spdlog::logger> The logger instance
 */
std::shared_ptr<spdlog::logger> get_logger();

/**
 * @brief Parse a textual level, unknown names map to info
 */
spdlog::level::level_enum parse_level(const std::string& value);

} // namespace hikari::log

// Convenience macros
#define HIKARI_LOG_TRACE(...) ::hikari::log::get_logger()->trace(__VA_ARGS__)
#define HIKARI_LOG_DEBUG(...) ::hikari::log::get_logger()->debug(__VA_ARGS__)
#define HIKARI_LOG_INFO(...)  ::hikari::log::get_logger()->info(__VA_ARGS__)
#define HIKARI_LOG_WARN(...)  ::hikari::log::get_logger()->warn(__VA_ARGS__)
#define HIKARI_LOG_ERROR(...) ::hikari::log::get_logger()->error(__VA_ARGS__)
#define HIKARI_LOG_CRITICAL(...) ::hikari::log::get_logger()->critical(__VA_ARGS__)
