// hikari - CPU path tracer
// Copyright (c) 2025 hikari Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "hikari/core/log.h"

#include <cctype>
#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace hikari::log
{

static std::shared_ptr<spdlog::logger> s_logger;
static std::mutex s_logger_mutex;

void init(spdlog::level::level_enum level)
{
    std::lock_guard<std::mutex> lock(s_logger_mutex);
    if (!s_logger)
    {
        s_logger = spdlog::get("hikari");
        if (!s_logger)
        {
            s_logger = spdlog::stdout_color_mt("hikari");
        }
        s_logger->set_pattern("[%T] [%^%l%$] %v");
    }
    s_logger->set_level(level);

    s_logger->debug("hikari logging system initialized");
}

std::shared_ptr<spdlog::logger> get_logger()
{
    {
        std::lock_guard<std::mutex> lock(s_logger_mutex);
        if (s_logger)
        {
            return s_logger;
        }
    }
    init();
    return s_logger;
}

spdlog::level::level_enum parse_level(const std::string& value)
{
    std::string lowered = value;
    for (char& c : lowered)
    {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (lowered == "trace") return spdlog::level::trace;
    if (lowered == "debug") return spdlog::level::debug;
    if (lowered == "warn" || lowered == "warning") return spdlog::level::warn;
    if (lowered == "error") return spdlog::level::err;
    if (lowered == "critical" || lowered == "fatal") return spdlog::level::critical;
    if (lowered == "off") return spdlog::level::off;
    return spdlog::level::info;
}

} // namespace hikari::log
