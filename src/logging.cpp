// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <spdlog/sinks/stdout_color_sinks.h>
#include <todomcp/logging.hpp>

namespace todomcp
{

std::shared_ptr<spdlog::logger> logger()
{
    if (auto existing = spdlog::get(kLoggerName))
        return existing;

    auto created = spdlog::stderr_color_mt(kLoggerName);
    created->set_level(spdlog::level::warn);
    created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
    return created;
}

void init_logging(spdlog::level::level_enum level)
{
    auto log = logger();
    log->set_level(level);
    log->flush_on(spdlog::level::warn);
}

} // namespace todomcp
