// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <memory>
#include <vector>

namespace qdeck {
namespace logging {

std::optional<spdlog::level::level_enum> parse_level(const std::string& name) {
    if (name == "trace")
        return spdlog::level::trace;
    if (name == "debug")
        return spdlog::level::debug;
    if (name == "info")
        return spdlog::level::info;
    if (name == "warn" || name == "warning")
        return spdlog::level::warn;
    if (name == "error")
        return spdlog::level::err;
    if (name == "critical")
        return spdlog::level::critical;
    if (name == "off")
        return spdlog::level::off;
    return std::nullopt;
}

spdlog::level::level_enum effective_level(spdlog::level::level_enum configured) {
    const char* env = std::getenv("QDECK_LOG_LEVEL");
    if (!env || !*env) {
        return configured;
    }
    if (auto level = parse_level(env)) {
        return *level;
    }
    spdlog::warn("[Logging] Ignoring unknown QDECK_LOG_LEVEL '{}'", env);
    return configured;
}

void init_logging(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    std::string file_error;
    if (!config.file_path.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file_path, config.max_file_size, config.max_files));
        } catch (const spdlog::spdlog_ex& e) {
            file_error = e.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>("qdeck", sinks.begin(), sinks.end());
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    logger->set_level(effective_level(config.level));
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    if (!file_error.empty()) {
        spdlog::error("[Logging] Cannot open log file {}: {}", config.file_path, file_error);
    }

    spdlog::debug("[Logging] Initialized: level={}, file={}",
                  spdlog::level::to_string_view(logger->level()),
                  config.file_path.empty() ? "(none)" : config.file_path);
}

} // namespace logging
} // namespace qdeck
