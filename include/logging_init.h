// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file logging_init.h
 * @brief spdlog sink setup for the application and tests
 */

#pragma once

#include <spdlog/common.h>

#include <cstddef>
#include <optional>
#include <string>

namespace qdeck {
namespace logging {

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    bool console = true;
    std::string file_path; ///< empty disables the file sink
    size_t max_file_size = 5 * 1024 * 1024;
    size_t max_files = 3;
};

/// "trace", "debug", "info", "warn", "error", "critical", "off".
/// std::nullopt for anything else.
std::optional<spdlog::level::level_enum> parse_level(const std::string& name);

/// Level after applying the QDECK_LOG_LEVEL override, if set and valid
spdlog::level::level_enum effective_level(spdlog::level::level_enum configured);

/**
 * @brief Install the default "qdeck" logger
 *
 * Colored stdout sink plus, when `file_path` is set, a rotating file sink.
 * Safe to call again: the previous default logger is replaced.
 */
void init_logging(const LogConfig& config);

/**
 * @brief Route LVGL log output through spdlog
 *
 * Call after init_logging(). Only available in the UI library.
 */
void register_lvgl_log_handler();

} // namespace logging
} // namespace qdeck
