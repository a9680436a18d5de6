// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>

#include <spdlog/spdlog.h>

namespace printlink {

class Config;

namespace logging {

/**
 * @brief Where log output goes in addition to the console
 */
enum class LogTarget {
    Auto,    ///< Journal if available, else syslog (Linux); console elsewhere
    Journal, ///< systemd journal (falls back to syslog without systemd support)
    Syslog,  ///< Traditional syslog
    File,    ///< Rotating file, 5MB x 3
    Console  ///< Console only
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    LogTarget target = LogTarget::Console;
    std::string file_path; ///< Empty: /var/log/printlink.log or XDG data dir
    bool enable_console = true;
};

/**
 * @brief Console-only logger so logging works before the config is read
 *
 * Also quiets libhv to WARN.
 */
void init_early();

/**
 * @brief Install the default spdlog logger described by config
 *
 * Replaces any previous default logger and syncs libhv's hlog level.
 */
void init(const LogConfig& config);

/**
 * @brief Build a LogConfig from /log_level, /log_target and /log_path
 */
LogConfig config_from(Config& config);

/// "journal", "syslog", "file", "console"; anything else is Auto
LogTarget parse_log_target(const std::string& str);

const char* log_target_name(LogTarget target);

/// "trace", "debug", "info", "warn", "error", "off"; unknown strings give info
spdlog::level::level_enum parse_log_level(const std::string& str);

/**
 * @brief libhv level matching an spdlog level
 *
 * Capped at DEBUG; libhv VERBOSE is too noisy.
 */
int hv_log_level(spdlog::level::level_enum level);

} // namespace logging
} // namespace printlink
