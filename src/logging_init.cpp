// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#include "logging_init.h"

#include "config.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <filesystem>
#include <vector>

#include "hv/hlog.h"

#ifdef __linux__
#ifdef PRINTLINK_HAS_SYSTEMD
#include <spdlog/sinks/systemd_sink.h>
#endif
#include <spdlog/sinks/syslog_sink.h>
#endif

namespace printlink {
namespace logging {

namespace {

constexpr const char* LOGGER_NAME = "printlink";

bool is_path_writable(const std::string& path) {
    std::filesystem::path dir = std::filesystem::path(path).parent_path();
    if (dir.empty()) {
        dir = ".";
    }

    std::error_code ec;
    if (!std::filesystem::exists(dir, ec)) {
        return false;
    }

    auto perms = std::filesystem::status(dir, ec).permissions();
    if (ec) {
        return false;
    }
    return (perms & std::filesystem::perms::owner_write) != std::filesystem::perms::none;
}

std::string get_xdg_data_home() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && xdg[0] != '\0') {
        return xdg;
    }

    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home) + "/.local/share";
    }

    return "/tmp";
}

std::string resolve_log_file_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return override_path;
    }

    const std::string var_log = "/var/log/printlink.log";
    if (is_path_writable(var_log)) {
        return var_log;
    }

    std::string user_dir = get_xdg_data_home() + "/printlink";
    std::error_code ec;
    std::filesystem::create_directories(user_dir, ec);
    return user_dir + "/printlink.log";
}

LogTarget detect_best_target() {
#ifdef __linux__
#ifdef PRINTLINK_HAS_SYSTEMD
    std::error_code ec;
    if (std::filesystem::exists("/run/systemd/journal/socket", ec)) {
        return LogTarget::Journal;
    }
#endif
    return LogTarget::Syslog;
#else
    return LogTarget::Console;
#endif
}

void add_system_sink(std::vector<spdlog::sink_ptr>& sinks, LogTarget target,
                     const std::string& file_path) {
    switch (target) {
#ifdef __linux__
#ifdef PRINTLINK_HAS_SYSTEMD
    case LogTarget::Journal:
        sinks.push_back(std::make_shared<spdlog::sinks::systemd_sink_mt>(LOGGER_NAME));
        break;
#else
    case LogTarget::Journal:
        // No systemd support compiled in
        sinks.push_back(std::make_shared<spdlog::sinks::syslog_sink_mt>(LOGGER_NAME, LOG_PID,
                                                                        LOG_USER, false));
        break;
#endif
    case LogTarget::Syslog:
        sinks.push_back(std::make_shared<spdlog::sinks::syslog_sink_mt>(LOGGER_NAME, LOG_PID,
                                                                        LOG_USER, false));
        break;
#else
    case LogTarget::Journal:
    case LogTarget::Syslog:
        break;
#endif
    case LogTarget::File: {
        std::string path = resolve_log_file_path(file_path);
        // 5MB max size, 3 rotated files
        sinks.push_back(
            std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path, 5 * 1024 * 1024, 3));
        break;
    }
    case LogTarget::Console:
    case LogTarget::Auto:
        break;
    }
}

} // namespace

void init_early() {
    auto logger = std::make_shared<spdlog::logger>(
        LOGGER_NAME, std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    spdlog::set_default_logger(logger);

    // libhv defaults to INFO, which prints on every connection
    hlog_set_level(LOG_LEVEL_WARN);
}

void init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.enable_console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    LogTarget effective_target =
        (config.target == LogTarget::Auto) ? detect_best_target() : config.target;

    try {
        add_system_sink(sinks, effective_target, config.file_path);
    } catch (const spdlog::spdlog_ex& e) {
        // Unwritable log file: keep going with the console
        if (sinks.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        }
        spdlog::warn("[Logging] Could not open {} sink: {}", log_target_name(effective_target),
                     e.what());
    }

    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    logger->set_level(config.level);
    spdlog::set_default_logger(logger);

    spdlog::enable_backtrace(32);

    hlog_set_level(hv_log_level(config.level));

    spdlog::debug("[Logging] Initialized: target={}, console={}, backtrace=32 messages",
                  log_target_name(effective_target), config.enable_console ? "yes" : "no");
}

LogConfig config_from(Config& config) {
    LogConfig log_config;
    log_config.level = parse_log_level(config.get<std::string>("/log_level", "info"));
    log_config.target = parse_log_target(config.get<std::string>("/log_target", "console"));
    log_config.file_path = config.get<std::string>("/log_path", "");
    return log_config;
}

LogTarget parse_log_target(const std::string& str) {
    if (str == "journal")
        return LogTarget::Journal;
    if (str == "syslog")
        return LogTarget::Syslog;
    if (str == "file")
        return LogTarget::File;
    if (str == "console")
        return LogTarget::Console;
    return LogTarget::Auto;
}

const char* log_target_name(LogTarget target) {
    switch (target) {
    case LogTarget::Auto:
        return "auto";
    case LogTarget::Journal:
        return "journal";
    case LogTarget::Syslog:
        return "syslog";
    case LogTarget::File:
        return "file";
    case LogTarget::Console:
        return "console";
    }
    return "unknown";
}

spdlog::level::level_enum parse_log_level(const std::string& str) {
    if (str == "trace")
        return spdlog::level::trace;
    if (str == "debug")
        return spdlog::level::debug;
    if (str == "warn")
        return spdlog::level::warn;
    if (str == "error")
        return spdlog::level::err;
    if (str == "off")
        return spdlog::level::off;
    return spdlog::level::info;
}

int hv_log_level(spdlog::level::level_enum level) {
    switch (level) {
    case spdlog::level::trace:
    case spdlog::level::debug:
        return LOG_LEVEL_DEBUG;
    case spdlog::level::info:
        return LOG_LEVEL_INFO;
    case spdlog::level::warn:
        return LOG_LEVEL_WARN;
    case spdlog::level::err:
    case spdlog::level::critical:
        return LOG_LEVEL_ERROR;
    case spdlog::level::off:
    default:
        return LOG_LEVEL_SILENT;
    }
}

} // namespace logging
} // namespace printlink
