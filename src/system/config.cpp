// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include <filesystem>
#include <fstream>
#include <iomanip>

namespace fs = std::filesystem;

namespace printlink {

namespace {

/// Add keys present in defaults but missing from target, recursively
/// @return true if anything was added
bool merge_missing(json& target, const json& defaults) {
    bool modified = false;
    for (auto& [key, value] : defaults.items()) {
        if (!target.contains(key)) {
            target[key] = value;
            modified = true;
        } else if (value.is_object() && target[key].is_object()) {
            modified |= merge_missing(target[key], value);
        }
    }
    return modified;
}

} // namespace

Config::Config() : data(defaults()) {}

json Config::defaults() {
    return {{"device",
             {{"host", ""},
              {"http_port", 80},
              {"rpc_port", 9999},
              {"http_timeout_sec", 5},
              {"connect_timeout_ms", 5000},
              {"read_timeout_ms", 10000},
              {"max_frame_bytes", 5 * 1024 * 1024}}},
            {"auth",
             {{"client_id", "MakerWare"},
              {"client_secret", "secret"},
              {"username", "MakerBot API"},
              {"poll_interval_ms", 1000},
              {"poll_max_attempts", 200}}},
            {"rpc",
             {{"echo_poll_interval_ms", 0},
              {"echo_poll_max_attempts", 120},
              {"newline_framing", true}}},
            {"recovery",
             {{"filament_pause_settle_ms", 7000},
              {"filament_load_settle_ms", 7000},
              {"filament_stop_settle_ms", 2000},
              {"thermal_recovery_ms", 10000}}},
            {"log_level", "info"},
            {"log_target", "console"},
            {"log_path", ""}};
}

void Config::init(const std::string& config_path) {
    path = config_path;
    bool config_modified = false;

    std::error_code ec;
    if (fs::exists(config_path, ec)) {
        spdlog::info("[Config] Loading config from {}", config_path);
        try {
            std::ifstream in(config_path);
            data = json::parse(in);
        } catch (const json::exception& e) {
            spdlog::error("[Config] Failed to parse {}: {}", config_path, e.what());
            spdlog::warn("[Config] Config file is corrupt, resetting to defaults");
            data = defaults();
            config_modified = true;
        }

        if (!data.is_object()) {
            spdlog::warn("[Config] Config root is not an object, resetting to defaults");
            data = defaults();
            config_modified = true;
        }
    } else {
        spdlog::info("[Config] No config at {}, creating defaults", config_path);
        data = defaults();
        config_modified = true;
    }

    if (merge_missing(data, defaults())) {
        config_modified = true;
    }

    // Pairing credentials must not be persisted
    if (data.contains("auth") && data["auth"].is_object() &&
        data["auth"].contains("auth_code")) {
        spdlog::warn("[Config] Removing stored auth_code; credentials are not persisted");
        data["auth"].erase("auth_code");
        config_modified = true;
    }

    if (config_modified && !save()) {
        spdlog::warn("[Config] Defaults could not be written to {}, continuing in memory",
                     config_path);
    }

    spdlog::debug("[Config] initialized: device={}:{}", get<std::string>("/device/host", ""),
                  get<int>("/device/rpc_port", 9999));
}

std::string Config::get_path() const {
    return path;
}

bool Config::save() {
    if (path.empty()) {
        spdlog::warn("[Config] save() called before init(), nothing written");
        return false;
    }

    spdlog::trace("[Config] Saving config to {}", path);
    const std::string tmp_path = path + ".tmp";

    try {
        fs::path dir = fs::path(path).parent_path();
        if (!dir.empty()) {
            fs::create_directories(dir);
        }

        {
            std::ofstream o(tmp_path);
            if (!o.is_open()) {
                spdlog::error("[Config] Failed to open config file for writing: {}", tmp_path);
                return false;
            }
            o << std::setw(2) << data << std::endl;
            if (!o.good()) {
                spdlog::error("[Config] Error writing to config file: {}", tmp_path);
                return false;
            }
        }

        fs::rename(tmp_path, path);
        spdlog::trace("[Config] saved successfully to {}", path);
        return true;

    } catch (const std::exception& e) {
        spdlog::error("[Config] Exception while saving config to {}: {}", path, e.what());
        std::error_code ec;
        fs::remove(tmp_path, ec);
        return false;
    }
}

} // namespace printlink
