// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef __PRINTLINK_CONFIG_H__
#define __PRINTLINK_CONFIG_H__

#include "spdlog/spdlog.h"

#include <string>

#include "hv/json.hpp"

namespace printlink {

using json = nlohmann::json;

/**
 * @brief Client configuration loaded from a JSON file
 *
 * Uses JSON pointer syntax (RFC 6901) for nested value access. Holds
 * device location, timeouts, poll caps, recovery timings and logging
 * options. Credentials obtained by pairing are never stored here.
 *
 * Thread safety: Not thread-safe. Load once at startup, then derive an
 * immutable SessionConfig.
 *
 * Example usage:
 * ```cpp
 * printlink::Config cfg;
 * cfg.init("/etc/printlink/printlink.json");
 *
 * std::string host = cfg.get<std::string>("/device/host", "");
 * cfg.set<int>("/device/rpc_port", 9999);
 * cfg.save();
 * ```
 */
class Config {
  private:
    std::string path;

  protected:
    json data;

    /// Allow test fixture to access protected members
    friend class ConfigTestFixture;

  public:
    Config();

    Config(Config& o) = delete;
    void operator=(const Config&) = delete;

    /**
     * @brief Default configuration document
     */
    static json defaults();

    /**
     * @brief Initialize configuration from file
     *
     * Loads the JSON file, fills in any missing keys from defaults() and
     * writes the file back if anything was added. A missing or corrupt
     * file is replaced by the defaults.
     *
     * @param config_path Path to JSON configuration file
     */
    void init(const std::string& config_path);

    /**
     * @brief Get configuration value at JSON pointer path
     *
     * @throws nlohmann::json::exception if path doesn't exist
     */
    template <typename T> T get(const std::string& json_ptr) {
        return data[json::json_pointer(json_ptr)].template get<T>();
    };

    /**
     * @brief Get configuration value with default fallback
     *
     * Returns default_value if the path doesn't exist, is null, or holds a
     * value of the wrong type.
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) {
        json::json_pointer ptr(json_ptr);
        if (!data.contains(ptr) || data[ptr].is_null()) {
            return default_value;
        }
        try {
            return data[ptr].template get<T>();
        } catch (const json::type_error& e) {
            spdlog::warn("[Config] {} has unexpected type ({}), using default", json_ptr,
                         e.what());
            return default_value;
        }
    };

    /**
     * @brief Set configuration value at JSON pointer path
     *
     * Creates intermediate paths if they don't exist. In-memory only until
     * save() is called.
     */
    template <typename T> T set(const std::string& json_ptr, T v) {
        data[json::json_pointer(json_ptr)] = v;
        return v;
    };

    /**
     * @brief Save current configuration to file
     *
     * Written to a temporary file then renamed over the original.
     *
     * @return true on success
     */
    bool save();

    std::string get_path() const;
};

} // namespace printlink

#endif // __PRINTLINK_CONFIG_H__
