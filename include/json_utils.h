// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>

#include "hv/json.hpp"

namespace printlink::json_util {

/// True when j is an object holding key with a non-null value.
inline bool has_field(const nlohmann::json& j, const char* key) {
    return j.is_object() && j.contains(key) && !j[key].is_null();
}

/// Safely extract a string from a JSON field that may be missing, null or non-string.
/// The device's HTTP replies are loosely typed; nlohmann .value() throws on null.
inline std::string safe_string(const nlohmann::json& j, const char* key,
                               const std::string& def = "") {
    if (!has_field(j, key)) {
        return def;
    }
    const auto& v = j[key];
    if (v.is_string()) {
        return v.get<std::string>();
    }
    return def;
}

} // namespace printlink::json_util
