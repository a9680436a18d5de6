// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "session_config.h"

#include "config.h"
#include "spdlog/spdlog.h"

namespace printlink {

namespace {

int positive_or(Config& config, const std::string& ptr, int fallback) {
    int v = config.get<int>(ptr, fallback);
    if (v <= 0) {
        spdlog::warn("[Session Config] {} must be positive (got {}), using {}", ptr, v, fallback);
        return fallback;
    }
    return v;
}

int non_negative_or(Config& config, const std::string& ptr, int fallback) {
    int v = config.get<int>(ptr, fallback);
    if (v < 0) {
        spdlog::warn("[Session Config] {} must not be negative (got {}), using {}", ptr, v,
                     fallback);
        return fallback;
    }
    return v;
}

uint16_t port_or(Config& config, const std::string& ptr, uint16_t fallback) {
    int v = config.get<int>(ptr, fallback);
    if (v < 1 || v > 65535) {
        spdlog::warn("[Session Config] {} is not a valid port ({}), using {}", ptr, v, fallback);
        return fallback;
    }
    return static_cast<uint16_t>(v);
}

std::chrono::milliseconds ms(int v) {
    return std::chrono::milliseconds(v);
}

} // namespace

SessionConfig SessionConfig::from_config(Config& config) {
    SessionConfig sc;

    sc.address.host = config.get<std::string>("/device/host", "");
    sc.address.http_port = port_or(config, "/device/http_port", sc.address.http_port);
    sc.address.rpc_port = port_or(config, "/device/rpc_port", sc.address.rpc_port);

    sc.identity.client_id = config.get<std::string>("/auth/client_id", sc.identity.client_id);
    sc.identity.client_secret =
        config.get<std::string>("/auth/client_secret", sc.identity.client_secret);
    sc.identity.username = config.get<std::string>("/auth/username", sc.identity.username);

    sc.http_timeout_sec = positive_or(config, "/device/http_timeout_sec", sc.http_timeout_sec);

    sc.transport.connect_timeout_ms = static_cast<uint32_t>(positive_or(
        config, "/device/connect_timeout_ms", static_cast<int>(sc.transport.connect_timeout_ms)));
    sc.transport.read_timeout_ms = static_cast<uint32_t>(non_negative_or(
        config, "/device/read_timeout_ms", static_cast<int>(sc.transport.read_timeout_ms)));
    sc.transport.max_frame_bytes = static_cast<size_t>(positive_or(
        config, "/device/max_frame_bytes", static_cast<int>(sc.transport.max_frame_bytes)));
    sc.transport.newline_framing =
        config.get<bool>("/rpc/newline_framing", sc.transport.newline_framing);

    sc.acceptance_poll = RetryPolicy::bounded(
        positive_or(config, "/auth/poll_max_attempts", sc.acceptance_poll.max_attempts),
        ms(non_negative_or(config, "/auth/poll_interval_ms",
                           static_cast<int>(sc.acceptance_poll.delay.count()))));

    sc.echo_poll = RetryPolicy::bounded(
        positive_or(config, "/rpc/echo_poll_max_attempts", sc.echo_poll.max_attempts),
        ms(non_negative_or(config, "/rpc/echo_poll_interval_ms",
                           static_cast<int>(sc.echo_poll.delay.count()))));

    sc.recovery.filament_pause_settle = ms(non_negative_or(
        config, "/recovery/filament_pause_settle_ms",
        static_cast<int>(sc.recovery.filament_pause_settle.count())));
    sc.recovery.filament_load_settle = ms(non_negative_or(
        config, "/recovery/filament_load_settle_ms",
        static_cast<int>(sc.recovery.filament_load_settle.count())));
    sc.recovery.filament_stop_settle = ms(non_negative_or(
        config, "/recovery/filament_stop_settle_ms",
        static_cast<int>(sc.recovery.filament_stop_settle.count())));
    sc.recovery.thermal_recovery =
        ms(non_negative_or(config, "/recovery/thermal_recovery_ms",
                           static_cast<int>(sc.recovery.thermal_recovery.count())));

    if (sc.address.host.empty()) {
        spdlog::warn("[Session Config] /device/host is empty; set it before connecting");
    }

    return sc;
}

} // namespace printlink
