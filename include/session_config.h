// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "device_transport.h"
#include "device_types.h"
#include "retry_policy.h"

#include <chrono>

namespace printlink {

class Config;

/**
 * @brief Settle times used by the composite recovery operations
 *
 * Empirical values tied to the printer's physical behaviour (filament
 * re-load settling, thermal recovery), not protocol requirements.
 */
struct RecoveryTimings {
    std::chrono::milliseconds filament_pause_settle{7000};
    std::chrono::milliseconds filament_load_settle{7000};
    std::chrono::milliseconds filament_stop_settle{2000};
    std::chrono::milliseconds thermal_recovery{10000};
};

/**
 * @brief Immutable settings for a DeviceSession
 *
 * Built once (from defaults or a Config file) and passed by value; holds
 * no credentials.
 */
struct SessionConfig {
    DeviceAddress address;
    ClientIdentity identity;
    TransportSettings transport;
    int http_timeout_sec = 5;

    /// User-acceptance poll during pairing
    RetryPolicy acceptance_poll = RetryPolicy::bounded(200, std::chrono::milliseconds(1000));

    /// Re-issue cap while the device echoes the method ("still processing")
    RetryPolicy echo_poll = RetryPolicy::bounded(120, std::chrono::milliseconds(0));

    RecoveryTimings recovery;

    /**
     * @brief Derive session settings from a loaded Config
     *
     * Out-of-range numbers (negative timeouts, ports outside 1..65535,
     * zero attempt caps) fall back to the defaults above with a warning.
     */
    static SessionConfig from_config(Config& config);
};

} // namespace printlink
