// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "device_error.h"
#include "device_session.h"
#include "retry_policy.h"

#include <cctype>
#include <cmath>
#include <string>

#include "hv/json.hpp"

namespace printlink {

/**
 * @brief Accepted range for temperature commands
 */
struct TemperatureLimits {
    double min_celsius = 0.0;
    double max_celsius = 300.0;
};

/**
 * @brief Validate temperature is finite and inside limits
 */
inline bool is_safe_temperature(double temp, const TemperatureLimits& limits) {
    return std::isfinite(temp) && temp >= limits.min_celsius && temp <= limits.max_celsius;
}

/**
 * @brief Validate a print URL before it is sent to the device
 *
 * Rejects empty strings and any control character (including NUL).
 */
inline bool is_valid_print_url(const std::string& url) {
    if (url.empty()) {
        return false;
    }
    for (char c : url) {
        if (std::iscntrl(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

/**
 * @brief Result of get_camera_frame()
 */
struct CameraFrame {
    json response;      ///< capture_image response with params = {url, base64}
    std::string url;    ///< Where the frame was fetched from
    std::string bytes;  ///< Raw PNG bytes
    std::string base64; ///< bytes, base64-encoded
};

/// Path the device writes captured frames to
constexpr const char* CAMERA_OUTPUT_FILE = "/home/settings/frame.png";

/// HTTP path serving the captured frame
constexpr const char* CAMERA_FRAME_PATH = "/settings/frame.png";

/**
 * @brief Printer operations on top of DeviceSession
 *
 * Each operation is one authenticated connection (see DeviceSession). The
 * composite recoveries chain operations with settle waits and stop at the
 * first failure.
 *
 * All methods block the calling thread. Pass a CancellationToken to abort
 * between steps; a cancelled operation returns CANCELLED.
 */
class PrinterAPI {
  public:
    explicit PrinterAPI(DeviceSession& session, TemperatureLimits limits = {});

    // ========================================================================
    // Filament
    // ========================================================================

    DeviceResult<json> load_filament(int tool_index = 0, const CancellationToken* cancel = nullptr);
    DeviceResult<json> unload_filament(int tool_index = 0,
                                       const CancellationToken* cancel = nullptr);
    DeviceResult<json> stop_filament(const CancellationToken* cancel = nullptr);

    // ========================================================================
    // Extruder and machine information
    // ========================================================================

    DeviceResult<json> attach_extruder(int index = 0, const CancellationToken* cancel = nullptr);
    DeviceResult<json> get_extruder_information(const CancellationToken* cancel = nullptr);
    DeviceResult<json> get_information(const CancellationToken* cancel = nullptr);
    DeviceResult<json> get_temperature(int index = 0, const CancellationToken* cancel = nullptr);

    // ========================================================================
    // Heating
    // ========================================================================

    /**
     * @brief Start heating the extruder
     *
     * @param temperature Target in Celsius, must be inside TemperatureLimits
     * @return INVALID_ARGUMENT without any I/O if out of range
     */
    DeviceResult<json> preheat(double temperature = 180.0,
                               const CancellationToken* cancel = nullptr);
    DeviceResult<json> cool(const CancellationToken* cancel = nullptr);

    // ========================================================================
    // Job control
    // ========================================================================

    /**
     * @brief Start a print from a URL the device can download
     *
     * @return INVALID_ARGUMENT without any I/O for an empty URL or one
     *         containing control characters
     */
    DeviceResult<json> print(const std::string& url, const CancellationToken* cancel = nullptr);
    DeviceResult<json> print_again(const CancellationToken* cancel = nullptr);
    DeviceResult<json> cancel(const CancellationToken* cancel = nullptr);
    DeviceResult<json> pause(const CancellationToken* cancel = nullptr);
    DeviceResult<json> unpause(const CancellationToken* cancel = nullptr);
    DeviceResult<json> acknowledge_error(int error_id = -1,
                                         const CancellationToken* cancel = nullptr);

    // ========================================================================
    // Composite recoveries
    // ========================================================================

    /**
     * @brief pause, load filament, stop loading, resume
     *
     * Waits RecoveryTimings::filament_pause_settle, filament_load_settle and
     * filament_stop_settle between the steps.
     *
     * @return Response of the final unpause
     */
    DeviceResult<json> recover_filament_slip(const CancellationToken* cancel = nullptr);

    /**
     * @brief pause, wait RecoveryTimings::thermal_recovery, resume
     */
    DeviceResult<json> recover_temperature_sag(const CancellationToken* cancel = nullptr);

    // ========================================================================
    // Camera
    // ========================================================================

    /**
     * @brief Capture a still and download it over HTTP
     *
     * The capture_image RPC runs on its own connection, which is closed
     * before the HTTP download starts. An empty body is an HTTP_ERROR.
     */
    DeviceResult<CameraFrame> get_camera_frame(const CancellationToken* cancel = nullptr);

    const TemperatureLimits& temperature_limits() const {
        return limits_;
    }

  private:
    /// Settle wait between recovery steps; CANCELLED error if interrupted
    DeviceError settle(std::chrono::milliseconds duration, const char* step,
                       const CancellationToken* cancel);

    DeviceSession& session_;
    TemperatureLimits limits_;
};

} // namespace printlink
