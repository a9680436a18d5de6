// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file printer_api.cpp
 * @brief Printer operations mapped to device RPC calls
 *
 * @pattern Thin wrappers over DeviceSession::call(); composites chain calls
 * @threading Blocking on the caller's thread
 * @gotchas Filament load/unload and acknowledge_error need a process_method
 * preamble on the same connection, otherwise the device ignores the command.
 */

#include "printer_api.h"

#include "http_channel.h"
#include "spdlog/spdlog.h"

#include "hv/base64.h"

#include <cmath>

namespace printlink {

PrinterAPI::PrinterAPI(DeviceSession& session, TemperatureLimits limits)
    : session_(session), limits_(limits) {}

namespace {

CallOptions with_preamble(const char* process_method) {
    CallOptions opts;
    opts.process_method = process_method;
    return opts;
}

CallOptions polled() {
    CallOptions opts;
    opts.poll_method_echo = true;
    return opts;
}

} // namespace

// ============================================================================
// Filament
// ============================================================================

DeviceResult<json> PrinterAPI::load_filament(int tool_index, const CancellationToken* cancel) {
    spdlog::info("[Printer API] Loading filament (tool {})", tool_index);
    return session_.call("load_filament", {{"tool_index", tool_index}},
                         with_preamble("load_filament"), cancel);
}

DeviceResult<json> PrinterAPI::unload_filament(int tool_index, const CancellationToken* cancel) {
    spdlog::info("[Printer API] Unloading filament (tool {})", tool_index);
    return session_.call("unload_filament", {{"tool_index", tool_index}},
                         with_preamble("unload_filament"), cancel);
}

DeviceResult<json> PrinterAPI::stop_filament(const CancellationToken* cancel) {
    return session_.call("process_method", {{"method", "stop_filament"}}, {}, cancel);
}

// ============================================================================
// Extruder and machine information
// ============================================================================

DeviceResult<json> PrinterAPI::attach_extruder(int index, const CancellationToken* cancel) {
    return session_.call("load_print_tool", {{"index", index}}, polled(), cancel);
}

DeviceResult<json> PrinterAPI::get_extruder_information(const CancellationToken* cancel) {
    return session_.call("get_tool_usage_stats", nullptr, polled(), cancel);
}

DeviceResult<json> PrinterAPI::get_information(const CancellationToken* cancel) {
    return session_.call("get_system_information", nullptr, polled(), cancel);
}

DeviceResult<json> PrinterAPI::get_temperature(int index, const CancellationToken* cancel) {
    json params = {{"machine_func", "get_temperature"}, {"params", {{"index", index}}}};
    return session_.call("machine_query_command", params, {}, cancel);
}

// ============================================================================
// Heating
// ============================================================================

DeviceResult<json> PrinterAPI::preheat(double temperature, const CancellationToken* cancel) {
    if (!is_safe_temperature(temperature, limits_)) {
        spdlog::warn("[Printer API] Rejecting preheat to {}°C (valid {:.0f}-{:.0f}°C)",
                     temperature, limits_.min_celsius, limits_.max_celsius);
        return DeviceError::invalid_argument(
            "temperature " + std::to_string(temperature) + " outside " +
                std::to_string(static_cast<int>(limits_.min_celsius)) + "-" +
                std::to_string(static_cast<int>(limits_.max_celsius)) + "°C",
            "preheat");
    }

    spdlog::info("[Printer API] Preheating to {}°C", temperature);
    // Whole degrees go out as integers ([200], not [200.0])
    json target = temperature;
    if (std::floor(temperature) == temperature) {
        target = static_cast<int>(temperature);
    }
    json params = {{"temperature_settings", json::array({target})}};
    return session_.call("preheat", params, polled(), cancel);
}

DeviceResult<json> PrinterAPI::cool(const CancellationToken* cancel) {
    spdlog::info("[Printer API] Cooling");
    return session_.call("cool", {{"ignore_tool_errors", false}}, polled(), cancel);
}

// ============================================================================
// Job control
// ============================================================================

DeviceResult<json> PrinterAPI::print(const std::string& url, const CancellationToken* cancel) {
    if (!is_valid_print_url(url)) {
        spdlog::warn("[Printer API] Rejecting print with invalid URL");
        return DeviceError::invalid_argument("print URL is empty or contains control characters",
                                             "external_print");
    }

    spdlog::info("[Printer API] Starting print from {}", url);
    json params = {{"url", url}, {"ensure_build_plate_clear", true}};
    return session_.call("external_print", params, {}, cancel);
}

DeviceResult<json> PrinterAPI::print_again(const CancellationToken* cancel) {
    return session_.call("print_again", nullptr, {}, cancel);
}

DeviceResult<json> PrinterAPI::cancel(const CancellationToken* cancel) {
    spdlog::info("[Printer API] Cancelling job");
    return session_.call("cancel", nullptr, {}, cancel);
}

DeviceResult<json> PrinterAPI::pause(const CancellationToken* cancel) {
    return session_.call("process_method", {{"method", "suspend"}}, {}, cancel);
}

DeviceResult<json> PrinterAPI::unpause(const CancellationToken* cancel) {
    return session_.call("process_method", {{"method", "resume"}}, {}, cancel);
}

DeviceResult<json> PrinterAPI::acknowledge_error(int error_id, const CancellationToken* cancel) {
    return session_.call("acknowledged", {{"error_id", error_id}},
                         with_preamble("acknowledge_error"), cancel);
}

// ============================================================================
// Composite recoveries
// ============================================================================

DeviceError PrinterAPI::settle(std::chrono::milliseconds duration, const char* step,
                               const CancellationToken* cancel) {
    spdlog::debug("[Printer API] Waiting {}ms after {}", duration.count(), step);
    DeviceError err = session_.wait(duration, cancel);
    if (err.has_error() && err.method.empty()) {
        err.method = step;
    }
    return err;
}

DeviceResult<json> PrinterAPI::recover_filament_slip(const CancellationToken* cancel) {
    const RecoveryTimings& timings = session_.config().recovery;
    spdlog::info("[Printer API] Recovering from filament slip");

    auto paused = pause(cancel);
    if (!paused) {
        return paused;
    }
    DeviceError err = settle(timings.filament_pause_settle, "suspend", cancel);
    if (err.has_error()) {
        return err;
    }

    auto loaded = load_filament(0, cancel);
    if (!loaded) {
        return loaded;
    }
    err = settle(timings.filament_load_settle, "load_filament", cancel);
    if (err.has_error()) {
        return err;
    }

    auto stopped = stop_filament(cancel);
    if (!stopped) {
        return stopped;
    }
    err = settle(timings.filament_stop_settle, "stop_filament", cancel);
    if (err.has_error()) {
        return err;
    }

    return unpause(cancel);
}

DeviceResult<json> PrinterAPI::recover_temperature_sag(const CancellationToken* cancel) {
    spdlog::info("[Printer API] Recovering from temperature sag");

    auto paused = pause(cancel);
    if (!paused) {
        return paused;
    }
    DeviceError err = settle(session_.config().recovery.thermal_recovery, "suspend", cancel);
    if (err.has_error()) {
        return err;
    }
    return unpause(cancel);
}

// ============================================================================
// Camera
// ============================================================================

DeviceResult<CameraFrame> PrinterAPI::get_camera_frame(const CancellationToken* cancel) {
    auto captured =
        session_.call("capture_image", {{"output_file", CAMERA_OUTPUT_FILE}}, {}, cancel);
    if (!captured) {
        return captured.error();
    }

    if (cancel && cancel->is_cancelled()) {
        return DeviceError::cancelled("capture_image");
    }

    HttpChannel& http = session_.authority().http();
    auto reply = http.get(CAMERA_FRAME_PATH, {});
    if (!reply) {
        return reply.error();
    }
    if (!reply.value().is_success()) {
        return DeviceError::http_error("camera frame download returned HTTP " +
                                           std::to_string(reply.value().status_code),
                                       "capture_image");
    }
    if (reply.value().body.empty()) {
        return DeviceError::http_error("camera frame is empty", "capture_image");
    }

    CameraFrame frame;
    frame.url = http.url_for(CAMERA_FRAME_PATH);
    frame.bytes = std::move(reply.value().body);
    frame.base64 = hv::Base64Encode(reinterpret_cast<const unsigned char*>(frame.bytes.data()),
                                    static_cast<unsigned int>(frame.bytes.size()));
    frame.response = std::move(captured.value());
    frame.response["params"] = {{"url", frame.url}, {"base64", frame.base64}};

    spdlog::debug("[Printer API] Camera frame: {} bytes from {}", frame.bytes.size(), frame.url);
    return DeviceResult<CameraFrame>::success(std::move(frame));
}

} // namespace printlink
