// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef PRINTLINK_DEVICE_ERROR_H
#define PRINTLINK_DEVICE_ERROR_H

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "hv/json.hpp"

namespace printlink {

using json = nlohmann::json;

/**
 * @brief Error types for device operations
 */
enum class DeviceErrorType {
    NONE,                  // No error
    CONNECT_ERROR,         // Socket or HTTP endpoint unreachable
    HTTP_ERROR,            // HTTP reply missing, non-2xx or missing required fields
    AUTHORIZATION_TIMEOUT, // User did not accept pairing before the attempt ceiling
    AUTH_ERROR,            // Device refused to mint an access token
    AUTHENTICATION_FAILED, // Device rejected the authenticate RPC on a connection
    PROTOCOL_ERROR,        // Malformed, truncated or JSON-RPC error response
    POLL_LIMIT_EXCEEDED,   // Device kept echoing the method past the configured cap
    NOT_AUTHORIZED,        // No authorization code held yet
    CANCELLED,             // Caller requested abort
    INVALID_ARGUMENT       // Rejected before any I/O
};

/**
 * @brief Error information for a failed device operation
 */
struct DeviceError {
    DeviceErrorType type = DeviceErrorType::NONE;
    std::string message; // Human-readable error message
    std::string method;  // RPC method or HTTP response_type that failed
    json details;        // Raw device payload when one was received

    bool has_error() const {
        return type != DeviceErrorType::NONE;
    }

    /**
     * @brief Get string representation of error type
     */
    std::string get_type_string() const {
        switch (type) {
        case DeviceErrorType::NONE:
            return "NONE";
        case DeviceErrorType::CONNECT_ERROR:
            return "CONNECT_ERROR";
        case DeviceErrorType::HTTP_ERROR:
            return "HTTP_ERROR";
        case DeviceErrorType::AUTHORIZATION_TIMEOUT:
            return "AUTHORIZATION_TIMEOUT";
        case DeviceErrorType::AUTH_ERROR:
            return "AUTH_ERROR";
        case DeviceErrorType::AUTHENTICATION_FAILED:
            return "AUTHENTICATION_FAILED";
        case DeviceErrorType::PROTOCOL_ERROR:
            return "PROTOCOL_ERROR";
        case DeviceErrorType::POLL_LIMIT_EXCEEDED:
            return "POLL_LIMIT_EXCEEDED";
        case DeviceErrorType::NOT_AUTHORIZED:
            return "NOT_AUTHORIZED";
        case DeviceErrorType::CANCELLED:
            return "CANCELLED";
        case DeviceErrorType::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        default:
            return "UNKNOWN";
        }
    }

    /**
     * @brief Get a user-friendly error message
     */
    std::string user_message() const {
        if (type == DeviceErrorType::CONNECT_ERROR) {
            return "Unable to reach printer. Check power and network connection.";
        } else if (type == DeviceErrorType::AUTHORIZATION_TIMEOUT) {
            return "Pairing was not confirmed on the printer in time.";
        } else if (type == DeviceErrorType::AUTH_ERROR ||
                   type == DeviceErrorType::AUTHENTICATION_FAILED) {
            return "Printer rejected the credentials. Pair again if this persists.";
        } else if (type == DeviceErrorType::NOT_AUTHORIZED) {
            return "Printer is not paired yet.";
        } else if (type == DeviceErrorType::POLL_LIMIT_EXCEEDED) {
            return "Printer is still busy. Try again later.";
        } else if (type == DeviceErrorType::CANCELLED) {
            return "Operation cancelled.";
        } else if (!message.empty()) {
            return message;
        }
        return "An unknown error occurred.";
    }

    static DeviceError make(DeviceErrorType type, std::string message,
                            const std::string& method_name = "") {
        DeviceError err;
        err.type = type;
        err.message = std::move(message);
        err.method = method_name;
        return err;
    }

    static DeviceError connect_error(const std::string& what,
                                     const std::string& method_name = "") {
        return make(DeviceErrorType::CONNECT_ERROR, "Connection failed: " + what, method_name);
    }

    static DeviceError http_error(const std::string& what, const std::string& method_name = "") {
        return make(DeviceErrorType::HTTP_ERROR, what, method_name);
    }

    static DeviceError authorization_timeout(int attempts) {
        return make(DeviceErrorType::AUTHORIZATION_TIMEOUT,
                    "Pairing not accepted after " + std::to_string(attempts) + " attempts",
                    "answer");
    }

    static DeviceError auth_error(const std::string& context, const json& reply = nullptr) {
        DeviceError err = make(DeviceErrorType::AUTH_ERROR,
                               "Device refused access token for context '" + context + "'",
                               "token");
        err.details = reply;
        return err;
    }

    static DeviceError authentication_failed(const std::string& what,
                                             const json& reply = nullptr) {
        DeviceError err =
            make(DeviceErrorType::AUTHENTICATION_FAILED, what, "authenticate");
        err.details = reply;
        return err;
    }

    static DeviceError protocol_error(const std::string& what,
                                      const std::string& method_name = "") {
        return make(DeviceErrorType::PROTOCOL_ERROR, "Protocol error: " + what, method_name);
    }

    /**
     * @brief Create error from a JSON-RPC error object in a device reply
     */
    static DeviceError from_json_rpc(const json& error_obj, const std::string& method_name) {
        std::string text = "JSON-RPC error";
        if (error_obj.is_object() && error_obj.contains("message") &&
            error_obj["message"].is_string()) {
            text = error_obj["message"].get<std::string>();
        }
        DeviceError err = make(DeviceErrorType::PROTOCOL_ERROR, text, method_name);
        err.details = error_obj;
        return err;
    }

    static DeviceError poll_limit(const std::string& method_name, int attempts) {
        return make(DeviceErrorType::POLL_LIMIT_EXCEEDED,
                    "Device still processing after " + std::to_string(attempts) + " attempts",
                    method_name);
    }

    static DeviceError not_authorized() {
        return make(DeviceErrorType::NOT_AUTHORIZED, "No authorization code held");
    }

    static DeviceError cancelled(const std::string& method_name = "") {
        return make(DeviceErrorType::CANCELLED, "Operation cancelled", method_name);
    }

    static DeviceError invalid_argument(const std::string& what,
                                        const std::string& method_name = "") {
        return make(DeviceErrorType::INVALID_ARGUMENT, what, method_name);
    }
};

/**
 * @brief Outcome of a device operation: either a value or a DeviceError
 *
 * Callers must check has_value() (or operator bool) before value().
 * Accessing the wrong alternative throws std::logic_error.
 */
template <typename T> class DeviceResult {
  public:
    static DeviceResult success(T value) {
        DeviceResult r;
        r.value_ = std::move(value);
        return r;
    }

    // Implicit from error so call sites can `return DeviceError::...;`
    DeviceResult(DeviceError error) : error_(std::move(error)) {
        if (error_.type == DeviceErrorType::NONE) {
            error_.type = DeviceErrorType::PROTOCOL_ERROR;
        }
    }

    bool has_value() const {
        return value_.has_value();
    }

    explicit operator bool() const {
        return has_value();
    }

    const T& value() const {
        if (!value_) {
            throw std::logic_error("DeviceResult::value() on error: " + error_.message);
        }
        return *value_;
    }

    T& value() {
        if (!value_) {
            throw std::logic_error("DeviceResult::value() on error: " + error_.message);
        }
        return *value_;
    }

    const DeviceError& error() const {
        return error_;
    }

    DeviceErrorType error_type() const {
        return has_value() ? DeviceErrorType::NONE : error_.type;
    }

  private:
    DeviceResult() = default;

    std::optional<T> value_;
    DeviceError error_;
};

} // namespace printlink

#endif // PRINTLINK_DEVICE_ERROR_H
