// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <string>

namespace printlink {

/**
 * @brief Network location of the target printer
 *
 * Immutable for the lifetime of a client instance.
 */
struct DeviceAddress {
    std::string host;
    uint16_t http_port = 80;
    uint16_t rpc_port = 9999;

    /// Base URL for the HTTP channel, e.g. "http://192.168.1.20" or "http://host:8080"
    std::string http_base_url() const {
        std::string url = "http://" + host;
        if (http_port != 80) {
            url += ":" + std::to_string(http_port);
        }
        return url;
    }
};

/**
 * @brief Static credentials identifying this client to the device
 */
struct ClientIdentity {
    std::string client_id = "MakerWare";
    std::string client_secret = "secret";
    std::string username = "MakerBot API"; ///< Shown on the printer during pairing
};

/**
 * @brief Long-lived secret obtained once per user-consent cycle
 */
struct AuthorizationCode {
    std::string value;

    bool empty() const {
        return value.empty();
    }
};

/**
 * @brief Scope an access token is minted for
 */
enum class TokenContext {
    JSONRPC, ///< Authenticates the JSON-RPC socket
    PUT,     ///< File upload
    CAMERA   ///< Camera stream
};

inline const char* token_context_name(TokenContext context) {
    switch (context) {
    case TokenContext::JSONRPC:
        return "jsonrpc";
    case TokenContext::PUT:
        return "put";
    case TokenContext::CAMERA:
        return "camera";
    }
    return "jsonrpc";
}

/**
 * @brief Short-lived, single-connection credential
 *
 * Minted fresh for every connection and never cached.
 */
struct AccessToken {
    std::string value;
    TokenContext context = TokenContext::JSONRPC;
};

/**
 * @brief Codes returned by the pairing request
 */
struct PairingHandle {
    std::string code;        ///< Pairing code shown by the device (may be empty)
    std::string answer_code; ///< Code used to poll for the user's answer
};

/**
 * @brief Device-authorization flow state
 *
 * UNAUTHENTICATED -> PAIRING_REQUESTED -> AWAITING_USER_ACCEPTANCE -> AUTHORIZED | TIMED_OUT
 */
enum class AuthorizationState {
    UNAUTHENTICATED,
    PAIRING_REQUESTED,
    AWAITING_USER_ACCEPTANCE,
    AUTHORIZED,
    TIMED_OUT
};

inline const char* authorization_state_name(AuthorizationState state) {
    switch (state) {
    case AuthorizationState::UNAUTHENTICATED:
        return "UNAUTHENTICATED";
    case AuthorizationState::PAIRING_REQUESTED:
        return "PAIRING_REQUESTED";
    case AuthorizationState::AWAITING_USER_ACCEPTANCE:
        return "AWAITING_USER_ACCEPTANCE";
    case AuthorizationState::AUTHORIZED:
        return "AUTHORIZED";
    case AuthorizationState::TIMED_OUT:
        return "TIMED_OUT";
    }
    return "UNKNOWN";
}

/// Log-safe rendering of a secret: first four characters then an ellipsis
inline std::string redact(const std::string& secret) {
    if (secret.size() <= 4) {
        return "****";
    }
    return secret.substr(0, 4) + "...";
}

} // namespace printlink
