// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file token_authority.cpp
 * @brief Pairing handshake and per-connection token minting
 *
 * @pattern Blocking HTTP GETs against /auth, one response_type per step
 * @threading Blocks the caller for up to acceptance_poll.max_attempts * delay
 * @gotchas The device answers every step with HTTP 200; success is decided
 * by fields in the JSON body, not the status code
 */

#include "token_authority.h"

#include "json_utils.h"
#include "spdlog/spdlog.h"

#include <utility>

namespace printlink {

TokenAuthority::TokenAuthority(std::shared_ptr<HttpChannel> http, ClientIdentity identity,
                               RetryPolicy acceptance_poll, Sleeper sleeper)
    : http_(std::move(http)), identity_(std::move(identity)), acceptance_poll_(acceptance_poll),
      sleeper_(sleeper ? std::move(sleeper) : default_sleeper()) {}

void TokenAuthority::set_state(AuthorizationState new_state) {
    AuthorizationState old_state = state_.exchange(new_state);
    if (old_state != new_state) {
        spdlog::debug("[Token Authority] Authorization state: {} -> {}",
                      authorization_state_name(old_state), authorization_state_name(new_state));
    }
}

void TokenAuthority::mark_authorized() {
    set_state(AuthorizationState::AUTHORIZED);
}

DeviceResult<json> TokenAuthority::get_auth(const QueryParams& query,
                                            const std::string& step) const {
    auto reply = http_->get(AUTH_PATH, query);
    if (!reply) {
        DeviceError err = reply.error();
        err.method = step;
        return err;
    }

    const HttpReply& r = reply.value();
    json body;
    try {
        body = json::parse(r.body);
    } catch (const json::parse_error& e) {
        spdlog::warn("[Token Authority] {} reply is not JSON (HTTP {}): {}", step, r.status_code,
                     e.what());
        return DeviceError::http_error(
            "HTTP " + std::to_string(r.status_code) + ": reply is not JSON", step);
    }

    if (!body.is_object()) {
        return DeviceError::http_error("reply is not a JSON object", step);
    }
    return DeviceResult<json>::success(std::move(body));
}

DeviceResult<PairingHandle> TokenAuthority::begin_authorization() {
    spdlog::info("[Token Authority] Requesting pairing as '{}'", identity_.username);

    auto reply = get_auth({{"response_type", "code"},
                           {"client_id", identity_.client_id},
                           {"client_secret", identity_.client_secret},
                           {"username", identity_.username}},
                          "code");
    if (!reply) {
        spdlog::error("[Token Authority] Pairing request failed: {}", reply.error().message);
        set_state(AuthorizationState::UNAUTHENTICATED);
        return reply.error();
    }

    PairingHandle handle;
    handle.code = json_util::safe_string(reply.value(), "code");
    handle.answer_code = json_util::safe_string(reply.value(), "answer_code");

    if (handle.answer_code.empty()) {
        spdlog::error("[Token Authority] Pairing reply has no answer_code");
        set_state(AuthorizationState::UNAUTHENTICATED);
        DeviceError err = DeviceError::http_error("pairing reply has no answer_code", "code");
        err.details = reply.value();
        return err;
    }

    set_state(AuthorizationState::PAIRING_REQUESTED);
    return DeviceResult<PairingHandle>::success(std::move(handle));
}

DeviceResult<AuthorizationCode>
TokenAuthority::poll_for_acceptance(const PairingHandle& handle,
                                    const CancellationToken* cancel) {
    if (handle.answer_code.empty()) {
        return DeviceError::invalid_argument("pairing handle has no answer_code", "answer");
    }

    set_state(AuthorizationState::AWAITING_USER_ACCEPTANCE);
    spdlog::info("[Token Authority] Waiting for pairing to be accepted on the printer "
                 "(up to {} attempts)",
                 acceptance_poll_.max_attempts);

    const QueryParams query = {{"response_type", "answer"},
                               {"client_id", identity_.client_id},
                               {"client_secret", identity_.client_secret},
                               {"answer_code", handle.answer_code}};

    // Each attempt yields the reply body; an empty object means "not yet"
    auto result = poll_until<json>(
        acceptance_poll_,
        [&](int attempt) -> DeviceResult<json> {
            auto reply = get_auth(query, "answer");
            if (!reply) {
                if (reply.error().type == DeviceErrorType::CONNECT_ERROR) {
                    return reply;
                }
                spdlog::warn("[Token Authority] Answer poll {} unusable: {}", attempt,
                             reply.error().message);
                return DeviceResult<json>::success(json::object());
            }
            spdlog::trace("[Token Authority] Answer poll {}: answer='{}'", attempt,
                          json_util::safe_string(reply.value(), "answer"));
            return reply;
        },
        [](const json& body) { return json_util::safe_string(body, "answer") == "accepted"; },
        [](int attempts) {
            spdlog::error("[Token Authority] Pairing not accepted after {} attempts", attempts);
            return DeviceError::authorization_timeout(attempts);
        },
        cancel, sleeper_);

    if (!result) {
        set_state(result.error().type == DeviceErrorType::AUTHORIZATION_TIMEOUT
                      ? AuthorizationState::TIMED_OUT
                      : AuthorizationState::UNAUTHENTICATED);
        return result.error();
    }

    AuthorizationCode code{json_util::safe_string(result.value(), "code")};
    if (code.empty()) {
        set_state(AuthorizationState::UNAUTHENTICATED);
        DeviceError err = DeviceError::http_error("accepted reply has no code", "answer");
        err.details = result.value();
        return err;
    }

    set_state(AuthorizationState::AUTHORIZED);
    spdlog::info("[Token Authority] Pairing accepted (code {})", redact(code.value));
    return DeviceResult<AuthorizationCode>::success(std::move(code));
}

DeviceResult<AuthorizationCode> TokenAuthority::authorize(const CancellationToken* cancel) {
    auto handle = begin_authorization();
    if (!handle) {
        return handle.error();
    }
    return poll_for_acceptance(handle.value(), cancel);
}

DeviceResult<AccessToken> TokenAuthority::mint_access_token(const AuthorizationCode& code,
                                                            TokenContext context) const {
    const char* context_name = token_context_name(context);
    if (code.empty()) {
        return DeviceError::not_authorized();
    }

    auto reply = get_auth({{"response_type", "token"},
                           {"client_id", identity_.client_id},
                           {"client_secret", identity_.client_secret},
                           {"context", context_name},
                           {"auth_code", code.value}},
                          "token");
    if (!reply) {
        spdlog::error("[Token Authority] Token request failed: {}", reply.error().message);
        return reply.error();
    }

    const json& body = reply.value();
    std::string status = json_util::safe_string(body, "status");
    std::string token = json_util::safe_string(body, "access_token");

    if (status != "success" || token.empty()) {
        spdlog::warn("[Token Authority] Device refused {} token (status '{}')", context_name,
                     status);
        return DeviceError::auth_error(context_name, body);
    }

    spdlog::debug("[Token Authority] Minted {} token {}", context_name, redact(token));
    AccessToken access;
    access.value = std::move(token);
    access.context = context;
    return DeviceResult<AccessToken>::success(std::move(access));
}

DeviceResult<bool> TokenAuthority::probe() const {
    auto reply = http_->get(AUTH_PATH, {});
    if (!reply) {
        return reply.error();
    }

    bool valid = false;
    try {
        json body = json::parse(reply.value().body);
        valid = body.is_object() && body.contains("status");
    } catch (const json::parse_error&) {
        valid = false;
    }

    spdlog::debug("[Token Authority] Probe: {}", valid ? "device responded" : "not a device");
    return DeviceResult<bool>::success(valid);
}

} // namespace printlink
