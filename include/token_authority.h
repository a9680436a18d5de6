// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef PRINTLINK_TOKEN_AUTHORITY_H
#define PRINTLINK_TOKEN_AUTHORITY_H

#include "device_error.h"
#include "device_types.h"
#include "http_channel.h"
#include "retry_policy.h"

#include <atomic>
#include <memory>
#include <string>

#include "hv/json.hpp"

namespace printlink {

/// Endpoint serving every step of the handshake
constexpr const char* AUTH_PATH = "/auth";

/**
 * @brief Device-authorization handshake and access-token minting over HTTP
 *
 * Pairing is a two-step flow: request a pairing code, then poll until the
 * user confirms on the printer (e.g. presses the knob). The device never
 * pushes the answer, so polling is bounded by the acceptance policy
 * (200 attempts, 1 s apart by default).
 *
 * Access tokens are minted per connection from the long-lived
 * AuthorizationCode and never cached here.
 *
 * Thread safety: state() may be read from any thread. The flow itself is
 * blocking and meant to run on one thread at a time.
 */
class TokenAuthority {
  public:
    static RetryPolicy default_acceptance_policy() {
        return RetryPolicy::bounded(200, std::chrono::milliseconds(1000));
    }

    /**
     * @param http Channel to the device's HTTP port
     * @param identity Client credentials sent with every request
     * @param acceptance_poll Spacing and ceiling for the user-acceptance poll
     * @param sleeper Wait used between poll attempts
     */
    TokenAuthority(std::shared_ptr<HttpChannel> http, ClientIdentity identity,
                   RetryPolicy acceptance_poll = default_acceptance_policy(),
                   Sleeper sleeper = default_sleeper());

    TokenAuthority(const TokenAuthority&) = delete;
    TokenAuthority& operator=(const TokenAuthority&) = delete;

    /**
     * @brief Request a pairing code (response_type=code)
     *
     * @return Pairing handle; HTTP_ERROR if the reply lacks answer_code
     */
    DeviceResult<PairingHandle> begin_authorization();

    /**
     * @brief Poll response_type=answer until the user accepts
     *
     * CONNECT_ERROR aborts the poll. Malformed replies count as "not yet".
     *
     * @return AuthorizationCode from the accepting reply, or
     *         AUTHORIZATION_TIMEOUT once the attempt ceiling is reached
     */
    DeviceResult<AuthorizationCode> poll_for_acceptance(const PairingHandle& handle,
                                                        const CancellationToken* cancel = nullptr);

    /// begin_authorization() followed by poll_for_acceptance()
    DeviceResult<AuthorizationCode> authorize(const CancellationToken* cancel = nullptr);

    /**
     * @brief Mint a single-use access token (response_type=token)
     *
     * @return Token when the reply has status "success"; AUTH_ERROR for any
     *         other reply; NOT_AUTHORIZED when code is empty
     */
    DeviceResult<AccessToken> mint_access_token(const AuthorizationCode& code,
                                                TokenContext context) const;

    /**
     * @brief Reachability probe: GET /auth without parameters
     *
     * @return true when the reply carries a "status" field (a real device)
     */
    DeviceResult<bool> probe() const;

    /// Record that a previously obtained code is in use (no flow was run)
    void mark_authorized();

    AuthorizationState state() const {
        return state_.load();
    }

    const ClientIdentity& identity() const {
        return identity_;
    }

    const RetryPolicy& acceptance_policy() const {
        return acceptance_poll_;
    }

    HttpChannel& http() const {
        return *http_;
    }

  private:
    /// GET /auth and parse the body as a JSON object
    DeviceResult<json> get_auth(const QueryParams& query, const std::string& step) const;

    void set_state(AuthorizationState new_state);

    std::shared_ptr<HttpChannel> http_;
    ClientIdentity identity_;
    RetryPolicy acceptance_poll_;
    Sleeper sleeper_;
    std::atomic<AuthorizationState> state_{AuthorizationState::UNAUTHENTICATED};
};

} // namespace printlink

#endif // PRINTLINK_TOKEN_AUTHORITY_H
