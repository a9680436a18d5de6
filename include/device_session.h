// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef PRINTLINK_DEVICE_SESSION_H
#define PRINTLINK_DEVICE_SESSION_H

#include "device_error.h"
#include "device_transport.h"
#include "device_types.h"
#include "retry_policy.h"
#include "session_config.h"
#include "token_authority.h"

#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "hv/json.hpp"

namespace printlink {

/**
 * @brief Per-call options for DeviceSession::call()
 */
struct CallOptions {
    /// When set, "process_method" {method: <this>} is sent before the command.
    /// Required by operations that change the device's process state.
    std::string process_method;

    /// Re-issue the call while the device echoes `method` ("still processing")
    bool poll_method_echo = false;
};

/**
 * @brief Connection-per-operation JSON-RPC session with the printer
 *
 * Every operation follows the same template:
 *   1. open a new transport connection
 *   2. mint a fresh jsonrpc access token and send "authenticate"
 *   3. send the operation's RPC call(s) in order
 *   4. optionally re-issue while the device echoes the method
 *   5. close the connection on every path
 *
 * Connections and tokens are never reused across operations: the device
 * accepts one token per connection.
 *
 * Thread safety: the held AuthorizationCode is guarded by a mutex, so one
 * session may be shared across threads. Each operation still blocks its
 * caller, and whether the device accepts concurrent authenticated
 * connections is unverified.
 */
class DeviceSession {
  public:
    using ConnectionBody = std::function<DeviceResult<json>(DeviceTransport&)>;

    /**
     * @param config Immutable settings
     * @param authority Pairing and token source (shared with callers that pair)
     * @param transport_factory Produces one unopened transport per operation
     * @param sleeper Wait used for echo polling and recovery settle times
     */
    DeviceSession(SessionConfig config, std::shared_ptr<TokenAuthority> authority,
                  TransportFactory transport_factory, Sleeper sleeper = default_sleeper());

    DeviceSession(const DeviceSession&) = delete;
    DeviceSession& operator=(const DeviceSession&) = delete;

    /**
     * @brief Session wired to the real device (libhv HTTP + TCP socket)
     */
    static std::unique_ptr<DeviceSession> create(const SessionConfig& config);

    // ========================================================================
    // Authorization
    // ========================================================================

    /**
     * @brief Run the full pairing flow and keep the resulting code
     *
     * Blocks until the user accepts on the printer or the acceptance
     * ceiling is reached.
     */
    DeviceResult<AuthorizationCode> authorize(const CancellationToken* cancel = nullptr);

    /**
     * @brief Install a code obtained earlier and verify it
     *
     * Opens one connection and authenticates. The code is kept only if
     * authentication succeeds.
     */
    DeviceResult<bool> set_authorization_code(const AuthorizationCode& code,
                                              const CancellationToken* cancel = nullptr);

    bool has_authorization_code() const;

    /// Copy of the held code (empty if not paired)
    AuthorizationCode authorization_code() const;

    /**
     * @brief True if the device currently mints tokens for the held code
     *
     * AUTH_ERROR is reported as false; unreachable device is an error.
     */
    DeviceResult<bool> is_authenticated() const;

    /// Reachability probe of the HTTP channel (GET /auth)
    DeviceResult<bool> validate_address() const;

    // ========================================================================
    // Operations
    // ========================================================================

    /**
     * @brief Authenticated single-command operation
     *
     * @param method RPC method
     * @param params Object parameters or null
     * @param options Optional process_method preamble and echo polling
     * @return Final device response
     */
    DeviceResult<json> call(const std::string& method, const json& params = nullptr,
                            const CallOptions& options = {},
                            const CancellationToken* cancel = nullptr);

    /**
     * @brief Run a custom sequence on one authenticated connection
     *
     * Opens, authenticates, invokes body, and closes regardless of outcome.
     */
    DeviceResult<json> with_connection(const ConnectionBody& body,
                                       const CancellationToken* cancel = nullptr);

    /**
     * @brief Send one RPC on an open connection, surfacing JSON-RPC errors
     */
    DeviceResult<json> request(DeviceTransport& transport, const std::string& method,
                               const json& params, const CancellationToken* cancel = nullptr);

    /**
     * @brief Send an RPC and re-issue it while the device echoes the method
     *
     * Bounded by SessionConfig::echo_poll; exceeding it yields
     * POLL_LIMIT_EXCEEDED.
     */
    DeviceResult<json> request_until_complete(DeviceTransport& transport,
                                              const std::string& method, const json& params,
                                              const CancellationToken* cancel = nullptr);

    /**
     * @brief Block for a settle time, waking early on cancellation
     *
     * @return CANCELLED if cancelled, PROTOCOL_ERROR if the sleeper throws
     */
    DeviceError wait(std::chrono::milliseconds duration, const CancellationToken* cancel = nullptr) const;

    const SessionConfig& config() const {
        return config_;
    }

    TokenAuthority& authority() const {
        return *authority_;
    }

  private:
    DeviceError authenticate(DeviceTransport& transport, const AuthorizationCode& code,
                             const CancellationToken* cancel);

    DeviceResult<json> run_on_connection(const AuthorizationCode& code, const ConnectionBody& body,
                                         const CancellationToken* cancel);

    const SessionConfig config_;
    std::shared_ptr<TokenAuthority> authority_;
    TransportFactory transport_factory_;
    Sleeper sleeper_;

    mutable std::mutex code_mutex_;
    AuthorizationCode auth_code_;
};

} // namespace printlink

#endif // PRINTLINK_DEVICE_SESSION_H
