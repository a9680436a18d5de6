// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file device_session.cpp
 * @brief Open -> authenticate -> call -> close template for every device operation
 *
 * @pattern RAII connection guard; bounded echo polling via poll_until()
 * @threading Blocking; auth code guarded by code_mutex_
 * @gotchas A response carrying `method` means "still processing", not an error.
 * Never reuse a connection or token across operations.
 *
 * @see token_authority.cpp, socket_transport.cpp
 */

#include "device_session.h"

#include "http_channel.h"
#include "spdlog/spdlog.h"

#include <exception>
#include <utility>

namespace printlink {

namespace {

/**
 * @brief Closes the transport when the operation scope ends
 *
 * close() runs even when open() failed, so every opened transport sees
 * exactly one close.
 */
class ScopedConnection {
  public:
    explicit ScopedConnection(std::unique_ptr<DeviceTransport> transport)
        : transport_(std::move(transport)) {}

    ~ScopedConnection() {
        if (transport_ && opened_) {
            transport_->close();
        }
    }

    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

    DeviceError open(const std::string& host, uint16_t port) {
        opened_ = true;
        return transport_->open(host, port);
    }

    DeviceTransport& get() {
        return *transport_;
    }

  private:
    std::unique_ptr<DeviceTransport> transport_;
    bool opened_ = false;
};

} // namespace

DeviceSession::DeviceSession(SessionConfig config, std::shared_ptr<TokenAuthority> authority,
                             TransportFactory transport_factory, Sleeper sleeper)
    : config_(std::move(config)), authority_(std::move(authority)),
      transport_factory_(std::move(transport_factory)),
      sleeper_(sleeper ? std::move(sleeper) : default_sleeper()) {}

std::unique_ptr<DeviceSession> DeviceSession::create(const SessionConfig& config) {
    auto http = std::make_shared<HvHttpChannel>(config.address.http_base_url(),
                                                config.http_timeout_sec);
    auto authority =
        std::make_shared<TokenAuthority>(http, config.identity, config.acceptance_poll);
    return std::make_unique<DeviceSession>(config, std::move(authority),
                                           SocketTransport::factory(config.transport));
}

// ============================================================================
// Authorization
// ============================================================================

DeviceResult<AuthorizationCode> DeviceSession::authorize(const CancellationToken* cancel) {
    auto code = authority_->authorize(cancel);
    if (!code) {
        spdlog::error("[Device Session] Pairing failed: {}", code.error().message);
        return code;
    }

    {
        std::lock_guard<std::mutex> lock(code_mutex_);
        auth_code_ = code.value();
    }
    spdlog::info("[Device Session] Paired with {}", config_.address.host);
    return code;
}

DeviceResult<bool> DeviceSession::set_authorization_code(const AuthorizationCode& code,
                                                         const CancellationToken* cancel) {
    if (code.empty()) {
        return DeviceError::invalid_argument("authorization code is empty");
    }

    auto verified = run_on_connection(
        code, [](DeviceTransport&) { return DeviceResult<json>::success(json::object()); },
        cancel);
    if (!verified) {
        spdlog::warn("[Device Session] Supplied authorization code rejected: {}",
                     verified.error().message);
        return verified.error();
    }

    {
        std::lock_guard<std::mutex> lock(code_mutex_);
        auth_code_ = code;
    }
    authority_->mark_authorized();
    spdlog::info("[Device Session] Authorization code installed");
    return DeviceResult<bool>::success(true);
}

bool DeviceSession::has_authorization_code() const {
    std::lock_guard<std::mutex> lock(code_mutex_);
    return !auth_code_.empty();
}

AuthorizationCode DeviceSession::authorization_code() const {
    std::lock_guard<std::mutex> lock(code_mutex_);
    return auth_code_;
}

DeviceResult<bool> DeviceSession::is_authenticated() const {
    AuthorizationCode code = authorization_code();
    if (code.empty()) {
        return DeviceResult<bool>::success(false);
    }

    auto token = authority_->mint_access_token(code, TokenContext::JSONRPC);
    if (token) {
        return DeviceResult<bool>::success(true);
    }
    if (token.error().type == DeviceErrorType::AUTH_ERROR) {
        return DeviceResult<bool>::success(false);
    }
    return token.error();
}

DeviceResult<bool> DeviceSession::validate_address() const {
    return authority_->probe();
}

// ============================================================================
// Connection template
// ============================================================================

DeviceError DeviceSession::authenticate(DeviceTransport& transport, const AuthorizationCode& code,
                                        const CancellationToken* cancel) {
    auto token = authority_->mint_access_token(code, TokenContext::JSONRPC);
    if (!token) {
        if (token.error().type == DeviceErrorType::AUTH_ERROR) {
            return DeviceError::authentication_failed(
                "no access token for connection: " + token.error().message,
                token.error().details);
        }
        return token.error();
    }

    auto reply = request(transport, "authenticate", {{"access_token", token.value().value}},
                         cancel);
    if (!reply) {
        // Only a JSON-RPC error object counts as rejection; transport faults pass through
        if (reply.error().type == DeviceErrorType::PROTOCOL_ERROR &&
            !reply.error().details.is_null()) {
            return DeviceError::authentication_failed(
                "device rejected authenticate: " + reply.error().message, reply.error().details);
        }
        return reply.error();
    }

    spdlog::debug("[Device Session] Connection authenticated");
    return DeviceError{};
}

DeviceResult<json> DeviceSession::run_on_connection(const AuthorizationCode& code,
                                                    const ConnectionBody& body,
                                                    const CancellationToken* cancel) {
    if (code.empty()) {
        return DeviceError::not_authorized();
    }
    if (cancel && cancel->is_cancelled()) {
        return DeviceError::cancelled();
    }

    std::unique_ptr<DeviceTransport> transport;
    if (transport_factory_) {
        transport = transport_factory_();
    }
    if (!transport) {
        return DeviceError::connect_error("no transport available");
    }
    ScopedConnection conn(std::move(transport));

    DeviceError open_err = conn.open(config_.address.host, config_.address.rpc_port);
    if (open_err.has_error()) {
        return open_err;
    }

    DeviceError auth_err = authenticate(conn.get(), code, cancel);
    if (auth_err.has_error()) {
        spdlog::error("[Device Session] Authentication failed: {}", auth_err.message);
        return auth_err;
    }

    try {
        return body(conn.get());
    } catch (const json::exception& e) {
        spdlog::error("[Device Session] Unexpected response shape: {}", e.what());
        return DeviceError::protocol_error(e.what());
    } catch (const std::exception& e) {
        spdlog::error("[Device Session] Connection body threw: {}", e.what());
        return DeviceError::protocol_error(e.what());
    }
}

DeviceResult<json> DeviceSession::with_connection(const ConnectionBody& body,
                                                  const CancellationToken* cancel) {
    return run_on_connection(authorization_code(), body, cancel);
}

DeviceResult<json> DeviceSession::request(DeviceTransport& transport, const std::string& method,
                                          const json& params, const CancellationToken* cancel) {
    if (cancel && cancel->is_cancelled()) {
        return DeviceError::cancelled(method);
    }

    auto reply = transport.request(method, params);
    if (!reply) {
        return reply;
    }

    const json& body = reply.value();
    if (!body.is_object()) {
        return DeviceError::protocol_error("response is not a JSON object", method);
    }
    if (body.contains("error") && !body["error"].is_null()) {
        spdlog::warn("[Device Session] {} returned error: {}", method, body["error"].dump());
        return DeviceError::from_json_rpc(body["error"], method);
    }
    return reply;
}

DeviceResult<json> DeviceSession::request_until_complete(DeviceTransport& transport,
                                                         const std::string& method,
                                                         const json& params,
                                                         const CancellationToken* cancel) {
    return poll_until<json>(
        config_.echo_poll,
        [&](int attempt) {
            if (attempt > 1) {
                spdlog::trace("[Device Session] {} still processing, re-issuing (attempt {})",
                              method, attempt);
            }
            return request(transport, method, params, cancel);
        },
        [](const json& response) { return !is_method_echo(response); },
        [&method](int attempts) {
            spdlog::warn("[Device Session] {} still processing after {} attempts, giving up",
                         method, attempts);
            return DeviceError::poll_limit(method, attempts);
        },
        cancel, sleeper_);
}

DeviceResult<json> DeviceSession::call(const std::string& method, const json& params,
                                       const CallOptions& options,
                                       const CancellationToken* cancel) {
    spdlog::debug("[Device Session] {}{}", method,
                  options.process_method.empty() ? "" : " (after process_method)");

    return with_connection(
        [&](DeviceTransport& transport) -> DeviceResult<json> {
            if (!options.process_method.empty()) {
                auto prep = request(transport, "process_method",
                                    {{"method", options.process_method}}, cancel);
                if (!prep) {
                    return prep;
                }
            }

            if (options.poll_method_echo) {
                return request_until_complete(transport, method, params, cancel);
            }
            return request(transport, method, params, cancel);
        },
        cancel);
}

DeviceError DeviceSession::wait(std::chrono::milliseconds duration,
                                const CancellationToken* cancel) const {
    try {
        if (!wait_for(sleeper_, duration, cancel)) {
            return DeviceError::cancelled();
        }
    } catch (const std::exception& e) {
        spdlog::error("[Device Session] Wait of {}ms failed: {}", duration.count(), e.what());
        return DeviceError::protocol_error(std::string("wait failed: ") + e.what());
    }
    return DeviceError{};
}

} // namespace printlink
