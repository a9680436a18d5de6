// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef PRINTLINK_DEVICE_TRANSPORT_H
#define PRINTLINK_DEVICE_TRANSPORT_H

#include "device_error.h"
#include "rpc_frame.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "hv/json.hpp"

namespace printlink {

/**
 * @brief Tunables for the JSON-RPC command socket
 */
struct TransportSettings {
    uint32_t connect_timeout_ms = 5000;          ///< TCP connect timeout
    uint32_t read_timeout_ms = 10000;            ///< Per-read timeout; 0 = OS default
    size_t max_frame_bytes = 5 * 1024 * 1024;    ///< Largest accepted response
    size_t read_chunk_bytes = 4096;              ///< Bytes requested per recv()
    bool newline_framing = true;                 ///< Terminate requests with '\n'
};

/**
 * @brief One half-duplex JSON-RPC connection to the device
 *
 * Strictly one request in flight: request() writes a frame and blocks until
 * one complete JSON response is decoded. Instances are single-use per
 * logical operation and are not thread-safe.
 *
 * Virtual so tests can substitute a scripted transport.
 */
class DeviceTransport {
  public:
    virtual ~DeviceTransport() = default;

    /**
     * @brief Establish the TCP stream
     *
     * @return Error with type NONE on success, CONNECT_ERROR otherwise
     */
    virtual DeviceError open(const std::string& host, uint16_t port) = 0;

    /**
     * @brief Send one request and wait for its response
     *
     * @param method RPC method name
     * @param params Object parameters, or null (sent as "params":null)
     * @return Parsed response, CONNECT_ERROR if not open, PROTOCOL_ERROR on
     *         write failure, timeout, peer close or undecodable bytes
     */
    virtual DeviceResult<json> request(const std::string& method, const json& params) = 0;

    /// Release the socket. Idempotent.
    virtual void close() = 0;

    virtual bool is_open() const = 0;
};

/// Creates a fresh, unopened transport for each logical operation.
using TransportFactory = std::function<std::unique_ptr<DeviceTransport>()>;

/**
 * @brief Blocking TCP transport built on libhv socket helpers
 */
class SocketTransport : public DeviceTransport {
  public:
    explicit SocketTransport(TransportSettings settings = {});
    ~SocketTransport() override;

    // Owns a file descriptor
    SocketTransport(const SocketTransport&) = delete;
    SocketTransport& operator=(const SocketTransport&) = delete;

    DeviceError open(const std::string& host, uint16_t port) override;
    DeviceResult<json> request(const std::string& method, const json& params) override;
    void close() override;

    bool is_open() const override {
        return fd_ >= 0;
    }

    /// Factory producing SocketTransports with the given settings
    static TransportFactory factory(TransportSettings settings);

  private:
    DeviceError write_all(const std::string& frame, const std::string& method);

    /// Read whatever is already queued without blocking and drop complete
    /// values; none of them can answer a request not yet written
    void discard_unsolicited();

    TransportSettings settings_;
    JsonFrameDecoder decoder_;
    int fd_ = -1;
    std::string peer_;
};

} // namespace printlink

#endif // PRINTLINK_DEVICE_TRANSPORT_H
