// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file socket_transport.cpp
 * @brief Blocking JSON-RPC socket to the printer's command port
 *
 * @pattern libhv hsocket helpers (ConnectTimeout, so_rcvtimeo) over a plain fd
 * @threading Blocks the calling thread; one request in flight per instance
 * @gotchas Device never delimits responses; JsonFrameDecoder finds the end of
 * each value, so a response may arrive across many recv() calls
 */

#include "device_transport.h"

#include "hv/hsocket.h"
#include "spdlog/spdlog.h"

#include <cerrno>
#include <cstdio>
#include <stdexcept>
#include <vector>

#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace printlink {

SocketTransport::SocketTransport(TransportSettings settings)
    : settings_(settings), decoder_(settings.max_frame_bytes) {}

SocketTransport::~SocketTransport() {
    if (fd_ >= 0) {
        // Destructor path: avoid spdlog during static destruction
        fprintf(stderr, "[Device Transport] Closing socket left open at destruction\n");
        closesocket(fd_);
        fd_ = -1;
    }
}

TransportFactory SocketTransport::factory(TransportSettings settings) {
    return [settings]() { return std::make_unique<SocketTransport>(settings); };
}

DeviceError SocketTransport::open(const std::string& host, uint16_t port) {
    if (fd_ >= 0) {
        spdlog::warn("[Device Transport] open() on an open connection to {}, reconnecting",
                     peer_);
        close();
    }

    peer_ = host + ":" + std::to_string(port);
    decoder_.reset();

    if (host.empty()) {
        return DeviceError::connect_error("no device host configured");
    }

    spdlog::debug("[Device Transport] Connecting to {} (timeout {}ms)", peer_,
                  settings_.connect_timeout_ms);

    int fd = ConnectTimeout(host.c_str(), port, static_cast<int>(settings_.connect_timeout_ms));
    if (fd < 0) {
        std::string reason = socket_strerror(-fd);
        spdlog::error("[Device Transport] Connect to {} failed: {}", peer_, reason);
        return DeviceError::connect_error(peer_ + ": " + reason);
    }

    if (settings_.read_timeout_ms > 0) {
        so_rcvtimeo(fd, static_cast<int>(settings_.read_timeout_ms));
        so_sndtimeo(fd, static_cast<int>(settings_.read_timeout_ms));
    }

    fd_ = fd;
    spdlog::debug("[Device Transport] Connected to {}", peer_);
    return DeviceError{};
}

void SocketTransport::close() {
    if (fd_ < 0) {
        return;
    }
    spdlog::debug("[Device Transport] Closing connection to {}", peer_);
    closesocket(fd_);
    fd_ = -1;
    decoder_.reset();
}

DeviceError SocketTransport::write_all(const std::string& frame, const std::string& method) {
    size_t sent = 0;
    while (sent < frame.size()) {
        ssize_t n = ::send(fd_, frame.data() + sent, frame.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::string reason = socket_strerror(errno);
            spdlog::error("[Device Transport] Write of {} to {} failed: {}", method, peer_,
                          reason);
            return DeviceError::protocol_error("write failed: " + reason, method);
        }
        sent += static_cast<size_t>(n);
    }
    return DeviceError{};
}

void SocketTransport::discard_unsolicited() {
    char chunk[1024];
    while (true) {
        ssize_t n = ::recv(fd_, chunk, sizeof(chunk), MSG_DONTWAIT);
        if (n > 0) {
            decoder_.feed(chunk, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        // EAGAIN, peer close or error: the blocking read below reports the latter two
        break;
    }

    while (auto stale = decoder_.next()) {
        spdlog::debug("[Device Transport] Discarding unsolicited frame from {}: {}", peer_,
                      stale->dump());
    }
}

DeviceResult<json> SocketTransport::request(const std::string& method, const json& params) {
    if (fd_ < 0) {
        return DeviceError::connect_error("transport not open", method);
    }

    RpcRequest rpc(method, params);
    const std::string frame = rpc.serialize(settings_.newline_framing);

    // A value still in progress before the write cannot be this request's reply
    bool stale_partial = false;
    try {
        discard_unsolicited();
        stale_partial = decoder_.buffered() > 0;
    } catch (const std::runtime_error& e) {
        spdlog::warn("[Device Transport] Dropping unreadable bytes from {}: {}", peer_, e.what());
        decoder_.reset();
    }

    spdlog::trace("[Device Transport] send: {}", rpc.to_log_json().dump());

    DeviceError write_err = write_all(frame, method);
    if (write_err.has_error()) {
        return write_err;
    }

    std::vector<char> chunk(settings_.read_chunk_bytes > 0 ? settings_.read_chunk_bytes : 2048);

    try {
        while (true) {
            ssize_t n = ::recv(fd_, chunk.data(), chunk.size(), 0);
            if (n == 0) {
                spdlog::error("[Device Transport] {} closed the connection during {}", peer_,
                              method);
                return DeviceError::protocol_error("connection closed by device", method);
            }
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    spdlog::error("[Device Transport] No response to {} within {}ms", method,
                                  settings_.read_timeout_ms);
                    return DeviceError::protocol_error(
                        "read timed out after " + std::to_string(settings_.read_timeout_ms) +
                            "ms",
                        method);
                }
                std::string reason = socket_strerror(errno);
                spdlog::error("[Device Transport] Read from {} failed: {}", peer_, reason);
                return DeviceError::protocol_error("read failed: " + reason, method);
            }

            decoder_.feed(chunk.data(), static_cast<size_t>(n));
            while (auto response = decoder_.next()) {
                if (stale_partial) {
                    stale_partial = false;
                    spdlog::debug("[Device Transport] Discarding unsolicited frame from {}: {}",
                                  peer_, response->dump());
                    continue;
                }
                spdlog::trace("[Device Transport] recv: {}", response->dump());
                return DeviceResult<json>::success(std::move(*response));
            }
        }
    } catch (const std::runtime_error& e) {
        spdlog::error("[Device Transport] Bad response to {}: {}", method, e.what());
        return DeviceError::protocol_error(e.what(), method);
    }
}

} // namespace printlink
