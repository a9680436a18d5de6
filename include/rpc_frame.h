// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "hv/json.hpp"

namespace printlink {

using json = nlohmann::json;

/// Fixed request id; the socket is half-duplex so ids are never used for correlation.
constexpr int RPC_SENTINEL_ID = -1;

/**
 * @brief JSON-RPC request envelope sent on the command socket
 *
 * Serializes as {"jsonrpc":"2.0","id":-1,"method":...,"params":...}.
 * Unlike standard JSON-RPC clients, params is always present, including as null.
 */
struct RpcRequest {
    std::string method;
    json params; ///< Object or null

    RpcRequest() = default;
    RpcRequest(std::string method_name, json request_params = nullptr);

    /// Envelope as a JSON object
    json to_json() const;

    /// Envelope with credential params (access_token) redacted, for logging
    json to_log_json() const;

    /**
     * @brief Compact wire form of the request
     *
     * @param newline_framing Append '\n' after the JSON document
     */
    std::string serialize(bool newline_framing = true) const;
};

/**
 * @brief True when a response repeats the invoked method
 *
 * The device answers "still processing, re-issue the call" by echoing a
 * `method` field. This is not a JSON-RPC error.
 */
bool is_method_echo(const json& response);

/**
 * @brief Incremental decoder for JSON values arriving on a byte stream
 *
 * The device does not delimit responses, and a response may span several
 * reads. feed() accumulates bytes; next() extracts the first complete
 * top-level value (object or array) by tracking nesting depth outside
 * string literals. Leading whitespace and newlines between values are
 * skipped. Remaining bytes stay buffered for the following response.
 * Scan state persists across calls, so each byte is examined once. The
 * size limit applies to complete and incomplete values alike.
 */
class JsonFrameDecoder {
  public:
    explicit JsonFrameDecoder(size_t max_frame_bytes = 5 * 1024 * 1024);

    void feed(const char* data, size_t len);
    void feed(const std::string& data) {
        feed(data.data(), data.size());
    }

    /**
     * @brief Extract the next complete JSON value
     *
     * @return Parsed value, or nullopt when more bytes are needed
     * @throws std::runtime_error when the buffer holds an unparseable value,
     *         starts with a non-JSON byte, or exceeds max_frame_bytes
     */
    std::optional<json> next();

    /// Bytes received but not yet consumed
    size_t buffered() const {
        return buffer_.size();
    }

    void reset();

  private:
    /// Index one past the end of the first complete value, or npos
    size_t scan_complete_value();
    void reset_scan();

    std::string buffer_;
    size_t max_frame_bytes_;

    size_t scan_pos_ = 0;
    int depth_ = 0;
    bool in_string_ = false;
    bool escaped_ = false;
};

} // namespace printlink
