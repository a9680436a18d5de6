// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file rpc_frame.cpp
 * @brief JSON-RPC envelope construction and stream framing for the command socket
 */

#include "rpc_frame.h"

#include "device_types.h"

#include "spdlog/spdlog.h"

#include <stdexcept>
#include <utility>

namespace printlink {

namespace {

bool is_json_whitespace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

} // namespace

RpcRequest::RpcRequest(std::string method_name, json request_params)
    : method(std::move(method_name)), params(std::move(request_params)) {}

json RpcRequest::to_json() const {
    json rpc;
    rpc["jsonrpc"] = "2.0";
    rpc["id"] = RPC_SENTINEL_ID;

    // Trim surrounding whitespace from method names passed through by callers
    const auto first = method.find_first_not_of(" \t\r\n");
    const auto last = method.find_last_not_of(" \t\r\n");
    rpc["method"] = (first == std::string::npos) ? "" : method.substr(first, last - first + 1);

    // params is always sent, null included
    rpc["params"] = params;
    return rpc;
}

json RpcRequest::to_log_json() const {
    json rpc = to_json();
    json& p = rpc["params"];
    if (p.is_object() && p.contains("access_token") && p["access_token"].is_string()) {
        p["access_token"] = redact(p["access_token"].get<std::string>());
    }
    return rpc;
}

std::string RpcRequest::serialize(bool newline_framing) const {
    std::string frame = to_json().dump();
    if (newline_framing) {
        frame += '\n';
    }
    return frame;
}

bool is_method_echo(const json& response) {
    return response.is_object() && response.contains("method");
}

// ============================================================================
// JsonFrameDecoder
// ============================================================================

JsonFrameDecoder::JsonFrameDecoder(size_t max_frame_bytes) : max_frame_bytes_(max_frame_bytes) {}

void JsonFrameDecoder::feed(const char* data, size_t len) {
    buffer_.append(data, len);
}

void JsonFrameDecoder::reset() {
    buffer_.clear();
    reset_scan();
}

void JsonFrameDecoder::reset_scan() {
    scan_pos_ = 0;
    depth_ = 0;
    in_string_ = false;
    escaped_ = false;
}

size_t JsonFrameDecoder::scan_complete_value() {
    // Resume where the previous call stopped; bytes before scan_pos_ are already counted
    for (; scan_pos_ < buffer_.size(); ++scan_pos_) {
        const char c = buffer_[scan_pos_];

        if (in_string_) {
            if (escaped_) {
                escaped_ = false;
            } else if (c == '\\') {
                escaped_ = true;
            } else if (c == '"') {
                in_string_ = false;
            }
            continue;
        }

        switch (c) {
        case '"':
            in_string_ = true;
            break;
        case '{':
        case '[':
            ++depth_;
            break;
        case '}':
        case ']':
            --depth_;
            if (depth_ == 0) {
                return scan_pos_ + 1;
            }
            if (depth_ < 0) {
                reset();
                throw std::runtime_error("unbalanced closing bracket in device response");
            }
            break;
        default:
            break;
        }
    }
    return std::string::npos;
}

std::optional<json> JsonFrameDecoder::next() {
    if (scan_pos_ == 0) {
        size_t start = 0;
        while (start < buffer_.size() && is_json_whitespace(buffer_[start])) {
            ++start;
        }
        if (start > 0) {
            buffer_.erase(0, start);
        }
        if (buffer_.empty()) {
            return std::nullopt;
        }

        if (buffer_[0] != '{' && buffer_[0] != '[') {
            std::string preview = buffer_.substr(0, 32);
            reset();
            throw std::runtime_error("device response does not start with a JSON object: '" +
                                     preview + "'");
        }
    }

    const size_t end = scan_complete_value();
    const size_t frame_bytes = (end == std::string::npos) ? buffer_.size() : end;
    if (frame_bytes > max_frame_bytes_) {
        reset();
        throw std::runtime_error("device response exceeds " + std::to_string(max_frame_bytes_) +
                                 " bytes (" + std::to_string(frame_bytes) + " buffered)");
    }
    if (end == std::string::npos) {
        spdlog::trace("[Frame Decoder] Incomplete value, {} bytes buffered", buffer_.size());
        return std::nullopt;
    }

    std::string frame = buffer_.substr(0, end);
    buffer_.erase(0, end);
    reset_scan();

    try {
        return json::parse(frame);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("unparseable device response: ") + e.what());
    }
}

} // namespace printlink
