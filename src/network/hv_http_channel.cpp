// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file hv_http_channel.cpp
 * @brief Synchronous HTTP GET channel for the authorization handshake
 *
 * The device serves plain HTTP only. Every request carries the configured
 * connect/read timeout; a missing reply maps to CONNECT_ERROR.
 */

#include "http_channel.h"

#include "hv/hurl.h"
#include "hv/requests.h"
#include "spdlog/spdlog.h"

#include <utility>

namespace printlink {

std::string build_query_string(const QueryParams& query) {
    std::string out;
    for (const auto& [key, value] : query) {
        if (!out.empty()) {
            out += '&';
        }
        out += HUrl::escape(key);
        out += '=';
        out += HUrl::escape(value);
    }
    return out;
}

HvHttpChannel::HvHttpChannel(std::string base_url, int timeout_sec)
    : base_url_(std::move(base_url)), timeout_sec_(timeout_sec) {
    // Tolerate a trailing slash in configured base URLs
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

std::string HvHttpChannel::url_for(const std::string& path) const {
    if (path.empty() || path[0] != '/') {
        return base_url_ + "/" + path;
    }
    return base_url_ + path;
}

DeviceResult<HttpReply> HvHttpChannel::get(const std::string& path, const QueryParams& query) {
    std::string url = url_for(path);
    if (!query.empty()) {
        url += "?" + build_query_string(query);
    }

    // Query strings carry secrets, log the path only
    spdlog::debug("[HTTP Channel] GET {}{}", url_for(path), query.empty() ? "" : "?...");

    auto req = std::make_shared<HttpRequest>();
    req->method = HTTP_GET;
    req->url = url;
    req->timeout = timeout_sec_;
    req->connect_timeout = timeout_sec_;

    auto resp = requests::request(req);
    if (!resp) {
        spdlog::error("[HTTP Channel] GET {} failed (no response)", url_for(path));
        return DeviceError::connect_error("no HTTP response from " + base_url_, path);
    }

    HttpReply reply;
    reply.status_code = static_cast<int>(resp->status_code);
    reply.body = resp->body;

    spdlog::trace("[HTTP Channel] GET {} -> HTTP {} ({} bytes)", url_for(path),
                  reply.status_code, reply.body.size());
    return DeviceResult<HttpReply>::success(std::move(reply));
}

} // namespace printlink
