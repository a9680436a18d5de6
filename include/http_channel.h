// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "device_error.h"

#include <string>
#include <utility>
#include <vector>

namespace printlink {

/// Ordered query parameters; order is preserved on the wire.
using QueryParams = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Raw reply from the device's HTTP channel
 */
struct HttpReply {
    int status_code = 0;
    std::string body;

    bool is_success() const {
        return status_code >= 200 && status_code < 300;
    }
};

/**
 * @brief Percent-encode and join query parameters ("a=1&b=x%20y")
 */
std::string build_query_string(const QueryParams& query);

/**
 * @brief Plain-HTTP GET channel to the device
 *
 * Used for the device-authorization handshake and static file retrieval.
 * Virtual so tests can script replies without a network.
 */
class HttpChannel {
  public:
    virtual ~HttpChannel() = default;

    /**
     * @brief Blocking GET of base_url + path + "?" + query
     *
     * @return Reply for any HTTP status; CONNECT_ERROR when no reply arrived
     */
    virtual DeviceResult<HttpReply> get(const std::string& path, const QueryParams& query) = 0;

    /// Absolute URL for a device path (used when reporting file locations)
    virtual std::string url_for(const std::string& path) const = 0;
};

/**
 * @brief HttpChannel backed by libhv's synchronous requests API
 */
class HvHttpChannel : public HttpChannel {
  public:
    /**
     * @param base_url e.g. "http://192.168.1.20"
     * @param timeout_sec Connect and read timeout applied to every request
     */
    HvHttpChannel(std::string base_url, int timeout_sec = 5);

    DeviceResult<HttpReply> get(const std::string& path, const QueryParams& query) override;
    std::string url_for(const std::string& path) const override;

  private:
    std::string base_url_;
    int timeout_sec_;
};

} // namespace printlink
