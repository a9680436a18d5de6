// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "device_transport.h"
#include "device_types.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include "spdlog/sinks/ostream_sink.h"
#include "spdlog/spdlog.h"

using namespace printlink;
using namespace std::chrono;

/**
 * SocketTransport tests against a loopback device
 *
 * LoopbackDevice accepts one connection on 127.0.0.1, decodes each request
 * with JsonFrameDecoder (so newline framing is optional) and hands it to a
 * scripted handler that writes raw bytes back. Returning false from the
 * handler closes the connection.
 */

namespace {

void send_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            return;
        }
        sent += static_cast<size_t>(n);
    }
}

class LoopbackDevice {
  public:
    using Handler = std::function<bool(int fd, const json& request)>;

    explicit LoopbackDevice(Handler handler) : handler_(std::move(handler)) {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        REQUIRE(listen_fd_ >= 0);
        int yes = 1;
        ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        REQUIRE(::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
        REQUIRE(::listen(listen_fd_, 1) == 0);

        socklen_t len = sizeof(addr);
        REQUIRE(::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this]() { serve(); });
    }

    ~LoopbackDevice() {
        stopping_ = true;
        ::shutdown(listen_fd_, SHUT_RDWR);
        int client = client_fd_.load();
        if (client >= 0) {
            ::shutdown(client, SHUT_RDWR);
        }
        if (thread_.joinable()) {
            thread_.join();
        }
        ::close(listen_fd_);
    }

    uint16_t port() const {
        return port_;
    }

    std::vector<json> requests() {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    std::string raw() {
        std::lock_guard<std::mutex> lock(mutex_);
        return raw_;
    }

  private:
    void serve() {
        int fd = ::accept(listen_fd_, nullptr, nullptr);
        if (fd < 0) {
            return;
        }
        client_fd_ = fd;

        JsonFrameDecoder decoder;
        char buf[512];
        bool open = true;
        while (open && !stopping_) {
            ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
            if (n <= 0) {
                break;
            }
            {
                std::lock_guard<std::mutex> lock(mutex_);
                raw_.append(buf, static_cast<size_t>(n));
            }
            decoder.feed(buf, static_cast<size_t>(n));
            while (open) {
                auto request = decoder.next();
                if (!request) {
                    break;
                }
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    requests_.push_back(*request);
                }
                open = handler_(fd, *request);
            }
        }

        client_fd_ = -1;
        ::close(fd);
    }

    Handler handler_;
    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::atomic<int> client_fd_{-1};
    std::atomic<bool> stopping_{false};
    std::thread thread_;
    std::mutex mutex_;
    std::vector<json> requests_;
    std::string raw_;
};

TransportSettings fast_settings() {
    TransportSettings s;
    s.connect_timeout_ms = 1000;
    s.read_timeout_ms = 1000;
    return s;
}

} // namespace

TEST_CASE("SocketTransport: request and response round trip", "[transport]") {
    LoopbackDevice device([](int fd, const json& req) {
        send_all(fd, json{{"jsonrpc", "2.0"}, {"id", -1}, {"result", {{"echo", req["method"]}}}}
                         .dump());
        return true;
    });

    SocketTransport transport(fast_settings());
    REQUIRE_FALSE(transport.open("127.0.0.1", device.port()).has_error());
    CHECK(transport.is_open());

    auto reply = transport.request("authenticate", {{"access_token", "tok"}});

    REQUIRE(reply.has_value());
    CHECK(reply.value()["result"]["echo"] == "authenticate");

    auto requests = device.requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0]["jsonrpc"] == "2.0");
    CHECK(requests[0]["id"] == -1);
    CHECK(requests[0]["params"]["access_token"] == "tok");
    CHECK(device.raw().back() == '\n');

    transport.close();
    CHECK_FALSE(transport.is_open());
}

TEST_CASE("SocketTransport: response split across writes is reassembled", "[transport]") {
    LoopbackDevice device([](int fd, const json&) {
        send_all(fd, R"({"id":-1,"result":{"temp)");
        std::this_thread::sleep_for(milliseconds(20));
        send_all(fd, R"(erature":21)");
        std::this_thread::sleep_for(milliseconds(20));
        send_all(fd, "5}}");
        return true;
    });

    SocketTransport transport(fast_settings());
    REQUIRE_FALSE(transport.open("127.0.0.1", device.port()).has_error());

    auto reply = transport.request("get_temperature", nullptr);

    REQUIRE(reply.has_value());
    CHECK(reply.value()["result"]["temperature"] == 215);
}

TEST_CASE("SocketTransport: unsolicited frame is not taken as the next reply", "[transport]") {
    std::atomic<int> seen{0};
    LoopbackDevice device([&](int fd, const json&) {
        if (seen++ == 0) {
            send_all(fd, "{\"result\":true}\n{\"method\":\"system_notification\"}\n");
        } else {
            send_all(fd, "{\"result\":{\"temperature\":200}}\n");
        }
        return true;
    });

    SocketTransport transport(fast_settings());
    REQUIRE_FALSE(transport.open("127.0.0.1", device.port()).has_error());

    auto first = transport.request("authenticate", {{"access_token", "tok"}});
    REQUIRE(first.has_value());
    CHECK(first.value()["result"] == true);

    // Let the trailing notification land in the receive queue
    std::this_thread::sleep_for(milliseconds(50));

    auto second = transport.request("get_temperature", nullptr);
    REQUIRE(second.has_value());
    CHECK(second.value()["result"]["temperature"] == 200);
}

TEST_CASE("SocketTransport: partial unsolicited frame completed after the write is dropped",
          "[transport]") {
    std::atomic<int> seen{0};
    LoopbackDevice device([&](int fd, const json&) {
        if (seen++ == 0) {
            send_all(fd, "{\"result\":1}{\"method\":\"state_not");
        } else {
            send_all(fd, "ification\"}{\"result\":2}");
        }
        return true;
    });

    SocketTransport transport(fast_settings());
    REQUIRE_FALSE(transport.open("127.0.0.1", device.port()).has_error());

    auto first = transport.request("get_system_information", nullptr);
    REQUIRE(first.has_value());
    CHECK(first.value()["result"] == 1);

    std::this_thread::sleep_for(milliseconds(50));

    auto second = transport.request("get_system_information", nullptr);
    REQUIRE(second.has_value());
    CHECK(second.value()["result"] == 2);
}

TEST_CASE("SocketTransport: access token never appears in trace logs", "[transport][logging]") {
    const std::string token = "SECRET-ACCESS-TOKEN-0123456789";
    LoopbackDevice device([](int fd, const json&) {
        send_all(fd, R"({"result":true})");
        return true;
    });

    std::ostringstream captured;
    auto previous = spdlog::default_logger();
    auto logger = std::make_shared<spdlog::logger>(
        "transport_capture", std::make_shared<spdlog::sinks::ostream_sink_mt>(captured));
    logger->set_level(spdlog::level::trace);
    spdlog::set_default_logger(logger);

    SocketTransport transport(fast_settings());
    REQUIRE_FALSE(transport.open("127.0.0.1", device.port()).has_error());
    auto reply = transport.request("authenticate", {{"access_token", token}});
    transport.close();

    logger->flush();
    spdlog::set_default_logger(previous);

    REQUIRE(reply.has_value());
    const std::string log = captured.str();
    CHECK(log.find("[Device Transport] send:") != std::string::npos);
    CHECK(log.find("authenticate") != std::string::npos);
    CHECK(log.find(token) == std::string::npos);
    CHECK(log.find(redact(token)) != std::string::npos);
}

TEST_CASE("SocketTransport: newline framing can be disabled", "[transport]") {
    LoopbackDevice device([](int fd, const json&) {
        send_all(fd, R"({"result":null})");
        return true;
    });

    TransportSettings settings = fast_settings();
    settings.newline_framing = false;
    SocketTransport transport(settings);
    REQUIRE_FALSE(transport.open("127.0.0.1", device.port()).has_error());

    REQUIRE(transport.request("cancel", nullptr).has_value());
    CHECK(device.raw().back() == '}');
}

TEST_CASE("SocketTransport: peer closing mid-request is PROTOCOL_ERROR", "[transport]") {
    LoopbackDevice device([](int fd, const json&) {
        send_all(fd, R"({"result":{"partial")");
        return false;
    });

    SocketTransport transport(fast_settings());
    REQUIRE_FALSE(transport.open("127.0.0.1", device.port()).has_error());

    auto reply = transport.request("get_system_information", nullptr);

    REQUIRE_FALSE(reply.has_value());
    CHECK(reply.error_type() == DeviceErrorType::PROTOCOL_ERROR);
    CHECK(reply.error().method == "get_system_information");
}

TEST_CASE("SocketTransport: silent device times out as PROTOCOL_ERROR", "[transport]") {
    LoopbackDevice device([](int, const json&) { return true; });

    TransportSettings settings = fast_settings();
    settings.read_timeout_ms = 200;
    SocketTransport transport(settings);
    REQUIRE_FALSE(transport.open("127.0.0.1", device.port()).has_error());

    auto start = steady_clock::now();
    auto reply = transport.request("cancel", nullptr);
    auto elapsed = duration_cast<milliseconds>(steady_clock::now() - start);

    CHECK(reply.error_type() == DeviceErrorType::PROTOCOL_ERROR);
    CHECK(elapsed >= milliseconds(150));
    CHECK(elapsed < milliseconds(5000));
}

TEST_CASE("SocketTransport: non-JSON reply is PROTOCOL_ERROR", "[transport]") {
    LoopbackDevice device([](int fd, const json&) {
        send_all(fd, "ERR unknown command\n");
        return true;
    });

    SocketTransport transport(fast_settings());
    REQUIRE_FALSE(transport.open("127.0.0.1", device.port()).has_error());

    CHECK(transport.request("cancel", nullptr).error_type() == DeviceErrorType::PROTOCOL_ERROR);
}

TEST_CASE("SocketTransport: oversized reply is PROTOCOL_ERROR", "[transport]") {
    LoopbackDevice device([](int fd, const json&) {
        send_all(fd, "{\"blob\":\"" + std::string(4096, 'a'));
        return true;
    });

    TransportSettings settings = fast_settings();
    settings.max_frame_bytes = 1024;
    SocketTransport transport(settings);
    REQUIRE_FALSE(transport.open("127.0.0.1", device.port()).has_error());

    CHECK(transport.request("capture_image", nullptr).error_type() ==
          DeviceErrorType::PROTOCOL_ERROR);
}

TEST_CASE("SocketTransport: refused connection is CONNECT_ERROR", "[transport]") {
    uint16_t closed_port = 0;
    {
        // Grab a free port, then release it so nothing is listening
        int fd = ::socket(AF_INET, SOCK_STREAM, 0);
        REQUIRE(fd >= 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        REQUIRE(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
        socklen_t len = sizeof(addr);
        REQUIRE(::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
        closed_port = ntohs(addr.sin_port);
        ::close(fd);
    }

    SocketTransport transport(fast_settings());
    DeviceError err = transport.open("127.0.0.1", closed_port);

    CHECK(err.type == DeviceErrorType::CONNECT_ERROR);
    CHECK_FALSE(transport.is_open());
}

TEST_CASE("SocketTransport: empty host is CONNECT_ERROR", "[transport]") {
    SocketTransport transport;
    CHECK(transport.open("", 9999).type == DeviceErrorType::CONNECT_ERROR);
}

TEST_CASE("SocketTransport: request before open is CONNECT_ERROR", "[transport]") {
    SocketTransport transport;
    CHECK(transport.request("cancel", nullptr).error_type() == DeviceErrorType::CONNECT_ERROR);
}

TEST_CASE("SocketTransport: factory yields independent unopened transports", "[transport]") {
    TransportFactory factory = SocketTransport::factory(fast_settings());
    auto a = factory();
    auto b = factory();
    REQUIRE(a);
    REQUIRE(b);
    CHECK(a.get() != b.get());
    CHECK_FALSE(a->is_open());
}
