// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"
#include "session_config.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include <catch2/catch_test_macros.hpp>

namespace fs = std::filesystem;

namespace printlink {

// Test fixture for Config class testing
class ConfigTestFixture {
  public:
    ConfigTestFixture() {
        dir = fs::temp_directory_path() /
              ("printlink_config_test_" +
               std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        fs::create_directories(dir);
        path = (dir / "printlink.json").string();
    }

    ~ConfigTestFixture() {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

  protected:
    Config config;
    fs::path dir;
    std::string path;

    void set_data_null(const std::string& json_ptr) {
        config.data[json::json_pointer(json_ptr)] = nullptr;
    }

    void set_data_empty() {
        config.data = json::object();
    }

    void setup_device_config() {
        config.data = {{"device", {{"host", "192.168.1.40"}, {"rpc_port", 9999}}},
                       {"auth", {{"username", "Lab Bench"}}},
                       {"log_level", "debug"}};
    }

    void write_file(const std::string& text) {
        std::ofstream out(path);
        out << text;
    }

    json read_file() {
        std::ifstream in(path);
        return json::parse(in);
    }
};

} // namespace printlink

using namespace printlink;

// ============================================================================
// get() without default parameter
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() returns existing string value",
                 "[config][get]") {
    setup_device_config();
    REQUIRE(config.get<std::string>("/device/host") == "192.168.1.40");
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() returns existing int value", "[config][get]") {
    setup_device_config();
    REQUIRE(config.get<int>("/device/rpc_port") == 9999);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() with missing key throws exception",
                 "[config][get]") {
    setup_device_config();
    REQUIRE_THROWS_AS(config.get<std::string>("/device/nonexistent_key"),
                      nlohmann::detail::type_error);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() with type mismatch throws exception",
                 "[config][get]") {
    setup_device_config();
    REQUIRE_THROWS(config.get<int>("/device/host"));
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() with object returns nested structure",
                 "[config][get]") {
    setup_device_config();
    auto device = config.get<json>("/device");
    REQUIRE(device.is_object());
    REQUIRE(device["host"] == "192.168.1.40");
}

// ============================================================================
// get() with default parameter
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() with default returns value when present",
                 "[config][get]") {
    setup_device_config();
    REQUIRE(config.get<std::string>("/auth/username", "MakerBot API") == "Lab Bench");
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() with default returns default when missing",
                 "[config][get]") {
    setup_device_config();
    REQUIRE(config.get<int>("/device/http_port", 80) == 80);
    REQUIRE(config.get<int>("/recovery/thermal_recovery_ms", 10000) == 10000);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() with default prevents crashes on null keys",
                 "[config][get]") {
    setup_device_config();
    set_data_null("/device/host");
    REQUIRE(config.get<std::string>("/device/host", "fallback") == "fallback");
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() with default on type mismatch returns default",
                 "[config][get]") {
    setup_device_config();
    REQUIRE(config.get<int>("/device/host", 7) == 7);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() with default handles empty config",
                 "[config][edge]") {
    set_data_empty();
    REQUIRE(config.get<std::string>("/device/host", "localhost") == "localhost");
}

// ============================================================================
// set()
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: set() creates nested path", "[config][set]") {
    set_data_empty();
    config.set<int>("/rpc/echo_poll_max_attempts", 40);
    REQUIRE(config.get<int>("/rpc/echo_poll_max_attempts") == 40);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: set() overwrites value of different type",
                 "[config][set]") {
    setup_device_config();
    config.set<int>("/device/host", 5);
    REQUIRE(config.get<int>("/device/host") == 5);
}

// ============================================================================
// init() and save()
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: init() writes defaults when file is missing",
                 "[config][file]") {
    config.init(path);

    REQUIRE(fs::exists(path));
    json saved = read_file();
    CHECK(saved["device"]["rpc_port"] == 9999);
    CHECK(saved["auth"]["poll_max_attempts"] == 200);
    CHECK(saved["rpc"]["echo_poll_max_attempts"] == 120);
    CHECK(saved["recovery"]["filament_stop_settle_ms"] == 2000);
    CHECK(config.get_path() == path);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: init() keeps user values and fills gaps",
                 "[config][file]") {
    write_file(R"({"device":{"host":"10.0.0.9","rpc_port":19999},"log_level":"trace"})");

    config.init(path);

    CHECK(config.get<std::string>("/device/host") == "10.0.0.9");
    CHECK(config.get<int>("/device/rpc_port") == 19999);
    CHECK(config.get<int>("/device/http_port") == 80);
    CHECK(config.get<std::string>("/log_level") == "trace");
    CHECK(read_file()["recovery"]["thermal_recovery_ms"] == 10000);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: init() resets a corrupt file to defaults",
                 "[config][file]") {
    write_file("{ this is not json");

    config.init(path);

    CHECK(config.get<int>("/device/rpc_port") == 9999);
    CHECK(read_file().is_object());
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: init() resets a non-object root", "[config][file]") {
    write_file("[1, 2, 3]");

    config.init(path);

    CHECK(config.get<std::string>("/auth/client_id") == "MakerWare");
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: stored auth_code is stripped", "[config][file]") {
    write_file(R"({"auth":{"auth_code":"secret-code","username":"Me"}})");

    config.init(path);

    CHECK(config.get<std::string>("/auth/auth_code", "") == "");
    CHECK(config.get<std::string>("/auth/username") == "Me");
    CHECK_FALSE(read_file()["auth"].contains("auth_code"));
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: save() round-trips and leaves no temp file",
                 "[config][file]") {
    config.init(path);
    config.set<std::string>("/device/host", "printer.lan");

    REQUIRE(config.save());

    CHECK(read_file()["device"]["host"] == "printer.lan");
    CHECK_FALSE(fs::exists(path + ".tmp"));
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: save() before init() writes nothing",
                 "[config][file]") {
    CHECK_FALSE(config.save());
}

// ============================================================================
// SessionConfig::from_config()
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "SessionConfig: defaults match the device protocol",
                 "[config][session]") {
    config.init(path);
    config.set<std::string>("/device/host", "192.168.1.40");

    SessionConfig sc = SessionConfig::from_config(config);

    CHECK(sc.address.host == "192.168.1.40");
    CHECK(sc.address.http_port == 80);
    CHECK(sc.address.rpc_port == 9999);
    CHECK(sc.identity.client_id == "MakerWare");
    CHECK(sc.identity.client_secret == "secret");
    CHECK(sc.identity.username == "MakerBot API");
    CHECK(sc.acceptance_poll.max_attempts == 200);
    CHECK(sc.acceptance_poll.delay == std::chrono::milliseconds(1000));
    CHECK(sc.echo_poll.max_attempts == 120);
    CHECK(sc.echo_poll.delay == std::chrono::milliseconds(0));
    CHECK(sc.transport.newline_framing);
    CHECK(sc.recovery.filament_pause_settle == std::chrono::milliseconds(7000));
    CHECK(sc.recovery.filament_load_settle == std::chrono::milliseconds(7000));
    CHECK(sc.recovery.filament_stop_settle == std::chrono::milliseconds(2000));
    CHECK(sc.recovery.thermal_recovery == std::chrono::milliseconds(10000));
}

TEST_CASE_METHOD(ConfigTestFixture, "SessionConfig: overrides are applied", "[config][session]") {
    config.init(path);
    config.set<int>("/device/rpc_port", 10000);
    config.set<int>("/auth/poll_max_attempts", 30);
    config.set<int>("/rpc/echo_poll_interval_ms", 250);
    config.set<int>("/recovery/thermal_recovery_ms", 15000);
    config.set<bool>("/rpc/newline_framing", false);

    SessionConfig sc = SessionConfig::from_config(config);

    CHECK(sc.address.rpc_port == 10000);
    CHECK(sc.acceptance_poll.max_attempts == 30);
    CHECK(sc.echo_poll.delay == std::chrono::milliseconds(250));
    CHECK(sc.recovery.thermal_recovery == std::chrono::milliseconds(15000));
    CHECK_FALSE(sc.transport.newline_framing);
}

TEST_CASE_METHOD(ConfigTestFixture, "SessionConfig: out-of-range values fall back",
                 "[config][session]") {
    config.init(path);
    config.set<int>("/device/rpc_port", 70000);
    config.set<int>("/auth/poll_max_attempts", 0);
    config.set<int>("/recovery/filament_load_settle_ms", -1);
    config.set<std::string>("/device/http_timeout_sec", "soon");

    SessionConfig sc = SessionConfig::from_config(config);

    CHECK(sc.address.rpc_port == 9999);
    CHECK(sc.acceptance_poll.max_attempts == 200);
    CHECK(sc.recovery.filament_load_settle == std::chrono::milliseconds(7000));
    CHECK(sc.http_timeout_sec == 5);
}
