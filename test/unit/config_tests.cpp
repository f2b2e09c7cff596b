// Copyright (c) 2025 The Watchtower developers
// Unit tests for application configuration (defaults, JSON file, validation)

#include <catch2/catch_test_macros.hpp>
#include "application.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

using namespace watchtower::app;
using json = nlohmann::json;

namespace {

// Writes a config file into a unique temp directory, removed on scope exit
class ConfigFileFixture {
public:
    std::filesystem::path dir;

    ConfigFileFixture() {
        auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        dir = std::filesystem::temp_directory_path() /
              ("watchtower_config_test_" + std::to_string(now));
        std::filesystem::create_directory(dir);
    }

    ~ConfigFileFixture() {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    std::filesystem::path Write(const std::string& contents) {
        auto path = dir / "watchtower.json";
        std::ofstream out(path);
        out << contents;
        return path;
    }
};

const std::string kNodeId =
    "02aabbccddeeff00112233445566778899aabbccddeeff00112233445566778899";

} // namespace

TEST_CASE("AppConfig - defaults", "[config][unit]") {
    AppConfig config;
    CHECK(config.role == Role::TOWER);
    CHECK(config.relay.listen_port == 9814);
    CHECK(config.relay.listen_enabled);
    CHECK(config.relay.io_threads == 1);
    CHECK(config.relay.poll_interval_ms == 100);
    CHECK(config.tower.appointment_max_size == 30);
    CHECK(config.node_id.empty());
    CHECK(config.log_level == "info");
    CHECK_NOTHROW(config.Validate());

    // Random node id when none is configured
    auto a = config.ResolveNodeId();
    CHECK(a.IsValid());
}

TEST_CASE("AppConfig - roles", "[config][unit]") {
    CHECK(ParseRole("tower") == Role::TOWER);
    CHECK(ParseRole("user") == Role::USER);
    CHECK_FALSE(ParseRole("Tower").has_value());
    CHECK_FALSE(ParseRole("").has_value());
    CHECK(std::string(RoleName(Role::TOWER)) == "tower");
    CHECK(std::string(RoleName(Role::USER)) == "user");
}

TEST_CASE("AppConfig - JSON overrides", "[config][unit]") {
    AppConfig config;
    config.ApplyJson(json{{"role", "user"},
                          {"listen_port", 19814},
                          {"listen_enabled", false},
                          {"io_threads", 2},
                          {"poll_interval_ms", 250},
                          {"appointment_max_size", 64},
                          {"node_id", kNodeId},
                          {"tower_address", "127.0.0.1"},
                          {"tower_port", 29814},
                          {"appointment_slots", 10},
                          {"subscription_period", 4320},
                          {"log_level", "debug"},
                          {"log_file", "/tmp/wt.log"}});

    CHECK(config.role == Role::USER);
    CHECK(config.relay.listen_port == 19814);
    CHECK_FALSE(config.relay.listen_enabled);
    CHECK(config.relay.io_threads == 2);
    CHECK(config.relay.poll_interval_ms == 250);
    CHECK(config.tower.appointment_max_size == 64);
    CHECK(config.user.tower_address == "127.0.0.1");
    CHECK(config.user.tower_port == 29814);
    CHECK(config.user.appointment_slots == 10);
    CHECK(config.user.subscription_period == 4320);
    CHECK(config.log_level == "debug");
    CHECK(config.log_file == "/tmp/wt.log");
    CHECK_NOTHROW(config.Validate());
    CHECK(config.ResolveNodeId().ToHex() == kNodeId);
}

TEST_CASE("AppConfig - partial JSON keeps defaults", "[config][unit]") {
    AppConfig config;
    config.ApplyJson(json{{"appointment_max_size", 100}});
    CHECK(config.tower.appointment_max_size == 100);
    CHECK(config.relay.listen_port == 9814);
    CHECK(config.role == Role::TOWER);
}

TEST_CASE("AppConfig - invalid JSON values are rejected", "[config][unit]") {
    AppConfig config;

    CHECK_THROWS_AS(config.ApplyJson(json::array()), std::runtime_error);
    CHECK_THROWS_AS(config.ApplyJson(json{{"role", "watcher"}}), std::runtime_error);
    CHECK_THROWS_AS(config.ApplyJson(json{{"listen_port", 70000}}), std::runtime_error);
    CHECK_THROWS_AS(config.ApplyJson(json{{"listen_port", -1}}), std::runtime_error);
    CHECK_THROWS_AS(config.ApplyJson(json{{"listen_port", "9814"}}), std::runtime_error);
    CHECK_THROWS_AS(config.ApplyJson(json{{"poll_interval_ms", 0}}), std::runtime_error);
    CHECK_THROWS_AS(config.ApplyJson(json{{"listen_enabled", 1}}), std::runtime_error);
    CHECK_THROWS_AS(config.ApplyJson(json{{"appointment_slots", 0}}), std::runtime_error);

    SECTION("Error names the offending key") {
        try {
            config.ApplyJson(json{{"unknown_option", true}});
            FAIL("expected std::runtime_error");
        } catch (const std::runtime_error& e) {
            CHECK(std::string(e.what()).find("unknown_option") != std::string::npos);
        }
    }
}

TEST_CASE("AppConfig - Validate", "[config][unit]") {
    AppConfig config;

    SECTION("Malformed node id") {
        config.node_id = "04" + kNodeId.substr(2);
        CHECK_THROWS_AS(config.Validate(), std::runtime_error);
        config.node_id = "02abc";
        CHECK_THROWS_AS(config.Validate(), std::runtime_error);
    }

    SECTION("User role needs a tower") {
        config.role = Role::USER;
        CHECK_THROWS_AS(config.Validate(), std::runtime_error);
        config.user.tower_address = "localhost";
        CHECK_NOTHROW(config.Validate());
    }

    SECTION("User subscription must fit the fee field") {
        config.role = Role::USER;
        config.user.tower_address = "localhost";
        config.user.appointment_slots = 0x10000;
        config.user.subscription_period = 0x10000;
        CHECK_THROWS_AS(config.Validate(), std::runtime_error);
    }
}

TEST_CASE("AppConfig - LoadFromFile", "[config][unit]") {
    ConfigFileFixture fixture;

    SECTION("Valid file") {
        auto path = fixture.Write(R"({"role": "tower", "listen_port": 12345})");
        auto config = AppConfig::LoadFromFile(path);
        CHECK(config.role == Role::TOWER);
        CHECK(config.relay.listen_port == 12345);
    }

    SECTION("Missing file") {
        CHECK_THROWS_AS(AppConfig::LoadFromFile(fixture.dir / "missing.json"),
                        std::runtime_error);
    }

    SECTION("Not JSON") {
        auto path = fixture.Write("role = tower");
        CHECK_THROWS_AS(AppConfig::LoadFromFile(path), std::runtime_error);
    }
}
