#include <catch2/catch_test_macros.hpp>
#include "core/config.hpp"

#include <QSettings>
#include <QTemporaryDir>

using namespace tandem;
using namespace std::chrono_literals;

TEST_CASE("SyncConfig defaults match the reference values", "[config]") {
    SyncConfig config;

    REQUIRE(config.ice_servers.size() == 3);
    REQUIRE(config.ice_servers.front() == "stun:stun.l.google.com:19302");
    REQUIRE(config.ice_gathering_timeout == 10s);
    REQUIRE(config.heartbeat_interval == 5s);
    REQUIRE(config.heartbeat_miss_limit == 3);
    REQUIRE(config.heartbeat_timeout() == 15s);
    REQUIRE(config.reconnect_grace == 2s);
    REQUIRE(config.role_deny_display == 3s);
    REQUIRE(config.role_request_timeout == 0ms);
    REQUIRE(config.auto_sync_on_connect);
    REQUIRE(config.auto_sync_delay == 500ms);
    REQUIRE(config.frame_size == 16 * 1024);
    REQUIRE(config.buffer_threshold == 64 * 1024);
}

TEST_CASE("SyncConfig loads from settings", "[config]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    QSettings settings(dir.filePath("tandem.ini"), QSettings::IniFormat);
    qunsetenv("TANDEM_ICE_SERVERS");

    SECTION("missing keys keep defaults") {
        auto config = load_sync_config(settings);
        REQUIRE(config.heartbeat_interval == 5s);
        REQUIRE(config.ice_servers.size() == 3);
    }

    SECTION("stored values are read back") {
        SyncConfig custom;
        custom.ice_servers = {"stun:example.org:3478"};
        custom.heartbeat_interval = 1s;
        custom.heartbeat_miss_limit = 5;
        custom.role_request_timeout = 30s;
        custom.auto_sync_on_connect = false;
        custom.frame_size = 8192;
        store_sync_config(settings, custom);

        auto config = load_sync_config(settings);
        REQUIRE(config.ice_servers == custom.ice_servers);
        REQUIRE(config.heartbeat_interval == 1s);
        REQUIRE(config.heartbeat_miss_limit == 5);
        REQUIRE(config.role_request_timeout == 30s);
        REQUIRE_FALSE(config.auto_sync_on_connect);
        REQUIRE(config.frame_size == 8192);
    }

    SECTION("invalid values are ignored") {
        settings.setValue("sync/heartbeat_interval_ms", "soon");
        settings.setValue("sync/heartbeat_miss_limit", 0);
        settings.setValue("sync/frame_size", 0);

        auto config = load_sync_config(settings);
        REQUIRE(config.heartbeat_interval == 5s);
        REQUIRE(config.heartbeat_miss_limit == 3);
        REQUIRE(config.frame_size == 16 * 1024);
    }

    SECTION("environment overrides the ICE server list") {
        qputenv("TANDEM_ICE_SERVERS", "stun:a.example:1, stun:b.example:2");
        auto config = load_sync_config(settings);
        qunsetenv("TANDEM_ICE_SERVERS");

        REQUIRE(config.ice_servers == std::vector<std::string>{"stun:a.example:1", "stun:b.example:2"});
    }
}
