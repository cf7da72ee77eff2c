#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

class QSettings;

namespace tandem {

/**
 * SyncConfig - tunables of the connection and sync protocol.
 *
 * The durations are reference values, not measured requirements.
 */
struct SyncConfig {
    std::vector<std::string> ice_servers{
        "stun:stun.l.google.com:19302",
        "stun:stun1.l.google.com:19302",
        "stun:stun.cloudflare.com:3478",
    };

    // Path discovery is bounded; on expiry negotiation proceeds with what was found.
    std::chrono::milliseconds ice_gathering_timeout{10000};

    std::chrono::milliseconds heartbeat_interval{5000};
    int heartbeat_miss_limit = 3;

    std::chrono::milliseconds reconnect_grace{2000};
    std::chrono::milliseconds role_deny_display{3000};
    // Zero disables expiry of an unanswered role request.
    std::chrono::milliseconds role_request_timeout{0};
    std::chrono::milliseconds disconnect_grace{300};

    bool auto_sync_on_connect = true;
    std::chrono::milliseconds auto_sync_delay{500};

    size_t frame_size = 16 * 1024;
    uint64_t buffer_threshold = 64 * 1024;

    [[nodiscard]] std::chrono::milliseconds heartbeat_timeout() const {
        return heartbeat_interval * heartbeat_miss_limit;
    }
};

/**
 * Load overrides from the `sync/` settings group, then from the environment
 * (TANDEM_ICE_SERVERS, comma separated). Missing keys keep their defaults.
 */
[[nodiscard]] SyncConfig load_sync_config(QSettings& settings);

/**
 * Persist the effective configuration so it can be edited by hand.
 */
void store_sync_config(QSettings& settings, const SyncConfig& config);

} // namespace tandem
