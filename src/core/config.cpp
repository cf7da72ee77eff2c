#include "core/config.hpp"

#include <QSettings>
#include <QStringList>
#include <QtGlobal>

namespace tandem {

namespace {

constexpr const char* kIceServers = "sync/ice_servers";
constexpr const char* kIceGatheringTimeoutMs = "sync/ice_gathering_timeout_ms";
constexpr const char* kHeartbeatIntervalMs = "sync/heartbeat_interval_ms";
constexpr const char* kHeartbeatMissLimit = "sync/heartbeat_miss_limit";
constexpr const char* kReconnectGraceMs = "sync/reconnect_grace_ms";
constexpr const char* kRoleDenyDisplayMs = "sync/role_deny_display_ms";
constexpr const char* kRoleRequestTimeoutMs = "sync/role_request_timeout_ms";
constexpr const char* kDisconnectGraceMs = "sync/disconnect_grace_ms";
constexpr const char* kAutoSyncOnConnect = "sync/auto_sync_on_connect";
constexpr const char* kAutoSyncDelayMs = "sync/auto_sync_delay_ms";
constexpr const char* kFrameSize = "sync/frame_size";
constexpr const char* kBufferThreshold = "sync/buffer_threshold";

void read_ms(QSettings& settings, const char* key, std::chrono::milliseconds& out) {
    const auto value = settings.value(QString::fromLatin1(key));
    if (!value.isValid()) return;
    bool ok = false;
    const auto ms = value.toLongLong(&ok);
    if (ok && ms >= 0) {
        out = std::chrono::milliseconds(ms);
    }
}

std::vector<std::string> split_servers(const QString& joined) {
    std::vector<std::string> out;
    const auto parts = joined.split(QLatin1Char(','), Qt::SkipEmptyParts);
    for (const auto& part : parts) {
        const auto trimmed = part.trimmed();
        if (!trimmed.isEmpty()) {
            out.push_back(trimmed.toStdString());
        }
    }
    return out;
}

} // namespace

SyncConfig load_sync_config(QSettings& settings) {
    SyncConfig config;

    const auto servers = settings.value(QString::fromLatin1(kIceServers)).toString();
    if (!servers.isEmpty()) {
        config.ice_servers = split_servers(servers);
    }

    read_ms(settings, kIceGatheringTimeoutMs, config.ice_gathering_timeout);
    read_ms(settings, kHeartbeatIntervalMs, config.heartbeat_interval);
    read_ms(settings, kReconnectGraceMs, config.reconnect_grace);
    read_ms(settings, kRoleDenyDisplayMs, config.role_deny_display);
    read_ms(settings, kRoleRequestTimeoutMs, config.role_request_timeout);
    read_ms(settings, kDisconnectGraceMs, config.disconnect_grace);
    read_ms(settings, kAutoSyncDelayMs, config.auto_sync_delay);

    const auto miss_limit = settings.value(QString::fromLatin1(kHeartbeatMissLimit),
                                           config.heartbeat_miss_limit).toInt();
    if (miss_limit > 0) {
        config.heartbeat_miss_limit = miss_limit;
    }
    config.auto_sync_on_connect = settings.value(QString::fromLatin1(kAutoSyncOnConnect),
                                                 config.auto_sync_on_connect).toBool();

    const auto frame_size = settings.value(QString::fromLatin1(kFrameSize),
                                           static_cast<qulonglong>(config.frame_size)).toULongLong();
    if (frame_size > 0) {
        config.frame_size = static_cast<size_t>(frame_size);
    }
    config.buffer_threshold = settings.value(QString::fromLatin1(kBufferThreshold),
                                             static_cast<qulonglong>(config.buffer_threshold))
                                  .toULongLong();

    if (qEnvironmentVariableIsSet("TANDEM_ICE_SERVERS")) {
        config.ice_servers = split_servers(qEnvironmentVariable("TANDEM_ICE_SERVERS"));
    }

    return config;
}

void store_sync_config(QSettings& settings, const SyncConfig& config) {
    QStringList servers;
    for (const auto& server : config.ice_servers) {
        servers << QString::fromStdString(server);
    }
    settings.setValue(QString::fromLatin1(kIceServers), servers.join(QLatin1Char(',')));
    settings.setValue(QString::fromLatin1(kIceGatheringTimeoutMs),
                      static_cast<qlonglong>(config.ice_gathering_timeout.count()));
    settings.setValue(QString::fromLatin1(kHeartbeatIntervalMs),
                      static_cast<qlonglong>(config.heartbeat_interval.count()));
    settings.setValue(QString::fromLatin1(kHeartbeatMissLimit), config.heartbeat_miss_limit);
    settings.setValue(QString::fromLatin1(kReconnectGraceMs),
                      static_cast<qlonglong>(config.reconnect_grace.count()));
    settings.setValue(QString::fromLatin1(kRoleDenyDisplayMs),
                      static_cast<qlonglong>(config.role_deny_display.count()));
    settings.setValue(QString::fromLatin1(kRoleRequestTimeoutMs),
                      static_cast<qlonglong>(config.role_request_timeout.count()));
    settings.setValue(QString::fromLatin1(kDisconnectGraceMs),
                      static_cast<qlonglong>(config.disconnect_grace.count()));
    settings.setValue(QString::fromLatin1(kAutoSyncOnConnect), config.auto_sync_on_connect);
    settings.setValue(QString::fromLatin1(kAutoSyncDelayMs),
                      static_cast<qlonglong>(config.auto_sync_delay.count()));
    settings.setValue(QString::fromLatin1(kFrameSize), static_cast<qulonglong>(config.frame_size));
    settings.setValue(QString::fromLatin1(kBufferThreshold),
                      static_cast<qulonglong>(config.buffer_threshold));
}

} // namespace tandem
