#pragma once

#include "core/config.hpp"
#include "network/connection_manager.hpp"
#include "storage/database.hpp"
#include "storage/migrations.hpp"
#include "storage/project_repository.hpp"
#include "support/loopback_transport.hpp"
#include "support/spin.hpp"
#include "sync/sync_orchestrator.hpp"

#include <memory>
#include <optional>

namespace tandem::test {

/**
 * Short timings so liveness and grace windows elapse within a test.
 */
inline SyncConfig fastConfig() {
    SyncConfig config;
    config.ice_servers.clear();
    config.ice_gathering_timeout = std::chrono::milliseconds(500);
    config.heartbeat_interval = std::chrono::milliseconds(50);
    config.heartbeat_miss_limit = 3;
    config.reconnect_grace = std::chrono::milliseconds(300);
    config.role_deny_display = std::chrono::milliseconds(100);
    config.disconnect_grace = std::chrono::milliseconds(50);
    config.auto_sync_on_connect = false;
    config.auto_sync_delay = std::chrono::milliseconds(20);
    config.frame_size = 1024;
    config.buffer_threshold = 4096;
    return config;
}

/**
 * Two ConnectionManagers joined by a LoopbackTransport pair.
 */
struct LinkedManagers {
    LoopbackTransport* offer_link = nullptr;
    LoopbackTransport* answer_link = nullptr;
    std::unique_ptr<network::ConnectionManager> offerer;
    std::unique_ptr<network::ConnectionManager> answerer;

    explicit LinkedManagers(const SyncConfig& config = fastConfig()) {
        auto [a, b] = LoopbackTransport::makePair();
        offer_link = a.get();
        answer_link = b.get();
        offerer = std::make_unique<network::ConnectionManager>(std::move(a), config);
        answerer = std::make_unique<network::ConnectionManager>(std::move(b), config);
    }

    /**
     * Run the full manual handshake; true once both sides are connected.
     */
    bool handshake() {
        std::optional<Result<network::LocalDescriptor>> offer;
        offerer->initiate([&](Result<network::LocalDescriptor> r) { offer = std::move(r); });
        if (!spinUntil([&] { return offer.has_value(); }) || offer->is_err()) return false;

        auto decoded_offer = network::decodeDescriptor(offer->unwrap().code);
        if (decoded_offer.is_err()) return false;

        std::optional<Result<network::LocalDescriptor>> answer;
        answerer->accept(decoded_offer.unwrap(),
                         [&](Result<network::LocalDescriptor> r) { answer = std::move(r); });
        if (!spinUntil([&] { return answer.has_value(); }) || answer->is_err()) return false;

        auto decoded_answer = network::decodeDescriptor(answer->unwrap().code);
        if (decoded_answer.is_err()) return false;
        if (offerer->complete(decoded_answer.unwrap()).is_err()) return false;

        return spinUntil([&] {
            return offerer->state() == network::ConnectionState::Connected &&
                   answerer->state() == network::ConnectionState::Connected;
        });
    }
};

/**
 * One full peer stack on an in-memory database.
 */
struct PeerStack {
    storage::Database db;
    std::unique_ptr<storage::ProjectRepository> store;
    std::unique_ptr<sync::SyncOrchestrator> orchestrator;

    PeerStack(network::ConnectionManager& connection, const SyncConfig& config, sync::PeerRole role)
        : db(storage::Database::open_memory().unwrap())
    {
        storage::initialize_database(db).unwrap();
        store = std::make_unique<storage::ProjectRepository>(db);
        orchestrator = std::make_unique<sync::SyncOrchestrator>(connection, *store, config);
        orchestrator->setPreferredRole(role);
    }
};

/**
 * Editor and viewer stacks over a loopback link, not yet connected.
 */
struct SyncPair {
    SyncConfig config;
    LinkedManagers link;
    PeerStack editor;
    PeerStack viewer;

    explicit SyncPair(SyncConfig cfg = fastConfig())
        : config(cfg)
        , link(config)
        , editor(*link.offerer, config, sync::PeerRole::Editor)
        , viewer(*link.answerer, config, sync::PeerRole::Viewer)
    {}

    bool connect() { return link.handshake(); }

    /**
     * Initial sync from editor to viewer, accepted and committed.
     */
    bool syncAndCommit() {
        if (editor.orchestrator->startSync().is_err()) return false;
        if (!spinUntil([&] { return viewer.orchestrator->pendingRequest().has_value(); })) return false;
        if (viewer.orchestrator->acceptSync().is_err()) return false;
        if (!spinUntil([&] {
                return viewer.orchestrator->progress().phase == sync::SyncPhase::Complete;
            })) {
            return false;
        }
        return viewer.orchestrator->commitSync().is_ok();
    }
};

} // namespace tandem::test
