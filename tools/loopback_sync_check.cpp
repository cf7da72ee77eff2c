#include <QCoreApplication>
#include <QEventLoop>
#include <QTimer>

#include "core/item.hpp"
#include "network/connection_manager.hpp"
#include "network/rtc_peer_transport.hpp"
#include "storage/database.hpp"
#include "storage/migrations.hpp"
#include "storage/project_repository.hpp"
#include "sync/sync_orchestrator.hpp"

#include <functional>
#include <memory>

using namespace tandem;

namespace {

// Runs the event loop until `done` holds or the deadline passes.
bool waitFor(const std::function<bool()>& done, int timeout_ms) {
    QEventLoop loop;
    QTimer timeout;
    timeout.setSingleShot(true);
    timeout.setInterval(timeout_ms);
    QObject::connect(&timeout, &QTimer::timeout, &loop, &QEventLoop::quit);

    QTimer poll;
    poll.setInterval(20);
    QObject::connect(&poll, &QTimer::timeout, &loop, [&]() {
        if (done()) loop.quit();
    });

    timeout.start();
    poll.start();
    if (!done()) loop.exec();
    return done();
}

struct Peer {
    storage::Database db;
    std::unique_ptr<storage::ProjectRepository> store;
    std::unique_ptr<network::ConnectionManager> connection;
    std::unique_ptr<sync::SyncOrchestrator> orchestrator;
};

std::unique_ptr<Peer> makePeer(const SyncConfig& config, sync::PeerRole role) {
    auto opened = storage::Database::open_memory();
    if (opened.is_err()) {
        qCritical() << "open_memory failed:" << opened.unwrap_err().message.c_str();
        return nullptr;
    }
    auto peer = std::make_unique<Peer>(Peer{.db = std::move(opened).unwrap()});
    auto migrated = storage::initialize_database(peer->db);
    if (migrated.is_err()) {
        qCritical() << "migration failed:" << migrated.unwrap_err().message.c_str();
        return nullptr;
    }
    peer->store = std::make_unique<storage::ProjectRepository>(peer->db);
    peer->connection = std::make_unique<network::ConnectionManager>(
        std::make_unique<network::RtcPeerTransport>(config.ice_servers), config);
    peer->orchestrator = std::make_unique<sync::SyncOrchestrator>(*peer->connection, *peer->store, config);
    peer->orchestrator->setPreferredRole(role);
    return peer;
}

} // namespace

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);

    qputenv("TANDEM_DEBUG_SYNC", "1");

    SyncConfig config;
    // Host candidates are enough on one machine.
    config.ice_servers.clear();
    config.auto_sync_on_connect = false;

    auto editor = makePeer(config, sync::PeerRole::Editor);
    auto viewer = makePeer(config, sync::PeerRole::Viewer);
    if (!editor || !viewer) {
        return 1;
    }

    // Seed the editor with two items, one carrying a payload larger than a frame.
    Bytes payload(config.frame_size * 3 + 123);
    for (size_t i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<uint8_t>(i * 31);
    }
    if (editor->store->save_project(create_project()).is_err() ||
        editor->store->save_item(create_item("first", 0)).is_err()) {
        qCritical() << "seeding failed";
        return 1;
    }
    auto second = create_item("second", 1);
    if (editor->store->save_item(second).is_err() ||
        editor->store->save_payload(second.id, payload).is_err()) {
        qCritical() << "seeding failed";
        return 1;
    }

    std::optional<network::LocalDescriptor> offer;
    std::optional<network::LocalDescriptor> answer;

    editor->connection->initiate([&](Result<network::LocalDescriptor> result) {
        if (result.is_err()) {
            qCritical() << "initiate failed:" << result.unwrap_err().message.c_str();
            return;
        }
        offer = result.unwrap();
    });
    if (!waitFor([&]() { return offer.has_value(); }, 15000)) {
        qCritical() << "no offer";
        return 1;
    }
    qInfo().noquote() << "offer code:" << offer->code.size() << "chars";

    auto decoded_offer = network::decodeDescriptor(offer->code);
    if (decoded_offer.is_err()) {
        qCritical() << "offer did not decode";
        return 1;
    }
    viewer->connection->accept(decoded_offer.unwrap(), [&](Result<network::LocalDescriptor> result) {
        if (result.is_err()) {
            qCritical() << "accept failed:" << result.unwrap_err().message.c_str();
            return;
        }
        answer = result.unwrap();
    });
    if (!waitFor([&]() { return answer.has_value(); }, 15000)) {
        qCritical() << "no answer";
        return 1;
    }

    auto decoded_answer = network::decodeDescriptor(answer->code);
    if (decoded_answer.is_err() || editor->connection->complete(decoded_answer.unwrap()).is_err()) {
        qCritical() << "answer not applied";
        return 1;
    }

    const auto connected = [&]() {
        return editor->connection->state() == network::ConnectionState::Connected &&
               viewer->connection->state() == network::ConnectionState::Connected;
    };
    if (!waitFor(connected, 15000)) {
        qCritical() << "peers did not connect";
        return 1;
    }
    qInfo() << "connected";

    QObject::connect(viewer->orchestrator.get(), &sync::SyncOrchestrator::pendingRequestChanged,
                     &app, [&]() {
        if (!viewer->orchestrator->pendingRequest()) return;
        if (viewer->orchestrator->acceptSync().is_err()) {
            qCritical() << "acceptSync failed";
        }
    });

    if (editor->orchestrator->startSync().is_err()) {
        qCritical() << "startSync failed";
        return 1;
    }
    const auto received = [&]() {
        return viewer->orchestrator->progress().phase == sync::SyncPhase::Complete ||
               viewer->orchestrator->progress().phase == sync::SyncPhase::Error;
    };
    if (!waitFor(received, 15000) ||
        viewer->orchestrator->progress().phase != sync::SyncPhase::Complete) {
        qCritical() << "initial sync did not complete";
        return 1;
    }
    if (viewer->orchestrator->commitSync().is_err()) {
        qCritical() << "commit failed";
        return 1;
    }

    auto items = viewer->store->load_items();
    auto copied = viewer->store->load_payload(second.id);
    if (items.is_err() || items.unwrap().size() != 2 || copied.is_err() ||
        !copied.unwrap() || *copied.unwrap() != payload) {
        qCritical() << "viewer state does not match editor";
        return 1;
    }
    qInfo() << "initial sync OK";

    // Real-time broadcast of a rename.
    ItemChanges rename;
    rename.label = "renamed";
    if (editor->orchestrator->updateItem(second.id, rename).is_err()) {
        qCritical() << "update failed";
        return 1;
    }
    const auto renamed = [&]() {
        auto item = viewer->store->load_item(second.id);
        return item.is_ok() && item.unwrap() && item.unwrap()->label == "renamed";
    };
    if (!waitFor(renamed, 5000)) {
        qCritical() << "rename not replicated";
        return 1;
    }
    qInfo() << "broadcast OK";

    bool left = false;
    editor->orchestrator->endSession([&]() { left = true; });
    const auto peer_gone = [&]() {
        return left && viewer->orchestrator->reconnection().phase ==
                           sync::ReconnectionPhase::PeerDisconnected;
    };
    if (!waitFor(peer_gone, 5000)) {
        qCritical() << "graceful disconnect not observed";
        return 1;
    }

    qInfo() << "OK";
    return 0;
}
