#include <catch2/catch_test_macros.hpp>
#include "network/rtc_peer_transport.hpp"
#include "support/peer_pair.hpp"

#include <variant>

using namespace tandem;
using namespace tandem::network;
using namespace tandem::sync;
using namespace tandem::test;

namespace {

constexpr std::chrono::milliseconds kRtcTimeout{15000};

SyncConfig rtcConfig() {
    auto config = fastConfig();
    // Host candidates only; a loaded machine still answers heartbeats in time.
    config.ice_gathering_timeout = std::chrono::milliseconds(2000);
    config.heartbeat_interval = std::chrono::milliseconds(1000);
    config.reconnect_grace = std::chrono::milliseconds(5000);
    config.frame_size = 16 * 1024;
    config.buffer_threshold = 64 * 1024;
    return config;
}

/**
 * Two ConnectionManagers over real data channels on this machine.
 */
struct RtcLink {
    std::unique_ptr<ConnectionManager> offerer;
    std::unique_ptr<ConnectionManager> answerer;

    explicit RtcLink(const SyncConfig& config)
        : offerer(std::make_unique<ConnectionManager>(
              std::make_unique<RtcPeerTransport>(config.ice_servers), config))
        , answerer(std::make_unique<ConnectionManager>(
              std::make_unique<RtcPeerTransport>(config.ice_servers), config))
    {}

    bool handshake() {
        std::optional<Result<LocalDescriptor>> offer;
        offerer->initiate([&](Result<LocalDescriptor> r) { offer = std::move(r); });
        if (!spinUntil([&] { return offer.has_value(); }, kRtcTimeout) || offer->is_err()) return false;

        auto decoded_offer = decodeDescriptor(offer->unwrap().code);
        if (decoded_offer.is_err()) return false;

        std::optional<Result<LocalDescriptor>> answer;
        answerer->accept(decoded_offer.unwrap(), [&](Result<LocalDescriptor> r) { answer = std::move(r); });
        if (!spinUntil([&] { return answer.has_value(); }, kRtcTimeout) || answer->is_err()) return false;

        auto decoded_answer = decodeDescriptor(answer->unwrap().code);
        if (decoded_answer.is_err()) return false;
        if (offerer->complete(decoded_answer.unwrap()).is_err()) return false;

        return spinUntil([&] {
            return offerer->state() == ConnectionState::Connected &&
                   answerer->state() == ConnectionState::Connected;
        }, kRtcTimeout);
    }
};

} // namespace

TEST_CASE("Control sends succeed while bulk frames are queued", "[rtc][integration]") {
    const auto config = rtcConfig();
    RtcLink link(config);
    REQUIRE(link.handshake());

    bool seen = false;
    QObject::connect(link.answerer.get(), &ConnectionManager::controlMessageReceived,
                     [&](const ControlMessage& message) {
        if (std::holds_alternative<SyncComplete>(message.body)) seen = true;
    });

    // Far more than the association drains at once.
    const Bytes frame(config.frame_size, 0x11);
    for (int i = 0; i < 256; ++i) {
        REQUIRE(link.offerer->sendBulk(frame));
    }
    REQUIRE(link.offerer->bufferedBytes() > 0);

    REQUIRE(link.offerer->send(makeMessage(SyncComplete{.total_items = 1, .total_bytes = 2})));
    REQUIRE(spinUntil([&] { return seen; }, kRtcTimeout));
}

TEST_CASE("A multi-frame snapshot crosses real data channels", "[rtc][integration]") {
    const auto config = rtcConfig();
    RtcLink link(config);
    PeerStack editor(*link.offerer, config, PeerRole::Editor);
    PeerStack viewer(*link.answerer, config, PeerRole::Viewer);

    Bytes payload(300 * 1024 + 7);
    for (size_t i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<uint8_t>(i * 29 + 1);
    }
    auto item = create_item("large", 0);
    editor.store->save_item(item).unwrap();
    editor.store->save_payload(item.id, payload).unwrap();

    REQUIRE(link.handshake());
    REQUIRE(spinUntil([&] { return viewer.orchestrator->role().has_value(); }, kRtcTimeout));

    REQUIRE(editor.orchestrator->startSync().is_ok());
    REQUIRE(spinUntil([&] { return viewer.orchestrator->pendingRequest().has_value(); }, kRtcTimeout));
    REQUIRE(viewer.orchestrator->acceptSync().is_ok());

    REQUIRE(spinUntil([&] {
        const auto phase = viewer.orchestrator->progress().phase;
        return phase == SyncPhase::Complete || phase == SyncPhase::Error;
    }, kRtcTimeout));
    REQUIRE(viewer.orchestrator->progress().phase == SyncPhase::Complete);
    REQUIRE(editor.orchestrator->progress().phase == SyncPhase::Complete);

    REQUIRE(viewer.orchestrator->commitSync().is_ok());
    REQUIRE(viewer.store->load_payload(item.id).unwrap() == payload);
}
