#include <catch2/catch_test_macros.hpp>
#include "support/peer_pair.hpp"

using namespace tandem;
using namespace tandem::network;
using namespace tandem::test;

TEST_CASE("Manual handshake walks both state machines", "[connection][integration]") {
    LinkedManagers link;

    std::vector<ConnectionState> offer_states;
    std::vector<ConnectionState> answer_states;
    QObject::connect(link.offerer.get(), &ConnectionManager::stateChanged,
                     [&](ConnectionState s) { offer_states.push_back(s); });
    QObject::connect(link.answerer.get(), &ConnectionManager::stateChanged,
                     [&](ConnectionState s) { answer_states.push_back(s); });

    REQUIRE(link.handshake());

    REQUIRE(offer_states == std::vector<ConnectionState>{
        ConnectionState::CreatingOffer, ConnectionState::AwaitingAnswer,
        ConnectionState::Connecting, ConnectionState::Connected});
    REQUIRE(answer_states == std::vector<ConnectionState>{
        ConnectionState::CreatingAnswer, ConnectionState::Connecting,
        ConnectionState::Connected});
    REQUIRE(link.offerer->isConnected());
    REQUIRE(link.answerer->isConnected());
}

TEST_CASE("Handshake codes are produced by the signaling codec", "[connection][integration]") {
    LinkedManagers link;

    std::optional<Result<LocalDescriptor>> offer;
    link.offerer->initiate([&](Result<LocalDescriptor> r) { offer = std::move(r); });
    REQUIRE(spinUntil([&] { return offer.has_value(); }));
    REQUIRE(offer->is_ok());
    REQUIRE(offer->unwrap().descriptor.kind == DescriptorKind::Offer);

    auto decoded = decodeDescriptor(offer->unwrap().code);
    REQUIRE(decoded.is_ok());
    REQUIRE(decoded.unwrap() == offer->unwrap().descriptor);
    REQUIRE(link.offerer->state() == ConnectionState::AwaitingAnswer);
}

TEST_CASE("Handshake misuse is rejected", "[connection][integration]") {
    LinkedManagers link;

    SECTION("accepting an answer code fails with a signaling error") {
        std::optional<Result<LocalDescriptor>> result;
        link.answerer->accept(ConnectionDescriptor{.kind = DescriptorKind::Answer, .payload = "v=0\r\n"},
                              [&](Result<LocalDescriptor> r) { result = std::move(r); });
        REQUIRE(result.has_value());
        REQUIRE(result->unwrap_err().code == ErrorCode::Signaling);
        REQUIRE(link.answerer->state() == ConnectionState::Disconnected);
    }

    SECTION("an offer without a session description is refused") {
        std::optional<Result<LocalDescriptor>> result;
        link.answerer->accept(ConnectionDescriptor{.kind = DescriptorKind::Offer, .payload = "garbage"},
                              [&](Result<LocalDescriptor> r) { result = std::move(r); });
        REQUIRE(result.has_value());
        REQUIRE(result->unwrap_err().code == ErrorCode::Signaling);
    }

    SECTION("completing without an outstanding offer") {
        auto completed = link.offerer->complete(
            ConnectionDescriptor{.kind = DescriptorKind::Answer, .payload = "v=0\r\n"});
        REQUIRE(completed.unwrap_err().code == ErrorCode::InvalidState);
    }

    SECTION("completing with an offer code") {
        std::optional<Result<LocalDescriptor>> offer;
        link.offerer->initiate([&](Result<LocalDescriptor> r) { offer = std::move(r); });
        REQUIRE(spinUntil([&] { return offer.has_value(); }));

        auto completed = link.offerer->complete(offer->unwrap().descriptor);
        REQUIRE(completed.unwrap_err().code == ErrorCode::Signaling);
        REQUIRE(link.offerer->state() == ConnectionState::AwaitingAnswer);
    }

    SECTION("a second initiate while negotiating") {
        std::optional<Result<LocalDescriptor>> first;
        std::optional<Result<LocalDescriptor>> second;
        link.offerer->initiate([&](Result<LocalDescriptor> r) { first = std::move(r); });
        link.offerer->initiate([&](Result<LocalDescriptor> r) { second = std::move(r); });
        REQUIRE(second.has_value());
        REQUIRE(second->unwrap_err().code == ErrorCode::InvalidState);
        REQUIRE(spinUntil([&] { return first.has_value(); }));
        REQUIRE(first->is_ok());
    }
}

TEST_CASE("Control messages cross the link in order", "[connection][integration]") {
    LinkedManagers link;
    REQUIRE(link.handshake());

    std::vector<std::string> received;
    QObject::connect(link.answerer.get(), &ConnectionManager::controlMessageReceived,
                     [&](const ControlMessage& m) {
        if (const auto* request = m.as<RoleRequest>()) received.push_back(request->reason.value_or(""));
    });

    REQUIRE(link.offerer->send(makeMessage(RoleRequest{.reason = "one"})));
    REQUIRE(link.offerer->send(makeMessage(RoleRequest{.reason = "two"})));
    REQUIRE(link.offerer->send(makeMessage(RoleRequest{.reason = "three"})));

    REQUIRE(spinUntil([&] { return received.size() == 3; }));
    REQUIRE(received == std::vector<std::string>{"one", "two", "three"});
}

TEST_CASE("Sending without a link fails", "[connection]") {
    LinkedManagers link;
    REQUIRE_FALSE(link.offerer->send(makeMessage(RoleRequest{})));
    REQUIRE_FALSE(link.offerer->sendBulk(Bytes{1, 2, 3}));
    REQUIRE(link.offerer->bufferedBytes() == 0);
}

TEST_CASE("A silent peer raises one liveness timeout", "[connection][integration]") {
    LinkedManagers link;
    REQUIRE(link.handshake());

    int timeouts = 0;
    int restored = 0;
    QObject::connect(link.offerer.get(), &ConnectionManager::livenessTimeout, [&] { ++timeouts; });
    QObject::connect(link.offerer.get(), &ConnectionManager::livenessRestored, [&] { ++restored; });

    link.offerer->startHeartbeat();
    link.answerer->startHeartbeat();
    REQUIRE(link.offerer->heartbeatRunning());

    spinFor(std::chrono::milliseconds(200));
    REQUIRE(timeouts == 0);

    link.answer_link->setHeld(true);
    link.offer_link->setHeld(true);
    spinFor(std::chrono::milliseconds(600));

    REQUIRE(timeouts == 1);
    REQUIRE(link.offerer->state() == ConnectionState::Reconnecting);
    REQUIRE(link.offerer->isConnected());

    link.offer_link->setHeld(false);
    link.answer_link->setHeld(false);
    REQUIRE(spinUntil([&] { return restored == 1; }));
    REQUIRE(link.offerer->state() == ConnectionState::Connected);
    REQUIRE(timeouts == 1);
}

TEST_CASE("Graceful disconnect is not mistaken for a network drop", "[connection][integration]") {
    LinkedManagers link;
    REQUIRE(link.handshake());
    link.offerer->startHeartbeat();
    link.answerer->startHeartbeat();

    std::optional<DisconnectReason> reason;
    int timeouts = 0;
    bool reconnecting = false;
    QObject::connect(link.answerer.get(), &ConnectionManager::peerDisconnected,
                     [&](DisconnectReason r) { reason = r; });
    QObject::connect(link.answerer.get(), &ConnectionManager::livenessTimeout, [&] { ++timeouts; });
    QObject::connect(link.answerer.get(), &ConnectionManager::stateChanged, [&](ConnectionState s) {
        if (s == ConnectionState::Reconnecting) reconnecting = true;
    });

    bool done = false;
    link.offerer->gracefulDisconnect(DisconnectReason::UserInitiated, [&] { done = true; });

    REQUIRE(spinUntil([&] { return done && reason.has_value(); }));
    REQUIRE(*reason == DisconnectReason::UserInitiated);
    REQUIRE(spinUntil([&] { return link.answerer->state() == ConnectionState::Disconnected; }));
    REQUIRE(link.offerer->state() == ConnectionState::Disconnected);

    spinFor(std::chrono::milliseconds(300));
    REQUIRE(timeouts == 0);
    REQUIRE_FALSE(reconnecting);
    REQUIRE_FALSE(link.answerer->heartbeatRunning());
}

TEST_CASE("A dropped link tears both sides down", "[connection][integration]") {
    LinkedManagers link;
    REQUIRE(link.handshake());

    bool peer_said_goodbye = false;
    QObject::connect(link.answerer.get(), &ConnectionManager::peerDisconnected,
                     [&](DisconnectReason) { peer_said_goodbye = true; });

    link.offer_link->dropLink();
    REQUIRE(spinUntil([&] {
        return link.offerer->state() == ConnectionState::Disconnected &&
               link.answerer->state() == ConnectionState::Disconnected;
    }));
    REQUIRE_FALSE(peer_said_goodbye);
    REQUIRE_FALSE(link.offerer->send(makeMessage(RoleRequest{})));
}

TEST_CASE("Teardown releases buffer-drain waiters", "[connection][integration]") {
    LinkedManagers link;
    REQUIRE(link.handshake());

    link.offer_link->setHeld(true);
    const Bytes frame(2048, 0xAB);
    REQUIRE(link.offerer->sendBulk(frame));
    REQUIRE(link.offerer->sendBulk(frame));
    REQUIRE(link.offerer->bufferedBytes() == 4096);

    QObject context;
    bool resumed = false;
    REQUIRE_FALSE(link.offerer->awaitBufferDrain(1024, &context, [&] { resumed = true; }));
    REQUIRE_FALSE(resumed);

    SECTION("released when the buffer drains") {
        link.offer_link->setHeld(false);
        REQUIRE(spinUntil([&] { return resumed; }));
    }

    SECTION("released on teardown") {
        link.offerer->teardown();
        REQUIRE(resumed);
    }
}
