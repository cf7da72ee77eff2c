#pragma once

#include "network/peer_transport.hpp"

#include <QPointer>

#include <deque>
#include <functional>
#include <memory>
#include <utility>

namespace tandem::test {

/**
 * LoopbackTransport - in-process PeerTransport for tests.
 *
 * Two instances created by makePair() are linked. Everything is delivered
 * through the event loop, never synchronously, so ordering matches a real
 * reliable ordered channel. The bulk buffered amount is the number of bytes
 * sent but not yet delivered to the peer.
 */
class LoopbackTransport : public network::PeerTransport {
public:
    static std::pair<std::unique_ptr<LoopbackTransport>, std::unique_ptr<LoopbackTransport>> makePair();

    ~LoopbackTransport() override;

    Result<void> createOffer() override;
    Result<void> acceptOffer(const std::string& sdp) override;
    Result<void> applyAnswer(const std::string& sdp) override;

    [[nodiscard]] std::string localDescription() const override { return local_sdp_; }
    [[nodiscard]] bool isChannelOpen(Channel channel) const override;

    bool sendControl(const QByteArray& message) override;
    bool sendBulk(const Bytes& frame) override;

    [[nodiscard]] uint64_t bulkBufferedAmount() const override { return buffered_; }
    void setBulkLowThreshold(uint64_t threshold) override { low_threshold_ = threshold; }

    void close() override;

    /**
     * Hold outgoing traffic instead of delivering it; a silent peer.
     * Releasing flushes the held traffic in order.
     */
    void setHeld(bool held);

    /**
     * Drop the link without a goodbye, as a network failure would.
     */
    void dropLink();

    /**
     * Deliver bytes sent on the bulk channel one event-loop turn at a time.
     * When false (the default) every queued frame is delivered on the next turn.
     */
    void setSlowBulk(bool slow) { slow_bulk_ = slow; }

    /**
     * Observe every control message this side sends, before delivery.
     */
    void setControlTap(std::function<void(const QByteArray&)> tap) { control_tap_ = std::move(tap); }

    /**
     * Drop bulk frames matching the predicate instead of delivering them.
     */
    void setBulkFilter(std::function<bool(const Bytes&)> drop) { bulk_filter_ = std::move(drop); }

    [[nodiscard]] bool isOpen() const { return open_; }

private:
    LoopbackTransport() = default;

    struct Pending {
        bool bulk = false;
        QByteArray control;
        Bytes frame;
    };

    QPointer<LoopbackTransport> peer_;
    std::string local_sdp_;
    bool offered_ = false;
    bool open_ = false;
    bool held_ = false;
    bool slow_bulk_ = false;
    bool delivery_scheduled_ = false;
    uint64_t buffered_ = 0;
    uint64_t low_threshold_ = 0;
    std::deque<Pending> outbox_;
    std::function<void(const QByteArray&)> control_tap_;
    std::function<bool(const Bytes&)> bulk_filter_;

    void openLink();
    void scheduleDelivery();
    void deliver();
    void peerClosed(LinkState state);
};

} // namespace tandem::test
