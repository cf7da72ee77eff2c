#pragma once

#include "core/config.hpp"
#include "network/peer_transport.hpp"

#include <memory>
#include <string>
#include <vector>

namespace rtc {
class DataChannel;
class PeerConnection;
} // namespace rtc

namespace tandem::network {

/**
 * RtcPeerTransport - PeerTransport over a libdatachannel PeerConnection.
 *
 * libdatachannel invokes its callbacks on internal threads; every callback is
 * re-posted to this object's thread before any state is touched, so the
 * owner only ever observes signals on its own event loop. Candidates are not
 * trickled: the local description is published once gathering completes.
 */
class RtcPeerTransport : public PeerTransport {
    Q_OBJECT

public:
    static constexpr const char* CONTROL_LABEL = "control";
    static constexpr const char* BULK_LABEL = "binary";

    explicit RtcPeerTransport(std::vector<std::string> ice_servers, QObject* parent = nullptr);
    ~RtcPeerTransport() override;

    Result<void> createOffer() override;
    Result<void> acceptOffer(const std::string& sdp) override;
    Result<void> applyAnswer(const std::string& sdp) override;

    [[nodiscard]] std::string localDescription() const override;
    [[nodiscard]] bool isChannelOpen(Channel channel) const override;

    bool sendControl(const QByteArray& message) override;
    bool sendBulk(const Bytes& frame) override;

    [[nodiscard]] uint64_t bulkBufferedAmount() const override;
    void setBulkLowThreshold(uint64_t threshold) override;

    void close() override;

private:
    std::vector<std::string> ice_servers_;
    std::shared_ptr<rtc::PeerConnection> pc_;
    std::shared_ptr<rtc::DataChannel> control_;
    std::shared_ptr<rtc::DataChannel> bulk_;
    uint64_t bulk_low_threshold_ = 0;
    uint64_t epoch_ = 0;
    bool description_published_ = false;

    Result<void> createPeerConnection();
    void attachChannel(Channel channel, std::shared_ptr<rtc::DataChannel> dc);
    void detachCallbacks();

    // Run `fn` on this object's thread if the link generation is still current.
    template<typename F>
    void post(uint64_t epoch, F&& fn);
};

} // namespace tandem::network
