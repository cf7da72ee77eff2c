#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <QByteArray>
#include <QObject>
#include <QString>

#include <cstdint>
#include <string>

namespace tandem::network {

/**
 * PeerTransport - one peer-to-peer link carrying a reliable ordered control
 * channel and a reliable ordered bulk channel.
 *
 * Owned exclusively by ConnectionManager. Implementations deliver every
 * signal on the thread the object lives on, and normalize incoming binary
 * data to Bytes before emitting bulkReceived().
 */
class PeerTransport : public QObject {
    Q_OBJECT

public:
    enum class Channel {
        Control,
        Bulk
    };

    enum class LinkState {
        New,
        Connecting,
        Connected,
        Disconnected,
        Failed,
        Closed
    };

    using QObject::QObject;
    ~PeerTransport() override = default;

    /**
     * Create the link and both channels, and start generating the local offer.
     * localDescriptionReady() fires once path discovery finishes.
     */
    virtual Result<void> createOffer() = 0;

    /**
     * Apply a remote offer and start generating the local answer.
     */
    virtual Result<void> acceptOffer(const std::string& sdp) = 0;

    /**
     * Apply the remote answer to a previously created offer.
     */
    virtual Result<void> applyAnswer(const std::string& sdp) = 0;

    /**
     * Local SDP including every candidate gathered so far.
     */
    [[nodiscard]] virtual std::string localDescription() const = 0;

    [[nodiscard]] virtual bool isChannelOpen(Channel channel) const = 0;

    /**
     * Send one control message; false if the channel is not open.
     */
    virtual bool sendControl(const QByteArray& message) = 0;

    /**
     * Send one bulk frame; false if the channel is not open.
     */
    virtual bool sendBulk(const Bytes& frame) = 0;

    [[nodiscard]] virtual uint64_t bulkBufferedAmount() const = 0;

    /**
     * bulkBufferedAmountLow() fires when the buffered amount drops to this value.
     */
    virtual void setBulkLowThreshold(uint64_t threshold) = 0;

    /**
     * Close both channels and the link. Idempotent.
     */
    virtual void close() = 0;

signals:
    void localDescriptionReady();
    void linkStateChanged(tandem::network::PeerTransport::LinkState state);
    void channelOpened(tandem::network::PeerTransport::Channel channel);
    void channelClosed(tandem::network::PeerTransport::Channel channel);
    void controlReceived(const QByteArray& message);
    void bulkReceived(const tandem::Bytes& frame);
    void bulkBufferedAmountLow();
    void transportError(const QString& message);
};

} // namespace tandem::network
