#include "network/rtc_peer_transport.hpp"

#include "core/logging.hpp"

#include <QDebug>
#include <QMetaObject>
#include <QPointer>

#include <rtc/rtc.hpp>

#include <cstddef>
#include <exception>
#include <utility>

namespace tandem::network {

namespace {

const char* link_state_name(rtc::PeerConnection::State s) {
    switch (s) {
        case rtc::PeerConnection::State::New: return "new";
        case rtc::PeerConnection::State::Connecting: return "connecting";
        case rtc::PeerConnection::State::Connected: return "connected";
        case rtc::PeerConnection::State::Disconnected: return "disconnected";
        case rtc::PeerConnection::State::Failed: return "failed";
        case rtc::PeerConnection::State::Closed: return "closed";
        default: return "unknown";
    }
}

PeerTransport::LinkState to_link_state(rtc::PeerConnection::State s) {
    switch (s) {
        case rtc::PeerConnection::State::New: return PeerTransport::LinkState::New;
        case rtc::PeerConnection::State::Connecting: return PeerTransport::LinkState::Connecting;
        case rtc::PeerConnection::State::Connected: return PeerTransport::LinkState::Connected;
        case rtc::PeerConnection::State::Disconnected: return PeerTransport::LinkState::Disconnected;
        case rtc::PeerConnection::State::Failed: return PeerTransport::LinkState::Failed;
        case rtc::PeerConnection::State::Closed: return PeerTransport::LinkState::Closed;
        default: return PeerTransport::LinkState::Failed;
    }
}

const char* channel_name(PeerTransport::Channel channel) {
    return channel == PeerTransport::Channel::Control ? RtcPeerTransport::CONTROL_LABEL
                                                      : RtcPeerTransport::BULK_LABEL;
}

Bytes to_bytes(const rtc::binary& data) {
    Bytes out(data.size());
    for (size_t i = 0; i < data.size(); ++i) {
        out[i] = std::to_integer<uint8_t>(data[i]);
    }
    return out;
}

Bytes to_bytes(const std::string& data) {
    return Bytes(data.begin(), data.end());
}

QByteArray to_qbytes(const rtc::binary& data) {
    return QByteArray(reinterpret_cast<const char*>(data.data()),
                      static_cast<qsizetype>(data.size()));
}

QByteArray to_qbytes(const std::string& data) {
    return QByteArray(data.data(), static_cast<qsizetype>(data.size()));
}

} // namespace

template<typename F>
void RtcPeerTransport::post(uint64_t epoch, F&& fn) {
    QPointer<RtcPeerTransport> self(this);
    QMetaObject::invokeMethod(
        this,
        [self, epoch, fn = std::forward<F>(fn)]() mutable {
            if (!self || self->epoch_ != epoch) {
                return;
            }
            fn();
        },
        Qt::QueuedConnection);
}

RtcPeerTransport::RtcPeerTransport(std::vector<std::string> ice_servers, QObject* parent)
    : PeerTransport(parent)
    , ice_servers_(std::move(ice_servers))
{
}

RtcPeerTransport::~RtcPeerTransport() {
    close();
}

Result<void> RtcPeerTransport::createPeerConnection() {
    close();
    ++epoch_;
    description_published_ = false;

    rtc::Configuration config;
    for (const auto& server : ice_servers_) {
        config.iceServers.emplace_back(server);
    }

    try {
        pc_ = std::make_shared<rtc::PeerConnection>(config);
    } catch (const std::exception& e) {
        return fail(ErrorCode::Negotiation,
                    std::string("Failed to create peer connection: ") + e.what());
    }

    const auto epoch = epoch_;
    pc_->onStateChange([this, epoch](rtc::PeerConnection::State s) {
        post(epoch, [this, s]() {
            if (sync_debug_enabled()) {
                qInfo() << "RTC: link state=" << link_state_name(s);
            }
            emit linkStateChanged(to_link_state(s));
        });
    });

    pc_->onGatheringStateChange([this, epoch](rtc::PeerConnection::GatheringState s) {
        if (s != rtc::PeerConnection::GatheringState::Complete) return;
        post(epoch, [this]() {
            if (description_published_) return;
            description_published_ = true;
            if (sync_debug_enabled()) {
                qInfo() << "RTC: gathering complete";
            }
            emit localDescriptionReady();
        });
    });

    pc_->onDataChannel([this, epoch](std::shared_ptr<rtc::DataChannel> dc) {
        post(epoch, [this, dc = std::move(dc)]() mutable {
            const auto label = dc->label();
            if (label == CONTROL_LABEL) {
                attachChannel(Channel::Control, std::move(dc));
            } else if (label == BULK_LABEL) {
                attachChannel(Channel::Bulk, std::move(dc));
            } else {
                qWarning() << "RTC: ignoring unexpected channel" << QString::fromStdString(label);
            }
        });
    });

    return Result<void>::ok();
}

void RtcPeerTransport::attachChannel(Channel channel, std::shared_ptr<rtc::DataChannel> dc) {
    auto& slot = channel == Channel::Control ? control_ : bulk_;
    slot = std::move(dc);
    const auto epoch = epoch_;

    slot->onOpen([this, epoch, channel]() {
        post(epoch, [this, channel]() {
            if (sync_debug_enabled()) {
                qInfo() << "RTC: channel open" << channel_name(channel);
            }
            emit channelOpened(channel);
        });
    });
    slot->onClosed([this, epoch, channel]() {
        post(epoch, [this, channel]() {
            if (sync_debug_enabled()) {
                qInfo() << "RTC: channel closed" << channel_name(channel);
            }
            emit channelClosed(channel);
        });
    });
    slot->onError([this, epoch, channel](std::string error) {
        post(epoch, [this, channel, error = std::move(error)]() {
            qWarning() << "RTC: channel" << channel_name(channel)
                       << "error:" << QString::fromStdString(error);
            emit transportError(QString::fromStdString(error));
        });
    });

    if (channel == Channel::Control) {
        slot->onMessage([this, epoch](rtc::message_variant data) {
            QByteArray bytes = std::visit([](const auto& d) { return to_qbytes(d); }, data);
            post(epoch, [this, bytes = std::move(bytes)]() {
                emit controlReceived(bytes);
            });
        });
    } else {
        slot->setBufferedAmountLowThreshold(static_cast<size_t>(bulk_low_threshold_));
        slot->onBufferedAmountLow([this, epoch]() {
            post(epoch, [this]() { emit bulkBufferedAmountLow(); });
        });
        slot->onMessage([this, epoch](rtc::message_variant data) {
            Bytes bytes = std::visit([](const auto& d) { return to_bytes(d); }, data);
            post(epoch, [this, bytes = std::move(bytes)]() {
                emit bulkReceived(bytes);
            });
        });
    }

    // A channel may already be open when announced to the answering side.
    if (slot->isOpen()) {
        post(epoch, [this, channel]() { emit channelOpened(channel); });
    }
}

Result<void> RtcPeerTransport::createOffer() {
    auto created = createPeerConnection();
    if (created.is_err()) return created;

    try {
        // Creating the first channel triggers local offer generation.
        attachChannel(Channel::Control, pc_->createDataChannel(CONTROL_LABEL));
        attachChannel(Channel::Bulk, pc_->createDataChannel(BULK_LABEL));
    } catch (const std::exception& e) {
        close();
        return fail(ErrorCode::Negotiation, std::string("Failed to open channels: ") + e.what());
    }
    return Result<void>::ok();
}

Result<void> RtcPeerTransport::acceptOffer(const std::string& sdp) {
    auto created = createPeerConnection();
    if (created.is_err()) return created;

    try {
        pc_->setRemoteDescription(rtc::Description(sdp, rtc::Description::Type::Offer));
    } catch (const std::exception& e) {
        close();
        return fail(ErrorCode::Negotiation, std::string("Invalid remote offer: ") + e.what());
    }
    return Result<void>::ok();
}

Result<void> RtcPeerTransport::applyAnswer(const std::string& sdp) {
    if (!pc_) {
        return fail(ErrorCode::Negotiation, "No pending offer");
    }
    try {
        pc_->setRemoteDescription(rtc::Description(sdp, rtc::Description::Type::Answer));
    } catch (const std::exception& e) {
        return fail(ErrorCode::Negotiation, std::string("Invalid remote answer: ") + e.what());
    }
    return Result<void>::ok();
}

std::string RtcPeerTransport::localDescription() const {
    if (!pc_) return {};
    const auto desc = pc_->localDescription();
    if (!desc) return {};
    return std::string(*desc);
}

bool RtcPeerTransport::isChannelOpen(Channel channel) const {
    const auto& dc = channel == Channel::Control ? control_ : bulk_;
    return dc && dc->isOpen();
}

bool RtcPeerTransport::sendControl(const QByteArray& message) {
    if (!isChannelOpen(Channel::Control)) return false;
    try {
        // send() returns false when the message was queued behind buffered data.
        control_->send(message.toStdString());
        return true;
    } catch (const std::exception& e) {
        qWarning() << "RTC: control send failed:" << e.what();
        return false;
    }
}

bool RtcPeerTransport::sendBulk(const Bytes& frame) {
    if (!isChannelOpen(Channel::Bulk)) return false;
    try {
        bulk_->send(reinterpret_cast<const std::byte*>(frame.data()), frame.size());
        return true;
    } catch (const std::exception& e) {
        qWarning() << "RTC: bulk send failed:" << e.what();
        return false;
    }
}

uint64_t RtcPeerTransport::bulkBufferedAmount() const {
    return bulk_ ? static_cast<uint64_t>(bulk_->bufferedAmount()) : 0;
}

void RtcPeerTransport::setBulkLowThreshold(uint64_t threshold) {
    bulk_low_threshold_ = threshold;
    if (bulk_) {
        bulk_->setBufferedAmountLowThreshold(static_cast<size_t>(threshold));
    }
}

void RtcPeerTransport::detachCallbacks() {
    for (auto* dc : {&control_, &bulk_}) {
        if (!*dc) continue;
        (*dc)->onOpen(nullptr);
        (*dc)->onClosed(nullptr);
        (*dc)->onError(nullptr);
        (*dc)->onMessage(nullptr);
        (*dc)->onBufferedAmountLow(nullptr);
    }
    if (pc_) {
        pc_->onStateChange(nullptr);
        pc_->onGatheringStateChange(nullptr);
        pc_->onDataChannel(nullptr);
    }
}

void RtcPeerTransport::close() {
    if (!pc_ && !control_ && !bulk_) return;

    detachCallbacks();
    ++epoch_;

    auto close_channel = [](std::shared_ptr<rtc::DataChannel>& dc) {
        if (!dc) return;
        try {
            dc->close();
        } catch (const std::exception& e) {
            qWarning() << "RTC: channel close failed:" << e.what();
        }
        dc.reset();
    };
    close_channel(control_);
    close_channel(bulk_);

    if (pc_) {
        try {
            pc_->close();
        } catch (const std::exception& e) {
            qWarning() << "RTC: peer connection close failed:" << e.what();
        }
        pc_.reset();
    }
}

} // namespace tandem::network
