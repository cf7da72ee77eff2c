#include "support/loopback_transport.hpp"

#include <QMetaObject>

namespace tandem::test {

std::pair<std::unique_ptr<LoopbackTransport>, std::unique_ptr<LoopbackTransport>>
LoopbackTransport::makePair() {
    std::unique_ptr<LoopbackTransport> a(new LoopbackTransport());
    std::unique_ptr<LoopbackTransport> b(new LoopbackTransport());
    a->peer_ = b.get();
    b->peer_ = a.get();
    return {std::move(a), std::move(b)};
}

LoopbackTransport::~LoopbackTransport() {
    close();
}

Result<void> LoopbackTransport::createOffer() {
    offered_ = true;
    local_sdp_ = "v=0\r\no=- 1 1 IN IP4 127.0.0.1\r\ns=loopback-offer\r\n";
    QMetaObject::invokeMethod(this, [this]() { emit localDescriptionReady(); }, Qt::QueuedConnection);
    return Result<void>::ok();
}

Result<void> LoopbackTransport::acceptOffer(const std::string& sdp) {
    if (sdp.find("v=0") == std::string::npos) {
        return fail(ErrorCode::Negotiation, "malformed offer");
    }
    local_sdp_ = "v=0\r\no=- 2 1 IN IP4 127.0.0.1\r\ns=loopback-answer\r\n";
    QMetaObject::invokeMethod(this, [this]() { emit localDescriptionReady(); }, Qt::QueuedConnection);
    return Result<void>::ok();
}

Result<void> LoopbackTransport::applyAnswer(const std::string& sdp) {
    if (!offered_ || sdp.find("v=0") == std::string::npos) {
        return fail(ErrorCode::Negotiation, "unexpected answer");
    }
    openLink();
    if (peer_) {
        peer_->openLink();
    }
    return Result<void>::ok();
}

void LoopbackTransport::openLink() {
    QMetaObject::invokeMethod(this, [this]() {
        open_ = true;
        emit linkStateChanged(LinkState::Connected);
        emit channelOpened(Channel::Control);
        emit channelOpened(Channel::Bulk);
    }, Qt::QueuedConnection);
}

bool LoopbackTransport::isChannelOpen(Channel) const {
    return open_;
}

bool LoopbackTransport::sendControl(const QByteArray& message) {
    if (!open_) return false;
    if (control_tap_) control_tap_(message);
    outbox_.push_back(Pending{.bulk = false, .control = message, .frame = {}});
    scheduleDelivery();
    return true;
}

bool LoopbackTransport::sendBulk(const Bytes& frame) {
    if (!open_) return false;
    buffered_ += frame.size();
    outbox_.push_back(Pending{.bulk = true, .control = {}, .frame = frame});
    scheduleDelivery();
    return true;
}

void LoopbackTransport::scheduleDelivery() {
    if (delivery_scheduled_ || held_ || outbox_.empty()) return;
    delivery_scheduled_ = true;
    QMetaObject::invokeMethod(this, [this]() {
        delivery_scheduled_ = false;
        deliver();
    }, Qt::QueuedConnection);
}

void LoopbackTransport::deliver() {
    bool delivered_bulk = false;
    while (!outbox_.empty() && !held_ && open_) {
        auto next = std::move(outbox_.front());
        outbox_.pop_front();

        if (next.bulk) {
            buffered_ -= next.frame.size();
            delivered_bulk = true;
            const bool dropped = bulk_filter_ && bulk_filter_(next.frame);
            if (peer_ && peer_->open_ && !dropped) {
                emit peer_->bulkReceived(next.frame);
            }
            if (slow_bulk_) break;
        } else if (peer_ && peer_->open_) {
            emit peer_->controlReceived(next.control);
        }
    }

    if (delivered_bulk && buffered_ <= low_threshold_) {
        emit bulkBufferedAmountLow();
    }
    scheduleDelivery();
}

void LoopbackTransport::setHeld(bool held) {
    held_ = held;
    scheduleDelivery();
}

void LoopbackTransport::close() {
    if (!open_ && !offered_ && local_sdp_.empty()) return;
    const bool was_open = open_;
    open_ = false;
    offered_ = false;
    local_sdp_.clear();
    outbox_.clear();
    buffered_ = 0;

    if (was_open && peer_) {
        QPointer<LoopbackTransport> peer = peer_;
        QMetaObject::invokeMethod(peer.data(), [peer]() {
            if (peer) peer->peerClosed(LinkState::Closed);
        }, Qt::QueuedConnection);
    }
}

void LoopbackTransport::dropLink() {
    if (!open_) return;
    open_ = false;
    outbox_.clear();
    buffered_ = 0;
    emit linkStateChanged(LinkState::Failed);
    if (peer_) {
        QPointer<LoopbackTransport> peer = peer_;
        QMetaObject::invokeMethod(peer.data(), [peer]() {
            if (peer) peer->peerClosed(LinkState::Failed);
        }, Qt::QueuedConnection);
    }
}

void LoopbackTransport::peerClosed(LinkState state) {
    if (!open_) return;
    open_ = false;
    outbox_.clear();
    buffered_ = 0;
    emit channelClosed(Channel::Control);
    emit channelClosed(Channel::Bulk);
    emit linkStateChanged(state);
}

} // namespace tandem::test
