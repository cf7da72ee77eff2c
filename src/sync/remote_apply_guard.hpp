#pragma once

namespace tandem::sync {

/**
 * RemoteApplyGuard - scope token marking that a remote operation is being
 * applied locally.
 *
 * While any guard is alive the owning depth counter is non-zero, and the
 * orchestrator suppresses outbound broadcasts so a received operation is
 * never echoed back to the peer.
 */
class RemoteApplyGuard {
public:
    explicit RemoteApplyGuard(int& depth) : depth_(depth) { ++depth_; }
    ~RemoteApplyGuard() { --depth_; }

    RemoteApplyGuard(const RemoteApplyGuard&) = delete;
    RemoteApplyGuard& operator=(const RemoteApplyGuard&) = delete;

    [[nodiscard]] static bool active(int depth) { return depth > 0; }

private:
    int& depth_;
};

} // namespace tandem::sync
