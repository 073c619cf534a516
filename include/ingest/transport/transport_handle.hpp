#pragma once

#include "ingest/transport/remote_transport.hpp"

#include <memory>
#include <mutex>

namespace ingest::transport {

/**
 * @brief The single swappable reference to the active transport
 *
 * The worker takes one snapshot per Job, so a swap during an upload only
 * affects the next Job; the old transport stays alive until that Job
 * releases it.
 */
class TransportHandle {
public:
    TransportHandle() = default;
    explicit TransportHandle(std::shared_ptr<RemoteTransport> initial) : current_(std::move(initial)) {}

    TransportHandle(const TransportHandle&) = delete;
    TransportHandle& operator=(const TransportHandle&) = delete;

    std::shared_ptr<RemoteTransport> snapshot() const {
        std::lock_guard lock(mutex_);
        return current_;
    }

    /// Install `next`; returns the transport it replaced
    std::shared_ptr<RemoteTransport> swap(std::shared_ptr<RemoteTransport> next) {
        std::lock_guard lock(mutex_);
        std::swap(current_, next);
        return next;
    }

private:
    mutable std::mutex mutex_;
    std::shared_ptr<RemoteTransport> current_;
};

} // namespace ingest::transport
