#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

#include <dockhand/transport/transport_stream.h>

namespace dockhand::http::detail {

// Idle keep-alive streams of one Connection. Streams are handed out most recent first.
class StreamPool {
public:
    explicit StreamPool(std::size_t maxIdle) : maxIdle_(maxIdle) {}

    std::optional<transport::TransportStream> acquire();
    // Keeps the stream for reuse, or closes it when the pool is full or it is already closed.
    void release(transport::TransportStream stream);
    void clear();
    std::size_t idle() const;

private:
    mutable std::mutex mutex_;
    std::deque<transport::TransportStream> idle_;
    std::size_t maxIdle_;
};

} // namespace dockhand::http::detail
