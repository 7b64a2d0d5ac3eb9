#include "stream_pool.h"

#include <spdlog/spdlog.h>

namespace dockhand::http::detail {

std::optional<transport::TransportStream> StreamPool::acquire() {
    std::lock_guard<std::mutex> lk(mutex_);
    while (!idle_.empty()) {
        auto stream = std::move(idle_.back());
        idle_.pop_back();
        if (stream.isOpen()) {
            spdlog::debug("StreamPool: reusing idle stream ({} left)", idle_.size());
            return stream;
        }
    }
    return std::nullopt;
}

void StreamPool::release(transport::TransportStream stream) {
    if (!stream.isOpen()) {
        return;
    }
    std::lock_guard<std::mutex> lk(mutex_);
    if (idle_.size() >= maxIdle_) {
        stream.close();
        return;
    }
    idle_.push_back(std::move(stream));
}

void StreamPool::clear() {
    std::lock_guard<std::mutex> lk(mutex_);
    for (auto& s : idle_) {
        s.close();
    }
    idle_.clear();
}

std::size_t StreamPool::idle() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return idle_.size();
}

} // namespace dockhand::http::detail
