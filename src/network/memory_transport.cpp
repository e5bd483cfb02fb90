#include "chunkstream/network/memory_transport.hpp"
#include "chunkstream/core/logger.hpp"

namespace chunkstream::network {

void MemoryTransport::Pipe::close() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        closed = true;
    }
    cv.notify_all();
}

std::pair<std::shared_ptr<MemoryTransport>, std::shared_ptr<MemoryTransport>>
MemoryTransport::create_pair(std::size_t capacity, std::string name) {
    auto a_to_b = std::make_shared<Pipe>(capacity);
    auto b_to_a = std::make_shared<Pipe>(capacity);

    std::shared_ptr<MemoryTransport> a(new MemoryTransport(b_to_a, a_to_b, name + ":a"));
    std::shared_ptr<MemoryTransport> b(new MemoryTransport(a_to_b, b_to_a, name + ":b"));
    return {a, b};
}

MemoryTransport::MemoryTransport(std::shared_ptr<Pipe> inbound, std::shared_ptr<Pipe> outbound, std::string name)
    : inbound_(std::move(inbound)), outbound_(std::move(outbound)), name_(std::move(name)) {
}

MemoryTransport::~MemoryTransport() {
    close();
}

TransportStatus MemoryTransport::send_frame(std::span<const std::uint8_t> frame) {
    if (closed_) {
        return TransportStatus::CLOSED;
    }

    {
        std::lock_guard<std::mutex> lock(outbound_->mutex);
        if (outbound_->closed) {
            return TransportStatus::CLOSED;
        }
        if (outbound_->buffer.size() + frame.size() > outbound_->capacity) {
            return TransportStatus::BACKPRESSURED;
        }
        outbound_->buffer.insert(outbound_->buffer.end(), frame.begin(), frame.end());
    }
    outbound_->cv.notify_all();

    ++frames_sent_;
    return TransportStatus::OK;
}

bool MemoryTransport::read_exact(std::span<std::uint8_t> buffer) {
    std::unique_lock<std::mutex> lock(inbound_->mutex);
    inbound_->cv.wait(lock, [&] {
        return closed_ || inbound_->closed || inbound_->buffer.size() >= buffer.size();
    });

    if (closed_ || inbound_->buffer.size() < buffer.size()) {
        return false;
    }

    auto end = inbound_->buffer.begin() + static_cast<std::ptrdiff_t>(buffer.size());
    std::copy(inbound_->buffer.begin(), end, buffer.begin());
    inbound_->buffer.erase(inbound_->buffer.begin(), end);
    return true;
}

void MemoryTransport::close() {
    if (closed_.exchange(true)) {
        return;
    }

    LOG_DEBUG("Closing memory transport {}", name_);
    outbound_->close();
    inbound_->close();
}

bool MemoryTransport::is_closed() const {
    if (closed_) {
        return true;
    }
    std::lock_guard<std::mutex> lock(outbound_->mutex);
    return outbound_->closed;
}

}
