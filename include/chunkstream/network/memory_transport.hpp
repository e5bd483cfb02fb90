#pragma once

#include "stream_transport.hpp"
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <utility>

namespace chunkstream::network {

// In-process byte pipe pair. Each end sees the other's sends in order; data already
// buffered is still delivered after the peer closes.
class MemoryTransport : public FramedStreamTransport {
public:
    static constexpr std::size_t DEFAULT_CAPACITY = 16 * 1024 * 1024;

    static std::pair<std::shared_ptr<MemoryTransport>, std::shared_ptr<MemoryTransport>>
    create_pair(std::size_t capacity = DEFAULT_CAPACITY, std::string name = "memory");

    ~MemoryTransport() override;

    TransportStatus send_frame(std::span<const std::uint8_t> frame) override;
    void close() override;
    bool is_closed() const override;
    std::string remote_endpoint() const override { return name_; }

    std::uint64_t frames_sent() const { return frames_sent_; }

protected:
    bool read_exact(std::span<std::uint8_t> buffer) override;

private:
    struct Pipe {
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<std::uint8_t> buffer;
        std::size_t capacity;
        bool closed = false;

        explicit Pipe(std::size_t cap) : capacity(cap) {}
        void close();
    };

    MemoryTransport(std::shared_ptr<Pipe> inbound, std::shared_ptr<Pipe> outbound, std::string name);

    std::shared_ptr<Pipe> inbound_;
    std::shared_ptr<Pipe> outbound_;
    std::string name_;
    std::atomic<bool> closed_{false};
    std::atomic<std::uint64_t> frames_sent_{0};
};

}
