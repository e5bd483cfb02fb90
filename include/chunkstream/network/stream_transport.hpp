#pragma once

#include "transport.hpp"
#include <atomic>

namespace chunkstream::network {

// Frames over a reliable byte stream. Subclasses provide the raw reads and writes.
class FramedStreamTransport : public Transport {
public:
    TransportStatus recv_frame(std::vector<std::uint8_t>& frame) override;

    std::uint64_t frames_received() const { return frames_received_; }
    std::uint64_t frames_rejected() const { return frames_rejected_; }

protected:
    // false once the stream is closed and cannot supply `buffer.size()` more bytes
    virtual bool read_exact(std::span<std::uint8_t> buffer) = 0;

private:
    std::atomic<std::uint64_t> frames_received_{0};
    std::atomic<std::uint64_t> frames_rejected_{0};
};

}
