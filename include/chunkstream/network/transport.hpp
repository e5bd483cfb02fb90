#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace chunkstream::network {

enum class TransportStatus {
    OK,
    CLOSED,
    BACKPRESSURED,
    FRAME_REJECTED
};

const char* transport_status_name(TransportStatus status);

// Ordered, framed, bidirectional channel to one peer. A frame is the complete
// wire frame: 5 header bytes followed by the body.
class Transport {
public:
    virtual ~Transport() = default;

    // Does not block waiting for the peer. BACKPRESSURED means nothing was written.
    virtual TransportStatus send_frame(std::span<const std::uint8_t> frame) = 0;

    // Blocks until a whole frame arrives, the transport closes, or the incoming
    // header fails validation (FRAME_REJECTED, the body is never allocated).
    virtual TransportStatus recv_frame(std::vector<std::uint8_t>& frame) = 0;

    // Idempotent. Unblocks a pending recv_frame().
    virtual void close() = 0;
    virtual bool is_closed() const = 0;

    virtual std::string remote_endpoint() const { return "unknown"; }
};

}
