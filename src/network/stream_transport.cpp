#include "chunkstream/network/stream_transport.hpp"
#include "chunkstream/network/codec.hpp"
#include "chunkstream/core/logger.hpp"
#include <algorithm>
#include <array>

namespace chunkstream::network {

const char* transport_status_name(TransportStatus status) {
    switch (status) {
        case TransportStatus::OK: return "ok";
        case TransportStatus::CLOSED: return "closed";
        case TransportStatus::BACKPRESSURED: return "backpressured";
        case TransportStatus::FRAME_REJECTED: return "frame rejected";
    }
    return "unknown";
}

TransportStatus FramedStreamTransport::recv_frame(std::vector<std::uint8_t>& frame) {
    std::array<std::uint8_t, FRAME_HEADER_SIZE> header_bytes;
    if (!read_exact(header_bytes)) {
        return TransportStatus::CLOSED;
    }

    FrameHeader header;
    try {
        header = codec::decode_header(header_bytes);
    } catch (const ProtocolError& e) {
        ++frames_rejected_;
        LOG_WARN("Rejected frame header from {}: {}", remote_endpoint(), e.what());
        // The stream position is lost once a header is refused
        close();
        return TransportStatus::FRAME_REJECTED;
    }

    frame.resize(header.frame_size());
    std::copy(header_bytes.begin(), header_bytes.end(), frame.begin());

    if (!read_exact(std::span<std::uint8_t>(frame).subspan(FRAME_HEADER_SIZE))) {
        return TransportStatus::CLOSED;
    }

    ++frames_received_;
    return TransportStatus::OK;
}

}
