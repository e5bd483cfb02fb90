#pragma once

#include "protocol.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace chunkstream::network {

struct FrameHeader {
    std::uint32_t length;   // tag + body
    MessageType type;

    std::uint32_t body_size() const { return length - 1; }
    std::size_t frame_size() const { return FRAME_HEADER_SIZE - 1 + length; }
};

namespace codec {

// Largest permitted value of the length field for a frame of this type.
std::uint32_t max_frame_length(MessageType type);

// Validates the 5 header bytes: known tag, non-zero length, length within the
// ceiling for the tag. Throws ProtocolError.
FrameHeader decode_header(std::span<const std::uint8_t> header);

// Complete frame including header. Throws ProtocolError when the result would
// exceed the ceiling for its type.
std::vector<std::uint8_t> encode(const Message& message);

Message decode_body(MessageType type, std::span<const std::uint8_t> body);

// Decodes a complete frame as produced by encode() or Transport::recv_frame().
Message decode(std::span<const std::uint8_t> frame);

MessageType type_of(const Message& message);

const std::string& file_id_of(const Message& message);

}

}
