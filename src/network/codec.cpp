#include "chunkstream/network/codec.hpp"

namespace chunkstream::network::codec {

namespace {
    template<MessagePayload T>
    Message decode_as(std::span<const std::uint8_t> body) {
        return T::deserialize(body);
    }
}

std::uint32_t max_frame_length(MessageType type) {
    return type == MessageType::CHUNK_DATA ? MAX_CHUNK_FRAME : MAX_MESSAGE_SIZE;
}

FrameHeader decode_header(std::span<const std::uint8_t> header) {
    if (header.size() < FRAME_HEADER_SIZE) {
        throw ProtocolError("Insufficient data for frame header");
    }

    std::uint32_t length = (static_cast<std::uint32_t>(header[0]) << 24) |
                           (static_cast<std::uint32_t>(header[1]) << 16) |
                           (static_cast<std::uint32_t>(header[2]) << 8) |
                           static_cast<std::uint32_t>(header[3]);
    std::uint8_t tag = header[4];

    if (tag < static_cast<std::uint8_t>(MessageType::TRANSFER_REQUEST) ||
        tag > static_cast<std::uint8_t>(MessageType::TRANSFER_RESUME)) {
        throw ProtocolError("Unknown message tag " + std::to_string(tag));
    }

    if (length == 0) {
        throw ProtocolError("Zero frame length");
    }

    auto type = static_cast<MessageType>(tag);
    if (length > max_frame_length(type)) {
        throw ProtocolError(std::string(message_type_name(type)) + " frame length " +
                            std::to_string(length) + " exceeds ceiling " +
                            std::to_string(max_frame_length(type)));
    }

    return FrameHeader{length, type};
}

std::vector<std::uint8_t> encode(const Message& message) {
    auto type = type_of(message);
    auto body = std::visit([](const auto& msg) { return msg.serialize(); }, message);

    std::uint64_t length = body.size() + 1;
    if (length > max_frame_length(type)) {
        throw ProtocolError(std::string(message_type_name(type)) + " of " + std::to_string(length) +
                            " bytes exceeds ceiling " + std::to_string(max_frame_length(type)));
    }

    std::vector<std::uint8_t> frame;
    frame.reserve(FRAME_HEADER_SIZE + body.size());
    frame.push_back((length >> 24) & 0xFF);
    frame.push_back((length >> 16) & 0xFF);
    frame.push_back((length >> 8) & 0xFF);
    frame.push_back(length & 0xFF);
    frame.push_back(static_cast<std::uint8_t>(type));
    frame.insert(frame.end(), body.begin(), body.end());
    return frame;
}

Message decode_body(MessageType type, std::span<const std::uint8_t> body) {
    switch (type) {
        case MessageType::TRANSFER_REQUEST: return decode_as<TransferRequest>(body);
        case MessageType::TRANSFER_ACCEPT: return decode_as<TransferAccept>(body);
        case MessageType::TRANSFER_REJECT: return decode_as<TransferReject>(body);
        case MessageType::CHUNK_DATA: return decode_as<ChunkData>(body);
        case MessageType::CHUNK_ACK: return decode_as<ChunkAck>(body);
        case MessageType::CHUNK_NACK: return decode_as<ChunkNack>(body);
        case MessageType::TRANSFER_COMPLETE: return decode_as<TransferComplete>(body);
        case MessageType::TRANSFER_ABORT: return decode_as<TransferAbort>(body);
        case MessageType::TRANSFER_PAUSE: return decode_as<TransferPause>(body);
        case MessageType::TRANSFER_RESUME: return decode_as<TransferResume>(body);
    }
    throw ProtocolError("Unknown message type");
}

Message decode(std::span<const std::uint8_t> frame) {
    auto header = decode_header(frame);
    if (frame.size() != header.frame_size()) {
        throw ProtocolError("Frame size " + std::to_string(frame.size()) +
                            " does not match header length " + std::to_string(header.length));
    }
    return decode_body(header.type, frame.subspan(FRAME_HEADER_SIZE));
}

MessageType type_of(const Message& message) {
    return std::visit([](const auto& msg) { return std::decay_t<decltype(msg)>::TYPE; }, message);
}

const std::string& file_id_of(const Message& message) {
    return std::visit([](const auto& msg) -> const std::string& { return msg.file_id; }, message);
}

}
