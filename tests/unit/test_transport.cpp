#include <gtest/gtest.h>
#include "chunkstream/network/memory_transport.hpp"
#include "chunkstream/network/codec.hpp"
#include <chrono>
#include <future>
#include <thread>

using namespace chunkstream;
using namespace chunkstream::network;

class MemoryTransportTest : public ::testing::Test {
protected:
    static std::vector<uint8_t> ack_frame(uint32_t index) {
        return codec::encode(Message{ChunkAck{"file", index}});
    }

    static std::vector<uint8_t> raw_header(uint32_t length, MessageType type) {
        return {static_cast<uint8_t>(length >> 24), static_cast<uint8_t>(length >> 16),
                static_cast<uint8_t>(length >> 8), static_cast<uint8_t>(length),
                static_cast<uint8_t>(type)};
    }
};

TEST_F(MemoryTransportTest, FramesArriveInOrder) {
    auto [a, b] = MemoryTransport::create_pair();

    for (uint32_t i = 0; i < 5; ++i) {
        ASSERT_EQ(a->send_frame(ack_frame(i)), TransportStatus::OK);
    }
    EXPECT_EQ(a->frames_sent(), 5u);

    for (uint32_t i = 0; i < 5; ++i) {
        std::vector<uint8_t> frame;
        ASSERT_EQ(b->recv_frame(frame), TransportStatus::OK);
        auto message = codec::decode(frame);
        ASSERT_TRUE(std::holds_alternative<ChunkAck>(message));
        EXPECT_EQ(std::get<ChunkAck>(message).index, i);
    }
    EXPECT_EQ(b->frames_received(), 5u);
}

TEST_F(MemoryTransportTest, BothDirectionsIndependent) {
    auto [a, b] = MemoryTransport::create_pair();

    ASSERT_EQ(a->send_frame(ack_frame(1)), TransportStatus::OK);
    ASSERT_EQ(b->send_frame(ack_frame(2)), TransportStatus::OK);

    std::vector<uint8_t> frame;
    ASSERT_EQ(a->recv_frame(frame), TransportStatus::OK);
    EXPECT_EQ(std::get<ChunkAck>(codec::decode(frame)).index, 2u);
    ASSERT_EQ(b->recv_frame(frame), TransportStatus::OK);
    EXPECT_EQ(std::get<ChunkAck>(codec::decode(frame)).index, 1u);
}

TEST_F(MemoryTransportTest, BackpressureWhenBufferFull) {
    auto frame_size = ack_frame(0).size();
    auto [a, b] = MemoryTransport::create_pair(frame_size * 2);

    EXPECT_EQ(a->send_frame(ack_frame(0)), TransportStatus::OK);
    EXPECT_EQ(a->send_frame(ack_frame(1)), TransportStatus::OK);
    EXPECT_EQ(a->send_frame(ack_frame(2)), TransportStatus::BACKPRESSURED);
    EXPECT_EQ(a->frames_sent(), 2u);

    // Draining one frame makes room again
    std::vector<uint8_t> frame;
    ASSERT_EQ(b->recv_frame(frame), TransportStatus::OK);
    EXPECT_EQ(a->send_frame(ack_frame(2)), TransportStatus::OK);

    ASSERT_EQ(b->recv_frame(frame), TransportStatus::OK);
    EXPECT_EQ(std::get<ChunkAck>(codec::decode(frame)).index, 1u);
    ASSERT_EQ(b->recv_frame(frame), TransportStatus::OK);
    EXPECT_EQ(std::get<ChunkAck>(codec::decode(frame)).index, 2u);
}

TEST_F(MemoryTransportTest, BufferedFramesSurvivePeerClose) {
    auto [a, b] = MemoryTransport::create_pair();

    ASSERT_EQ(a->send_frame(ack_frame(7)), TransportStatus::OK);
    a->close();
    a->close();

    EXPECT_TRUE(a->is_closed());
    EXPECT_EQ(a->send_frame(ack_frame(8)), TransportStatus::CLOSED);

    std::vector<uint8_t> frame;
    ASSERT_EQ(b->recv_frame(frame), TransportStatus::OK);
    EXPECT_EQ(std::get<ChunkAck>(codec::decode(frame)).index, 7u);
    EXPECT_EQ(b->recv_frame(frame), TransportStatus::CLOSED);
    EXPECT_TRUE(b->is_closed());
    EXPECT_EQ(b->send_frame(ack_frame(9)), TransportStatus::CLOSED);
}

TEST_F(MemoryTransportTest, CloseUnblocksPendingReceive) {
    auto [a, b] = MemoryTransport::create_pair();

    auto pending = std::async(std::launch::async, [receiver = b] {
        std::vector<uint8_t> frame;
        return receiver->recv_frame(frame);
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    b->close();

    ASSERT_EQ(pending.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(pending.get(), TransportStatus::CLOSED);
}

TEST_F(MemoryTransportTest, OversizeHeaderRejectedBeforeBody) {
    auto [a, b] = MemoryTransport::create_pair();

    // Only the header is ever sent; the receiver must not wait for the body
    ASSERT_EQ(a->send_frame(raw_header(MAX_CHUNK_FRAME + 1, MessageType::CHUNK_DATA)), TransportStatus::OK);

    std::vector<uint8_t> frame;
    EXPECT_EQ(b->recv_frame(frame), TransportStatus::FRAME_REJECTED);
    EXPECT_TRUE(frame.empty());
    EXPECT_EQ(b->frames_rejected(), 1u);
    EXPECT_TRUE(b->is_closed());
}

TEST_F(MemoryTransportTest, ControlMessageCeilingApplies) {
    auto [a, b] = MemoryTransport::create_pair();

    ASSERT_EQ(a->send_frame(raw_header(MAX_MESSAGE_SIZE + 1, MessageType::CHUNK_ACK)), TransportStatus::OK);

    std::vector<uint8_t> frame;
    EXPECT_EQ(b->recv_frame(frame), TransportStatus::FRAME_REJECTED);
}

TEST_F(MemoryTransportTest, UnknownTagRejected) {
    auto [a, b] = MemoryTransport::create_pair();

    std::vector<uint8_t> header = {0, 0, 0, 1, 0x7F};
    ASSERT_EQ(a->send_frame(header), TransportStatus::OK);

    std::vector<uint8_t> frame;
    EXPECT_EQ(b->recv_frame(frame), TransportStatus::FRAME_REJECTED);
}

TEST_F(MemoryTransportTest, TruncatedFrameReportsClosed) {
    auto [a, b] = MemoryTransport::create_pair();

    auto frame = ack_frame(3);
    frame.resize(frame.size() - 2);
    ASSERT_EQ(a->send_frame(frame), TransportStatus::OK);
    a->close();

    std::vector<uint8_t> received;
    EXPECT_EQ(b->recv_frame(received), TransportStatus::CLOSED);
    EXPECT_EQ(b->frames_received(), 0u);
}

TEST(TransportStatusTest, Names) {
    EXPECT_STREQ(transport_status_name(TransportStatus::OK), "ok");
    EXPECT_STREQ(transport_status_name(TransportStatus::BACKPRESSURED), "backpressured");
    EXPECT_STREQ(transport_status_name(TransportStatus::FRAME_REJECTED), "frame rejected");
}
