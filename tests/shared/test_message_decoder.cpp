/**
 * @file test_message_decoder.cpp
 * @brief Frame reassembly tests for MessageDecoder
 */

#include <gtest/gtest.h>

#include "MessageDecoder.hpp"
#include "utils/TestHelpers.hpp"

using namespace Tether;
using namespace Tether::Test;

namespace {

std::vector<uint8_t> encodeAll(const std::vector<ServerMessage>& messages) {
    std::vector<uint8_t> bytes;
    for (const auto& message : messages) {
        std::vector<uint8_t> frame = NetworkSerializer::encodeFrame(message);
        bytes.insert(bytes.end(), frame.begin(), frame.end());
    }
    return bytes;
}

std::vector<ServerMessage> sampleMessages() {
    SyncMessage sync;
    sync.entity_states = { makeState(1, 1.0f), makeState(2, -3.5f, 2.0f) };
    return { LoadLevelMessage{ "levels/arena" }, sync, SyncMessage{}, LoadLevelMessage{ "x" } };
}

} // namespace

// =============================================================================
// Chunking
// =============================================================================

TEST(MessageDecoderTest, WholeBufferYieldsAllMessagesInOrder) {
    std::vector<ServerMessage> expected = sampleMessages();
    std::vector<uint8_t> bytes = encodeAll(expected);

    MessageDecoder<ServerMessage> decoder;
    std::vector<ServerMessage> received;
    decoder.feed(bytes.data(), bytes.size());
    EXPECT_EQ(NetError::None, decoder.drain([&](const ServerMessage& m) { received.push_back(m); }));

    EXPECT_EQ(expected, received);
    EXPECT_EQ(0u, decoder.getBufferedBytes());
}

TEST(MessageDecoderTest, ByteByByteMatchesWholeBuffer) {
    std::vector<ServerMessage> expected = sampleMessages();
    std::vector<uint8_t> bytes = encodeAll(expected);

    MessageDecoder<ServerMessage> decoder;
    std::vector<ServerMessage> received;
    for (uint8_t byte : bytes) {
        decoder.feed(&byte, 1);
        ASSERT_EQ(NetError::None, decoder.drain([&](const ServerMessage& m) { received.push_back(m); }));
    }

    EXPECT_EQ(expected, received);
}

TEST(MessageDecoderTest, PartialFrameStaysBuffered) {
    std::vector<uint8_t> frame = NetworkSerializer::encodeFrame(ServerMessage(LoadLevelMessage{ "partial" }));

    MessageDecoder<ServerMessage> decoder;
    int count = 0;
    decoder.feed(frame.data(), frame.size() - 2);
    EXPECT_EQ(NetError::None, decoder.drain([&](const ServerMessage&) { count++; }));
    EXPECT_EQ(0, count);
    EXPECT_EQ(frame.size() - 2, decoder.getBufferedBytes());

    decoder.feed(frame.data() + frame.size() - 2, 2);
    EXPECT_EQ(NetError::None, decoder.drain([&](const ServerMessage&) { count++; }));
    EXPECT_EQ(1, count);
}

// =============================================================================
// Malformed Frames
// =============================================================================

TEST(MessageDecoderTest, ZeroLengthFrameIsDecodeError) {
    std::vector<uint8_t> bytes = rawFrame(0, {});

    MessageDecoder<ClientMessage> decoder;
    decoder.feed(bytes.data(), bytes.size());
    EXPECT_EQ(NetError::Decode, decoder.drain([](const ClientMessage&) {}));
    EXPECT_TRUE(decoder.hasFailed());
}

TEST(MessageDecoderTest, OversizedFrameIsRejectedFromHeaderAlone) {
    std::vector<uint8_t> bytes = rawFrame(1025, {});

    MessageDecoder<ClientMessage> decoder(1024);
    decoder.feed(bytes.data(), bytes.size());
    EXPECT_EQ(NetError::Decode, decoder.drain([](const ClientMessage&) {}));
}

TEST(MessageDecoderTest, MessagesBeforeBadFrameAreDelivered) {
    std::vector<uint8_t> bytes = NetworkSerializer::encodeFrame(ClientMessage(PlayerInputMessage{ true, false }));
    std::vector<uint8_t> bad = rawFrame({ 99 });
    bytes.insert(bytes.end(), bad.begin(), bad.end());

    MessageDecoder<ClientMessage> decoder;
    std::vector<ClientMessage> received;
    decoder.feed(bytes.data(), bytes.size());
    EXPECT_EQ(NetError::Decode, decoder.drain([&](const ClientMessage& m) { received.push_back(m); }));

    ASSERT_EQ(1u, received.size());
    EXPECT_EQ(ClientMessage(PlayerInputMessage{ true, false }), received[0]);
}

TEST(MessageDecoderTest, FailedDecoderStaysFailed) {
    std::vector<uint8_t> bad = rawFrame({ 99 });
    std::vector<uint8_t> good = NetworkSerializer::encodeFrame(ClientMessage(PlayerInputMessage{}));

    MessageDecoder<ClientMessage> decoder;
    decoder.feed(bad.data(), bad.size());
    EXPECT_EQ(NetError::Decode, decoder.drain([](const ClientMessage&) {}));

    int count = 0;
    decoder.feed(good.data(), good.size());
    EXPECT_EQ(NetError::Decode, decoder.drain([&](const ClientMessage&) { count++; }));
    EXPECT_EQ(0, count);

    decoder.reset();
    decoder.feed(good.data(), good.size());
    EXPECT_EQ(NetError::None, decoder.drain([&](const ClientMessage&) { count++; }));
    EXPECT_EQ(1, count);
}
