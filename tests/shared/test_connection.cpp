/**
 * @file test_connection.cpp
 * @brief Tests for the framed Connection over fake and mocked streams
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "Connection.hpp"
#include "mocks/FakeByteStream.hpp"
#include "mocks/MockByteStream.hpp"
#include "utils/TestHelpers.hpp"

using namespace Tether;
using namespace Tether::Test;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

// =============================================================================
// Send / Receive
// =============================================================================

TEST(ConnectionTest, SendWritesOneFrame) {
    FakePeer peer;
    ClientLink link(peer.createStream());

    EXPECT_EQ(NetError::None, link.send(LoadLevelMessage{ "arena" }));

    auto received = peer.takeMessages<ServerMessage>();
    ASSERT_EQ(1u, received.size());
    EXPECT_EQ(ServerMessage(LoadLevelMessage{ "arena" }), received[0]);
    EXPECT_EQ(1u, link.getStats().messages_sent);
}

TEST(ConnectionTest, PollDispatchesInArrivalOrder) {
    FakePeer peer;
    ClientLink link(peer.createStream());

    peer.pushMessage(ClientMessage(PlayerInputMessage{ true, false }));
    peer.pushMessage(ClientMessage(PlayerInputMessage{ false, true }));

    std::vector<ClientMessage> received;
    EXPECT_EQ(NetError::None, link.pollIncoming([&](const ClientMessage& m) { received.push_back(m); }));

    ASSERT_EQ(2u, received.size());
    EXPECT_EQ(ClientMessage(PlayerInputMessage{ true, false }), received[0]);
    EXPECT_EQ(ClientMessage(PlayerInputMessage{ false, true }), received[1]);
    EXPECT_EQ(2u, link.getStats().messages_received);
}

TEST(ConnectionTest, PollWithNothingAvailableIsNotAnError) {
    FakePeer peer;
    ClientLink link(peer.createStream());

    int count = 0;
    EXPECT_EQ(NetError::None, link.pollIncoming([&](const ClientMessage&) { count++; }));
    EXPECT_EQ(0, count);
    EXPECT_TRUE(link.isOpen());
}

TEST(ConnectionTest, PartialWriteIsCompletedByFlush) {
    FakePeer peer;
    peer.getControl().write_budget = 3;
    ClientLink link(peer.createStream());

    EXPECT_EQ(NetError::None, link.send(LoadLevelMessage{ "slow" }));
    EXPECT_GT(link.getPendingOutboundBytes(), 0u);
    EXPECT_TRUE(peer.takeMessages<ServerMessage>().empty());

    peer.getControl().write_budget = std::numeric_limits<size_t>::max();
    EXPECT_EQ(NetError::None, link.flush());
    EXPECT_EQ(0u, link.getPendingOutboundBytes());

    auto received = peer.takeMessages<ServerMessage>();
    ASSERT_EQ(1u, received.size());
    EXPECT_EQ(ServerMessage(LoadLevelMessage{ "slow" }), received[0]);
}

// =============================================================================
// Failures
// =============================================================================

TEST(ConnectionTest, PeerCloseIsTransportError) {
    FakePeer peer;
    ClientLink link(peer.createStream());

    peer.pushMessage(ClientMessage(PlayerInputMessage{ true, true }));
    peer.closeRemote();

    int count = 0;
    EXPECT_EQ(NetError::Transport, link.pollIncoming([&](const ClientMessage&) { count++; }));
    EXPECT_EQ(1, count);
    EXPECT_EQ(ConnectionState::CLOSED, link.getState());
}

TEST(ConnectionTest, MalformedFrameIsDecodeErrorAndClosesStream) {
    FakePeer peer;
    ClientLink link(peer.createStream());

    peer.pushBytes(rawFrame({ 64, 7, 0 }));

    EXPECT_EQ(NetError::Decode, link.pollIncoming([](const ClientMessage&) {}));
    EXPECT_EQ(ConnectionState::ERRORED, link.getState());
    EXPECT_TRUE(peer.localClosed());
}

TEST(ConnectionTest, OperationsAfterFailureReturnTransport) {
    FakePeer peer;
    ClientLink link(peer.createStream());
    peer.getControl().fail_reads = true;

    EXPECT_EQ(NetError::Transport, link.pollIncoming([](const ClientMessage&) {}));
    EXPECT_EQ(ConnectionState::ERRORED, link.getState());

    EXPECT_EQ(NetError::Transport, link.send(SyncMessage{}));
    EXPECT_EQ(NetError::Transport, link.flush());
    EXPECT_EQ(1u, link.getStats().send_failures);
}

TEST(ConnectionTest, OversizedFrameRespectsConfiguredLimit) {
    FakePeer peer;
    ClientLink link(peer.createStream(), 16);

    peer.pushBytes(rawFrame(17, {}));

    EXPECT_EQ(NetError::Decode, link.pollIncoming([](const ClientMessage&) {}));
}

TEST(ConnectionTest, WriteErrorMarksConnectionErrored) {
    auto stream = std::make_unique<NiceMock<MockByteStream>>();
    stream->acceptEverything();
    EXPECT_CALL(*stream, write(_, _, _)).WillOnce(Return(IoStatus::Error));
    EXPECT_CALL(*stream, close()).Times(::testing::AtLeast(1));

    ClientLink link(std::move(stream));
    EXPECT_EQ(NetError::Transport, link.send(SyncMessage{}));
    EXPECT_EQ(ConnectionState::ERRORED, link.getState());
}

TEST(ConnectionTest, IdsAreUnique) {
    FakePeer a, b;
    ClientLink first(a.createStream());
    ServerLink second(b.createStream());

    EXPECT_NE(INVALID_CONNECTION_ID, first.getId());
    EXPECT_NE(first.getId(), second.getId());
}
