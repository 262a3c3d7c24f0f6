/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

#include <gtest/gtest.h>

#include "../src/Signaling/Transport/RoomProtocol.h"

using namespace PeerRelay::Signaling;

TEST(RoomProtocolTests, ParsesHello) {
    auto bare = RoomProtocol::parse("HELLO");
    ASSERT_TRUE(bare.success());
    EXPECT_EQ(bare.value.command, RoomCommand::Hello);
    EXPECT_TRUE(bare.value.peer.empty());

    auto withId = RoomProtocol::parse("HELLO 1234\r\n");
    ASSERT_TRUE(withId.success());
    EXPECT_EQ(withId.value.peer, "1234");
}

TEST(RoomProtocolTests, ParsesRoomOkPeerList) {
    auto empty = RoomProtocol::parse("ROOM_OK");
    ASSERT_TRUE(empty.success());
    EXPECT_EQ(empty.value.command, RoomCommand::RoomOk);
    EXPECT_TRUE(empty.value.peers.empty());

    auto listed = RoomProtocol::parse("ROOM_OK 11 22  33");
    ASSERT_TRUE(listed.success());
    EXPECT_EQ(listed.value.peers, (std::vector<PeerId>{"11", "22", "33"}));
}

TEST(RoomProtocolTests, PeerMessageKeepsPayloadSpaces) {
    auto frame = RoomProtocol::parse(R"(ROOM_PEER_MSG 42 {"type": "offer", "sdp": "v=0"})");
    ASSERT_TRUE(frame.success()) << frame.errorMessage;
    EXPECT_EQ(frame.value.command, RoomCommand::RoomPeerMsg);
    EXPECT_EQ(frame.value.peer, "42");
    EXPECT_EQ(frame.value.payload, R"({"type": "offer", "sdp": "v=0"})");
}

TEST(RoomProtocolTests, ParsesMembershipAndErrors) {
    auto joined = RoomProtocol::parse("ROOM_PEER_JOINED 7");
    ASSERT_TRUE(joined.success());
    EXPECT_EQ(joined.value.command, RoomCommand::RoomPeerJoined);
    EXPECT_EQ(joined.value.peer, "7");

    auto left = RoomProtocol::parse("ROOM_PEER_LEFT 7");
    ASSERT_TRUE(left.success());
    EXPECT_EQ(left.value.command, RoomCommand::RoomPeerLeft);

    auto error = RoomProtocol::parse("ERROR peer 9 not found");
    ASSERT_TRUE(error.success());
    EXPECT_EQ(error.value.command, RoomCommand::Error);
    EXPECT_EQ(error.value.argument, "peer 9 not found");
}

TEST(RoomProtocolTests, RejectsMalformedFrames) {
    for (const char* text : {"", "BOGUS 1", "ROOM", "ROOM_PEER_MSG", "ROOM_PEER_MSG 7", "ROOM_PEER_JOINED",
                             "ROOM_PEER_LEFT 1 2", "hello"}) {
        auto frame = RoomProtocol::parse(text);
        EXPECT_EQ(frame.error, SignalingError::InvalidMessage) << "accepted: '" << text << "'";
    }
}

TEST(RoomProtocolTests, FormatsOutboundCommands) {
    EXPECT_EQ(RoomProtocol::hello(), "HELLO");
    EXPECT_EQ(RoomProtocol::hello("relay"), "HELLO relay");
    EXPECT_EQ(RoomProtocol::joinRoom("lobby"), "ROOM lobby");
    EXPECT_EQ(RoomProtocol::peerMessage("7", R"({"type":"answer"})"), R"(ROOM_PEER_MSG 7 {"type":"answer"})");

    RoomFrame ok;
    ok.command = RoomCommand::RoomOk;
    ok.peers = {"1", "2"};
    EXPECT_EQ(RoomProtocol::format(ok), "ROOM_OK 1 2");
    EXPECT_STREQ(roomCommandToString(RoomCommand::RoomPeerLeft), "ROOM_PEER_LEFT");
}
