/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

#include <gtest/gtest.h>

#include "../src/Signaling/Actor/TransportActor.h"
#include "MockSignalingTransport.h"

using namespace PeerRelay::Signaling;
using namespace PeerRelay::Signaling::Testing;

TEST(TransportActorTests, StartOpensAndSendsGreeting) {
    auto transport = std::make_shared<MockSignalingTransport>();
    TransportActor::Options options;
    options.mode = RoutingMode::Room;
    options.greeting = {"ROOM lobby"};
    auto actor = std::make_shared<TransportActor>(nullptr, 16, transport, options);

    ASSERT_TRUE(actor->start().success());
    EXPECT_EQ(transport->openCount(), 1);
    EXPECT_EQ(transport->sent(), (std::vector<std::string>{"ROOM lobby"}));
    actor->stop();
}

TEST(TransportActorTests, OpenFailureIsReported) {
    auto transport = std::make_shared<MockSignalingTransport>();
    transport->failOpen = true;
    auto actor = std::make_shared<TransportActor>(nullptr, 16, transport, TransportActor::Options{});
    EXPECT_EQ(actor->start().error, SignalingError::ConnectionClosed);

    auto orphan = std::make_shared<TransportActor>(nullptr, 16, nullptr, TransportActor::Options{});
    EXPECT_EQ(orphan->start().error, SignalingError::InvalidParameter);
}

TEST(TransportActorTests, SinglePeerSendsBareJson) {
    auto transport = std::make_shared<MockSignalingTransport>();
    TransportActor::Options options;
    options.mode = RoutingMode::SinglePeer;
    auto actor = std::make_shared<TransportActor>(nullptr, 16, transport, options);
    ASSERT_TRUE(actor->start().success());

    ASSERT_TRUE(actor->send(OutboundSignal{"remote", SdpMessage{SdpKind::Answer, "ANSWER_1"}}).success());

    auto sent = transport->sent();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].front(), '{');
    auto decoded = SignalingCodec().decode(sent[0]);
    ASSERT_TRUE(decoded.success());
    EXPECT_EQ(std::get<SdpMessage>(decoded.value).sdp, "ANSWER_1");
    EXPECT_EQ(actor->framesSent(), 1u);
    actor->stop();
}

TEST(TransportActorTests, PeerModesWrapInPeerMessage) {
    auto transport = std::make_shared<MockSignalingTransport>();
    TransportActor::Options options;
    options.mode = RoutingMode::PerPeer;
    options.dialect = WireDialect::Tagged;
    auto actor = std::make_shared<TransportActor>(nullptr, 16, transport, options);
    ASSERT_TRUE(actor->start().success());

    ASSERT_TRUE(actor->send(OutboundSignal{"42", IceCandidate{0, "c1", std::string("0")}}).success());

    auto sent = transport->sent();
    ASSERT_EQ(sent.size(), 1u);
    const std::string prefix = "ROOM_PEER_MSG 42 ";
    ASSERT_EQ(sent[0].rfind(prefix, 0), 0u);
    auto decoded = SignalingCodec().decode(sent[0].substr(prefix.size()));
    ASSERT_TRUE(decoded.success());
    EXPECT_EQ(std::get<IceCandidate>(decoded.value).candidate, "c1");
    EXPECT_NE(sent[0].find("\"ice\""), std::string::npos);
    actor->stop();
}

TEST(TransportActorTests, InboundFramesReachHandler) {
    auto transport = std::make_shared<MockSignalingTransport>();
    std::vector<std::string> inbound;
    TransportActor::Options options;
    options.inbound = [&inbound](const std::string& frame) { inbound.push_back(frame); };
    auto actor = std::make_shared<TransportActor>(nullptr, 16, transport, options);
    ASSERT_TRUE(actor->start().success());

    transport->deliver("ROOM_PEER_JOINED 5");
    transport->deliver("{}");
    EXPECT_EQ(inbound, (std::vector<std::string>{"ROOM_PEER_JOINED 5", "{}"}));
    actor->stop();
}

TEST(TransportActorTests, SendFailureFailsActor) {
    auto transport = std::make_shared<MockSignalingTransport>();
    auto actor = std::make_shared<TransportActor>(nullptr, 16, transport, TransportActor::Options{});
    ASSERT_TRUE(actor->start().success());

    SignalingError reported = SignalingError::None;
    actor->setFailureCallback([&](const RouteKey&, SignalingError error, const std::string&) { reported = error; });

    transport->failSends = true;
    ASSERT_TRUE(actor->send(OutboundSignal{"remote", SdpMessage{SdpKind::Offer, "OFFER_1"}}).success());
    EXPECT_EQ(actor->status(), ActorStatus::Failed);
    EXPECT_EQ(reported, SignalingError::ConnectionClosed);
}

TEST(TransportActorTests, DroppedConnectionFailsActor) {
    auto transport = std::make_shared<MockSignalingTransport>();
    auto actor = std::make_shared<TransportActor>(nullptr, 16, transport, TransportActor::Options{});
    ASSERT_TRUE(actor->start().success());

    int failures = 0;
    actor->setFailureCallback([&](const RouteKey& key, SignalingError error, const std::string&) {
        EXPECT_EQ(key, RouteKey::transport());
        EXPECT_EQ(error, SignalingError::ConnectionClosed);
        ++failures;
    });

    transport->drop();
    EXPECT_EQ(actor->status(), ActorStatus::Failed);
    EXPECT_EQ(failures, 1);
}

TEST(TransportActorTests, StopClosesTransportWithoutFailing) {
    auto transport = std::make_shared<MockSignalingTransport>();
    auto actor = std::make_shared<TransportActor>(nullptr, 16, transport, TransportActor::Options{});
    ASSERT_TRUE(actor->start().success());

    int failures = 0;
    actor->setFailureCallback([&](const RouteKey&, SignalingError, const std::string&) { ++failures; });

    actor->stop();
    EXPECT_EQ(transport->getState(), TransportState::Closed);
    EXPECT_EQ(actor->status(), ActorStatus::Stopped);
    EXPECT_EQ(failures, 0);
}
