/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

#include <gtest/gtest.h>
#include <json/json.h>

#include <memory>

#include "../src/Signaling/Transport/SignalingCodec.h"

using namespace PeerRelay::Signaling;

namespace {

Json::Value parseJson(const std::string& text) {
    Json::Value root;
    std::string errs;
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    EXPECT_TRUE(reader->parse(text.data(), text.data() + text.size(), &root, &errs)) << errs;
    return root;
}

} // namespace

TEST(SignalingCodecTests, DecodesFlatOffer) {
    SignalingCodec codec;
    auto result = codec.decode(R"({"type":"offer","sdp":"v=0\r\n"})");
    ASSERT_TRUE(result.success()) << result.errorMessage;
    auto& sdp = std::get<SdpMessage>(result.value);
    EXPECT_EQ(sdp.kind, SdpKind::Offer);
    EXPECT_EQ(sdp.sdp, "v=0\r\n");
}

TEST(SignalingCodecTests, DecodesTaggedAnswer) {
    SignalingCodec codec;
    auto result = codec.decode(R"({"sdp":{"type":"answer","sdp":"ANSWER_1"}})");
    ASSERT_TRUE(result.success()) << result.errorMessage;
    EXPECT_EQ(std::get<SdpMessage>(result.value), (SdpMessage{SdpKind::Answer, "ANSWER_1"}));
}

TEST(SignalingCodecTests, DecodesCandidateInEveryShape) {
    SignalingCodec codec;
    const IceCandidate expected{1, "candidate:1 1 UDP 2122 10.0.0.1 5000 typ host", std::string("1")};

    for (const char* text : {
             R"({"type":"ice","candidate":"candidate:1 1 UDP 2122 10.0.0.1 5000 typ host","sdpMLineIndex":1,"sdpMid":"1"})",
             R"({"ice":{"candidate":"candidate:1 1 UDP 2122 10.0.0.1 5000 typ host","sdpMLineIndex":1,"sdpMid":"1"}})",
             R"({"candidate":"candidate:1 1 UDP 2122 10.0.0.1 5000 typ host","sdpMLineIndex":1,"sdpMid":"1"})"}) {
        auto result = codec.decode(text);
        ASSERT_TRUE(result.success()) << text << ": " << result.errorMessage;
        EXPECT_EQ(std::get<IceCandidate>(result.value), expected) << text;
    }
}

TEST(SignalingCodecTests, MidIsOptional) {
    SignalingCodec codec;
    auto result = codec.decode(R"({"type":"ice","candidate":"c1","sdpMLineIndex":0,"sdpMid":null})");
    ASSERT_TRUE(result.success());
    EXPECT_FALSE(std::get<IceCandidate>(result.value).mid.has_value());

    result = codec.decode(R"({"type":"ice","candidate":"","sdpMLineIndex":0})");
    ASSERT_TRUE(result.success());
    EXPECT_TRUE(std::get<IceCandidate>(result.value).candidate.empty());
}

TEST(SignalingCodecTests, RejectsMalformedMessages) {
    SignalingCodec codec;
    for (const char* text : {
             "",
             "not json",
             "[1,2,3]",
             R"({"sdp":"v=0"})",
             R"({"type":"pranswer","sdp":"v=0"})",
             R"({"type":"offer"})",
             R"({"type":7,"sdp":"v=0"})",
             R"({"type":"ice","sdpMLineIndex":0})",
             R"({"type":"ice","candidate":"c1"})",
             R"({"type":"ice","candidate":"c1","sdpMLineIndex":-1})",
             R"({"type":"ice","candidate":"c1","sdpMLineIndex":1.5})",
             R"({"type":"ice","candidate":"c1","sdpMLineIndex":0,"sdpMid":3})",
             R"({"ice":{"sdpMLineIndex":0}})"}) {
        auto result = codec.decode(text);
        EXPECT_EQ(result.error, SignalingError::InvalidMessage) << "accepted: " << text;
    }
}

TEST(SignalingCodecTests, EncodesFlatDialect) {
    SignalingCodec codec(WireDialect::Flat);

    auto offer = parseJson(codec.encodeSdp(SdpMessage{SdpKind::Offer, "OFFER_1"}));
    EXPECT_EQ(offer["type"].asString(), "offer");
    EXPECT_EQ(offer["sdp"].asString(), "OFFER_1");

    auto ice = parseJson(codec.encodeIce(IceCandidate{0, "c1", std::string("video")}));
    EXPECT_EQ(ice["type"].asString(), "ice");
    EXPECT_EQ(ice["candidate"].asString(), "c1");
    EXPECT_EQ(ice["sdpMLineIndex"].asUInt(), 0u);
    EXPECT_EQ(ice["sdpMid"].asString(), "video");
}

TEST(SignalingCodecTests, EncodesTaggedDialect) {
    SignalingCodec codec(WireDialect::Tagged);

    auto answer = parseJson(codec.encode(SdpMessage{SdpKind::Answer, "ANSWER_1"}));
    ASSERT_TRUE(answer["sdp"].isObject());
    EXPECT_EQ(answer["sdp"]["type"].asString(), "answer");
    EXPECT_EQ(answer["sdp"]["sdp"].asString(), "ANSWER_1");

    auto ice = parseJson(codec.encode(IceCandidate{2, "c2", std::nullopt}));
    ASSERT_TRUE(ice["ice"].isObject());
    EXPECT_EQ(ice["ice"]["sdpMLineIndex"].asUInt(), 2u);
    EXPECT_FALSE(ice["ice"].isMember("sdpMid"));
}

TEST(SignalingCodecTests, EncodedOutputIsSingleLine) {
    SignalingCodec codec;
    auto text = codec.encodeSdp(SdpMessage{SdpKind::Offer, "v=0\r\no=- 1 1 IN IP4 0.0.0.0\r\n"});
    EXPECT_EQ(text.find('\n'), std::string::npos);

    auto decoded = codec.decode(text);
    ASSERT_TRUE(decoded.success());
    EXPECT_EQ(std::get<SdpMessage>(decoded.value).sdp, "v=0\r\no=- 1 1 IN IP4 0.0.0.0\r\n");
}
