/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

#include "SignalingCodec.h"

#include <json/json.h>

#include <memory>

namespace PeerRelay::Signaling {

namespace {

Result<SignalingEvent> invalid(std::string message) {
    return Result<SignalingEvent>::err(SignalingError::InvalidMessage, std::move(message));
}

Result<SignalingEvent> decodeSdpObject(const Json::Value& obj) {
    const Json::Value& type = obj["type"];
    const Json::Value& sdp = obj["sdp"];
    if (!type.isString()) {
        return invalid("SDP message has no string \"type\"");
    }
    auto kind = parseSdpKind(type.asString());
    if (!kind) {
        return invalid("Unknown SDP type: " + type.asString());
    }
    if (!sdp.isString()) {
        return invalid("SDP message has no string \"sdp\"");
    }
    return Result<SignalingEvent>::ok(SdpMessage{*kind, sdp.asString()});
}

Result<SignalingEvent> decodeIceObject(const Json::Value& obj) {
    const Json::Value& candidate = obj["candidate"];
    const Json::Value& mline = obj["sdpMLineIndex"];
    const Json::Value& mid = obj["sdpMid"];

    if (!candidate.isString()) {
        return invalid("ICE message has no string \"candidate\"");
    }
    // Negative or fractional indices are rejected rather than truncated
    if (!mline.isIntegral() || !mline.isUInt()) {
        return invalid("ICE message has no valid \"sdpMLineIndex\"");
    }

    IceCandidate ice;
    ice.candidate = candidate.asString();
    ice.mlineIndex = mline.asUInt();
    if (mid.isString()) {
        ice.mid = mid.asString();
    } else if (!mid.isNull()) {
        return invalid("ICE message has a non-string \"sdpMid\"");
    }
    return Result<SignalingEvent>::ok(std::move(ice));
}

Json::Value iceToJson(const IceCandidate& ice) {
    Json::Value obj(Json::objectValue);
    obj["candidate"] = ice.candidate;
    obj["sdpMLineIndex"] = ice.mlineIndex;
    if (ice.mid) {
        obj["sdpMid"] = *ice.mid;
    }
    return obj;
}

std::string writeCompact(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

} // namespace

Result<SignalingEvent> SignalingCodec::decode(const std::string& text) const {
    Json::Value root;
    std::string errs;
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errs)) {
        return invalid("Malformed signaling JSON: " + errs);
    }
    if (!root.isObject()) {
        return invalid("Signaling message is not a JSON object");
    }

    // Tagged dialect
    if (root["sdp"].isObject()) {
        return decodeSdpObject(root["sdp"]);
    }
    if (root["ice"].isObject()) {
        return decodeIceObject(root["ice"]);
    }

    const Json::Value& type = root["type"];
    if (type.isNull()) {
        if (root.isMember("candidate")) {
            return decodeIceObject(root);
        }
        return invalid("Signaling message has no \"type\"");
    }
    if (!type.isString()) {
        return invalid("Signaling \"type\" is not a string");
    }
    if (type.asString() == "ice") {
        return decodeIceObject(root);
    }
    return decodeSdpObject(root);
}

std::string SignalingCodec::encodeSdp(const SdpMessage& message) const {
    Json::Value sdp(Json::objectValue);
    sdp["type"] = sdpKindToString(message.kind);
    sdp["sdp"] = message.sdp;

    if (_dialect == WireDialect::Tagged) {
        Json::Value root(Json::objectValue);
        root["sdp"] = std::move(sdp);
        return writeCompact(root);
    }
    return writeCompact(sdp);
}

std::string SignalingCodec::encodeIce(const IceCandidate& candidate) const {
    Json::Value ice = iceToJson(candidate);

    if (_dialect == WireDialect::Tagged) {
        Json::Value root(Json::objectValue);
        root["ice"] = std::move(ice);
        return writeCompact(root);
    }
    ice["type"] = "ice";
    return writeCompact(ice);
}

std::string SignalingCodec::encode(const SignalingEvent& event) const {
    if (const auto* sdp = std::get_if<SdpMessage>(&event)) {
        return encodeSdp(*sdp);
    }
    return encodeIce(std::get<IceCandidate>(event));
}

} // namespace PeerRelay::Signaling
