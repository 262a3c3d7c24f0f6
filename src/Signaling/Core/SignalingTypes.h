/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

/**
 * @file SignalingTypes.h
 * @brief Domain value types for SDP/ICE negotiation
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace PeerRelay::Signaling {

/**
 * @brief Identifies a remote participant within a signaling scope
 *
 * Unique among registered peers. Numeric ids from the room server are carried
 * in their decimal text form.
 */
using PeerId = std::string;

/**
 * @brief Session description kind
 */
enum class SdpKind : uint8_t {
    Offer,
    Answer
};

inline const char* sdpKindToString(SdpKind kind) {
    switch (kind) {
        case SdpKind::Offer: return "offer";
        case SdpKind::Answer: return "answer";
    }
    return "?";
}

/**
 * @brief Parses the engine-facing SDP type constant
 * @return The kind, or nullopt for anything other than "offer" / "answer"
 */
inline std::optional<SdpKind> parseSdpKind(std::string_view text) {
    if (text == "offer") return SdpKind::Offer;
    if (text == "answer") return SdpKind::Answer;
    return std::nullopt;
}

/**
 * @brief Session description payload with its kind
 *
 * The SDP text is opaque to the signaling core; only the engine parses it.
 */
struct SdpMessage {
    SdpKind kind = SdpKind::Offer;
    std::string sdp;

    bool operator==(const SdpMessage&) const = default;
};

/**
 * @brief Trickle ICE candidate
 *
 * An empty candidate string is the end-of-candidates marker.
 */
struct IceCandidate {
    uint32_t mlineIndex = 0;            ///< SDP media-line index
    std::string candidate;              ///< "candidate:..." attribute value
    std::optional<std::string> mid;     ///< Media stream identification tag

    bool operator==(const IceCandidate&) const = default;
};

/**
 * @brief Inbound or outbound signaling payload
 */
using SignalingEvent = std::variant<SdpMessage, IceCandidate>;

/**
 * @brief Fixed at session creation
 *
 * Initiators create the offer when the engine asks for negotiation;
 * responders only react to received offers.
 */
enum class NegotiationRole : uint8_t {
    Initiator,
    Responder
};

inline const char* negotiationRoleToString(NegotiationRole role) {
    return role == NegotiationRole::Initiator ? "Initiator" : "Responder";
}

/**
 * @brief Offer/answer progress of one peer session
 *
 * Initiator: Idle -> OfferCreated -> LocalDescriptionSet -> Stable.
 * Responder: Idle -> RemoteDescriptionSet -> AnswerCreated -> Stable.
 * Failed is reachable from any state and is terminal.
 */
enum class NegotiationState : uint8_t {
    Idle,
    OfferCreated,
    LocalDescriptionSet,
    AnswerCreated,
    RemoteDescriptionSet,
    Stable,
    Failed
};

inline const char* negotiationStateToString(NegotiationState state) {
    switch (state) {
        case NegotiationState::Idle: return "Idle";
        case NegotiationState::OfferCreated: return "OfferCreated";
        case NegotiationState::LocalDescriptionSet: return "LocalDescriptionSet";
        case NegotiationState::AnswerCreated: return "AnswerCreated";
        case NegotiationState::RemoteDescriptionSet: return "RemoteDescriptionSet";
        case NegotiationState::Stable: return "Stable";
        case NegotiationState::Failed: return "Failed";
    }
    return "?";
}

/**
 * @brief Peer connection state as reported by the engine
 */
enum class EngineConnectionState : uint8_t {
    New,
    Connecting,
    Connected,
    Disconnected,
    Failed,
    Closed
};

inline const char* engineConnectionStateToString(EngineConnectionState state) {
    switch (state) {
        case EngineConnectionState::New: return "New";
        case EngineConnectionState::Connecting: return "Connecting";
        case EngineConnectionState::Connected: return "Connected";
        case EngineConnectionState::Disconnected: return "Disconnected";
        case EngineConnectionState::Failed: return "Failed";
        case EngineConnectionState::Closed: return "Closed";
    }
    return "?";
}

} // namespace PeerRelay::Signaling
