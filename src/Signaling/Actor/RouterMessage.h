/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

/**
 * @file RouterMessage.h
 * @brief Messages exchanged between actors
 */

#pragma once

#include <variant>

#include "../Core/SignalingTypes.h"

namespace PeerRelay::Signaling {

struct RemoteSdp {
    PeerId peer;
    SdpMessage message;
};

struct RemoteIce {
    PeerId peer;
    IceCandidate candidate;
};

/// A peer appeared; create its session with the given role
struct PeerJoined {
    PeerId peer;
    NegotiationRole role = NegotiationRole::Initiator;
};

struct PeerLeft {
    PeerId peer;
};

struct StartNegotiation {
    PeerId peer;
};

/// Local SDP or ICE bound for the signaling channel
struct OutboundSignal {
    PeerId peer;
    SignalingEvent event;
};

struct Shutdown {};

using RouterMessage = std::variant<RemoteSdp, RemoteIce, PeerJoined, PeerLeft, StartNegotiation, OutboundSignal, Shutdown>;

inline const char* routerMessageName(const RouterMessage& message) {
    switch (message.index()) {
        case 0: return "RemoteSdp";
        case 1: return "RemoteIce";
        case 2: return "PeerJoined";
        case 3: return "PeerLeft";
        case 4: return "StartNegotiation";
        case 5: return "OutboundSignal";
        case 6: return "Shutdown";
    }
    return "?";
}

} // namespace PeerRelay::Signaling
