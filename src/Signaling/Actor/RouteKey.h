/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

/**
 * @file RouteKey.h
 * @brief Typed addresses of actors on the router
 */

#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include "../Core/SignalingTypes.h"

namespace PeerRelay::Signaling {

/**
 * @brief Address of one actor
 *
 * The string form is what appears in logs and matches the unit names used by
 * the signaling deployments: "server", "client", "webrtc_<peer>",
 * "web_socket_<order>" and "transport".
 */
struct RouteKey {
    enum class Kind : uint8_t {
        Server,         ///< Single-peer answering side
        Client,         ///< Single-peer offering side
        Peer,           ///< Per-peer negotiation actor
        RoomMember,     ///< Room member, numbered by join order
        Transport       ///< The signaling channel
    };

    Kind kind = Kind::Server;
    PeerId peer;            ///< Set for Peer
    uint32_t order = 0;     ///< Set for RoomMember

    static RouteKey server() { return RouteKey{Kind::Server, {}, 0}; }
    static RouteKey client() { return RouteKey{Kind::Client, {}, 0}; }
    static RouteKey forPeer(PeerId peer) { return RouteKey{Kind::Peer, std::move(peer), 0}; }
    static RouteKey roomMember(uint32_t order) { return RouteKey{Kind::RoomMember, {}, order}; }
    static RouteKey transport() { return RouteKey{Kind::Transport, {}, 0}; }

    std::string toString() const {
        switch (kind) {
            case Kind::Server: return "server";
            case Kind::Client: return "client";
            case Kind::Peer: return "webrtc_" + peer;
            case Kind::RoomMember: return "web_socket_" + std::to_string(order);
            case Kind::Transport: return "transport";
        }
        return "?";
    }

    bool operator==(const RouteKey&) const = default;
};

} // namespace PeerRelay::Signaling

namespace std {
template<>
struct hash<PeerRelay::Signaling::RouteKey> {
    size_t operator()(const PeerRelay::Signaling::RouteKey& key) const noexcept {
        size_t h = std::hash<std::string>{}(key.peer);
        h ^= std::hash<uint32_t>{}(key.order) + 0x9e3779b9 + (h << 6) + (h >> 2);
        h ^= static_cast<size_t>(key.kind) + 0x9e3779b9 + (h << 6) + (h >> 2);
        return h;
    }
};
} // namespace std
