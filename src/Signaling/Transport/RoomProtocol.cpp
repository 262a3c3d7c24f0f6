/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

#include "RoomProtocol.h"

#include <sstream>
#include <string_view>

namespace PeerRelay::Signaling {

const char* roomCommandToString(RoomCommand command) {
    switch (command) {
        case RoomCommand::Hello: return "HELLO";
        case RoomCommand::Room: return "ROOM";
        case RoomCommand::RoomOk: return "ROOM_OK";
        case RoomCommand::RoomPeerMsg: return "ROOM_PEER_MSG";
        case RoomCommand::RoomPeerJoined: return "ROOM_PEER_JOINED";
        case RoomCommand::RoomPeerLeft: return "ROOM_PEER_LEFT";
        case RoomCommand::Error: return "ERROR";
    }
    return "?";
}

namespace RoomProtocol {

namespace {

Result<RoomFrame> invalid(std::string message) {
    return Result<RoomFrame>::err(SignalingError::InvalidMessage, std::move(message));
}

std::string_view trimLeft(std::string_view text) {
    while (!text.empty() && text.front() == ' ') {
        text.remove_prefix(1);
    }
    return text;
}

} // namespace

Result<RoomFrame> parse(const std::string& text) {
    std::string_view view(text);
    while (!view.empty() && (view.back() == '\r' || view.back() == '\n')) {
        view.remove_suffix(1);
    }

    auto space = view.find(' ');
    std::string_view word = view.substr(0, space);
    std::string_view rest = space == std::string_view::npos ? std::string_view{} : trimLeft(view.substr(space + 1));

    RoomFrame frame;
    if (word == "HELLO") {
        frame.command = RoomCommand::Hello;
        frame.peer = std::string(rest);
    } else if (word == "ROOM") {
        if (rest.empty()) {
            return invalid("ROOM requires a room id");
        }
        frame.command = RoomCommand::Room;
        frame.argument = std::string(rest);
    } else if (word == "ROOM_OK") {
        frame.command = RoomCommand::RoomOk;
        std::istringstream peers{std::string(rest)};
        std::string peer;
        while (peers >> peer) {
            frame.peers.push_back(peer);
        }
    } else if (word == "ROOM_PEER_MSG") {
        auto sep = rest.find(' ');
        if (rest.empty() || sep == std::string_view::npos) {
            return invalid("ROOM_PEER_MSG requires a peer id and a payload");
        }
        frame.command = RoomCommand::RoomPeerMsg;
        frame.peer = std::string(rest.substr(0, sep));
        frame.payload = std::string(trimLeft(rest.substr(sep + 1)));
        if (frame.payload.empty()) {
            return invalid("ROOM_PEER_MSG requires a payload");
        }
    } else if (word == "ROOM_PEER_JOINED" || word == "ROOM_PEER_LEFT") {
        if (rest.empty() || rest.find(' ') != std::string_view::npos) {
            return invalid(std::string(word) + " requires exactly one peer id");
        }
        frame.command = word == "ROOM_PEER_JOINED" ? RoomCommand::RoomPeerJoined : RoomCommand::RoomPeerLeft;
        frame.peer = std::string(rest);
    } else if (word == "ERROR") {
        frame.command = RoomCommand::Error;
        frame.argument = std::string(rest);
    } else {
        return invalid("Unknown room command: " + std::string(word));
    }
    return Result<RoomFrame>::ok(std::move(frame));
}

std::string format(const RoomFrame& frame) {
    std::string out = roomCommandToString(frame.command);
    switch (frame.command) {
        case RoomCommand::Hello:
        case RoomCommand::RoomPeerJoined:
        case RoomCommand::RoomPeerLeft:
            if (!frame.peer.empty()) {
                out += ' ';
                out += frame.peer;
            }
            break;
        case RoomCommand::Room:
        case RoomCommand::Error:
            if (!frame.argument.empty()) {
                out += ' ';
                out += frame.argument;
            }
            break;
        case RoomCommand::RoomOk:
            for (const auto& peer : frame.peers) {
                out += ' ';
                out += peer;
            }
            break;
        case RoomCommand::RoomPeerMsg:
            out += ' ';
            out += frame.peer;
            out += ' ';
            out += frame.payload;
            break;
    }
    return out;
}

std::string hello(const PeerId& id) {
    RoomFrame frame;
    frame.command = RoomCommand::Hello;
    frame.peer = id;
    return format(frame);
}

std::string joinRoom(const std::string& room) {
    RoomFrame frame;
    frame.command = RoomCommand::Room;
    frame.argument = room;
    return format(frame);
}

std::string peerMessage(const PeerId& peer, const std::string& payload) {
    RoomFrame frame;
    frame.command = RoomCommand::RoomPeerMsg;
    frame.peer = peer;
    frame.payload = payload;
    return format(frame);
}

} // namespace RoomProtocol

} // namespace PeerRelay::Signaling
