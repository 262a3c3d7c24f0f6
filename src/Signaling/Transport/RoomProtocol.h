/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

/**
 * @file RoomProtocol.h
 * @brief Text framing spoken with the room signaling server
 *
 * Frames are a command word optionally followed by a space and arguments:
 * @code
 * HELLO [id]
 * ROOM <room>
 * ROOM_OK [peer ...]
 * ROOM_PEER_MSG <peer> <json>
 * ROOM_PEER_JOINED <peer>
 * ROOM_PEER_LEFT <peer>
 * ERROR <text>
 * @endcode
 */

#pragma once

#include <string>
#include <vector>

#include "../Core/ErrorCodes.h"
#include "../Core/SignalingTypes.h"

namespace PeerRelay::Signaling {

enum class RoomCommand : uint8_t {
    Hello,
    Room,
    RoomOk,
    RoomPeerMsg,
    RoomPeerJoined,
    RoomPeerLeft,
    Error
};

const char* roomCommandToString(RoomCommand command);

/**
 * @brief One parsed frame
 *
 * Which fields are populated depends on the command: peer for HELLO and the
 * ROOM_PEER_* commands, argument for ROOM and ERROR, peers for ROOM_OK and
 * payload for ROOM_PEER_MSG.
 */
struct RoomFrame {
    RoomCommand command = RoomCommand::Hello;
    PeerId peer;
    std::string argument;
    std::vector<PeerId> peers;
    std::string payload;
};

namespace RoomProtocol {

/**
 * @brief Parses a frame
 * @return InvalidMessage for unknown commands or missing arguments
 */
Result<RoomFrame> parse(const std::string& text);

std::string format(const RoomFrame& frame);

std::string hello(const PeerId& id = {});
std::string joinRoom(const std::string& room);
std::string peerMessage(const PeerId& peer, const std::string& payload);

} // namespace RoomProtocol

} // namespace PeerRelay::Signaling
