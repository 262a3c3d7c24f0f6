/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

/**
 * @file SignalingCodec.h
 * @brief JSON encoding of SDP and ICE signaling payloads
 */

#pragma once

#include <string>

#include "../Core/ErrorCodes.h"
#include "../Core/SignalingConfig.h"
#include "../Core/SignalingTypes.h"

namespace PeerRelay::Signaling {

/**
 * @brief Converts signaling JSON to and from SignalingEvent
 *
 * Decoding accepts both wire dialects and candidate objects without a "type"
 * field. Encoding uses the dialect chosen at construction. Decoding never
 * throws; malformed input is reported as InvalidMessage.
 */
class SignalingCodec {
public:
    explicit SignalingCodec(WireDialect dialect = WireDialect::Flat)
        : _dialect(dialect) {}

    Result<SignalingEvent> decode(const std::string& text) const;

    std::string encode(const SignalingEvent& event) const;
    std::string encodeSdp(const SdpMessage& message) const;
    std::string encodeIce(const IceCandidate& candidate) const;

    WireDialect dialect() const { return _dialect; }

private:
    WireDialect _dialect;
};

} // namespace PeerRelay::Signaling
