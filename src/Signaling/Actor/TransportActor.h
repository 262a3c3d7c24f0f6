/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

/**
 * @file TransportActor.h
 * @brief Actor owning the signaling channel
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "../Core/SignalingConfig.h"
#include "../Transport/SignalingCodec.h"
#include "../Transport/SignalingTransport.h"
#include "Actor.h"

namespace PeerRelay::Signaling {

/**
 * @brief Serializes outbound signaling onto a SignalingTransport
 *
 * OutboundSignal messages are encoded with the configured wire dialect. In
 * SinglePeer mode the JSON goes out as is; otherwise it is wrapped in
 * "ROOM_PEER_MSG <peer> <json>".
 *
 * start() opens the transport (if needed), wires inbound frames to the
 * InboundHandler and sends the greeting frames (the room join). A send
 * failure, or the transport closing while the actor runs, fails the actor; the
 * Supervisor then rebuilds it with a fresh transport.
 */
class TransportActor : public Actor {
public:
    using InboundHandler = std::function<void(const std::string& frame)>;

    struct Options {
        RoutingMode mode = RoutingMode::SinglePeer;
        WireDialect dialect = WireDialect::Flat;
        std::vector<std::string> greeting;      ///< Frames sent right after open
        InboundHandler inbound;
    };

    TransportActor(EntropyEngine::Core::Concurrency::WorkContractGroup* group, size_t mailboxCapacity,
                   std::shared_ptr<SignalingTransport> transport, Options options);
    ~TransportActor() override;

    /// Must be called once the actor is owned by a shared_ptr
    Result<void> start();

    const std::shared_ptr<SignalingTransport>& transport() const { return _transport; }
    uint64_t framesSent() const { return _framesSent.load(std::memory_order_relaxed); }

protected:
    Result<void> handle(const RouterMessage& message) override;
    void onStop() override;

private:
    std::shared_ptr<SignalingTransport> _transport;
    Options _options;
    SignalingCodec _codec;
    std::atomic<uint64_t> _framesSent{0};
};

} // namespace PeerRelay::Signaling
