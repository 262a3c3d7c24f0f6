/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

#include "TransportActor.h"

#include <Logging/Logger.h>

#include <format>

#include "../Transport/RoomProtocol.h"

namespace PeerRelay::Signaling
{

TransportActor::TransportActor(EntropyEngine::Core::Concurrency::WorkContractGroup* group, size_t mailboxCapacity,
                               std::shared_ptr<SignalingTransport> transport, Options options)
    : Actor(RouteKey::transport(), group, mailboxCapacity),
      _transport(std::move(transport)),
      _options(std::move(options)),
      _codec(_options.dialect) {}

TransportActor::~TransportActor() {
    if (_transport) {
        _transport->setMessageCallback(nullptr);
        _transport->setStateCallback(nullptr);
    }
}

Result<void> TransportActor::start() {
    if (!_transport) {
        return Result<void>::err(SignalingError::InvalidParameter, "Transport is null");
    }

    _transport->setMessageCallback([inbound = _options.inbound](const std::string& frame) {
        ENTROPY_LOG_DEBUG_CAT("Transport", std::format("<< {}", frame));
        if (inbound) {
            inbound(frame);
        }
    });

    std::weak_ptr<Actor> weakSelf = weak_from_this();
    _transport->setStateCallback([weakSelf](TransportState state) {
        if (state != TransportState::Closed && state != TransportState::Failed) {
            return;
        }
        auto self = std::static_pointer_cast<TransportActor>(weakSelf.lock());
        if (!self || self->status() != ActorStatus::Running) {
            return;
        }
        self->postTask([raw = self.get(), state]() {
            raw->fail(SignalingError::ConnectionClosed,
                      std::format("Signaling channel {}", transportStateToString(state)));
        });
    });

    if (!_transport->isOpen()) {
        auto opened = _transport->open();
        if (opened.failed()) {
            return opened;
        }
    }

    for (const auto& frame : _options.greeting) {
        auto sent = _transport->send(frame);
        if (sent.failed()) {
            return sent;
        }
        ENTROPY_LOG_DEBUG_CAT("Transport", std::format(">> {}", frame));
    }
    return Result<void>::ok();
}

Result<void> TransportActor::handle(const RouterMessage& message) {
    const auto* outbound = std::get_if<OutboundSignal>(&message);
    if (!outbound) {
        ENTROPY_LOG_WARNING_CAT("Transport", std::format("transport: unexpected {}", routerMessageName(message)));
        return Result<void>::ok();
    }

    std::string json = _codec.encode(outbound->event);
    std::string frame = _options.mode == RoutingMode::SinglePeer ? json
                                                                 : RoomProtocol::peerMessage(outbound->peer, json);

    auto sent = _transport->send(frame);
    if (sent.failed()) {
        return Result<void>::err(sent.error, std::format("Sending to {} failed: {}", outbound->peer,
                                                         sent.errorMessage));
    }
    _framesSent.fetch_add(1, std::memory_order_relaxed);
    ENTROPY_LOG_DEBUG_CAT("Transport", std::format(">> {}", frame));
    return Result<void>::ok();
}

void TransportActor::onStop() {
    if (_transport) {
        _transport->close();
    }
}

} // namespace PeerRelay::Signaling
