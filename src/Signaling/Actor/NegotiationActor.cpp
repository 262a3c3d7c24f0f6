/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

#include "NegotiationActor.h"

#include <Logging/Logger.h>

#include <format>

namespace PeerRelay::Signaling
{

namespace {

// Engine-side errors are reported by the session itself; only a failure to
// build the session reaches the supervisor.
bool isSessionLevel(SignalingError error) {
    switch (error) {
        case SignalingError::ProtocolViolation:
        case SignalingError::EngineFailure:
        case SignalingError::SessionClosed:
        case SignalingError::NotFound:
        case SignalingError::InvalidParameter:
            return true;
        default:
            return false;
    }
}

} // namespace

NegotiationActor::NegotiationActor(RouteKey key, EntropyEngine::Core::Concurrency::WorkContractGroup* group,
                                   size_t mailboxCapacity, PeerRegistry& registry, Options options)
    : Actor(std::move(key), group, mailboxCapacity), _registry(registry), _options(std::move(options)) {}

bool NegotiationActor::addressedToMe(const PeerId& peer, const char* what) const {
    if (peer == _options.peer) {
        return true;
    }
    ENTROPY_LOG_WARNING_CAT("Negotiation", std::format("{}: {} for peer {} ignored (serving {})", key().toString(),
                                                       what, peer, _options.peer));
    return false;
}

Result<void> NegotiationActor::handle(const RouterMessage& message) {
    if (const auto* msg = std::get_if<PeerJoined>(&message)) return handlePeerJoined(*msg);
    if (const auto* msg = std::get_if<RemoteSdp>(&message)) return handleRemoteSdp(*msg);
    if (const auto* msg = std::get_if<RemoteIce>(&message)) return handleRemoteIce(*msg);
    if (const auto* msg = std::get_if<StartNegotiation>(&message)) return handleStartNegotiation(*msg);
    if (const auto* msg = std::get_if<PeerLeft>(&message)) return handlePeerLeft(*msg);

    ENTROPY_LOG_WARNING_CAT("Negotiation", std::format("{}: unexpected {}", key().toString(),
                                                       routerMessageName(message)));
    return Result<void>::ok();
}

Result<void> NegotiationActor::ensureSession(NegotiationRole role) {
    auto added = _registry.add(_options.peer, role);
    if (added.success()) {
        drainEarlyCandidates(added.value);
        return Result<void>::ok();
    }
    if (added.error == SignalingError::AlreadyExists) {
        return Result<void>::ok();
    }
    return Result<void>::err(added.error, std::format("Could not create session for peer {}: {}", _options.peer,
                                                      added.errorMessage));
}

void NegotiationActor::drainEarlyCandidates(PeerHandle& handle) {
    while (!_earlyCandidates.empty()) {
        IceCandidate candidate = std::move(_earlyCandidates.front());
        _earlyCandidates.pop_front();
        auto applied = handle.handleIceCandidate(candidate);
        if (applied.failed()) {
            ENTROPY_LOG_DEBUG_CAT("Negotiation", std::format("{}: early candidate not applied: {}", key().toString(),
                                                             applied.errorMessage));
        }
    }
}

Result<void> NegotiationActor::handlePeerJoined(const PeerJoined& msg) {
    if (!addressedToMe(msg.peer, "PeerJoined")) {
        return Result<void>::ok();
    }
    ENTROPY_LOG_INFO_CAT("Negotiation", std::format("{}: peer {} joined as {}", key().toString(), msg.peer,
                                                    negotiationRoleToString(msg.role)));
    return ensureSession(msg.role);
}

Result<void> NegotiationActor::handleRemoteSdp(const RemoteSdp& msg) {
    if (!addressedToMe(msg.peer, "RemoteSdp")) {
        return Result<void>::ok();
    }

    auto handle = _registry.get(_options.peer);
    if (!handle) {
        if (msg.message.kind != SdpKind::Offer || _options.role != NegotiationRole::Responder) {
            ENTROPY_LOG_WARNING_CAT("Negotiation", std::format("{}: {} from {} without a session, discarded",
                                                               key().toString(), sdpKindToString(msg.message.kind),
                                                               msg.peer));
            return Result<void>::ok();
        }
        auto created = ensureSession(NegotiationRole::Responder);
        if (created.failed()) {
            return created;
        }
        handle = _registry.get(_options.peer);
        if (!handle) {
            // Failed while being activated; the failure path already ran
            return Result<void>::ok();
        }
    }

    auto result = handle->handleRemoteSdp(msg.message.kind, msg.message.sdp);
    if (result.failed() && !isSessionLevel(result.error)) {
        return result;
    }
    return Result<void>::ok();
}

Result<void> NegotiationActor::handleRemoteIce(const RemoteIce& msg) {
    if (!addressedToMe(msg.peer, "RemoteIce")) {
        return Result<void>::ok();
    }

    auto handle = _registry.get(_options.peer);
    if (!handle) {
        if (_options.maxEarlyCandidates == 0) {
            ++_earlyCandidatesDropped;
            ENTROPY_LOG_WARNING_CAT("Negotiation", std::format("{}: candidate without a session dropped",
                                                               key().toString()));
            return Result<void>::ok();
        }
        if (_earlyCandidates.size() >= _options.maxEarlyCandidates) {
            _earlyCandidates.pop_front();
            ++_earlyCandidatesDropped;
            ENTROPY_LOG_WARNING_CAT("Negotiation", std::format("{}: early candidate queue full ({}), oldest dropped",
                                                               key().toString(), _options.maxEarlyCandidates));
        }
        ENTROPY_LOG_DEBUG_CAT("Negotiation", std::format("{}: holding candidate until the session exists",
                                                         key().toString()));
        _earlyCandidates.push_back(msg.candidate);
        return Result<void>::ok();
    }

    auto result = handle->handleIceCandidate(msg.candidate);
    if (result.failed() && !isSessionLevel(result.error)) {
        return result;
    }
    return Result<void>::ok();
}

Result<void> NegotiationActor::handleStartNegotiation(const StartNegotiation& msg) {
    if (!addressedToMe(msg.peer, "StartNegotiation")) {
        return Result<void>::ok();
    }

    auto handle = _registry.get(_options.peer);
    if (!handle) {
        ENTROPY_LOG_WARNING_CAT("Negotiation", std::format("{}: StartNegotiation without a session",
                                                           key().toString()));
        return Result<void>::ok();
    }

    auto result = handle->startNegotiation();
    if (result.failed() && !isSessionLevel(result.error)) {
        return result;
    }
    return Result<void>::ok();
}

Result<void> NegotiationActor::handlePeerLeft(const PeerLeft& msg) {
    if (!addressedToMe(msg.peer, "PeerLeft")) {
        return Result<void>::ok();
    }
    ENTROPY_LOG_INFO_CAT("Negotiation", std::format("{}: peer {} left", key().toString(), msg.peer));
    _earlyCandidates.clear();
    _registry.remove(_options.peer);
    return Result<void>::ok();
}

bool NegotiationActor::sessionFailed(SignalingError error, std::function<void()> removal) {
    return postTask([this, error, removal = std::move(removal)]() {
        removal();
        _earlyCandidates.clear();
        if (error == SignalingError::ConnectionClosed) {
            fail(SignalingError::ConnectionClosed, std::format("Peer connection to {} lost", _options.peer));
            return;
        }
        ENTROPY_LOG_WARNING_CAT("Negotiation", std::format("{}: session for {} dropped after {}; waiting for the "
                                                           "remote side to negotiate again", key().toString(),
                                                           _options.peer, errorToString(error)));
    });
}

// May run on any thread; only touches the registry
void NegotiationActor::onStop() {
    _registry.remove(_options.peer);
}

} // namespace PeerRelay::Signaling
