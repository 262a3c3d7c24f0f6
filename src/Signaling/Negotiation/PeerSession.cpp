/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

#include "PeerSession.h"

#include <Logging/Logger.h>

#include <format>

namespace PeerRelay::Signaling
{

std::shared_ptr<PeerSession> PeerSession::create(PeerId peerId, NegotiationRole role,
                                                 std::unique_ptr<PeerEngine> engine, Options options) {
    std::shared_ptr<PeerSession> session(new PeerSession(std::move(peerId), role, std::move(engine), options));
    session->wireEngine();
    return session;
}

PeerSession::PeerSession(PeerId peerId, NegotiationRole role, std::unique_ptr<PeerEngine> engine, Options options)
    : _peerId(std::move(peerId)), _role(role), _options(options), _engine(std::move(engine)) {}

PeerSession::~PeerSession() {
    teardown();
}

void PeerSession::wireEngine() {
    std::weak_ptr<PeerSession> weak = weak_from_this();

    _engine->onIceCandidate([weak](const IceCandidate& candidate) {
        if (auto self = weak.lock()) self->onLocalIceCandidate(candidate);
    });
    _engine->onNegotiationNeeded([weak]() {
        if (auto self = weak.lock()) self->handleNegotiationNeeded();
    });
    _engine->onConnectionStateChange([weak](EngineConnectionState state) {
        if (auto self = weak.lock()) self->handleEngineState(state);
    });
}

void PeerSession::setOutboundSink(OutboundSink sink) {
    std::lock_guard<std::mutex> lock(_mutex);
    _outboundSink = std::move(sink);
}

void PeerSession::setErrorCallback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(_mutex);
    _errorCallback = std::move(callback);
}

void PeerSession::setFailureHook(FailureHook hook) {
    std::lock_guard<std::mutex> lock(_mutex);
    _failureHook = std::move(hook);
}

Result<void> PeerSession::activate() {
    if (isTornDown()) {
        return Result<void>::err(SignalingError::SessionClosed, "Session torn down");
    }
    auto started = _engine->start();
    if (started.failed()) {
        ENTROPY_LOG_ERROR_CAT("Negotiation",
                              std::format("Peer {}: engine start failed: {}", _peerId, started.errorMessage));
    }
    return started;
}

void PeerSession::handleNegotiationNeeded() {
    if (_role != NegotiationRole::Initiator || !_options.offerOnNegotiationNeeded) {
        ENTROPY_LOG_DEBUG_CAT("Negotiation", std::format("Peer {}: negotiation-needed ignored ({})", _peerId,
                                                         negotiationRoleToString(_role)));
        return;
    }

    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_tornDown || _state != NegotiationState::Idle || _negotiationInFlight) {
            return;
        }
    }

    auto result = startNegotiation();
    if (result.failed() && result.error != SignalingError::SessionClosed) {
        ENTROPY_LOG_WARNING_CAT("Negotiation", std::format("Peer {}: negotiation-needed could not start: {}", _peerId,
                                                           result.errorMessage));
    }
}

void PeerSession::handleEngineState(EngineConnectionState state) {
    ENTROPY_LOG_DEBUG_CAT("Negotiation",
                          std::format("Peer {}: engine state {}", _peerId, engineConnectionStateToString(state)));
    if (state == EngineConnectionState::Failed) {
        fail(SignalingError::ConnectionClosed, "Peer connection entered Failed state");
    }
}

Result<void> PeerSession::protocolViolation(std::unique_lock<std::mutex>& lock, std::string message) {
    ++_stats.protocolViolations;
    auto current = _state;
    lock.unlock();

    ENTROPY_LOG_WARNING_CAT("Negotiation", std::format("Peer {} ({}, {}): discarded: {}", _peerId,
                                                       negotiationRoleToString(_role),
                                                       negotiationStateToString(current), message));
    return Result<void>::err(SignalingError::ProtocolViolation, std::move(message));
}

Result<void> PeerSession::startNegotiation() {
    {
        std::unique_lock<std::mutex> lock(_mutex);
        if (_tornDown) {
            return Result<void>::err(SignalingError::SessionClosed, "Session torn down");
        }
        if (_role != NegotiationRole::Initiator) {
            return protocolViolation(lock, "start_negotiation on a responder session");
        }
        if (_state != NegotiationState::Idle || _negotiationInFlight) {
            return protocolViolation(lock, "start_negotiation outside Idle");
        }
        _negotiationInFlight = true;
    }

    ENTROPY_LOG_DEBUG_CAT("Negotiation", std::format("Peer {}: creating offer", _peerId));

    std::weak_ptr<PeerSession> weak = weak_from_this();
    _engine->createOffer([weak](Result<std::string> offer) {
        if (auto self = weak.lock()) self->onOfferCreated(std::move(offer));
    });
    return Result<void>::ok();
}

void PeerSession::onOfferCreated(Result<std::string> offer) {
    if (offer.failed()) {
        fail(SignalingError::EngineFailure,
             offer.errorMessage.empty() ? "Offer creation got no response"
                                        : "Offer creation got error response: " + offer.errorMessage);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_tornDown || _state == NegotiationState::Failed) return;
        _state = NegotiationState::OfferCreated;
    }

    auto applied = _engine->setLocalDescription(SdpKind::Offer, offer.value);
    if (applied.failed()) {
        fail(SignalingError::EngineFailure, "Setting local offer failed: " + applied.errorMessage);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_tornDown || _state == NegotiationState::Failed) return;
        _state = NegotiationState::LocalDescriptionSet;
        _negotiationInFlight = false;
    }

    ENTROPY_LOG_INFO_CAT("Negotiation", std::format("Peer {}: offer ready ({} bytes)", _peerId, offer.value.size()));
    emit(SdpMessage{SdpKind::Offer, offer.value});
}

Result<void> PeerSession::handleRemoteSdp(SdpKind kind, const std::string& sdp) {
    {
        std::unique_lock<std::mutex> lock(_mutex);
        if (_tornDown) {
            return Result<void>::err(SignalingError::SessionClosed, "Session torn down");
        }

        const bool acceptOffer = kind == SdpKind::Offer && _role == NegotiationRole::Responder &&
                                 _state == NegotiationState::Idle && !_negotiationInFlight;
        const bool acceptAnswer = kind == SdpKind::Answer && _role == NegotiationRole::Initiator &&
                                  _state == NegotiationState::LocalDescriptionSet && !_negotiationInFlight;

        if (!acceptOffer && !acceptAnswer) {
            return protocolViolation(lock, std::format("unexpected remote {}", sdpKindToString(kind)));
        }
        // Held until the description is applied so a repeated frame is rejected
        _negotiationInFlight = true;
    }

    ENTROPY_LOG_DEBUG_CAT("Negotiation",
                          std::format("Peer {}: remote {} ({} bytes)", _peerId, sdpKindToString(kind), sdp.size()));

    // Set-remote must happen-before create-answer, so the whole chain runs in
    // the engine's own context
    std::weak_ptr<PeerSession> weak = weak_from_this();
    bool posted = _engine->post([weak, kind, sdp]() {
        if (auto self = weak.lock()) self->applyRemoteDescription(kind, sdp);
    });
    if (!posted) {
        return Result<void>::err(SignalingError::SessionClosed, "Engine context closed");
    }
    return Result<void>::ok();
}

void PeerSession::applyRemoteDescription(SdpKind kind, const std::string& sdp) {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_tornDown || _state == NegotiationState::Failed) return;
        const NegotiationState expected = kind == SdpKind::Offer ? NegotiationState::Idle
                                                                 : NegotiationState::LocalDescriptionSet;
        if (_state != expected || _haveRemoteDescription) {
            ENTROPY_LOG_WARNING_CAT("Negotiation", std::format("Peer {}: remote {} no longer applicable in {}",
                                                               _peerId, sdpKindToString(kind),
                                                               negotiationStateToString(_state)));
            return;
        }
    }

    auto applied = _engine->setRemoteDescription(kind, sdp);
    if (applied.failed()) {
        fail(SignalingError::EngineFailure,
             std::format("Setting remote {} failed: {}", sdpKindToString(kind), applied.errorMessage));
        return;
    }

    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_tornDown || _state == NegotiationState::Failed) return;
        _state = kind == SdpKind::Offer ? NegotiationState::RemoteDescriptionSet : NegotiationState::Stable;
        _haveRemoteDescription = true;
        _flushing = true;
        if (kind == SdpKind::Answer) {
            _negotiationInFlight = false;
        }
    }

    flushPendingCandidates();
    flushHeldLocalCandidates();

    if (kind == SdpKind::Answer) {
        ENTROPY_LOG_INFO_CAT("Negotiation", std::format("Peer {}: negotiation stable", _peerId));
        return;
    }

    std::weak_ptr<PeerSession> weak = weak_from_this();
    _engine->createAnswer([weak](Result<std::string> answer) {
        if (auto self = weak.lock()) self->onAnswerCreated(std::move(answer));
    });
}

void PeerSession::onAnswerCreated(Result<std::string> answer) {
    if (answer.failed()) {
        fail(SignalingError::EngineFailure,
             answer.errorMessage.empty() ? "Answer creation got no response"
                                         : "Answer creation got error response: " + answer.errorMessage);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_tornDown || _state == NegotiationState::Failed) return;
        _state = NegotiationState::AnswerCreated;
    }

    auto applied = _engine->setLocalDescription(SdpKind::Answer, answer.value);
    if (applied.failed()) {
        fail(SignalingError::EngineFailure, "Setting local answer failed: " + applied.errorMessage);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_tornDown || _state == NegotiationState::Failed) return;
        _state = NegotiationState::Stable;
        _negotiationInFlight = false;
    }

    ENTROPY_LOG_INFO_CAT("Negotiation", std::format("Peer {}: answer ready, negotiation stable", _peerId));
    emit(SdpMessage{SdpKind::Answer, answer.value});
}

Result<void> PeerSession::handleIceCandidate(const IceCandidate& candidate) {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_tornDown) {
            return Result<void>::err(SignalingError::SessionClosed, "Session torn down");
        }
        if (!_haveRemoteDescription || _flushing) {
            _pendingRemoteCandidates.push_back(candidate);
            ++_stats.candidatesBuffered;
            ENTROPY_LOG_DEBUG_CAT("Negotiation", std::format("Peer {}: queued remote candidate ({} pending)", _peerId,
                                                             _pendingRemoteCandidates.size()));
            return Result<void>::ok();
        }
    }

    auto applied = _engine->addIceCandidate(candidate);
    std::lock_guard<std::mutex> lock(_mutex);
    if (applied.failed()) {
        ++_stats.candidatesRejected;
        ENTROPY_LOG_WARNING_CAT("Negotiation", std::format("Peer {}: candidate rejected (mline={}): {}", _peerId,
                                                           candidate.mlineIndex, applied.errorMessage));
        return applied;
    }
    ++_stats.candidatesApplied;
    return Result<void>::ok();
}

void PeerSession::flushPendingCandidates() {
    std::unique_lock<std::mutex> lock(_mutex);
    while (!_pendingRemoteCandidates.empty() && !_tornDown) {
        std::deque<IceCandidate> batch;
        batch.swap(_pendingRemoteCandidates);
        lock.unlock();

        ENTROPY_LOG_DEBUG_CAT("Negotiation",
                              std::format("Peer {}: flushing {} queued candidates", _peerId, batch.size()));

        uint64_t applied = 0;
        uint64_t rejected = 0;
        for (const auto& candidate : batch) {
            auto result = _engine->addIceCandidate(candidate);
            if (result.success()) {
                ++applied;
            } else {
                ++rejected;
                ENTROPY_LOG_WARNING_CAT("Negotiation", std::format("Peer {}: queued candidate rejected (mline={}): {}",
                                                                   _peerId, candidate.mlineIndex,
                                                                   result.errorMessage));
            }
        }

        lock.lock();
        _stats.candidatesApplied += applied;
        _stats.candidatesRejected += rejected;
    }
    // Only now may new candidates bypass the queue
    _flushing = false;
}

void PeerSession::onLocalIceCandidate(const IceCandidate& candidate) {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_tornDown) return;
        if (_options.gateLocalCandidates && !_haveRemoteDescription) {
            _heldLocalCandidates.push_back(candidate);
            return;
        }
        ++_stats.localCandidatesSent;
    }
    emit(candidate);
}

void PeerSession::flushHeldLocalCandidates() {
    std::deque<IceCandidate> held;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        held.swap(_heldLocalCandidates);
        _stats.localCandidatesSent += held.size();
    }
    for (const auto& candidate : held) {
        emit(candidate);
    }
}

void PeerSession::emit(const SignalingEvent& event) {
    OutboundSink sink;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_tornDown) return;
        sink = _outboundSink;
    }
    if (sink) {
        sink(_peerId, event);
    } else {
        ENTROPY_LOG_DEBUG_CAT("Negotiation", std::format("Peer {}: no outbound sink, event dropped", _peerId));
    }
}

void PeerSession::fail(SignalingError error, std::string message) {
    SessionError report;
    ErrorCallback errorCallback;
    FailureHook failureHook;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_tornDown || _state == NegotiationState::Failed) return;
        report = SessionError{_peerId, error, std::move(message), _state};
        _state = NegotiationState::Failed;
        _negotiationInFlight = false;
        errorCallback = _errorCallback;
        failureHook = _failureHook;
    }

    ENTROPY_LOG_ERROR_CAT("Negotiation", std::format("Peer {} failed in {}: {} ({})", report.peerId,
                                                     negotiationStateToString(report.state), report.message,
                                                     errorToString(report.error)));

    if (errorCallback) {
        errorCallback(report);
    }
    if (failureHook) {
        failureHook(_peerId, report.error);
    } else {
        teardown();
    }
}

void PeerSession::teardown() {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_tornDown) return;
        _tornDown = true;
        _pendingRemoteCandidates.clear();
        _heldLocalCandidates.clear();
        _outboundSink = nullptr;
        _errorCallback = nullptr;
        _failureHook = nullptr;
    }

    if (_engine) {
        _engine->close();
    }
    ENTROPY_LOG_DEBUG_CAT("Negotiation", std::format("Peer {}: torn down", _peerId));
}

NegotiationState PeerSession::state() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _state;
}

bool PeerSession::isTornDown() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _tornDown;
}

bool PeerSession::hasRemoteDescription() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _haveRemoteDescription;
}

size_t PeerSession::pendingCandidateCount() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _pendingRemoteCandidates.size();
}

SessionStats PeerSession::stats() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _stats;
}

bool PeerSession::engineReleased() const {
    return !_engine || _engine->isReleased();
}

std::shared_ptr<MediaSink> PeerSession::mediaSink() const {
    return _engine ? _engine->mediaSink() : nullptr;
}

}  // namespace PeerRelay::Signaling
