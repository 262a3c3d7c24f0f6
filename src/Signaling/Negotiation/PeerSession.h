/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

/**
 * @file PeerSession.h
 * @brief Per-peer SDP/ICE negotiation state machine
 */

#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>

#include "../Core/ErrorCodes.h"
#include "../Core/SignalingTypes.h"
#include "../Engine/PeerEngine.h"

namespace PeerRelay::Signaling {

/**
 * @brief Structured error emitted once when a session fails
 */
struct SessionError {
    PeerId peerId;
    SignalingError error = SignalingError::None;
    std::string message;
    NegotiationState state = NegotiationState::Idle;  ///< State the session was in when it failed
};

/**
 * @brief Per-session counters
 */
struct SessionStats {
    uint64_t candidatesBuffered = 0;        ///< Remote candidates queued before the remote description
    uint64_t candidatesApplied = 0;         ///< Remote candidates accepted by the engine
    uint64_t candidatesRejected = 0;        ///< Remote candidates the engine refused
    uint64_t localCandidatesSent = 0;       ///< Local candidates handed to the outbound sink
    uint64_t protocolViolations = 0;        ///< Discarded out-of-state messages
};

/**
 * @brief Negotiation state machine owning one peer's engine
 *
 * Sessions are always held by std::shared_ptr (see create()). Every engine
 * continuation captures a std::weak_ptr to the session and does nothing once
 * the session is gone or torn down, so a promise that resolves after teardown
 * never touches a released engine.
 *
 * Remote candidates that arrive before the remote description is applied are
 * queued in arrival order and flushed into the engine, one by one and in the
 * same order, right after setRemoteDescription succeeds. A candidate the engine
 * rejects is logged and skipped.
 *
 * Out-of-state messages are protocol violations: they are logged, counted and
 * discarded, and the state is unchanged. Engine failures move the session to
 * Failed, emit exactly one SessionError and fire the failure hook (the registry
 * uses it to remove the session). Without a hook the session tears itself down.
 *
 * @code
 * auto session = PeerSession::create("7", NegotiationRole::Responder, std::move(engine));
 * session->setOutboundSink([&](const PeerId& peer, const SignalingEvent& ev) { router.send(...); });
 * session->activate();
 * session->handleRemoteSdp(SdpKind::Offer, offerSdp);
 * @endcode
 */
class PeerSession : public std::enable_shared_from_this<PeerSession> {
public:
    using OutboundSink = std::function<void(const PeerId&, const SignalingEvent&)>;
    using ErrorCallback = std::function<void(const SessionError&)>;
    using FailureHook = std::function<void(const PeerId&, SignalingError)>;

    struct Options {
        bool gateLocalCandidates = false;       ///< Hold local candidates until the remote description is set
        bool offerOnNegotiationNeeded = true;   ///< Initiators start negotiating when the engine asks
    };

    /**
     * @brief Creates a session and wires the engine callbacks to it
     *
     * The engine is exclusively owned by the session and released by teardown().
     */
    static std::shared_ptr<PeerSession> create(PeerId peerId, NegotiationRole role,
                                               std::unique_ptr<PeerEngine> engine, Options options);
    static std::shared_ptr<PeerSession> create(PeerId peerId, NegotiationRole role,
                                               std::unique_ptr<PeerEngine> engine) {
        return create(std::move(peerId), role, std::move(engine), Options{});
    }

    ~PeerSession();

    PeerSession(const PeerSession&) = delete;
    PeerSession& operator=(const PeerSession&) = delete;

    void setOutboundSink(OutboundSink sink);
    void setErrorCallback(ErrorCallback callback);
    void setFailureHook(FailureHook hook);

    /**
     * @brief Starts the engine; call after the sinks are installed
     */
    Result<void> activate();

    /**
     * @brief Creates and sends an offer (Initiator in Idle only)
     */
    Result<void> startNegotiation();

    /**
     * @brief Applies a remote offer (Responder in Idle) or answer (Initiator in LocalDescriptionSet)
     * @return ProtocolViolation for any other combination
     */
    Result<void> handleRemoteSdp(SdpKind kind, const std::string& sdp);

    /**
     * @brief Applies a remote candidate, or queues it until the remote description is set
     */
    Result<void> handleIceCandidate(const IceCandidate& candidate);

    /**
     * @brief Trickles a locally gathered candidate to the remote peer
     */
    void onLocalIceCandidate(const IceCandidate& candidate);

    /**
     * @brief Cancels outstanding continuations and releases the engine; idempotent
     */
    void teardown();

    const PeerId& peerId() const { return _peerId; }
    NegotiationRole role() const { return _role; }

    NegotiationState state() const;
    bool isTornDown() const;
    bool hasRemoteDescription() const;
    size_t pendingCandidateCount() const;
    SessionStats stats() const;

    bool engineReleased() const;
    std::shared_ptr<MediaSink> mediaSink() const;

private:
    PeerSession(PeerId peerId, NegotiationRole role, std::unique_ptr<PeerEngine> engine, Options options);

    void wireEngine();
    void handleNegotiationNeeded();
    void handleEngineState(EngineConnectionState state);

    void onOfferCreated(Result<std::string> offer);
    void onAnswerCreated(Result<std::string> answer);
    void applyRemoteDescription(SdpKind kind, const std::string& sdp);

    void flushPendingCandidates();
    void flushHeldLocalCandidates();

    Result<void> protocolViolation(std::unique_lock<std::mutex>& lock, std::string message);
    void fail(SignalingError error, std::string message);
    void emit(const SignalingEvent& event);

    const PeerId _peerId;
    const NegotiationRole _role;
    const Options _options;
    std::unique_ptr<PeerEngine> _engine;

    mutable std::mutex _mutex;
    NegotiationState _state = NegotiationState::Idle;
    bool _negotiationInFlight = false;       // offer/answer requested, not finished
    bool _haveRemoteDescription = false;
    bool _flushing = false;                  // pending queue is being drained
    bool _tornDown = false;
    std::deque<IceCandidate> _pendingRemoteCandidates;
    std::deque<IceCandidate> _heldLocalCandidates;
    SessionStats _stats;

    OutboundSink _outboundSink;
    ErrorCallback _errorCallback;
    FailureHook _failureHook;
};

} // namespace PeerRelay::Signaling
