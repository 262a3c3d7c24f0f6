/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

/**
 * @file NegotiationActor.h
 * @brief Actor that drives the peer session of one remote participant
 */

#pragma once

#include <deque>

#include "../Registry/PeerRegistry.h"
#include "Actor.h"
#include "Router.h"

namespace PeerRelay::Signaling {

/**
 * @brief Applies routed signaling to the session of one peer
 *
 * The same actor serves every routing mode; only its key differs ("server",
 * "client", "webrtc_<peer>" or "web_socket_<order>"). The session itself lives
 * in the shared PeerRegistry, so outbound SDP/ICE reaches the transport through
 * the registry's outbound sink.
 *
 * - PeerJoined registers the session. Initiators offer as soon as the engine
 *   asks for negotiation.
 * - A RemoteSdp offer for an unknown peer registers a Responder session first
 *   when this actor's role is Responder.
 * - RemoteIce that arrives before any session exists is kept, up to
 *   Options::maxEarlyCandidates with the oldest dropped first, and handed to
 *   the session once it is created.
 * - Protocol violations and rejected candidates are logged by the session and
 *   do not fail the actor. Failed sessions are removed through sessionFailed().
 *   A lost peer connection also fails the actor so the Supervisor can rebuild
 *   it; a rejected engine operation only removes the session and the remote
 *   side has to negotiate again.
 *
 * Stopping the actor removes its session.
 */
class NegotiationActor : public Actor {
public:
    struct Options {
        PeerId peer;
        NegotiationRole role = NegotiationRole::Responder;
        size_t maxEarlyCandidates = 64;     ///< Older candidates are dropped past this
    };

    NegotiationActor(RouteKey key, EntropyEngine::Core::Concurrency::WorkContractGroup* group,
                     size_t mailboxCapacity, PeerRegistry& registry, Options options);

    const PeerId& peer() const { return _options.peer; }
    NegotiationRole role() const { return _options.role; }

    /**
     * @brief Runs a deferred registry removal on this actor
     *
     * The actor fails afterwards when @p error is ConnectionClosed.
     * @return false if the actor is no longer running (the caller must run
     *         the removal itself)
     */
    bool sessionFailed(SignalingError error, std::function<void()> removal);

    /// Candidates waiting for the session to exist
    size_t earlyCandidateCount() const { return _earlyCandidates.size(); }
    uint64_t earlyCandidatesDropped() const { return _earlyCandidatesDropped; }

protected:
    Result<void> handle(const RouterMessage& message) override;
    void onStop() override;

private:
    Result<void> handlePeerJoined(const PeerJoined& msg);
    Result<void> handleRemoteSdp(const RemoteSdp& msg);
    Result<void> handleRemoteIce(const RemoteIce& msg);
    Result<void> handleStartNegotiation(const StartNegotiation& msg);
    Result<void> handlePeerLeft(const PeerLeft& msg);

    Result<void> ensureSession(NegotiationRole role);
    void drainEarlyCandidates(PeerHandle& handle);
    bool addressedToMe(const PeerId& peer, const char* what) const;

    PeerRegistry& _registry;
    const Options _options;
    std::deque<IceCandidate> _earlyCandidates;
    uint64_t _earlyCandidatesDropped = 0;
};

} // namespace PeerRelay::Signaling
