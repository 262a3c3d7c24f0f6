/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

/**
 * @file SignalingService.h
 * @brief Wires transport, router, supervisor and registry into a relay
 */

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

#include "../Core/SignalingConfig.h"
#include "../Registry/PeerRegistry.h"
#include "../Transport/SignalingCodec.h"
#include "../Transport/SignalingTransport.h"
#include "Router.h"
#include "Supervisor.h"

namespace EntropyEngine::Core::Concurrency {
class WorkService;
class WorkContractGroup;
}

namespace PeerRelay::Signaling {

/**
 * @brief One signaling channel and the peers negotiated over it
 *
 * Inbound frames are decoded on the transport's thread and routed to
 * negotiation actors according to RelayConfig::routingMode:
 * - SinglePeer: bare JSON, all of it for RelayConfig::singlePeerId, handled by
 *   the "server" (Responder) or "client" (Initiator) actor.
 * - PerPeer: "ROOM_PEER_MSG <peer> <json>"; an offer or candidate from an
 *   unknown peer spawns a Responder actor "webrtc_<peer>".
 * - Room: as PerPeer, plus the room handshake. "ROOM_PEER_JOINED <peer>"
 *   spawns an Initiator actor "web_socket_<order>", "ROOM_PEER_LEFT <peer>"
 *   retires it.
 *
 * Malformed frames are logged and discarded. The service owns a WorkService
 * unless a WorkContractGroup is supplied.
 *
 * @code
 * SignalingService service(config, RtcPeerEngine::factory(config.engine, &group),
 *     [&] { return std::make_shared<WebSocketTransport>(config.transport); }, &fanout, &group);
 * service.start();
 * @endcode
 */
class SignalingService {
public:
    using TransportFactory = std::function<std::shared_ptr<SignalingTransport>()>;

    SignalingService(RelayConfig config, PeerEngineFactory engineFactory, TransportFactory transportFactory,
                     MediaFanout* fanout = nullptr,
                     EntropyEngine::Core::Concurrency::WorkContractGroup* group = nullptr);
    ~SignalingService();

    SignalingService(const SignalingService&) = delete;
    SignalingService& operator=(const SignalingService&) = delete;

    /**
     * @brief Starts workers, the transport actor and (SinglePeer) the peer actor
     * @return The transport's error if the channel could not be opened
     */
    Result<void> start();

    /// Retires every actor, tears down every session and stops the workers
    void stop();

    bool isRunning() const { return _running.load(std::memory_order_acquire); }

    /**
     * @brief True once the signaling channel failed and the restart policy
     *        will not bring it back
     *
     * The service keeps its sessions until stop(); owners poll this to reap it.
     */
    bool isChannelDown() const;

    /// Entry point for frames read from the signaling channel
    void handleInboundFrame(const std::string& frame);

    /**
     * @brief Spawns the negotiation actor for a peer and registers its session
     * @return AlreadyExists if the peer is routed already
     */
    Result<void> addPeer(const PeerId& peer, NegotiationRole role);

    /// Retires the peer's actor; its session is removed. No-op when absent.
    void removePeer(const PeerId& peer);

    std::optional<RouteKey> routeFor(const PeerId& peer) const;

    void setSessionErrorCallback(PeerSession::ErrorCallback callback);

    Router& router() { return _router; }
    Supervisor& supervisor() { return *_supervisor; }
    PeerRegistry& registry() { return *_registry; }
    const RelayConfig& config() const { return _config; }

    uint64_t framesDiscarded() const { return _framesDiscarded.load(std::memory_order_relaxed); }

private:
    struct PeerRoute {
        RouteKey key;
        NegotiationRole role;
    };

    Result<void> spawnTransport();
    Result<void> spawnPeer(const PeerId& peer, NegotiationRole role, bool announce);
    RouteKey keyForNewPeer(const PeerId& peer, NegotiationRole role);

    void routeSignal(const PeerId& peer, SignalingEvent event);
    void handleRoomFrame(const std::string& frame);
    void discard(const std::string& why);

    void onRestart(const RouteKey& key, uint32_t restarts);
    void deferRemoval(const PeerId& peer, SignalingError error, std::function<void()> removal);

    RelayConfig _config;
    TransportFactory _transportFactory;
    SignalingCodec _codec;

    std::unique_ptr<EntropyEngine::Core::Concurrency::WorkService> _ownedWorkService;
    std::unique_ptr<EntropyEngine::Core::Concurrency::WorkContractGroup> _ownedGroup;
    EntropyEngine::Core::Concurrency::WorkContractGroup* _group;

    Router _router;
    std::unique_ptr<PeerRegistry> _registry;
    std::unique_ptr<Supervisor> _supervisor;

    mutable std::mutex _routesMutex;
    std::unordered_map<PeerId, PeerRoute> _routes;
    uint32_t _nextMemberOrder = 0;

    std::mutex _callbackMutex;
    PeerSession::ErrorCallback _errorCallback;

    std::atomic<bool> _running{false};
    std::atomic<uint64_t> _framesDiscarded{0};
};

} // namespace PeerRelay::Signaling
