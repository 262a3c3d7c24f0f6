/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

#include "SignalingService.h"

#include <Concurrency/WorkContractGroup.h>
#include <Concurrency/WorkService.h>
#include <Logging/Logger.h>

#include <algorithm>
#include <format>
#include <thread>

#include "../Transport/RoomProtocol.h"
#include "NegotiationActor.h"
#include "TransportActor.h"

namespace PeerRelay::Signaling
{

using EntropyEngine::Core::Concurrency::WorkContractGroup;
using EntropyEngine::Core::Concurrency::WorkService;

namespace {
constexpr size_t SERVICE_CONTRACT_CAPACITY = 4096;
}

SignalingService::SignalingService(RelayConfig config, PeerEngineFactory engineFactory,
                                   TransportFactory transportFactory, MediaFanout* fanout, WorkContractGroup* group)
    : _config(std::move(config)),
      _transportFactory(std::move(transportFactory)),
      _codec(_config.transport.dialect),
      _group(group) {
    if (!_group) {
        WorkService::Config workConfig;
        workConfig.threadCount = _config.workerThreads != 0 ? _config.workerThreads
                                                            : std::max(1u, std::thread::hardware_concurrency());
        _ownedWorkService = std::make_unique<WorkService>(workConfig);
        _ownedGroup = std::make_unique<WorkContractGroup>(SERVICE_CONTRACT_CAPACITY, "PeerRelaySignaling");
        _ownedWorkService->addWorkContractGroup(_ownedGroup.get());
        _group = _ownedGroup.get();
    }

    PeerSession::Options sessionOptions;
    sessionOptions.gateLocalCandidates = _config.gateLocalCandidates;
    _registry = std::make_unique<PeerRegistry>(std::move(engineFactory), _config.maxPeers, fanout, sessionOptions);

    _registry->setOutboundSink([this](const PeerId& peer, const SignalingEvent& event) {
        auto sent = _router.send(RouteKey::transport(), OutboundSignal{peer, event});
        if (sent.failed()) {
            ENTROPY_LOG_WARNING_CAT("SignalingService", std::format("Outbound signal for {} dropped: {}", peer,
                                                                    sent.errorMessage));
        }
    });
    _registry->setErrorCallback([this](const SessionError& error) {
        PeerSession::ErrorCallback callback;
        {
            std::lock_guard<std::mutex> lock(_callbackMutex);
            callback = _errorCallback;
        }
        if (callback) {
            callback(error);
        }
    });
    _registry->setDeferrer([this](const PeerId& peer, SignalingError error, std::function<void()> removal) {
        deferRemoval(peer, error, std::move(removal));
    });

    _supervisor = std::make_unique<Supervisor>(_router, _config.restartPolicy);
    _supervisor->setRestartCallback([this](const RouteKey& key, uint32_t restarts) { onRestart(key, restarts); });
}

SignalingService::~SignalingService() {
    stop();
}

Result<void> SignalingService::start() {
    if (_running.exchange(true, std::memory_order_acq_rel)) {
        return Result<void>::err(SignalingError::AlreadyExists, "Service is already running");
    }

    if (_ownedWorkService) {
        _ownedWorkService->start();
    }

    auto transport = spawnTransport();
    if (transport.failed()) {
        ENTROPY_LOG_ERROR_CAT("SignalingService", std::format("Signaling channel unavailable: {}",
                                                              transport.errorMessage));
        stop();
        return transport;
    }

    if (_config.routingMode == RoutingMode::SinglePeer) {
        auto peer = spawnPeer(_config.singlePeerId, _config.singlePeerRole, true);
        if (peer.failed()) {
            stop();
            return peer;
        }
    }

    ENTROPY_LOG_INFO_CAT("SignalingService", std::format("Signaling service started (routing={}, maxPeers={})",
                                                         routingModeToString(_config.routingMode),
                                                         _config.maxPeers));
    return Result<void>::ok();
}

void SignalingService::stop() {
    if (!_running.exchange(false, std::memory_order_acq_rel)) {
        return;
    }

    // Executors must be idle before the workers go away
    _supervisor->shutdown();
    _router.stopAll();
    _registry->clear();
    {
        std::lock_guard<std::mutex> lock(_routesMutex);
        _routes.clear();
    }

    if (_ownedWorkService) {
        _ownedWorkService->stop();
    }
    ENTROPY_LOG_INFO_CAT("SignalingService", "Signaling service stopped");
}

bool SignalingService::isChannelDown() const {
    return isRunning() && _supervisor->isDown(RouteKey::transport());
}

Result<void> SignalingService::spawnTransport() {
    auto lastError = std::make_shared<Result<void>>(Result<void>::ok());

    auto factory = [this, lastError]() -> std::shared_ptr<Actor> {
        auto transport = _transportFactory ? _transportFactory() : nullptr;
        if (!transport) {
            *lastError = Result<void>::err(SignalingError::InvalidParameter, "Transport factory returned null");
            return nullptr;
        }

        TransportActor::Options options;
        options.mode = _config.routingMode;
        options.dialect = _config.transport.dialect;
        if (_config.routingMode == RoutingMode::Room && !_config.transport.roomId.empty()) {
            options.greeting.push_back(RoomProtocol::joinRoom(_config.transport.roomId));
        }
        options.inbound = [this](const std::string& frame) { handleInboundFrame(frame); };

        auto actor = std::make_shared<TransportActor>(_group, _config.mailboxCapacity, std::move(transport),
                                                      std::move(options));
        auto started = actor->start();
        if (started.failed()) {
            ENTROPY_LOG_ERROR_CAT("SignalingService", std::format("Opening signaling channel failed: {}",
                                                                  started.errorMessage));
            *lastError = started;
            return nullptr;
        }
        return actor;
    };

    auto spawned = _supervisor->spawn(RouteKey::transport(), std::move(factory));
    if (spawned.failed() && lastError->failed()) {
        return *lastError;
    }
    return spawned;
}

RouteKey SignalingService::keyForNewPeer(const PeerId& peer, NegotiationRole role) {
    switch (_config.routingMode) {
        case RoutingMode::SinglePeer:
            return role == NegotiationRole::Initiator ? RouteKey::client() : RouteKey::server();
        case RoutingMode::PerPeer:
            return RouteKey::forPeer(peer);
        case RoutingMode::Room:
            return RouteKey::roomMember(_nextMemberOrder++);
    }
    return RouteKey::forPeer(peer);
}

Result<void> SignalingService::spawnPeer(const PeerId& peer, NegotiationRole role, bool announce) {
    if (peer.empty()) {
        return Result<void>::err(SignalingError::InvalidParameter, "Peer id is empty");
    }

    RouteKey key;
    {
        std::lock_guard<std::mutex> lock(_routesMutex);
        if (_routes.count(peer) != 0) {
            return Result<void>::err(SignalingError::AlreadyExists, std::format("Peer {} is already routed", peer));
        }
        key = keyForNewPeer(peer, role);
        _routes.emplace(peer, PeerRoute{key, role});
    }

    NegotiationActor::Options options{peer, role};
    auto spawned = _supervisor->spawn(key, [this, key, options]() -> std::shared_ptr<Actor> {
        return std::make_shared<NegotiationActor>(key, _group, _config.mailboxCapacity, *_registry, options);
    });
    if (spawned.failed()) {
        std::lock_guard<std::mutex> lock(_routesMutex);
        _routes.erase(peer);
        return spawned;
    }

    ENTROPY_LOG_INFO_CAT("SignalingService", std::format("Routing peer {} via {} ({})", peer, key.toString(),
                                                         negotiationRoleToString(role)));
    if (announce) {
        return _router.send(key, PeerJoined{peer, role});
    }
    return Result<void>::ok();
}

Result<void> SignalingService::addPeer(const PeerId& peer, NegotiationRole role) {
    if (!isRunning()) {
        return Result<void>::err(SignalingError::ConnectionClosed, "Service is not running");
    }
    return spawnPeer(peer, role, true);
}

void SignalingService::removePeer(const PeerId& peer) {
    std::optional<RouteKey> key;
    {
        std::lock_guard<std::mutex> lock(_routesMutex);
        auto it = _routes.find(peer);
        if (it == _routes.end()) {
            return;
        }
        key = it->second.key;
        _routes.erase(it);
    }
    _supervisor->retire(*key);
    // The actor may already be down; the session must still go
    _registry->remove(peer);
}

std::optional<RouteKey> SignalingService::routeFor(const PeerId& peer) const {
    std::lock_guard<std::mutex> lock(_routesMutex);
    auto it = _routes.find(peer);
    if (it == _routes.end()) {
        return std::nullopt;
    }
    return it->second.key;
}

void SignalingService::setSessionErrorCallback(PeerSession::ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(_callbackMutex);
    _errorCallback = std::move(callback);
}

void SignalingService::discard(const std::string& why) {
    _framesDiscarded.fetch_add(1, std::memory_order_relaxed);
    ENTROPY_LOG_WARNING_CAT("SignalingService", std::format("Discarding frame: {}", why));
}

void SignalingService::handleInboundFrame(const std::string& frame) {
    if (!isRunning()) {
        return;
    }

    if (_config.routingMode != RoutingMode::SinglePeer) {
        handleRoomFrame(frame);
        return;
    }

    auto decoded = _codec.decode(frame);
    if (decoded.failed()) {
        discard(decoded.errorMessage);
        return;
    }
    routeSignal(_config.singlePeerId, std::move(decoded.value));
}

void SignalingService::handleRoomFrame(const std::string& frame) {
    auto parsed = RoomProtocol::parse(frame);
    if (parsed.failed()) {
        discard(parsed.errorMessage);
        return;
    }
    const RoomFrame& room = parsed.value;

    switch (room.command) {
        case RoomCommand::RoomPeerMsg: {
            auto decoded = _codec.decode(room.payload);
            if (decoded.failed()) {
                discard(std::format("from {}: {}", room.peer, decoded.errorMessage));
                return;
            }
            routeSignal(room.peer, std::move(decoded.value));
            return;
        }

        case RoomCommand::RoomPeerJoined:
            if (_config.routingMode != RoutingMode::Room) {
                discard("ROOM_PEER_JOINED outside room mode");
                return;
            }
            if (auto spawned = spawnPeer(room.peer, NegotiationRole::Initiator, true); spawned.failed()) {
                ENTROPY_LOG_WARNING_CAT("SignalingService", std::format("Peer {} joined but was not added: {}",
                                                                        room.peer, spawned.errorMessage));
            }
            return;

        case RoomCommand::RoomPeerLeft:
            removePeer(room.peer);
            return;

        case RoomCommand::RoomOk:
            ENTROPY_LOG_INFO_CAT("SignalingService", std::format("Joined room {} with {} peers",
                                                                 _config.transport.roomId, room.peers.size()));
            // Members already present offer to us; be ready to answer them
            for (const auto& peer : room.peers) {
                auto spawned = spawnPeer(peer, NegotiationRole::Responder, false);
                if (spawned.failed() && spawned.error != SignalingError::AlreadyExists) {
                    ENTROPY_LOG_WARNING_CAT("SignalingService", std::format("Cannot route room member {}: {}", peer,
                                                                            spawned.errorMessage));
                }
            }
            return;

        case RoomCommand::Error:
            ENTROPY_LOG_ERROR_CAT("SignalingService", std::format("Signaling server error: {}", room.argument));
            return;

        case RoomCommand::Hello:
            ENTROPY_LOG_DEBUG_CAT("SignalingService", "Late HELLO from signaling server");
            return;

        case RoomCommand::Room:
            discard("unexpected ROOM from server");
            return;
    }
}

void SignalingService::routeSignal(const PeerId& peer, SignalingEvent event) {
    auto key = routeFor(peer);
    if (!key) {
        const auto* sdp = std::get_if<SdpMessage>(&event);
        if (_config.routingMode == RoutingMode::SinglePeer || (sdp && sdp->kind == SdpKind::Answer)) {
            discard(std::format("no session for peer {}", peer));
            return;
        }
        auto spawned = spawnPeer(peer, NegotiationRole::Responder, false);
        if (spawned.failed() && spawned.error != SignalingError::AlreadyExists) {
            discard(std::format("cannot route peer {}: {}", peer, spawned.errorMessage));
            return;
        }
        key = routeFor(peer);
        if (!key) {
            discard(std::format("peer {} vanished while routing", peer));
            return;
        }
    }

    RouterMessage message = std::holds_alternative<SdpMessage>(event)
        ? RouterMessage{RemoteSdp{peer, std::get<SdpMessage>(std::move(event))}}
        : RouterMessage{RemoteIce{peer, std::get<IceCandidate>(std::move(event))}};

    auto sent = _router.send(*key, std::move(message));
    if (sent.failed()) {
        _framesDiscarded.fetch_add(1, std::memory_order_relaxed);
    }
}

void SignalingService::onRestart(const RouteKey& key, uint32_t restarts) {
    if (key == RouteKey::transport()) {
        return;
    }

    std::optional<PeerJoined> rejoin;
    {
        std::lock_guard<std::mutex> lock(_routesMutex);
        for (const auto& [peer, route] : _routes) {
            if (route.key == key) {
                if (route.role == NegotiationRole::Initiator || _config.routingMode == RoutingMode::SinglePeer) {
                    rejoin = PeerJoined{peer, route.role};
                }
                break;
            }
        }
    }

    if (rejoin) {
        ENTROPY_LOG_INFO_CAT("SignalingService", std::format("Renegotiating with {} after restart #{}", rejoin->peer,
                                                             restarts));
        auto sent = _router.send(key, *rejoin);
        if (sent.failed()) {
            ENTROPY_LOG_WARNING_CAT("SignalingService", std::format("Could not re-add {}: {}", rejoin->peer,
                                                                    sent.errorMessage));
        }
    }
}

void SignalingService::deferRemoval(const PeerId& peer, SignalingError error, std::function<void()> removal) {
    auto key = routeFor(peer);
    auto actor = key ? std::dynamic_pointer_cast<NegotiationActor>(_router.find(*key)) : nullptr;
    if (!actor || !actor->sessionFailed(error, removal)) {
        removal();
    }
}

} // namespace PeerRelay::Signaling
