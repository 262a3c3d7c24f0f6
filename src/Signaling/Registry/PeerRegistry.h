/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

/**
 * @file PeerRegistry.h
 * @brief Slot-based registry of active peer sessions
 */

#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <thread>
#include <unordered_map>
#include <vector>

#include "../Core/ErrorCodes.h"
#include "../Core/SignalingTypes.h"
#include "../Engine/MediaFanout.h"
#include "../Engine/PeerEngine.h"
#include "../Negotiation/PeerSession.h"
#include "PeerHandle.h"

namespace PeerRelay::Signaling {

/**
 * @brief Owns every PeerSession, keyed by PeerId
 *
 * Sessions live in a fixed array of slots with per-slot generation counters,
 * the same scheme the work-contract groups use: a PeerHandle is a stamped
 * (registry, index, generation) triple and goes stale when the slot is freed.
 *
 * add() reserves the id, builds and starts the engine and links its fan-out
 * branch outside the registry lock, then publishes the session. Readers never
 * see an id while it is being constructed; a second add() for that id fails
 * with AlreadyExists and a remove() for it waits until construction finishes.
 * Operations on different ids proceed concurrently.
 *
 * Every registered session owns a live engine. remove() unlinks the branch from
 * the shared fan-out with block, unlink, unblock, then tears the session down.
 * Removing an unknown id is a no-op.
 *
 * A session that fails removes itself through its failure hook. By default the
 * removal runs immediately on the failing thread; a Deferrer can move it onto
 * the actor that owns the peer instead. The Deferrer also receives the failure:
 * ConnectionClosed for a lost peer connection, EngineFailure for a rejected
 * engine operation.
 */
class PeerRegistry {
public:
    /// Runs a removal on behalf of a failed session
    using Deferrer = std::function<void(const PeerId& peerId, SignalingError error, std::function<void()> removal)>;

    struct Metrics {
        uint64_t sessionsAdded = 0;
        uint64_t sessionsRemoved = 0;
        uint64_t duplicateAdds = 0;
        uint64_t constructionFailures = 0;
        uint64_t sessionsFailed = 0;
    };

    /**
     * @param factory Creates the (unstarted) engine for each new peer
     * @param capacity Maximum number of concurrently registered peers
     * @param fanout Optional shared distribution point each peer branches from
     * @param options Applied to every session this registry creates
     */
    PeerRegistry(PeerEngineFactory factory, size_t capacity, MediaFanout* fanout, PeerSession::Options options);
    PeerRegistry(PeerEngineFactory factory, size_t capacity = 64, MediaFanout* fanout = nullptr)
        : PeerRegistry(std::move(factory), capacity, fanout, PeerSession::Options{}) {}
    ~PeerRegistry();

    PeerRegistry(const PeerRegistry&) = delete;
    PeerRegistry& operator=(const PeerRegistry&) = delete;

    /// Outbound sink installed on sessions created after this call
    void setOutboundSink(PeerSession::OutboundSink sink);
    void setErrorCallback(PeerSession::ErrorCallback callback);
    void setDeferrer(Deferrer deferrer);

    /**
     * @brief Registers a peer with a fully started engine
     * @return Handle to the session, AlreadyExists for a registered or
     *         in-construction id, ResourceLimitExceeded when no slot is free,
     *         or the engine's error if construction failed
     */
    Result<PeerHandle> add(const PeerId& peerId, NegotiationRole role);

    /**
     * @brief Unregisters and tears down a peer; no-op when absent
     */
    void remove(const PeerId& peerId);

    /**
     * @brief Removes the session the handle refers to, if it is still current
     */
    void remove(const PeerHandle& handle);

    std::optional<PeerHandle> get(const PeerId& peerId) const;

    /// Direct session lookup for routing code
    std::shared_ptr<PeerSession> lookup(const PeerId& peerId) const;
    std::shared_ptr<PeerSession> resolve(const PeerHandle& handle) const;

    bool validateHandle(const PeerHandle& handle) const noexcept;

    bool contains(const PeerId& peerId) const;
    size_t size() const;
    size_t capacity() const { return _slots.size(); }
    std::vector<PeerId> peerIds() const;

    /**
     * @brief Visits a snapshot of the registered sessions outside the lock
     */
    void forEach(const std::function<void(const std::shared_ptr<PeerSession>&)>& visitor) const;

    /// Removes every registered peer
    void clear();

    Metrics getMetrics() const;

private:
    struct Slot {
        std::shared_ptr<PeerSession> session;
        PeerId peerId;
        uint32_t generation = 1;
        bool occupied = false;
    };

    struct Construction {
        std::thread::id builder;
        uint32_t index = 0;
        bool cancelled = false;     // session failed while still being built
    };

    Result<PeerHandle> abortConstruction(const PeerId& peerId, uint32_t index, SignalingError error,
                                         std::string message);
    void removeInternal(const PeerId& peerId, std::optional<uint32_t> generation);
    PeerSession::FailureHook makeFailureHook(uint32_t index, uint32_t generation);

    PeerEngineFactory _factory;
    MediaFanout* _fanout;
    PeerSession::Options _options;

    mutable std::shared_mutex _mutex;
    std::condition_variable_any _constructionCv;
    std::vector<Slot> _slots;
    std::vector<uint32_t> _freeList;
    std::unordered_map<PeerId, uint32_t> _index;
    std::unordered_map<PeerId, Construction> _constructing;

    mutable std::mutex _callbackMutex;
    PeerSession::OutboundSink _outboundSink;
    PeerSession::ErrorCallback _errorCallback;
    Deferrer _deferrer;

    mutable std::mutex _metricsMutex;
    Metrics _metrics;
};

} // namespace PeerRelay::Signaling
