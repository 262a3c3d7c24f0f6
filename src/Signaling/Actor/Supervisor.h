/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

/**
 * @file Supervisor.h
 * @brief Rebuilds failed actors according to a RestartPolicy
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

#include "../Core/SignalingConfig.h"
#include "Router.h"

namespace PeerRelay::Signaling {

/**
 * @brief Owns actor factories and restarts failed actors
 *
 * spawn() builds an actor from its factory, registers it on the router and
 * watches it. When the actor fails:
 * - Never: the failed actor stays registered; sends get MailboxClosed.
 * - UpToN: a fresh actor replaces it immediately, until maxRestarts is spent.
 * - InfiniteWithBackoff: a fresh actor replaces it after
 *   min(initialBackoff * 2^restarts, maxBackoff), forever.
 *
 * Every restart calls the factory again, so restarted actors start from fresh
 * state. Delayed restarts run on the supervisor's timer thread.
 *
 * @code
 * Supervisor sup(router, RestartPolicy::upTo(3));
 * sup.spawn(RouteKey::transport(), [&] { return std::make_shared<TransportActor>(...); });
 * @endcode
 */
class Supervisor {
public:
    using ActorFactory = std::function<std::shared_ptr<Actor>()>;
    using RestartCallback = std::function<void(const RouteKey& key, uint32_t restarts)>;

    Supervisor(Router& router, RestartPolicy policy);
    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    /**
     * @brief Builds, registers and supervises an actor
     * @return AlreadyExists if the key is supervised or routed already
     */
    Result<void> spawn(const RouteKey& key, ActorFactory factory);

    /**
     * @brief Stops supervising key, unregisters and stops its actor
     */
    void retire(const RouteKey& key);

    bool isSupervised(const RouteKey& key) const;
    uint32_t restartCount(const RouteKey& key) const;

    /// True once the actor at key has failed and will not be restarted
    bool isDown(const RouteKey& key) const;

    /// Fires after each successful restart
    void setRestartCallback(RestartCallback callback);

    /// Delay before restart number `attempt` (0-based) under this policy
    std::chrono::milliseconds backoffFor(uint32_t attempt) const;

    const RestartPolicy& policy() const { return _policy; }

    /// Cancels pending restarts, joins the timer thread and retires every actor
    void shutdown();

private:
    struct Entry {
        ActorFactory factory;
        uint32_t restarts = 0;
        uint64_t incarnation = 0;
        bool down = false;
    };

    struct PendingRestart {
        RouteKey key;
        uint64_t incarnation;
    };

    void watch(const std::shared_ptr<Actor>& actor, uint64_t incarnation);
    void onActorFailed(const RouteKey& key, uint64_t incarnation, SignalingError error);
    void restart(const RouteKey& key, uint64_t incarnation);
    void timerLoop();

    Router& _router;
    const RestartPolicy _policy;

    mutable std::mutex _mutex;
    std::unordered_map<RouteKey, Entry> _entries;
    uint64_t _nextIncarnation = 0;      // unique across keys and re-spawns
    RestartCallback _restartCallback;

    std::condition_variable _timerCv;
    std::multimap<std::chrono::steady_clock::time_point, PendingRestart> _pending;
    std::thread _timerThread;
    bool _stopping = false;
};

} // namespace PeerRelay::Signaling
