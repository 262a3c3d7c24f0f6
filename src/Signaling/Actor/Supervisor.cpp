/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

#include "Supervisor.h"

#include <Logging/Logger.h>

#include <algorithm>
#include <format>
#include <vector>

namespace PeerRelay::Signaling
{

Supervisor::Supervisor(Router& router, RestartPolicy policy)
    : _router(router), _policy(policy) {
    if (_policy.kind == RestartPolicy::Kind::InfiniteWithBackoff) {
        _timerThread = std::thread([this] { timerLoop(); });
    }
}

Supervisor::~Supervisor() {
    shutdown();
}

std::chrono::milliseconds Supervisor::backoffFor(uint32_t attempt) const {
    if (_policy.kind != RestartPolicy::Kind::InfiniteWithBackoff) {
        return std::chrono::milliseconds{0};
    }

    uint64_t base = static_cast<uint64_t>(std::max<int64_t>(0, _policy.initialBackoff.count()));
    uint64_t cap = static_cast<uint64_t>(std::max<int64_t>(0, _policy.maxBackoff.count()));
    // Past 2^31 the cap has long been reached
    uint32_t shift = std::min<uint32_t>(attempt, 31);
    uint64_t backoff = base << shift;
    if ((base != 0 && (backoff >> shift) != base) || (cap > 0 && backoff > cap)) {
        backoff = cap;
    }
    return std::chrono::milliseconds{static_cast<int64_t>(backoff)};
}

Result<void> Supervisor::spawn(const RouteKey& key, ActorFactory factory) {
    if (!factory) {
        return Result<void>::err(SignalingError::InvalidParameter, "Actor factory is null");
    }

    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_stopping) {
            return Result<void>::err(SignalingError::MailboxClosed, "Supervisor is shut down");
        }
        if (_entries.count(key) != 0) {
            return Result<void>::err(SignalingError::AlreadyExists,
                                     std::format("{} is already supervised", key.toString()));
        }
    }

    std::shared_ptr<Actor> actor;
    try {
        actor = factory();
    } catch (const std::exception& e) {
        return Result<void>::err(SignalingError::EngineFailure,
                                 std::format("Failed to build {}: {}", key.toString(), e.what()));
    }
    if (!actor || !(actor->key() == key)) {
        return Result<void>::err(SignalingError::InvalidParameter,
                                 std::format("Factory for {} built no actor or one under another key", key.toString()));
    }

    uint64_t incarnation = 0;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        auto [it, inserted] = _entries.try_emplace(key);
        if (!inserted) {
            return Result<void>::err(SignalingError::AlreadyExists,
                                     std::format("{} is already supervised", key.toString()));
        }
        it->second.factory = std::move(factory);
        it->second.incarnation = ++_nextIncarnation;
        incarnation = it->second.incarnation;
    }

    watch(actor, incarnation);
    auto registered = _router.registerActor(actor);
    if (registered.failed()) {
        std::lock_guard<std::mutex> lock(_mutex);
        _entries.erase(key);
        return registered;
    }
    return Result<void>::ok();
}

void Supervisor::watch(const std::shared_ptr<Actor>& actor, uint64_t incarnation) {
    actor->setFailureCallback([this, incarnation](const RouteKey& key, SignalingError error, const std::string&) {
        onActorFailed(key, incarnation, error);
    });
}

void Supervisor::onActorFailed(const RouteKey& key, uint64_t incarnation, SignalingError error) {
    std::unique_lock<std::mutex> lock(_mutex);
    if (_stopping) {
        return;
    }
    auto it = _entries.find(key);
    if (it == _entries.end() || it->second.incarnation != incarnation) {
        return;
    }
    Entry& entry = it->second;

    switch (_policy.kind) {
        case RestartPolicy::Kind::Never:
            entry.down = true;
            lock.unlock();
            ENTROPY_LOG_ERROR_CAT("Supervisor", std::format("{} failed ({}); restart policy is Never",
                                                            key.toString(), errorToString(error)));
            return;

        case RestartPolicy::Kind::UpToN:
            if (entry.restarts >= _policy.maxRestarts) {
                entry.down = true;
                uint32_t restarts = entry.restarts;
                lock.unlock();
                ENTROPY_LOG_ERROR_CAT("Supervisor", std::format("{} failed ({}); giving up after {} restarts",
                                                                key.toString(), errorToString(error), restarts));
                return;
            }
            lock.unlock();
            restart(key, incarnation);
            return;

        case RestartPolicy::Kind::InfiniteWithBackoff: {
            auto delay = backoffFor(entry.restarts);
            _pending.emplace(std::chrono::steady_clock::now() + delay, PendingRestart{key, incarnation});
            lock.unlock();
            _timerCv.notify_one();
            ENTROPY_LOG_WARNING_CAT("Supervisor", std::format("{} failed ({}); restarting in {} ms", key.toString(),
                                                              errorToString(error), delay.count()));
            return;
        }
    }
}

void Supervisor::restart(const RouteKey& key, uint64_t incarnation) {
    ActorFactory factory;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _entries.find(key);
        if (_stopping || it == _entries.end() || it->second.incarnation != incarnation) {
            return;
        }
        factory = it->second.factory;
    }

    std::shared_ptr<Actor> actor;
    try {
        actor = factory();
    } catch (const std::exception& e) {
        ENTROPY_LOG_ERROR_CAT("Supervisor", std::format("Rebuilding {} threw: {}", key.toString(), e.what()));
    }

    uint32_t restarts = 0;
    uint64_t nextIncarnation = 0;
    {
        std::unique_lock<std::mutex> lock(_mutex);
        auto it = _entries.find(key);
        if (_stopping || it == _entries.end() || it->second.incarnation != incarnation) {
            lock.unlock();
            if (actor) {
                actor->stop();
            }
            return;
        }
        Entry& entry = it->second;
        entry.restarts++;
        entry.incarnation = ++_nextIncarnation;
        restarts = entry.restarts;
        nextIncarnation = entry.incarnation;
        if (!actor) {
            entry.down = true;
        }
    }

    if (!actor) {
        // A rebuild that fails counts as another failure of the unit
        onActorFailed(key, nextIncarnation, SignalingError::EngineFailure);
        return;
    }

    watch(actor, nextIncarnation);

    // Published under the lock so a concurrent retire() or shutdown() either
    // sees the new actor or keeps it off the router
    std::shared_ptr<Actor> previous;
    bool published = false;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _entries.find(key);
        if (!_stopping && it != _entries.end() && it->second.incarnation == nextIncarnation) {
            previous = _router.replaceActor(actor);
            it->second.down = false;
            published = true;
        }
    }
    if (!published) {
        ENTROPY_LOG_DEBUG_CAT("Supervisor", std::format("{} retired while restarting", key.toString()));
        actor->stop();
        return;
    }
    if (previous && previous != actor) {
        previous->stop();
    }

    ENTROPY_LOG_INFO_CAT("Supervisor", std::format("Restarted {} (restart #{})", key.toString(), restarts));

    RestartCallback callback;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        callback = _restartCallback;
    }
    if (callback) {
        callback(key, restarts);
    }
}

void Supervisor::timerLoop() {
    std::unique_lock<std::mutex> lock(_mutex);
    while (!_stopping) {
        if (_pending.empty()) {
            _timerCv.wait(lock, [this] { return _stopping || !_pending.empty(); });
            continue;
        }

        auto due = _pending.begin()->first;
        if (std::chrono::steady_clock::now() < due) {
            _timerCv.wait_until(lock, due);
            continue;
        }

        PendingRestart next = _pending.begin()->second;
        _pending.erase(_pending.begin());
        lock.unlock();
        restart(next.key, next.incarnation);
        lock.lock();
    }
}

void Supervisor::retire(const RouteKey& key) {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _entries.erase(key);
    }
    if (auto actor = _router.unregisterActor(key)) {
        actor->stop();
    }
}

bool Supervisor::isSupervised(const RouteKey& key) const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _entries.count(key) != 0;
}

bool Supervisor::isDown(const RouteKey& key) const {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _entries.find(key);
    return it != _entries.end() && it->second.down;
}

uint32_t Supervisor::restartCount(const RouteKey& key) const {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _entries.find(key);
    return it != _entries.end() ? it->second.restarts : 0;
}

void Supervisor::setRestartCallback(RestartCallback callback) {
    std::lock_guard<std::mutex> lock(_mutex);
    _restartCallback = std::move(callback);
}

void Supervisor::shutdown() {
    std::vector<RouteKey> keys;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_stopping) {
            return;
        }
        _stopping = true;
        _pending.clear();
        for (const auto& [key, entry] : _entries) {
            keys.push_back(key);
        }
        _entries.clear();
    }
    _timerCv.notify_all();
    if (_timerThread.joinable()) {
        _timerThread.join();
    }

    for (const auto& key : keys) {
        if (auto actor = _router.unregisterActor(key)) {
            actor->stop();
        }
    }
}

} // namespace PeerRelay::Signaling
