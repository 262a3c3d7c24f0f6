/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

#include "Router.h"

#include <Logging/Logger.h>

#include <format>
#include <mutex>

namespace PeerRelay::Signaling
{

Router::~Router() {
    stopAll();
}

Result<void> Router::registerActor(std::shared_ptr<Actor> actor) {
    if (!actor) {
        return Result<void>::err(SignalingError::InvalidParameter, "Actor is null");
    }

    std::unique_lock<std::shared_mutex> lock(_mutex);
    auto [it, inserted] = _actors.try_emplace(actor->key(), actor);
    if (!inserted) {
        return Result<void>::err(SignalingError::AlreadyExists,
                                 std::format("Route {} already registered", actor->key().toString()));
    }
    lock.unlock();

    ENTROPY_LOG_DEBUG_CAT("Router", std::format("Registered {}", actor->key().toString()));
    return Result<void>::ok();
}

std::shared_ptr<Actor> Router::replaceActor(std::shared_ptr<Actor> actor) {
    if (!actor) {
        return nullptr;
    }

    std::shared_ptr<Actor> previous;
    {
        std::unique_lock<std::shared_mutex> lock(_mutex);
        auto& slot = _actors[actor->key()];
        previous = std::move(slot);
        slot = std::move(actor);
    }
    return previous;
}

std::shared_ptr<Actor> Router::unregisterActor(const RouteKey& key) {
    std::shared_ptr<Actor> removed;
    {
        std::unique_lock<std::shared_mutex> lock(_mutex);
        auto it = _actors.find(key);
        if (it == _actors.end()) {
            return nullptr;
        }
        removed = std::move(it->second);
        _actors.erase(it);
    }
    ENTROPY_LOG_DEBUG_CAT("Router", std::format("Unregistered {}", key.toString()));
    return removed;
}

Result<void> Router::send(const RouteKey& key, RouterMessage message) {
    std::shared_ptr<Actor> actor = find(key);
    if (!actor) {
        _routeMisses.fetch_add(1, std::memory_order_relaxed);
        ENTROPY_LOG_WARNING_CAT("Router", std::format("No route for {} ({})", key.toString(),
                                                      routerMessageName(message)));
        return Result<void>::err(SignalingError::RouteNotFound, std::format("No actor at {}", key.toString()));
    }

    auto result = actor->send(std::move(message));
    if (result.failed()) {
        _deliveryFailures.fetch_add(1, std::memory_order_relaxed);
        return result;
    }
    _messagesRouted.fetch_add(1, std::memory_order_relaxed);
    return result;
}

std::shared_ptr<Actor> Router::find(const RouteKey& key) const {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    auto it = _actors.find(key);
    return it != _actors.end() ? it->second : nullptr;
}

bool Router::contains(const RouteKey& key) const {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    return _actors.count(key) != 0;
}

size_t Router::size() const {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    return _actors.size();
}

std::vector<RouteKey> Router::keys() const {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    std::vector<RouteKey> out;
    out.reserve(_actors.size());
    for (const auto& [key, actor] : _actors) {
        out.push_back(key);
    }
    return out;
}

void Router::stopAll() {
    std::unordered_map<RouteKey, std::shared_ptr<Actor>> actors;
    {
        std::unique_lock<std::shared_mutex> lock(_mutex);
        actors.swap(_actors);
    }
    for (auto& [key, actor] : actors) {
        actor->stop();
    }
}

Router::Metrics Router::getMetrics() const {
    Metrics m;
    m.messagesRouted = _messagesRouted.load(std::memory_order_relaxed);
    m.routeMisses = _routeMisses.load(std::memory_order_relaxed);
    m.deliveryFailures = _deliveryFailures.load(std::memory_order_relaxed);
    return m;
}

} // namespace PeerRelay::Signaling
