/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

/**
 * @file Router.h
 * @brief Dispatches messages to actors by RouteKey
 */

#pragma once

#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "Actor.h"

namespace PeerRelay::Signaling {

/**
 * @brief Thread-safe key to actor table
 *
 * send() to an unregistered key returns RouteNotFound; nothing is dropped
 * silently. Actor mailboxes are entered outside the table lock.
 */
class Router {
public:
    struct Metrics {
        uint64_t messagesRouted = 0;
        uint64_t routeMisses = 0;
        uint64_t deliveryFailures = 0;   ///< MailboxFull / MailboxClosed
    };

    Router() = default;
    ~Router();

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    /// AlreadyExists if the key is taken, InvalidParameter for null
    Result<void> registerActor(std::shared_ptr<Actor> actor);

    /// Installs actor under its key, returning whatever was there before
    std::shared_ptr<Actor> replaceActor(std::shared_ptr<Actor> actor);

    std::shared_ptr<Actor> unregisterActor(const RouteKey& key);

    Result<void> send(const RouteKey& key, RouterMessage message);

    std::shared_ptr<Actor> find(const RouteKey& key) const;
    bool contains(const RouteKey& key) const;
    size_t size() const;
    std::vector<RouteKey> keys() const;

    /// Unregisters and stops every actor
    void stopAll();

    Metrics getMetrics() const;

private:
    mutable std::shared_mutex _mutex;
    std::unordered_map<RouteKey, std::shared_ptr<Actor>> _actors;

    std::atomic<uint64_t> _messagesRouted{0};
    std::atomic<uint64_t> _routeMisses{0};
    std::atomic<uint64_t> _deliveryFailures{0};
};

} // namespace PeerRelay::Signaling
