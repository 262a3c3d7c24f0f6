/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

/**
 * @file Actor.h
 * @brief Named unit with a bounded serial mailbox
 */

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>

#include "../Core/ErrorCodes.h"
#include "../Core/SerialExecutor.h"
#include "RouteKey.h"
#include "RouterMessage.h"

namespace EntropyEngine::Core::Concurrency {
class WorkContractGroup;
}

namespace PeerRelay::Signaling {

enum class ActorStatus : uint8_t {
    Running,
    Stopped,
    Failed
};

inline const char* actorStatusToString(ActorStatus status) {
    switch (status) {
        case ActorStatus::Running: return "Running";
        case ActorStatus::Stopped: return "Stopped";
        case ActorStatus::Failed: return "Failed";
    }
    return "?";
}

/**
 * @brief Base class of every unit on the router
 *
 * Messages are handled one at a time in arrival order on the actor's
 * SerialExecutor. handle() returning an error or throwing marks the actor
 * Failed; the failure callback (installed by the Supervisor) runs once, on the
 * actor's own execution context. A Shutdown message stops the actor after
 * calling onStop().
 *
 * Actors are always owned through std::shared_ptr. Queued messages keep the
 * actor alive until they have been handled or dropped.
 */
class Actor : public std::enable_shared_from_this<Actor> {
public:
    using FailureCallback = std::function<void(const RouteKey& key, SignalingError error, const std::string& message)>;

    Actor(RouteKey key, EntropyEngine::Core::Concurrency::WorkContractGroup* group, size_t mailboxCapacity);
    virtual ~Actor();

    Actor(const Actor&) = delete;
    Actor& operator=(const Actor&) = delete;

    /**
     * @brief Enqueues a message
     * @return MailboxFull at capacity, MailboxClosed once stopped or failed
     */
    Result<void> send(RouterMessage message);

    /// Stops accepting messages and drops queued ones. Idempotent.
    void stop();

    void setFailureCallback(FailureCallback callback);

    const RouteKey& key() const { return _key; }
    ActorStatus status() const { return _status.load(std::memory_order_acquire); }
    size_t mailboxSize() const { return _queued.load(std::memory_order_acquire); }
    size_t mailboxCapacity() const { return _capacity; }
    uint64_t processedCount() const { return _processed.load(std::memory_order_relaxed); }

protected:
    virtual Result<void> handle(const RouterMessage& message) = 0;
    virtual void onStop() {}

    /// True when called from inside handle()
    bool onActorThread() const { return _executor.isCurrentThread(); }

    /**
     * @brief Runs an internal task in mailbox order, bypassing the capacity
     * @return false once the actor is stopped or failed
     */
    bool postTask(std::function<void()> task);

    /// Marks the actor Failed and notifies the failure callback once
    void fail(SignalingError error, const std::string& message);

private:
    void process(const RouterMessage& message);

    const RouteKey _key;
    const std::string _name;
    const size_t _capacity;
    SerialExecutor _executor;

    std::atomic<ActorStatus> _status{ActorStatus::Running};
    std::atomic<size_t> _queued{0};
    std::atomic<uint64_t> _processed{0};

    std::mutex _cbMutex;
    FailureCallback _failureCallback;
};

} // namespace PeerRelay::Signaling
