/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

#include "Actor.h"

#include <Logging/Logger.h>

#include <format>

namespace PeerRelay::Signaling
{

Actor::Actor(RouteKey key, EntropyEngine::Core::Concurrency::WorkContractGroup* group, size_t mailboxCapacity)
    : _key(std::move(key)),
      _name(_key.toString()),
      _capacity(mailboxCapacity),
      _executor(group, _name) {}

Actor::~Actor() {
    _executor.shutdown();
}

Result<void> Actor::send(RouterMessage message) {
    if (status() != ActorStatus::Running) {
        return Result<void>::err(SignalingError::MailboxClosed,
                                 std::format("Actor {} is {}", _name, actorStatusToString(status())));
    }

    size_t queued = _queued.fetch_add(1, std::memory_order_acq_rel);
    if (queued >= _capacity) {
        _queued.fetch_sub(1, std::memory_order_acq_rel);
        ENTROPY_LOG_WARNING_CAT("Actor", std::format("{}: mailbox full ({} messages), dropping {}", _name, _capacity,
                                                     routerMessageName(message)));
        return Result<void>::err(SignalingError::MailboxFull, std::format("Mailbox of {} is full", _name));
    }

    auto self = shared_from_this();
    bool posted = _executor.post([self, message = std::move(message)]() {
        self->_queued.fetch_sub(1, std::memory_order_acq_rel);
        self->process(message);
    });
    if (!posted) {
        _queued.fetch_sub(1, std::memory_order_acq_rel);
        return Result<void>::err(SignalingError::MailboxClosed, std::format("Actor {} is stopped", _name));
    }
    return Result<void>::ok();
}

bool Actor::postTask(std::function<void()> task) {
    if (status() != ActorStatus::Running) {
        return false;
    }
    auto self = shared_from_this();
    return _executor.post([self, task = std::move(task)]() {
        if (self->status() == ActorStatus::Running) {
            task();
        }
    });
}

void Actor::process(const RouterMessage& message) {
    if (status() != ActorStatus::Running) {
        return;
    }

    if (std::holds_alternative<Shutdown>(message)) {
        ENTROPY_LOG_DEBUG_CAT("Actor", std::format("{}: shutdown requested", _name));
        stop();
        return;
    }

    Result<void> result = Result<void>::ok();
    try {
        result = handle(message);
    } catch (const std::exception& e) {
        result = Result<void>::err(SignalingError::EngineFailure,
                                   std::format("{} threw while handling {}: {}", _name, routerMessageName(message),
                                               e.what()));
    }
    _processed.fetch_add(1, std::memory_order_relaxed);

    if (result.failed()) {
        fail(result.error, result.errorMessage);
    }
}

void Actor::fail(SignalingError error, const std::string& message) {
    ActorStatus expected = ActorStatus::Running;
    if (!_status.compare_exchange_strong(expected, ActorStatus::Failed, std::memory_order_acq_rel)) {
        return;
    }

    ENTROPY_LOG_ERROR_CAT("Actor", std::format("{} failed: {} ({})", _name, message, errorToString(error)));
    _executor.shutdown();

    FailureCallback callback;
    {
        std::lock_guard<std::mutex> lock(_cbMutex);
        callback = _failureCallback;
    }
    if (callback) {
        callback(_key, error, message);
    }
}

void Actor::stop() {
    ActorStatus expected = ActorStatus::Running;
    if (!_status.compare_exchange_strong(expected, ActorStatus::Stopped, std::memory_order_acq_rel)) {
        return;
    }

    try {
        onStop();
    } catch (const std::exception& e) {
        ENTROPY_LOG_ERROR_CAT("Actor", std::format("{}: onStop threw: {}", _name, e.what()));
    }
    _executor.shutdown();
    ENTROPY_LOG_DEBUG_CAT("Actor", std::format("{} stopped", _name));
}

void Actor::setFailureCallback(FailureCallback callback) {
    std::lock_guard<std::mutex> lock(_cbMutex);
    _failureCallback = std::move(callback);
}

} // namespace PeerRelay::Signaling
