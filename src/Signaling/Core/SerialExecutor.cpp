/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

#include "SerialExecutor.h"

#include <Concurrency/WorkContractGroup.h>
#include <Logging/Logger.h>

#include <exception>
#include <format>

namespace PeerRelay::Signaling
{

SerialExecutor::SerialExecutor(EntropyEngine::Core::Concurrency::WorkContractGroup* group, std::string name)
    : _state(std::make_shared<State>()) {
    _state->group = group;
    _state->name = std::move(name);
}

SerialExecutor::~SerialExecutor() {
    shutdown();
}

bool SerialExecutor::post(Task task) {
    bool startDrain = false;
    {
        std::lock_guard<std::mutex> lock(_state->mutex);
        if (_state->shutdown) {
            return false;
        }
        _state->queue.push_back(std::move(task));
        if (!_state->draining) {
            _state->draining = true;
            startDrain = true;
        }
    }

    if (!startDrain) {
        return true;
    }

    if (_state->group) {
        auto handle = _state->group->createContract([state = _state]() { drain(state); });
        if (handle.valid()) {
            handle.schedule();
            return true;
        }
        // Group is at capacity; keep ordering by draining here
        ENTROPY_LOG_WARNING(std::format("SerialExecutor '{}': work group full, draining inline", _state->name));
    }

    auto state = _state;
    drain(state);
    return true;
}

void SerialExecutor::drain(const std::shared_ptr<State>& state) {
    std::unique_lock<std::mutex> lock(state->mutex);
    state->drainThread = std::this_thread::get_id();

    while (!state->queue.empty()) {
        Task task = std::move(state->queue.front());
        state->queue.pop_front();
        lock.unlock();

        try {
            task();
        } catch (const std::exception& e) {
            ENTROPY_LOG_ERROR(std::format("SerialExecutor '{}': task threw: {}", state->name, e.what()));
        }
        task = nullptr;

        lock.lock();
    }

    state->draining = false;
    state->drainThread = std::thread::id();
    lock.unlock();
    state->idleCv.notify_all();
}

void SerialExecutor::shutdown() {
    std::unique_lock<std::mutex> lock(_state->mutex);
    _state->shutdown = true;
    std::deque<Task> dropped;
    dropped.swap(_state->queue);

    if (!(_state->draining && _state->drainThread == std::this_thread::get_id())) {
        _state->idleCv.wait(lock, [this] { return !_state->draining; });
    }
    lock.unlock();
    // Dropped tasks may own objects whose destructors post back here
    dropped.clear();
}

size_t SerialExecutor::pending() const {
    std::lock_guard<std::mutex> lock(_state->mutex);
    return _state->queue.size();
}

bool SerialExecutor::isShutdown() const {
    std::lock_guard<std::mutex> lock(_state->mutex);
    return _state->shutdown;
}

bool SerialExecutor::isCurrentThread() const {
    std::lock_guard<std::mutex> lock(_state->mutex);
    return _state->draining && _state->drainThread == std::this_thread::get_id();
}

}  // namespace PeerRelay::Signaling
