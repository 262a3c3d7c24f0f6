/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

/**
 * @file SignalingTransport.h
 * @brief Abstract text channel carrying signaling frames
 */

#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "../Core/ErrorCodes.h"

namespace PeerRelay::Signaling {

/**
 * @brief Lifecycle of a signaling channel
 */
enum class TransportState {
    Closed,
    Connecting,
    Open,
    Failed
};

inline const char* transportStateToString(TransportState state) {
    switch (state) {
        case TransportState::Closed: return "Closed";
        case TransportState::Connecting: return "Connecting";
        case TransportState::Open: return "Open";
        case TransportState::Failed: return "Failed";
    }
    return "?";
}

/**
 * @brief Bidirectional text transport (WebSocket, message bus, test loopback)
 *
 * Implementations deliver each inbound frame through onMessageReceived() and
 * each lifecycle change through onStateChanged(). Callbacks are copied under a
 * lock and invoked outside it; shutdownCallbacks() blocks until in-flight
 * callbacks have returned, and must be called from implementation destructors.
 */
class SignalingTransport {
public:
    using MessageCallback = std::function<void(const std::string&)>;
    using StateCallback = std::function<void(TransportState)>;

    virtual ~SignalingTransport() = default;

    virtual Result<void> open() = 0;
    virtual Result<void> send(const std::string& frame) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;
    virtual TransportState getState() const = 0;

    void setMessageCallback(MessageCallback callback) noexcept {
        std::lock_guard<std::mutex> lock(_cbMutex);
        _messageCallback = std::move(callback);
    }

    void setStateCallback(StateCallback callback) noexcept {
        std::lock_guard<std::mutex> lock(_cbMutex);
        _stateCallback = std::move(callback);
    }

protected:
    SignalingTransport() = default;

    void onMessageReceived(const std::string& frame) noexcept {
        if (_callbacksShutdown.load(std::memory_order_acquire)) {
            return;
        }

        _activeCallbacks.fetch_add(1, std::memory_order_relaxed);
        struct CallbackGuard {
            std::atomic<int>& counter;
            ~CallbackGuard() { counter.fetch_sub(1, std::memory_order_release); }
        } guard{_activeCallbacks};

        if (_callbacksShutdown.load(std::memory_order_acquire)) {
            return;
        }

        MessageCallback cb;
        {
            std::lock_guard<std::mutex> lock(_cbMutex);
            cb = _messageCallback;
        }
        if (cb) {
            cb(frame);
        }
    }

    void onStateChanged(TransportState state) noexcept {
        if (_callbacksShutdown.load(std::memory_order_acquire)) {
            return;
        }

        _activeCallbacks.fetch_add(1, std::memory_order_relaxed);
        struct CallbackGuard {
            std::atomic<int>& counter;
            ~CallbackGuard() { counter.fetch_sub(1, std::memory_order_release); }
        } guard{_activeCallbacks};

        if (_callbacksShutdown.load(std::memory_order_acquire)) {
            return;
        }

        StateCallback cb;
        {
            std::lock_guard<std::mutex> lock(_cbMutex);
            cb = _stateCallback;
        }
        if (cb) {
            cb(state);
        }
    }

    void shutdownCallbacks() noexcept {
        _callbacksShutdown.store(true, std::memory_order_release);
        while (_activeCallbacks.load(std::memory_order_acquire) > 0) {
            std::this_thread::yield();
        }
    }

private:
    mutable std::mutex _cbMutex;
    MessageCallback _messageCallback;
    StateCallback _stateCallback;
    std::atomic<int> _activeCallbacks{0};
    std::atomic<bool> _callbacksShutdown{false};
};

} // namespace PeerRelay::Signaling
