/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

#pragma once

#include "../src/Signaling/Transport/SignalingTransport.h"
#include <mutex>
#include <string>
#include <vector>

namespace PeerRelay::Signaling::Testing {

/**
 * @brief In-memory SignalingTransport
 *
 * Frames sent by the code under test are recorded; deliver() injects inbound
 * frames as if read from the wire.
 */
class MockSignalingTransport : public SignalingTransport {
public:
    ~MockSignalingTransport() override { shutdownCallbacks(); }

    Result<void> open() override {
        {
            std::lock_guard lock(_mutex);
            ++_openCount;
            if (failOpen) {
                _state = TransportState::Failed;
                return Result<void>::err(SignalingError::ConnectionClosed, "open refused");
            }
            _state = TransportState::Open;
        }
        onStateChanged(TransportState::Open);
        return Result<void>::ok();
    }

    Result<void> send(const std::string& frame) override {
        std::lock_guard lock(_mutex);
        if (_state != TransportState::Open) {
            return Result<void>::err(SignalingError::ConnectionClosed, "Not connected");
        }
        if (failSends) {
            return Result<void>::err(SignalingError::ConnectionClosed, "send failed");
        }
        _sent.push_back(frame);
        return Result<void>::ok();
    }

    void close() override {
        {
            std::lock_guard lock(_mutex);
            if (_state == TransportState::Closed) return;
            _state = TransportState::Closed;
        }
        onStateChanged(TransportState::Closed);
    }

    bool isOpen() const override { return getState() == TransportState::Open; }

    TransportState getState() const override {
        std::lock_guard lock(_mutex);
        return _state;
    }

    void deliver(const std::string& frame) { onMessageReceived(frame); }

    /// Simulates the remote end dropping the connection
    void drop() {
        {
            std::lock_guard lock(_mutex);
            _state = TransportState::Failed;
        }
        onStateChanged(TransportState::Failed);
    }

    std::vector<std::string> sent() const {
        std::lock_guard lock(_mutex);
        return _sent;
    }

    int openCount() const {
        std::lock_guard lock(_mutex);
        return _openCount;
    }

    bool failOpen = false;
    bool failSends = false;

private:
    mutable std::mutex _mutex;
    TransportState _state = TransportState::Closed;
    std::vector<std::string> _sent;
    int _openCount = 0;
};

} // namespace PeerRelay::Signaling::Testing
