/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "../src/Signaling/Actor/Actor.h"

namespace PeerRelay::Signaling::Testing {

/**
 * @brief Polls a predicate until it holds or the timeout expires
 *
 * @code
 * ASSERT_TRUE(waitFor([&] { return transport->sent().size() == 2; }));
 * @endcode
 */
inline bool waitFor(const std::function<bool()>& predicate,
                    std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

/**
 * @brief Actor that records what it handles and fails on request
 *
 * StartNegotiation{"fail"} returns an error, StartNegotiation{"throw"} throws,
 * StartNegotiation{"block"} waits until release() is called.
 */
class ProbeActor : public Actor {
public:
    ProbeActor(RouteKey key, EntropyEngine::Core::Concurrency::WorkContractGroup* group, size_t capacity = 64)
        : Actor(std::move(key), group, capacity) {}

    std::vector<std::string> handled() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _handled;
    }

    size_t handledCount() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _handled.size();
    }

    void release() { _release = true; }

    std::atomic<bool> blocking{false};
    std::atomic<bool> overlapped{false};
    std::atomic<bool> stopped{false};

protected:
    Result<void> handle(const RouterMessage& message) override {
        if (_running.fetch_add(1) != 0) overlapped = true;

        std::string label = routerMessageName(message);
        if (const auto* start = std::get_if<StartNegotiation>(&message)) {
            label = start->peer;
        }
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _handled.push_back(label);
        }

        if (label == "block") {
            blocking = true;
            while (!_release.load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
        }

        _running.fetch_sub(1);
        if (label == "fail") {
            return Result<void>::err(SignalingError::ConnectionClosed, "probe failure");
        }
        if (label == "throw") {
            throw std::runtime_error("probe exception");
        }
        return Result<void>::ok();
    }

    void onStop() override { stopped = true; }

private:
    mutable std::mutex _mutex;
    std::vector<std::string> _handled;
    std::atomic<int> _running{0};
    std::atomic<bool> _release{false};
};

} // namespace PeerRelay::Signaling::Testing
