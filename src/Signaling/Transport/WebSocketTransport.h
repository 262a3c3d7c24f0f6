/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

/**
 * @file WebSocketTransport.h
 * @brief SignalingTransport over a libdatachannel WebSocket
 */

#pragma once

#include <rtc/rtc.hpp>

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>

#include "../Core/SignalingConfig.h"
#include "SignalingTransport.h"

namespace PeerRelay::Signaling {

/**
 * @brief Text signaling channel on rtc::WebSocket
 *
 * Client mode dials TransportConfig::url and performs the HELLO handshake:
 * it sends "HELLO <localId>" and waits for the server's "HELLO". A reply that
 * starts with "ERROR" (or anything else) fails open(). open() blocks until the
 * handshake completes or handshakeTimeoutMs elapses.
 *
 * Accepted mode wraps a socket handed out by rtc::WebSocketServer::onClient.
 * An inbound "HELLO ..." is answered with "HELLO" and not forwarded.
 *
 * Only text frames carry signaling; binary frames are logged and dropped.
 */
class WebSocketTransport : public SignalingTransport {
public:
    /// Client mode
    explicit WebSocketTransport(TransportConfig config);

    /// Accepted mode
    explicit WebSocketTransport(std::shared_ptr<rtc::WebSocket> accepted);

    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    Result<void> open() override;
    Result<void> send(const std::string& frame) override;
    void close() override;
    bool isOpen() const override;
    TransportState getState() const override;

    bool isAccepted() const { return _accepted; }

private:
    struct CallbackContext {
        WebSocketTransport* transport;
        std::atomic<bool> valid{true};
        std::atomic<int> activeCallbacks{0};
    };

    struct CallbackGuard {
        std::shared_ptr<CallbackContext> ctx;

        explicit CallbackGuard(std::shared_ptr<CallbackContext> c) : ctx(std::move(c)) {
            ctx->activeCallbacks.fetch_add(1, std::memory_order_acquire);
        }
        ~CallbackGuard() { ctx->activeCallbacks.fetch_sub(1, std::memory_order_release); }

        CallbackGuard(const CallbackGuard&) = delete;
        CallbackGuard& operator=(const CallbackGuard&) = delete;

        WebSocketTransport* get() const {
            return ctx->valid.load(std::memory_order_acquire) ? ctx->transport : nullptr;
        }
    };

    void wireCallbacks();
    void handleOpen();
    void handleText(const std::string& text);
    void handleClosed();
    void handleError(const std::string& error);

    void setState(TransportState state);
    void finishHandshake(Result<void> result);

    TransportConfig _config;
    bool _accepted;
    std::shared_ptr<rtc::WebSocket> _ws;
    std::shared_ptr<CallbackContext> _context;

    mutable std::mutex _mutex;
    std::condition_variable _handshakeCv;
    std::optional<Result<void>> _handshakeResult;
    bool _handshaking = false;
    std::atomic<TransportState> _state{TransportState::Closed};
};

} // namespace PeerRelay::Signaling
