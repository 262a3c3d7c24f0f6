/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

#include "WebSocketTransport.h"

#include <Logging/Logger.h>

#include <chrono>
#include <format>
#include <thread>

#include "RoomProtocol.h"

namespace PeerRelay::Signaling
{

WebSocketTransport::WebSocketTransport(TransportConfig config)
    : _config(std::move(config)), _accepted(false), _context(std::make_shared<CallbackContext>()) {
    _context->transport = this;
}

WebSocketTransport::WebSocketTransport(std::shared_ptr<rtc::WebSocket> accepted)
    : _accepted(true), _ws(std::move(accepted)), _context(std::make_shared<CallbackContext>()) {
    _context->transport = this;
}

WebSocketTransport::~WebSocketTransport() {
    close();

    _context->valid.store(false, std::memory_order_release);
    while (_context->activeCallbacks.load(std::memory_order_acquire) > 0) {
        std::this_thread::yield();
    }
    shutdownCallbacks();
}

void WebSocketTransport::wireCallbacks() {
    std::weak_ptr<CallbackContext> weakCtx = _context;

    _ws->onOpen([weakCtx]() {
        auto ctx = weakCtx.lock();
        if (!ctx) return;
        CallbackGuard guard(ctx);
        if (auto* self = guard.get()) self->handleOpen();
    });

    _ws->onMessage([weakCtx](rtc::message_variant data) {
        auto ctx = weakCtx.lock();
        if (!ctx) return;
        CallbackGuard guard(ctx);
        auto* self = guard.get();
        if (!self) return;

        if (std::holds_alternative<std::string>(data)) {
            self->handleText(std::get<std::string>(data));
        } else {
            ENTROPY_LOG_WARNING_CAT("WebSocketTransport", "Dropping binary frame on signaling channel");
        }
    });

    _ws->onClosed([weakCtx]() {
        auto ctx = weakCtx.lock();
        if (!ctx) return;
        CallbackGuard guard(ctx);
        if (auto* self = guard.get()) self->handleClosed();
    });

    _ws->onError([weakCtx](std::string error) {
        auto ctx = weakCtx.lock();
        if (!ctx) return;
        CallbackGuard guard(ctx);
        if (auto* self = guard.get()) self->handleError(error);
    });
}

Result<void> WebSocketTransport::open() {
    TransportState current = _state.load(std::memory_order_acquire);
    if (current == TransportState::Open || current == TransportState::Connecting) {
        return Result<void>::err(SignalingError::AlreadyExists, "Transport already open");
    }

    if (_accepted) {
        if (!_ws) {
            return Result<void>::err(SignalingError::InvalidParameter, "Accepted socket is null");
        }
        wireCallbacks();
        setState(_ws->isOpen() ? TransportState::Open : TransportState::Connecting);
        return Result<void>::ok();
    }

    if (_config.url.empty()) {
        return Result<void>::err(SignalingError::InvalidParameter, "Signaling URL is empty");
    }

    {
        std::lock_guard<std::mutex> lock(_mutex);
        _handshakeResult.reset();
        _handshaking = true;
    }

    try {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _ws = std::make_shared<rtc::WebSocket>();
        }
        wireCallbacks();
        setState(TransportState::Connecting);
        _ws->open(_config.url);
    } catch (const std::exception& e) {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _handshaking = false;
        }
        setState(TransportState::Failed);
        return Result<void>::err(SignalingError::ConnectionClosed,
                                 std::format("Failed to open {}: {}", _config.url, e.what()));
    }

    std::unique_lock<std::mutex> lock(_mutex);
    bool done = _handshakeCv.wait_for(lock, std::chrono::milliseconds(_config.handshakeTimeoutMs),
                                      [this] { return _handshakeResult.has_value(); });
    if (!done) {
        _handshaking = false;
        lock.unlock();
        ENTROPY_LOG_ERROR_CAT("WebSocketTransport",
                              std::format("No HELLO from {} within {} ms", _config.url, _config.handshakeTimeoutMs));
        close();
        setState(TransportState::Failed);
        return Result<void>::err(SignalingError::Timeout, "Signaling handshake timed out");
    }

    Result<void> result = *_handshakeResult;
    lock.unlock();

    if (result.failed()) {
        close();
        setState(TransportState::Failed);
        return result;
    }

    setState(TransportState::Open);
    ENTROPY_LOG_INFO_CAT("WebSocketTransport", std::format("Registered with {} as '{}'", _config.url, _config.localId));
    return Result<void>::ok();
}

Result<void> WebSocketTransport::send(const std::string& frame) {
    std::shared_ptr<rtc::WebSocket> ws;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        ws = _ws;
    }
    if (!ws || !ws->isOpen()) {
        return Result<void>::err(SignalingError::ConnectionClosed, "Not connected");
    }

    try {
        if (!ws->send(frame)) {
            ENTROPY_LOG_DEBUG_CAT("WebSocketTransport", "Frame buffered by WebSocket");
        }
    } catch (const std::exception& e) {
        return Result<void>::err(SignalingError::ConnectionClosed, std::format("WebSocket send failed: {}", e.what()));
    }
    return Result<void>::ok();
}

void WebSocketTransport::close() {
    std::shared_ptr<rtc::WebSocket> ws;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        ws = _ws;
    }
    if (!ws) {
        return;
    }

    try {
        ws->close();
    } catch (const std::exception& e) {
        ENTROPY_LOG_WARNING_CAT("WebSocketTransport", std::format("WebSocket close failed: {}", e.what()));
    }
}

bool WebSocketTransport::isOpen() const {
    return _state.load(std::memory_order_acquire) == TransportState::Open;
}

TransportState WebSocketTransport::getState() const {
    return _state.load(std::memory_order_acquire);
}

void WebSocketTransport::setState(TransportState state) {
    TransportState previous = _state.exchange(state, std::memory_order_acq_rel);
    if (previous != state) {
        onStateChanged(state);
    }
}

void WebSocketTransport::finishHandshake(Result<void> result) {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!_handshaking) return;
        _handshaking = false;
        _handshakeResult = std::move(result);
    }
    _handshakeCv.notify_all();
}

void WebSocketTransport::handleOpen() {
    if (_accepted) {
        setState(TransportState::Open);
        return;
    }

    bool handshaking;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        handshaking = _handshaking;
    }
    if (handshaking) {
        auto sent = send(RoomProtocol::hello(_config.localId));
        if (sent.failed()) {
            finishHandshake(sent);
        }
    }
}

void WebSocketTransport::handleText(const std::string& text) {
    if (_accepted) {
        if (text.rfind("HELLO", 0) == 0) {
            auto reply = send(RoomProtocol::hello());
            if (reply.failed()) {
                ENTROPY_LOG_WARNING_CAT("WebSocketTransport",
                                        std::format("Failed to answer HELLO: {}", reply.errorMessage));
            }
            return;
        }
        onMessageReceived(text);
        return;
    }

    bool handshaking;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        handshaking = _handshaking;
    }
    if (!handshaking) {
        onMessageReceived(text);
        return;
    }

    if (text.rfind("ERROR", 0) == 0) {
        finishHandshake(Result<void>::err(SignalingError::ConnectionClosed,
                                          std::format("Signaling server refused HELLO: {}", text)));
    } else if (text.rfind("HELLO", 0) == 0) {
        finishHandshake(Result<void>::ok());
    } else {
        finishHandshake(Result<void>::err(SignalingError::InvalidMessage,
                                          std::format("Server didn't say HELLO: {}", text)));
    }
}

void WebSocketTransport::handleClosed() {
    finishHandshake(Result<void>::err(SignalingError::ConnectionClosed, "Connection closed during handshake"));
    ENTROPY_LOG_INFO_CAT("WebSocketTransport", "Signaling channel closed");
    setState(TransportState::Closed);
}

void WebSocketTransport::handleError(const std::string& error) {
    ENTROPY_LOG_ERROR_CAT("WebSocketTransport", std::format("Signaling error: {}", error));
    finishHandshake(Result<void>::err(SignalingError::ConnectionClosed, error));
    setState(TransportState::Failed);
}

} // namespace PeerRelay::Signaling
