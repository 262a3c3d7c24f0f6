/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

#include "RtpIngest.h"

#include <Logging/Logger.h>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <format>
#include <vector>

namespace PeerRelay::Signaling
{

RtpIngest::RtpIngest(MediaFanout* fanout, std::string bindAddress, uint16_t port)
    : _fanout(fanout), _bindAddress(std::move(bindAddress)), _requestedPort(port) {}

RtpIngest::~RtpIngest() {
    stop();
}

Result<void> RtpIngest::start() {
    if (_running.load(std::memory_order_acquire)) {
        return Result<void>::err(SignalingError::AlreadyExists, "RTP ingest already running");
    }
    if (!_fanout) {
        return Result<void>::err(SignalingError::InvalidParameter, "MediaFanout is null");
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(_requestedPort);
    if (inet_pton(AF_INET, _bindAddress.c_str(), &addr.sin_addr) != 1) {
        return Result<void>::err(SignalingError::InvalidParameter,
                                 std::format("Invalid RTP bind address {}", _bindAddress));
    }

    _socket = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (_socket < 0) {
        return Result<void>::err(SignalingError::ConnectionClosed,
                                 std::format("socket() failed: {}", std::strerror(errno)));
    }
    fcntl(_socket, F_SETFD, FD_CLOEXEC);

    if (::bind(_socket, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        int bindErrno = errno;
        ::close(_socket);
        _socket = -1;
        return Result<void>::err(SignalingError::ConnectionClosed,
                                 std::format("bind({}:{}) failed: {}", _bindAddress, _requestedPort,
                                             std::strerror(bindErrno)));
    }

    sockaddr_in bound{};
    socklen_t boundLen = sizeof(bound);
    if (::getsockname(_socket, reinterpret_cast<sockaddr*>(&bound), &boundLen) == 0) {
        _boundPort = ntohs(bound.sin_port);
    } else {
        _boundPort = _requestedPort;
    }

    _running.store(true, std::memory_order_release);
    _thread = std::thread([this]() { receiveLoop(); });

    ENTROPY_LOG_INFO(std::format("RTP ingest listening on {}:{}", _bindAddress, _boundPort));
    return Result<void>::ok();
}

void RtpIngest::stop() {
    _running.store(false, std::memory_order_release);
    if (_thread.joinable()) {
        _thread.join();
    }
    if (_socket >= 0) {
        ::close(_socket);
        _socket = -1;
    }
}

void RtpIngest::receiveLoop() {
    std::vector<uint8_t> buffer(MAX_DATAGRAM_SIZE);

    while (_running.load(std::memory_order_acquire)) {
        pollfd pfd{_socket, POLLIN, 0};
        int ready = ::poll(&pfd, 1, 100);
        if (ready < 0) {
            if (errno == EINTR) continue;
            ENTROPY_LOG_ERROR(std::format("RTP ingest poll failed on port {}: {}", _boundPort, std::strerror(errno)));
            break;
        }
        if (ready == 0 || !(pfd.revents & POLLIN)) continue;

        ssize_t n = ::recv(_socket, buffer.data(), buffer.size(), 0);
        if (n <= 0) continue;

        _packetsReceived.fetch_add(1, std::memory_order_relaxed);
        _fanout->push(std::vector<uint8_t>(buffer.begin(), buffer.begin() + n));
    }

    _running.store(false, std::memory_order_release);
}

}  // namespace PeerRelay::Signaling
