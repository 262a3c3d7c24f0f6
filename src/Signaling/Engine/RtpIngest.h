/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

/**
 * @file RtpIngest.h
 * @brief UDP receiver feeding an external encoder's RTP into a MediaFanout
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>

#include "../Core/ErrorCodes.h"
#include "MediaFanout.h"

namespace PeerRelay::Signaling {

/**
 * @brief Binds a UDP port and pushes every datagram into a fan-out
 *
 * The external media pipeline encodes and payloads the stream and sends RTP to
 * this port; the relay only distributes it. One ingest per camera/stream.
 */
class RtpIngest {
public:
    static constexpr size_t MAX_DATAGRAM_SIZE = 1600;

    RtpIngest(MediaFanout* fanout, std::string bindAddress, uint16_t port);
    ~RtpIngest();

    RtpIngest(const RtpIngest&) = delete;
    RtpIngest& operator=(const RtpIngest&) = delete;

    Result<void> start();
    void stop();

    bool isRunning() const { return _running.load(std::memory_order_acquire); }

    /// Bound port; differs from the requested one when 0 was requested
    uint16_t port() const { return _boundPort; }

    uint64_t packetsReceived() const { return _packetsReceived.load(std::memory_order_relaxed); }

private:
    void receiveLoop();

    MediaFanout* _fanout;
    std::string _bindAddress;
    uint16_t _requestedPort;
    uint16_t _boundPort = 0;

    int _socket = -1;
    std::thread _thread;
    std::atomic<bool> _running{false};
    std::atomic<uint64_t> _packetsReceived{0};
};

} // namespace PeerRelay::Signaling
