/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

/**
 * @file MediaFanout.h
 * @brief Shared distribution point feeding one media stream to many peers
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "../Core/ErrorCodes.h"
#include "../Core/SignalingTypes.h"

namespace PeerRelay::Signaling {

/**
 * @brief Per-peer branch endpoint of the fan-out
 */
class MediaSink {
public:
    virtual ~MediaSink() = default;

    /**
     * @brief Writes one packet into the peer's outgoing track
     *
     * Failing writes only affect this branch.
     */
    virtual Result<void> write(const std::vector<uint8_t>& packet) = 0;
};

/**
 * @brief Fan-out (tee) of one encoded stream into per-peer branches
 *
 * Branch membership only changes under block(): the registry blocks the shared
 * output, unlinks the branch, then unblocks, so push() never writes into a
 * branch that is being torn down. block() waits for an in-flight push() to
 * finish before returning. Packets pushed while blocked are dropped.
 *
 * Blocks nest; the output resumes when every block() has been matched.
 */
class MediaFanout {
public:
    MediaFanout() = default;
    MediaFanout(const MediaFanout&) = delete;
    MediaFanout& operator=(const MediaFanout&) = delete;

    Result<void> addBranch(const PeerId& peerId, std::shared_ptr<MediaSink> sink);

    /**
     * @brief Unlinks a branch
     * @return true if a branch was removed
     */
    bool removeBranch(const PeerId& peerId);

    void block();
    void unblock();
    bool isBlocked() const;

    /**
     * @brief Delivers a packet to every branch
     * @return Number of branches that accepted the packet
     */
    size_t push(const std::vector<uint8_t>& packet);

    size_t branchCount() const;
    bool hasBranch(const PeerId& peerId) const;

    uint64_t packetsPushed() const { return _packetsPushed.load(std::memory_order_relaxed); }
    uint64_t packetsDropped() const { return _packetsDropped.load(std::memory_order_relaxed); }
    uint64_t branchWriteFailures() const { return _writeFailures.load(std::memory_order_relaxed); }

private:
    mutable std::shared_mutex _flowMutex;
    std::unordered_map<PeerId, std::shared_ptr<MediaSink>> _branches;
    std::atomic<int> _blockDepth{0};

    std::atomic<uint64_t> _packetsPushed{0};
    std::atomic<uint64_t> _packetsDropped{0};
    std::atomic<uint64_t> _writeFailures{0};
};

/**
 * @brief RAII block()/unblock() pair
 */
class FanoutBlockGuard {
public:
    explicit FanoutBlockGuard(MediaFanout* fanout) : _fanout(fanout) {
        if (_fanout) _fanout->block();
    }
    ~FanoutBlockGuard() {
        if (_fanout) _fanout->unblock();
    }

    FanoutBlockGuard(const FanoutBlockGuard&) = delete;
    FanoutBlockGuard& operator=(const FanoutBlockGuard&) = delete;

private:
    MediaFanout* _fanout;
};

} // namespace PeerRelay::Signaling
