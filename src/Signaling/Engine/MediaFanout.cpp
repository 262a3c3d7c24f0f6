/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

#include "MediaFanout.h"

#include <Logging/Logger.h>

#include <format>
#include <mutex>

namespace PeerRelay::Signaling
{

Result<void> MediaFanout::addBranch(const PeerId& peerId, std::shared_ptr<MediaSink> sink) {
    if (!sink) {
        return Result<void>::err(SignalingError::InvalidParameter, "Media sink is null");
    }

    std::unique_lock<std::shared_mutex> lock(_flowMutex);
    auto [it, inserted] = _branches.emplace(peerId, std::move(sink));
    if (!inserted) {
        return Result<void>::err(SignalingError::AlreadyExists,
                                 std::format("Fan-out already has a branch for peer {}", peerId));
    }

    ENTROPY_LOG_DEBUG_CAT("MediaFanout", std::format("Linked branch for peer {} ({} branches)", peerId, _branches.size()));
    return Result<void>::ok();
}

bool MediaFanout::removeBranch(const PeerId& peerId) {
    std::unique_lock<std::shared_mutex> lock(_flowMutex);
    if (_branches.erase(peerId) == 0) {
        return false;
    }
    ENTROPY_LOG_DEBUG_CAT("MediaFanout", std::format("Unlinked branch for peer {} ({} branches)", peerId, _branches.size()));
    return true;
}

void MediaFanout::block() {
    _blockDepth.fetch_add(1, std::memory_order_acq_rel);
    // Wait out any push() that started before the block
    std::unique_lock<std::shared_mutex> lock(_flowMutex);
}

void MediaFanout::unblock() {
    int previous = _blockDepth.fetch_sub(1, std::memory_order_acq_rel);
    if (previous <= 0) {
        _blockDepth.store(0, std::memory_order_release);
        ENTROPY_LOG_WARNING_CAT("MediaFanout", "unblock() without matching block()");
    }
}

bool MediaFanout::isBlocked() const {
    return _blockDepth.load(std::memory_order_acquire) > 0;
}

size_t MediaFanout::push(const std::vector<uint8_t>& packet) {
    std::shared_lock<std::shared_mutex> lock(_flowMutex);
    if (_blockDepth.load(std::memory_order_acquire) > 0) {
        _packetsDropped.fetch_add(1, std::memory_order_relaxed);
        return 0;
    }

    _packetsPushed.fetch_add(1, std::memory_order_relaxed);

    size_t delivered = 0;
    for (const auto& [peerId, sink] : _branches) {
        auto result = sink->write(packet);
        if (result.success()) {
            ++delivered;
        } else {
            _writeFailures.fetch_add(1, std::memory_order_relaxed);
        }
    }
    return delivered;
}

size_t MediaFanout::branchCount() const {
    std::shared_lock<std::shared_mutex> lock(_flowMutex);
    return _branches.size();
}

bool MediaFanout::hasBranch(const PeerId& peerId) const {
    std::shared_lock<std::shared_mutex> lock(_flowMutex);
    return _branches.count(peerId) != 0;
}

}  // namespace PeerRelay::Signaling
