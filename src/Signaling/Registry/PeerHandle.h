/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

/**
 * @file PeerHandle.h
 * @brief Generation-stamped handle for registered peer sessions
 */

#pragma once

#include <EntropyCore.h>

#include <cstdint>
#include <string>

#include "../Core/ErrorCodes.h"
#include "../Core/SignalingTypes.h"

namespace PeerRelay::Signaling {

class PeerRegistry;

/**
 * @brief EntropyObject stamped with (registry + slot + generation)
 *
 * Operations delegate to the PeerRegistry, which resolves the stamp back to the
 * live session. Removing a peer bumps its slot generation, so every copy of the
 * handle stops resolving at once, including copies captured by late callbacks.
 *
 * @code
 * auto added = registry.add("7", NegotiationRole::Initiator);
 * PeerHandle h = added.value;
 * h.startNegotiation();
 * registry.remove("7");
 * h.valid();   // false
 * @endcode
 */
class PeerHandle : public EntropyEngine::Core::EntropyObject {
private:
    friend class PeerRegistry;

    PeerHandle(PeerRegistry* registry, uint32_t index, uint32_t generation) {
        EntropyEngine::Core::HandleAccess::set(*this, registry, index, generation);
    }

public:
    PeerHandle() = default;

    PeerHandle(const PeerHandle& other) noexcept { copyStamp(other); }

    PeerHandle& operator=(const PeerHandle& other) noexcept {
        if (this != &other) copyStamp(other);
        return *this;
    }

    PeerHandle(PeerHandle&& other) noexcept { copyStamp(other); }

    PeerHandle& operator=(PeerHandle&& other) noexcept {
        if (this != &other) copyStamp(other);
        return *this;
    }

    /**
     * @brief Checks whether this handle still refers to a registered session
     */
    bool valid() const;

    /// Peer id, or empty if the handle no longer resolves
    PeerId peerId() const;
    NegotiationRole role() const;

    /// Current negotiation state, or Failed if the handle no longer resolves
    NegotiationState getState() const;

    Result<void> startNegotiation();
    Result<void> handleRemoteSdp(SdpKind kind, const std::string& sdp);
    Result<void> handleIceCandidate(const IceCandidate& candidate);

    /**
     * @brief Removes the session from its registry; no-op if already removed
     */
    void remove();

    // EntropyObject interface
    const char* className() const noexcept override { return "PeerHandle"; }
    uint64_t classHash() const noexcept override;
    std::string toString() const override;

private:
    void copyStamp(const PeerHandle& other) noexcept {
        if (other.hasHandle()) {
            EntropyEngine::Core::HandleAccess::set(*this, const_cast<void*>(other.handleOwner()),
                                                   other.handleIndex(), other.handleGeneration());
        } else {
            EntropyEngine::Core::HandleAccess::clear(*this);
        }
    }

    PeerRegistry* registry() const;
};

} // namespace PeerRelay::Signaling
