/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

#include "PeerHandle.h"

#include <format>

#include "PeerRegistry.h"

namespace PeerRelay::Signaling
{

PeerRegistry* PeerHandle::registry() const {
    return static_cast<PeerRegistry*>(const_cast<void*>(handleOwner()));
}

bool PeerHandle::valid() const {
    auto* reg = registry();
    if (!reg) return false;
    return reg->validateHandle(*this);
}

PeerId PeerHandle::peerId() const {
    auto* reg = registry();
    if (!reg) return {};
    auto session = reg->resolve(*this);
    return session ? session->peerId() : PeerId{};
}

NegotiationRole PeerHandle::role() const {
    auto* reg = registry();
    if (!reg) return NegotiationRole::Responder;
    auto session = reg->resolve(*this);
    return session ? session->role() : NegotiationRole::Responder;
}

NegotiationState PeerHandle::getState() const {
    auto* reg = registry();
    if (!reg) return NegotiationState::Failed;
    auto session = reg->resolve(*this);
    return session ? session->state() : NegotiationState::Failed;
}

Result<void> PeerHandle::startNegotiation() {
    auto* reg = registry();
    if (!reg) {
        return Result<void>::err(SignalingError::InvalidParameter, "Invalid handle");
    }
    auto session = reg->resolve(*this);
    if (!session) {
        return Result<void>::err(SignalingError::NotFound, "Peer no longer registered");
    }
    return session->startNegotiation();
}

Result<void> PeerHandle::handleRemoteSdp(SdpKind kind, const std::string& sdp) {
    auto* reg = registry();
    if (!reg) {
        return Result<void>::err(SignalingError::InvalidParameter, "Invalid handle");
    }
    auto session = reg->resolve(*this);
    if (!session) {
        return Result<void>::err(SignalingError::NotFound, "Peer no longer registered");
    }
    return session->handleRemoteSdp(kind, sdp);
}

Result<void> PeerHandle::handleIceCandidate(const IceCandidate& candidate) {
    auto* reg = registry();
    if (!reg) {
        return Result<void>::err(SignalingError::InvalidParameter, "Invalid handle");
    }
    auto session = reg->resolve(*this);
    if (!session) {
        return Result<void>::err(SignalingError::NotFound, "Peer no longer registered");
    }
    return session->handleIceCandidate(candidate);
}

void PeerHandle::remove() {
    auto* reg = registry();
    if (reg) {
        reg->remove(*this);
    }
}

uint64_t PeerHandle::classHash() const noexcept {
    static const uint64_t hash =
        static_cast<uint64_t>(EntropyEngine::Core::TypeSystem::createTypeId<PeerHandle>().id);
    return hash;
}

std::string PeerHandle::toString() const {
    if (!hasHandle()) {
        return std::format("{}@{}(invalid)", className(), static_cast<const void*>(this));
    }
    return std::format("{}@{}(owner={}, idx={}, gen={})", className(), static_cast<const void*>(this), handleOwner(),
                       handleIndex(), handleGeneration());
}

}  // namespace PeerRelay::Signaling
