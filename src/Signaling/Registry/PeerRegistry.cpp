/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

#include "PeerRegistry.h"

#include <Logging/Logger.h>

#include <format>

namespace PeerRelay::Signaling
{

PeerRegistry::PeerRegistry(PeerEngineFactory factory, size_t capacity, MediaFanout* fanout,
                           PeerSession::Options options)
    : _factory(std::move(factory)), _fanout(fanout), _options(options), _slots(capacity) {
    _freeList.reserve(capacity);
    // Hand out low indices first
    for (size_t i = capacity; i > 0; --i) {
        _freeList.push_back(static_cast<uint32_t>(i - 1));
    }
}

PeerRegistry::~PeerRegistry() {
    clear();
}

void PeerRegistry::setOutboundSink(PeerSession::OutboundSink sink) {
    std::lock_guard<std::mutex> lock(_callbackMutex);
    _outboundSink = std::move(sink);
}

void PeerRegistry::setErrorCallback(PeerSession::ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(_callbackMutex);
    _errorCallback = std::move(callback);
}

void PeerRegistry::setDeferrer(Deferrer deferrer) {
    std::lock_guard<std::mutex> lock(_callbackMutex);
    _deferrer = std::move(deferrer);
}

Result<PeerHandle> PeerRegistry::add(const PeerId& peerId, NegotiationRole role) {
    if (peerId.empty()) {
        return Result<PeerHandle>::err(SignalingError::InvalidParameter, "Peer id is empty");
    }
    if (!_factory) {
        return Result<PeerHandle>::err(SignalingError::InvalidParameter, "No engine factory");
    }

    uint32_t index;
    uint32_t generation;
    {
        std::unique_lock<std::shared_mutex> lock(_mutex);
        if (_index.count(peerId) != 0 || _constructing.count(peerId) != 0) {
            lock.unlock();
            {
                std::lock_guard<std::mutex> metricsLock(_metricsMutex);
                ++_metrics.duplicateAdds;
            }
            ENTROPY_LOG_WARNING_CAT("PeerRegistry", std::format("add({}): peer already registered", peerId));
            return Result<PeerHandle>::err(SignalingError::AlreadyExists,
                                           std::format("Peer {} already registered", peerId));
        }
        if (_freeList.empty()) {
            return Result<PeerHandle>::err(SignalingError::ResourceLimitExceeded,
                                           std::format("Registry full ({} peers)", _slots.size()));
        }
        index = _freeList.back();
        _freeList.pop_back();
        generation = _slots[index].generation;
        _constructing.emplace(peerId, Construction{std::this_thread::get_id(), index, false});
    }

    // Engine construction runs outside the registry lock
    auto engine = _factory(peerId, role);
    if (engine.failed()) {
        return abortConstruction(peerId, index, engine.error, "Engine creation failed: " + engine.errorMessage);
    }
    if (!engine.value) {
        return abortConstruction(peerId, index, SignalingError::EngineFailure, "Engine factory returned nothing");
    }

    auto session = PeerSession::create(peerId, role, std::move(engine.value), _options);
    {
        std::lock_guard<std::mutex> lock(_callbackMutex);
        session->setOutboundSink(_outboundSink);
        session->setErrorCallback(_errorCallback);
    }
    session->setFailureHook(makeFailureHook(index, generation));

    auto activated = session->activate();
    if (activated.failed()) {
        session->teardown();
        return abortConstruction(peerId, index, activated.error, "Engine start failed: " + activated.errorMessage);
    }

    bool branchLinked = false;
    if (_fanout) {
        if (auto sink = session->mediaSink()) {
            auto linked = _fanout->addBranch(peerId, std::move(sink));
            if (linked.failed()) {
                session->teardown();
                return abortConstruction(peerId, index, linked.error, linked.errorMessage);
            }
            branchLinked = true;
        }
    }

    bool cancelled = false;
    {
        std::unique_lock<std::shared_mutex> lock(_mutex);
        auto construction = _constructing.find(peerId);
        if (construction != _constructing.end()) {
            cancelled = construction->second.cancelled;
            _constructing.erase(construction);
        }

        if (cancelled) {
            _freeList.push_back(index);
        } else {
            auto& slot = _slots[index];
            slot.session = session;
            slot.peerId = peerId;
            slot.occupied = true;
            _index.emplace(peerId, index);
        }
    }
    _constructionCv.notify_all();

    if (cancelled) {
        // The session failed before it could be published
        if (branchLinked) {
            FanoutBlockGuard block(_fanout);
            _fanout->removeBranch(peerId);
        }
        session->teardown();
        {
            std::lock_guard<std::mutex> metricsLock(_metricsMutex);
            ++_metrics.constructionFailures;
        }
        return Result<PeerHandle>::err(SignalingError::EngineFailure,
                                       std::format("Peer {} failed during construction", peerId));
    }

    {
        std::lock_guard<std::mutex> metricsLock(_metricsMutex);
        ++_metrics.sessionsAdded;
    }
    ENTROPY_LOG_INFO_CAT("PeerRegistry", std::format("Registered peer {} as {} (slot {}, gen {})", peerId,
                                                     negotiationRoleToString(role), index, generation));
    return Result<PeerHandle>::ok(PeerHandle(this, index, generation));
}

Result<PeerHandle> PeerRegistry::abortConstruction(const PeerId& peerId, uint32_t index, SignalingError error,
                                                   std::string message) {
    {
        std::unique_lock<std::shared_mutex> lock(_mutex);
        _constructing.erase(peerId);
        _freeList.push_back(index);
    }
    _constructionCv.notify_all();

    {
        std::lock_guard<std::mutex> metricsLock(_metricsMutex);
        ++_metrics.constructionFailures;
    }
    ENTROPY_LOG_ERROR_CAT("PeerRegistry", std::format("add({}) failed: {}", peerId, message));
    return Result<PeerHandle>::err(error, std::move(message));
}

PeerSession::FailureHook PeerRegistry::makeFailureHook(uint32_t index, uint32_t generation) {
    return [this, index, generation](const PeerId& peerId, SignalingError error) {
        {
            std::lock_guard<std::mutex> metricsLock(_metricsMutex);
            ++_metrics.sessionsFailed;
        }

        Deferrer deferrer;
        {
            std::lock_guard<std::mutex> lock(_callbackMutex);
            deferrer = _deferrer;
        }

        ENTROPY_LOG_DEBUG_CAT("PeerRegistry", std::format("Peer {} (slot {}) failed, removing", peerId, index));
        auto removal = [this, peerId, generation]() { removeInternal(peerId, generation); };
        if (deferrer) {
            deferrer(peerId, error, std::move(removal));
        } else {
            removal();
        }
    };
}

void PeerRegistry::remove(const PeerId& peerId) {
    removeInternal(peerId, std::nullopt);
}

void PeerRegistry::remove(const PeerHandle& handle) {
    if (!validateHandle(handle)) {
        return;
    }
    PeerId peerId;
    {
        std::shared_lock<std::shared_mutex> lock(_mutex);
        peerId = _slots[handle.handleIndex()].peerId;
    }
    removeInternal(peerId, handle.handleGeneration());
}

void PeerRegistry::removeInternal(const PeerId& peerId, std::optional<uint32_t> generation) {
    std::shared_ptr<PeerSession> session;
    {
        std::unique_lock<std::shared_mutex> lock(_mutex);

        // Never act on a half-built session
        for (;;) {
            auto construction = _constructing.find(peerId);
            if (construction == _constructing.end()) break;
            if (construction->second.builder == std::this_thread::get_id()) {
                construction->second.cancelled = true;
                return;
            }
            _constructionCv.wait(lock);
        }

        auto it = _index.find(peerId);
        if (it == _index.end()) {
            ENTROPY_LOG_DEBUG_CAT("PeerRegistry", std::format("remove({}): not registered", peerId));
            return;
        }

        auto& slot = _slots[it->second];
        if (generation && slot.generation != *generation) {
            // The id was re-registered after the caller's session went away
            return;
        }

        session = std::move(slot.session);
        slot.session.reset();
        slot.peerId.clear();
        slot.occupied = false;
        ++slot.generation;
        _freeList.push_back(it->second);
        _index.erase(it);
    }

    if (_fanout) {
        FanoutBlockGuard block(_fanout);
        _fanout->removeBranch(peerId);
    }

    session->teardown();

    {
        std::lock_guard<std::mutex> metricsLock(_metricsMutex);
        ++_metrics.sessionsRemoved;
    }
    ENTROPY_LOG_INFO_CAT("PeerRegistry", std::format("Removed peer {} (final state {})", peerId,
                                                     negotiationStateToString(session->state())));
}

std::optional<PeerHandle> PeerRegistry::get(const PeerId& peerId) const {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    auto it = _index.find(peerId);
    if (it == _index.end()) {
        return std::nullopt;
    }
    return PeerHandle(const_cast<PeerRegistry*>(this), it->second, _slots[it->second].generation);
}

std::shared_ptr<PeerSession> PeerRegistry::lookup(const PeerId& peerId) const {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    auto it = _index.find(peerId);
    if (it == _index.end()) {
        return nullptr;
    }
    return _slots[it->second].session;
}

std::shared_ptr<PeerSession> PeerRegistry::resolve(const PeerHandle& handle) const {
    if (handle.handleOwner() != static_cast<const void*>(this)) return nullptr;

    std::shared_lock<std::shared_mutex> lock(_mutex);
    uint32_t index = handle.handleIndex();
    if (index >= _slots.size()) return nullptr;
    const auto& slot = _slots[index];
    if (!slot.occupied || slot.generation != handle.handleGeneration()) return nullptr;
    return slot.session;
}

bool PeerRegistry::validateHandle(const PeerHandle& handle) const noexcept {
    if (handle.handleOwner() != static_cast<const void*>(this)) return false;

    std::shared_lock<std::shared_mutex> lock(_mutex);
    uint32_t index = handle.handleIndex();
    if (index >= _slots.size()) return false;
    const auto& slot = _slots[index];
    return slot.occupied && slot.generation == handle.handleGeneration();
}

bool PeerRegistry::contains(const PeerId& peerId) const {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    return _index.count(peerId) != 0;
}

size_t PeerRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    return _index.size();
}

std::vector<PeerId> PeerRegistry::peerIds() const {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    std::vector<PeerId> ids;
    ids.reserve(_index.size());
    for (const auto& [peerId, index] : _index) {
        ids.push_back(peerId);
    }
    return ids;
}

void PeerRegistry::forEach(const std::function<void(const std::shared_ptr<PeerSession>&)>& visitor) const {
    std::vector<std::shared_ptr<PeerSession>> snapshot;
    {
        std::shared_lock<std::shared_mutex> lock(_mutex);
        snapshot.reserve(_index.size());
        for (const auto& [peerId, index] : _index) {
            snapshot.push_back(_slots[index].session);
        }
    }
    for (const auto& session : snapshot) {
        visitor(session);
    }
}

void PeerRegistry::clear() {
    for (const auto& peerId : peerIds()) {
        remove(peerId);
    }
}

PeerRegistry::Metrics PeerRegistry::getMetrics() const {
    std::lock_guard<std::mutex> lock(_metricsMutex);
    return _metrics;
}

}  // namespace PeerRelay::Signaling
