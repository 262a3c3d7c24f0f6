/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

/**
 * @file PeerEngine.h
 * @brief Facade over the external WebRTC peer-connection engine
 *
 * The negotiation state machine only talks to this interface. RtcPeerEngine
 * binds it to libdatachannel; tests bind it to an instrumented fake.
 */

#pragma once

#include <functional>
#include <memory>
#include <string>

#include "../Core/ErrorCodes.h"
#include "../Core/SignalingTypes.h"
#include "MediaFanout.h"

namespace PeerRelay::Signaling {

/**
 * @brief Abstract peer-connection engine
 *
 * Threading contract:
 * - createOffer()/createAnswer() return immediately; the completion runs later
 *   on an engine thread (or inline when the engine already has the result).
 * - post() submits work into the engine's own serialized context. Mutations
 *   that must happen-before each other (set-remote before create-answer) are
 *   chained inside one posted task rather than raced from the caller.
 * - Callbacks may fire on any thread and may fire after close() has started;
 *   owners must treat late callbacks as no-ops.
 *
 * close() is idempotent. After close() every operation fails with
 * SessionClosed and isReleased() returns true.
 */
class PeerEngine {
public:
    using SdpCompletion = std::function<void(Result<std::string>)>;
    using IceCandidateCallback = std::function<void(const IceCandidate&)>;
    using NegotiationNeededCallback = std::function<void()>;
    using ConnectionStateCallback = std::function<void(EngineConnectionState)>;
    using Task = std::function<void()>;

    virtual ~PeerEngine() = default;

    /**
     * @brief Brings the engine up (tracks, channels) and arms negotiation-needed
     *
     * Callbacks must be installed before start() so the first
     * negotiation-needed event is not lost.
     */
    virtual Result<void> start() = 0;

    virtual void createOffer(SdpCompletion completion) = 0;
    virtual void createAnswer(SdpCompletion completion) = 0;

    virtual Result<void> setLocalDescription(SdpKind kind, const std::string& sdp) = 0;
    virtual Result<void> setRemoteDescription(SdpKind kind, const std::string& sdp) = 0;

    /**
     * @brief Applies one remote candidate
     *
     * Must only be called after setRemoteDescription() succeeded.
     */
    virtual Result<void> addIceCandidate(const IceCandidate& candidate) = 0;

    virtual void onIceCandidate(IceCandidateCallback callback) = 0;
    virtual void onNegotiationNeeded(NegotiationNeededCallback callback) = 0;
    virtual void onConnectionStateChange(ConnectionStateCallback callback) = 0;

    /**
     * @brief Runs a task in the engine's serialized context
     * @return false if the engine is closed and the task was dropped
     */
    virtual bool post(Task task) = 0;

    /**
     * @brief Releases every engine resource; idempotent
     */
    virtual void close() = 0;

    virtual bool isReleased() const = 0;

    /**
     * @brief Endpoint this peer exposes to the shared media fan-out
     * @return Sink for relayed media, or nullptr if the engine carries no media
     */
    virtual std::shared_ptr<MediaSink> mediaSink() = 0;
};

/**
 * @brief Creates the engine for a newly registered peer
 */
using PeerEngineFactory =
    std::function<Result<std::unique_ptr<PeerEngine>>(const PeerId& peerId, NegotiationRole role)>;

} // namespace PeerRelay::Signaling
