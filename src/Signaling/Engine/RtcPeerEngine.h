/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

/**
 * @file RtcPeerEngine.h
 * @brief PeerEngine implementation over the libdatachannel C API
 */

#pragma once

#include <rtc/rtc.h>

#include <atomic>
#include <mutex>
#include <optional>

#include "../Core/SerialExecutor.h"
#include "../Core/SignalingConfig.h"
#include "PeerEngine.h"

namespace EntropyEngine::Core::Concurrency {
class WorkContractGroup;
}

namespace PeerRelay::Signaling {

/**
 * @brief libdatachannel peer connection with one outgoing H264 track
 *
 * Auto-negotiation is disabled so the negotiation state machine stays in
 * charge: createOffer()/createAnswer() call rtcSetLocalDescription(), which
 * generates and applies the description in one step, and complete when the
 * local-description callback fires. setLocalDescription() then confirms the
 * engine holds a local description of the expected kind.
 *
 * libdatachannel invokes callbacks on its own threads. Every callback only
 * captures its arguments and re-posts them onto this engine's SerialExecutor,
 * so user callbacks and completions always run in the engine context, never on
 * a libdatachannel thread. That keeps close() (and the destructor) free to call
 * rtcDeletePeerConnection, which blocks until libdatachannel callbacks return.
 *
 * @code
 * RtcPeerEngine engine("7", config, &group);
 * engine.onIceCandidate([](const IceCandidate& c) { ... });
 * engine.start();
 * engine.createOffer([](Result<std::string> sdp) { ... });
 * @endcode
 */
class RtcPeerEngine : public PeerEngine {
public:
    RtcPeerEngine(PeerId peerId, EngineConfig config,
                  EntropyEngine::Core::Concurrency::WorkContractGroup* group = nullptr);
    ~RtcPeerEngine() override;

    RtcPeerEngine(const RtcPeerEngine&) = delete;
    RtcPeerEngine& operator=(const RtcPeerEngine&) = delete;

    Result<void> start() override;

    void createOffer(SdpCompletion completion) override;
    void createAnswer(SdpCompletion completion) override;

    Result<void> setLocalDescription(SdpKind kind, const std::string& sdp) override;
    Result<void> setRemoteDescription(SdpKind kind, const std::string& sdp) override;
    Result<void> addIceCandidate(const IceCandidate& candidate) override;

    void onIceCandidate(IceCandidateCallback callback) override;
    void onNegotiationNeeded(NegotiationNeededCallback callback) override;
    void onConnectionStateChange(ConnectionStateCallback callback) override;

    bool post(Task task) override;
    void close() override;
    bool isReleased() const override;

    std::shared_ptr<MediaSink> mediaSink() override;

    int peerConnectionId() const;

    /**
     * @brief Builds a factory that creates one RtcPeerEngine per peer
     *
     * Engines are returned unstarted; the owning session starts them once its
     * callbacks are installed.
     */
    static PeerEngineFactory factory(EngineConfig config,
                                     EntropyEngine::Core::Concurrency::WorkContractGroup* group);

private:
    // Callback context for safe C API callbacks
    struct CallbackContext {
        RtcPeerEngine* engine;
        std::atomic<bool> valid{true};
        std::atomic<int> activeCallbacks{0};
    };

    // Counts callbacks in flight so the destructor can wait them out
    struct CallbackGuard {
        CallbackContext* ctx;

        explicit CallbackGuard(CallbackContext* c) : ctx(c) {
            if (ctx) ctx->activeCallbacks.fetch_add(1, std::memory_order_acquire);
        }
        ~CallbackGuard() {
            if (ctx) ctx->activeCallbacks.fetch_sub(1, std::memory_order_release);
        }

        CallbackGuard(const CallbackGuard&) = delete;
        CallbackGuard& operator=(const CallbackGuard&) = delete;

        bool isValid() const { return ctx && ctx->valid.load(std::memory_order_acquire); }
        RtcPeerEngine* getEngine() const { return ctx ? ctx->engine : nullptr; }
    };

    /**
     * @brief Writes relayed RTP into the outgoing track
     *
     * Rewrites payload type and SSRC to the values announced in our SDP.
     */
    class TrackSink : public MediaSink {
    public:
        TrackSink(int trackId, int payloadType, uint32_t ssrc)
            : _trackId(trackId), _payloadType(payloadType), _ssrc(ssrc) {}

        Result<void> write(const std::vector<uint8_t>& packet) override;

        void setOpen(bool open) { _open.store(open, std::memory_order_release); }
        void detach();

    private:
        std::mutex _mutex;
        int _trackId;
        int _payloadType;
        uint32_t _ssrc;
        std::atomic<bool> _open{false};
    };

    struct PendingDescription {
        SdpKind kind;
        SdpCompletion completion;
    };

    static void onLocalDescriptionCallback(int pc, const char* sdp, const char* type, void* user);
    static void onLocalCandidateCallback(int pc, const char* cand, const char* mid, void* user);
    static void onStateChangeCallback(int pc, rtcState state, void* user);
    static void onGatheringStateChangeCallback(int pc, rtcGatheringState state, void* user);
    static void onTrackOpenCallback(int id, void* user);
    static void onTrackClosedCallback(int id, void* user);

    void setupPeerConnection();
    void setupTrack();
    void createLocalDescription(SdpKind kind, SdpCompletion completion);

    CallbackContext* _callbackContext;

    PeerId _peerId;
    EngineConfig _config;
    SerialExecutor _executor;

    mutable std::mutex _mutex;
    int _peerConnectionId = -1;
    int _trackId = -1;
    std::optional<PendingDescription> _pendingLocal;
    std::shared_ptr<TrackSink> _sink;

    IceCandidateCallback _iceCallback;
    NegotiationNeededCallback _negotiationNeededCallback;
    ConnectionStateCallback _stateCallback;

    std::atomic<bool> _released{false};
};

} // namespace PeerRelay::Signaling
