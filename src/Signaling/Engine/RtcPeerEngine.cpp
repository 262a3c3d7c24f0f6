/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

#include "RtcPeerEngine.h"

#include <Logging/Logger.h>

#include <chrono>
#include <cstring>
#include <format>
#include <stdexcept>
#include <thread>

namespace PeerRelay::Signaling
{

static const char* rtcStateToString(rtcState s) {
    switch (s) {
        case RTC_NEW:
            return "RTC_NEW";
        case RTC_CONNECTING:
            return "RTC_CONNECTING";
        case RTC_CONNECTED:
            return "RTC_CONNECTED";
        case RTC_DISCONNECTED:
            return "RTC_DISCONNECTED";
        case RTC_FAILED:
            return "RTC_FAILED";
        case RTC_CLOSED:
            return "RTC_CLOSED";
    }
    return "RTC_?";
}

static EngineConnectionState toEngineState(rtcState s) {
    switch (s) {
        case RTC_NEW:
            return EngineConnectionState::New;
        case RTC_CONNECTING:
            return EngineConnectionState::Connecting;
        case RTC_CONNECTED:
            return EngineConnectionState::Connected;
        case RTC_DISCONNECTED:
            return EngineConnectionState::Disconnected;
        case RTC_FAILED:
            return EngineConnectionState::Failed;
        case RTC_CLOSED:
            return EngineConnectionState::Closed;
    }
    return EngineConnectionState::Failed;
}

// Encode uint32_t to big-endian bytes
static void encodeU32BigEndian(uint32_t value, uint8_t* dest) {
    dest[0] = (value >> 24) & 0xFF;
    dest[1] = (value >> 16) & 0xFF;
    dest[2] = (value >> 8) & 0xFF;
    dest[3] = value & 0xFF;
}

// Fixed RTP header: V/P/X/CC, M/PT, sequence(2), timestamp(4), SSRC(4)
constexpr size_t RTP_HEADER_SIZE = 12;

Result<void> RtcPeerEngine::TrackSink::write(const std::vector<uint8_t>& packet) {
    if (!_open.load(std::memory_order_acquire)) {
        return Result<void>::err(SignalingError::ConnectionClosed, "Track not open");
    }
    if (packet.size() < RTP_HEADER_SIZE) {
        return Result<void>::err(SignalingError::InvalidMessage, "Packet shorter than an RTP header");
    }

    std::vector<uint8_t> rewritten(packet);
    rewritten[1] = static_cast<uint8_t>((rewritten[1] & 0x80) | (_payloadType & 0x7F));
    encodeU32BigEndian(_ssrc, &rewritten[8]);

    std::lock_guard<std::mutex> lock(_mutex);
    if (_trackId < 0) {
        return Result<void>::err(SignalingError::SessionClosed, "Track released");
    }
    int result = rtcSendMessage(_trackId, reinterpret_cast<const char*>(rewritten.data()),
                                static_cast<int>(rewritten.size()));
    if (result < 0) {
        return Result<void>::err(SignalingError::EngineFailure,
                                 std::format("rtcSendMessage on track failed with code {}", result));
    }
    return Result<void>::ok();
}

void RtcPeerEngine::TrackSink::detach() {
    std::lock_guard<std::mutex> lock(_mutex);
    _open.store(false, std::memory_order_release);
    _trackId = -1;
}

RtcPeerEngine::RtcPeerEngine(PeerId peerId, EngineConfig config,
                             EntropyEngine::Core::Concurrency::WorkContractGroup* group)
    : _callbackContext(new CallbackContext{this}),
      _peerId(std::move(peerId)),
      _config(std::move(config)),
      _executor(group, "engine_" + _peerId) {}

RtcPeerEngine::~RtcPeerEngine() {
    // Order matters:
    // 1. close() invalidates the context, clears user pointers and deletes the
    //    peer connection, so no new callbacks can obtain the context
    // 2. wait for callbacks that obtained it before step 1
    // 3. delete the context
    close();

    int waitCount = 0;
    while (_callbackContext->activeCallbacks.load(std::memory_order_acquire) > 0) {
        std::this_thread::sleep_for(std::chrono::microseconds(100));
        if (++waitCount % 10000 == 0) {
            ENTROPY_LOG_WARNING(std::format("Engine {}: waiting for {} active callbacks", _peerId,
                                            _callbackContext->activeCallbacks.load(std::memory_order_acquire)));
        }
    }

    delete _callbackContext;
    _callbackContext = nullptr;
}

PeerEngineFactory RtcPeerEngine::factory(EngineConfig config,
                                         EntropyEngine::Core::Concurrency::WorkContractGroup* group) {
    return [config = std::move(config), group](const PeerId& peerId,
                                               NegotiationRole role) -> Result<std::unique_ptr<PeerEngine>> {
        auto engine = std::make_unique<RtcPeerEngine>(peerId, config, group);
        ENTROPY_LOG_DEBUG(std::format("Created engine for peer {} ({})", peerId, negotiationRoleToString(role)));
        return Result<std::unique_ptr<PeerEngine>>::ok(std::move(engine));
    };
}

// C API callback adapters. Each one only hops onto the engine executor.

void RtcPeerEngine::onLocalDescriptionCallback(int, const char* sdp, const char* type, void* user) {
    CallbackGuard guard(static_cast<CallbackContext*>(user));
    if (!guard.isValid()) return;
    auto* self = guard.getEngine();

    std::string sdpText = sdp ? sdp : "";
    std::string typeText = type ? type : "";
    ENTROPY_LOG_DEBUG(std::format("Engine {}: local description type={}, sdpLen={}", self->_peerId, typeText,
                                  sdpText.size()));

    auto kind = parseSdpKind(typeText);
    std::optional<PendingDescription> pending;
    {
        std::lock_guard<std::mutex> lock(self->_mutex);
        if (self->_pendingLocal && kind && self->_pendingLocal->kind == *kind) {
            pending = std::move(self->_pendingLocal);
            self->_pendingLocal.reset();
        }
    }

    if (!pending) {
        ENTROPY_LOG_DEBUG(std::format("Engine {}: unsolicited local description '{}'", self->_peerId, typeText));
        return;
    }

    self->_executor.post([completion = std::move(pending->completion), sdpText = std::move(sdpText)]() {
        completion(Result<std::string>::ok(sdpText));
    });
}

void RtcPeerEngine::onLocalCandidateCallback(int, const char* cand, const char* mid, void* user) {
    CallbackGuard guard(static_cast<CallbackContext*>(user));
    if (!guard.isValid()) return;
    auto* self = guard.getEngine();

    IceCandidate candidate;
    // A single media section is negotiated, so every candidate belongs to m-line 0
    candidate.mlineIndex = 0;
    candidate.candidate = cand ? cand : "";
    if (mid && *mid) {
        candidate.mid = std::string(mid);
    }

    self->_executor.post([self, candidate = std::move(candidate)]() {
        IceCandidateCallback callback;
        {
            std::lock_guard<std::mutex> lock(self->_mutex);
            callback = self->_iceCallback;
        }
        if (callback) callback(candidate);
    });
}

void RtcPeerEngine::onStateChangeCallback(int, rtcState state, void* user) {
    CallbackGuard guard(static_cast<CallbackContext*>(user));
    if (!guard.isValid()) return;
    auto* self = guard.getEngine();

    ENTROPY_LOG_INFO(std::format("Engine {}: PeerConnection state {}", self->_peerId, rtcStateToString(state)));

    self->_executor.post([self, mapped = toEngineState(state)]() {
        ConnectionStateCallback callback;
        {
            std::lock_guard<std::mutex> lock(self->_mutex);
            callback = self->_stateCallback;
        }
        if (callback) callback(mapped);
    });
}

void RtcPeerEngine::onGatheringStateChangeCallback(int, rtcGatheringState state, void* user) {
    CallbackGuard guard(static_cast<CallbackContext*>(user));
    if (!guard.isValid()) return;
    auto* self = guard.getEngine();

    if (state == RTC_GATHERING_COMPLETE) {
        ENTROPY_LOG_DEBUG(std::format("Engine {}: ICE gathering complete", self->_peerId));
    }
}

void RtcPeerEngine::onTrackOpenCallback(int, void* user) {
    CallbackGuard guard(static_cast<CallbackContext*>(user));
    if (!guard.isValid()) return;
    auto* self = guard.getEngine();

    std::lock_guard<std::mutex> lock(self->_mutex);
    if (self->_sink) self->_sink->setOpen(true);
    ENTROPY_LOG_INFO(std::format("Engine {}: video track open", self->_peerId));
}

void RtcPeerEngine::onTrackClosedCallback(int, void* user) {
    CallbackGuard guard(static_cast<CallbackContext*>(user));
    if (!guard.isValid()) return;
    auto* self = guard.getEngine();

    std::lock_guard<std::mutex> lock(self->_mutex);
    if (self->_sink) self->_sink->setOpen(false);
    ENTROPY_LOG_INFO(std::format("Engine {}: video track closed", self->_peerId));
}

Result<void> RtcPeerEngine::start() {
    if (_released.load(std::memory_order_acquire)) {
        return Result<void>::err(SignalingError::SessionClosed, "Engine released");
    }

    int pcId = -1;
    try {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_peerConnectionId >= 0) {
            return Result<void>::err(SignalingError::AlreadyExists, "Engine already started");
        }
        setupPeerConnection();
        setupTrack();
        pcId = _peerConnectionId;
    } catch (const std::exception& e) {
        close();
        return Result<void>::err(SignalingError::EngineFailure,
                                 std::format("Failed to create peer connection: {}", e.what()));
    }

    // Adding the track leaves the connection needing negotiation; surface it
    // asynchronously so the caller finishes wiring first
    if (rtcIsNegotiationNeeded(pcId)) {
        _executor.post([this]() {
            NegotiationNeededCallback callback;
            {
                std::lock_guard<std::mutex> lock(_mutex);
                callback = _negotiationNeededCallback;
            }
            if (callback) callback();
        });
    }
    return Result<void>::ok();
}

void RtcPeerEngine::setupPeerConnection() {
    rtcConfiguration config;
    std::memset(&config, 0, sizeof(config));

    std::vector<const char*> iceServerPtrs;
    iceServerPtrs.reserve(_config.iceServers.size());
    for (const auto& server : _config.iceServers) {
        iceServerPtrs.push_back(server.c_str());
    }
    config.iceServers = iceServerPtrs.empty() ? nullptr : iceServerPtrs.data();
    config.iceServersCount = static_cast<int>(iceServerPtrs.size());

    if (!_config.bindAddress.empty()) {
        config.bindAddress = _config.bindAddress.c_str();
    }
    if (_config.portRangeBegin > 0 && _config.portRangeEnd > 0) {
        config.portRangeBegin = _config.portRangeBegin;
        config.portRangeEnd = _config.portRangeEnd;
    }
    config.enableIceTcp = _config.enableIceTcp;
    config.maxMessageSize = _config.maxMessageSize;
    config.disableAutoNegotiation = true;

    ENTROPY_LOG_INFO(std::format("Engine {}: creating PeerConnection ({} ICE servers)", _peerId,
                                 iceServerPtrs.size()));
    _peerConnectionId = rtcCreatePeerConnection(&config);
    if (_peerConnectionId < 0) {
        throw std::runtime_error("rtcCreatePeerConnection failed");
    }

    rtcSetUserPointer(_peerConnectionId, _callbackContext);
    rtcSetLocalDescriptionCallback(_peerConnectionId, onLocalDescriptionCallback);
    rtcSetLocalCandidateCallback(_peerConnectionId, onLocalCandidateCallback);
    rtcSetStateChangeCallback(_peerConnectionId, onStateChangeCallback);
    rtcSetGatheringStateChangeCallback(_peerConnectionId, onGatheringStateChangeCallback);
}

void RtcPeerEngine::setupTrack() {
    rtcTrackInit init;
    std::memset(&init, 0, sizeof(init));
    init.direction = RTC_DIRECTION_SENDONLY;
    init.codec = RTC_CODEC_H264;
    init.payloadType = _config.videoPayloadType;
    init.ssrc = _config.videoSsrc;
    init.mid = _config.videoMid.c_str();
    init.name = _config.videoMid.c_str();
    init.msid = _config.videoStreamId.c_str();

    _trackId = rtcAddTrackEx(_peerConnectionId, &init);
    if (_trackId < 0) {
        throw std::runtime_error("rtcAddTrackEx failed");
    }

    _sink = std::make_shared<TrackSink>(_trackId, _config.videoPayloadType, _config.videoSsrc);
    rtcSetUserPointer(_trackId, _callbackContext);
    rtcSetOpenCallback(_trackId, onTrackOpenCallback);
    rtcSetClosedCallback(_trackId, onTrackClosedCallback);
}

void RtcPeerEngine::createOffer(SdpCompletion completion) {
    createLocalDescription(SdpKind::Offer, std::move(completion));
}

void RtcPeerEngine::createAnswer(SdpCompletion completion) {
    createLocalDescription(SdpKind::Answer, std::move(completion));
}

void RtcPeerEngine::createLocalDescription(SdpKind kind, SdpCompletion completion) {
    int pcId = -1;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_released.load(std::memory_order_acquire) || _peerConnectionId < 0) {
            pcId = -1;
        } else if (_pendingLocal) {
            pcId = -2;
        } else {
            _pendingLocal = PendingDescription{kind, std::move(completion)};
            pcId = _peerConnectionId;
        }
    }

    if (pcId == -1) {
        completion(Result<std::string>::err(SignalingError::SessionClosed, "Engine released"));
        return;
    }
    if (pcId == -2) {
        completion(Result<std::string>::err(SignalingError::EngineFailure,
                                            "A local description is already being created"));
        return;
    }

    int result = rtcSetLocalDescription(pcId, sdpKindToString(kind));
    if (result < 0) {
        std::optional<PendingDescription> pending;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            pending.swap(_pendingLocal);
        }
        if (pending) {
            pending->completion(Result<std::string>::err(
                SignalingError::EngineFailure,
                std::format("rtcSetLocalDescription({}) failed with code {}", sdpKindToString(kind), result)));
        }
    }
}

Result<void> RtcPeerEngine::setLocalDescription(SdpKind kind, const std::string& sdp) {
    int pcId;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_released.load(std::memory_order_acquire) || _peerConnectionId < 0) {
            return Result<void>::err(SignalingError::SessionClosed, "Engine released");
        }
        pcId = _peerConnectionId;
    }

    // rtcSetLocalDescription already applied the description it generated
    char type[16] = {};
    if (rtcGetLocalDescriptionType(pcId, type, sizeof(type)) < 0) {
        return Result<void>::err(SignalingError::EngineFailure, "Engine has no local description");
    }
    auto applied = parseSdpKind(type);
    if (!applied || *applied != kind) {
        return Result<void>::err(SignalingError::EngineFailure,
                                 std::format("Local description is '{}', expected '{}'", type, sdpKindToString(kind)));
    }

    ENTROPY_LOG_DEBUG(std::format("Engine {}: local {} in place (sdpLen={})", _peerId, type, sdp.size()));
    return Result<void>::ok();
}

Result<void> RtcPeerEngine::setRemoteDescription(SdpKind kind, const std::string& sdp) {
    int pcId;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_released.load(std::memory_order_acquire) || _peerConnectionId < 0) {
            return Result<void>::err(SignalingError::SessionClosed, "Engine released");
        }
        pcId = _peerConnectionId;
    }

    int result = rtcSetRemoteDescription(pcId, sdp.c_str(), sdpKindToString(kind));
    if (result < 0) {
        return Result<void>::err(SignalingError::EngineFailure,
                                 std::format("rtcSetRemoteDescription({}) failed with code {}",
                                             sdpKindToString(kind), result));
    }
    return Result<void>::ok();
}

Result<void> RtcPeerEngine::addIceCandidate(const IceCandidate& candidate) {
    int pcId;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_released.load(std::memory_order_acquire) || _peerConnectionId < 0) {
            return Result<void>::err(SignalingError::SessionClosed, "Engine released");
        }
        pcId = _peerConnectionId;
    }

    // Ignore empty candidates (end-of-candidates signal)
    if (candidate.candidate.empty()) {
        return Result<void>::ok();
    }

    const char* mid = candidate.mid ? candidate.mid->c_str() : nullptr;
    int result = rtcAddRemoteCandidate(pcId, candidate.candidate.c_str(), mid);
    if (result < 0) {
        return Result<void>::err(SignalingError::EngineFailure,
                                 std::format("rtcAddRemoteCandidate failed with code {}", result));
    }
    return Result<void>::ok();
}

void RtcPeerEngine::onIceCandidate(IceCandidateCallback callback) {
    std::lock_guard<std::mutex> lock(_mutex);
    _iceCallback = std::move(callback);
}

void RtcPeerEngine::onNegotiationNeeded(NegotiationNeededCallback callback) {
    std::lock_guard<std::mutex> lock(_mutex);
    _negotiationNeededCallback = std::move(callback);
}

void RtcPeerEngine::onConnectionStateChange(ConnectionStateCallback callback) {
    std::lock_guard<std::mutex> lock(_mutex);
    _stateCallback = std::move(callback);
}

bool RtcPeerEngine::post(Task task) {
    if (_released.load(std::memory_order_acquire)) {
        return false;
    }
    return _executor.post(std::move(task));
}

void RtcPeerEngine::close() {
    if (_released.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    _callbackContext->valid.store(false, std::memory_order_release);

    int pcId;
    int trackId;
    std::optional<PendingDescription> abandoned;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        pcId = _peerConnectionId;
        trackId = _trackId;
        _peerConnectionId = -1;
        _trackId = -1;
        abandoned.swap(_pendingLocal);
        _iceCallback = nullptr;
        _negotiationNeededCallback = nullptr;
        _stateCallback = nullptr;
        if (_sink) _sink->detach();
    }

    // Clear user pointers so callbacks queued inside libdatachannel find nothing
    if (trackId >= 0) rtcSetUserPointer(trackId, nullptr);
    if (pcId >= 0) rtcSetUserPointer(pcId, nullptr);

    if (trackId >= 0) rtcDeleteTrack(trackId);
    if (pcId >= 0) rtcDeletePeerConnection(pcId);

    // Pending completions are cancelled, not failed
    if (abandoned) {
        ENTROPY_LOG_DEBUG(std::format("Engine {}: dropped pending {} creation", _peerId,
                                      sdpKindToString(abandoned->kind)));
    }

    _executor.shutdown();
    ENTROPY_LOG_INFO(std::format("Engine {}: released", _peerId));
}

bool RtcPeerEngine::isReleased() const {
    return _released.load(std::memory_order_acquire);
}

std::shared_ptr<MediaSink> RtcPeerEngine::mediaSink() {
    std::lock_guard<std::mutex> lock(_mutex);
    return _sink;
}

int RtcPeerEngine::peerConnectionId() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _peerConnectionId;
}

}  // namespace PeerRelay::Signaling
