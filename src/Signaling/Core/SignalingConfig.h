/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

/**
 * @file SignalingConfig.h
 * @brief Configuration structures for the relay, its engines and its actors
 *
 * All structs carry usable defaults; a relay can run from a default-constructed
 * RelayConfig. loadRelayConfig() overlays a JSON file on top of the defaults.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "ErrorCodes.h"
#include "SignalingTypes.h"

namespace PeerRelay::Signaling {

/// Default SCTP max message size, matching libdatachannel's default
constexpr int DEFAULT_ENGINE_MAX_MESSAGE_SIZE = 256 * 1024;

/**
 * @brief Peer connection engine configuration
 */
struct EngineConfig {
    std::vector<std::string> iceServers{"stun:stun.l.google.com:19302"};  ///< ICE server URLs (STUN/TURN)
    std::string bindAddress;                                             ///< Optional local bind address
    uint16_t portRangeBegin = 0;                                         ///< Port range start (0 = OS chooses)
    uint16_t portRangeEnd = 0;                                           ///< Port range end (0 = OS chooses)
    int maxMessageSize = DEFAULT_ENGINE_MAX_MESSAGE_SIZE;                ///< Maximum message size
    bool enableIceTcp = false;                                           ///< Enable ICE-TCP candidates

    // Outgoing video track
    std::string videoMid = "video";                                      ///< SDP mid of the relayed track
    std::string videoStreamId = "peer-relay";                            ///< msid stream id
    uint32_t videoSsrc = 42;                                             ///< SSRC written into the track
    int videoPayloadType = 96;                                           ///< H264 payload type
};

/**
 * @brief JSON shape used when encoding outbound SDP/ICE
 */
enum class WireDialect : uint8_t {
    Flat,       ///< {"type":"offer","sdp":...} / {"type":"ice","candidate":...}
    Tagged      ///< {"sdp":{"type":...,"sdp":...}} / {"ice":{"candidate":...}}
};

/**
 * @brief Signaling channel configuration
 */
struct TransportConfig {
    std::string url;                            ///< Client mode: signaling server URL (ws:// or wss://)
    uint16_t listenPort = 8443;                 ///< Server mode: WebSocket listen port
    bool enableTls = false;                     ///< Server mode: serve wss://
    std::string localId;                        ///< Id announced with HELLO
    std::string roomId;                         ///< Room joined in Room routing mode
    WireDialect dialect = WireDialect::Flat;    ///< Outbound JSON shape
    int handshakeTimeoutMs = 5000;              ///< Wait for HELLO reply
};

/**
 * @brief Restart policy applied when an actor unit fails
 */
struct RestartPolicy {
    enum class Kind : uint8_t {
        Never,                  ///< Failed units stay down
        UpToN,                  ///< Restart immediately, at most maxRestarts times
        InfiniteWithBackoff     ///< Restart forever with exponential backoff
    };

    Kind kind = Kind::UpToN;
    uint32_t maxRestarts = 5;
    std::chrono::milliseconds initialBackoff{100};
    std::chrono::milliseconds maxBackoff{10000};

    static RestartPolicy never() { return RestartPolicy{Kind::Never, 0, {}, {}}; }
    static RestartPolicy upTo(uint32_t n) {
        return RestartPolicy{Kind::UpToN, n, std::chrono::milliseconds{0}, std::chrono::milliseconds{0}};
    }
    static RestartPolicy infiniteWithBackoff(std::chrono::milliseconds initial, std::chrono::milliseconds max) {
        return RestartPolicy{Kind::InfiniteWithBackoff, 0, initial, max};
    }
};

/**
 * @brief How inbound signaling is addressed to negotiation actors
 */
enum class RoutingMode : uint8_t {
    SinglePeer,     ///< One session under "server" or "client"
    PerPeer,        ///< One actor per peer under "webrtc_<peer>"
    Room            ///< Room server framing, one actor per member under "web_socket_<order>"
};

/**
 * @brief Top-level relay configuration
 */
struct RelayConfig {
    EngineConfig engine;
    TransportConfig transport;
    RestartPolicy restartPolicy;
    RoutingMode routingMode = RoutingMode::PerPeer;

    // SinglePeer mode: the one remote peer ("server" answers, "client" offers)
    PeerId singlePeerId = "remote";
    NegotiationRole singlePeerRole = NegotiationRole::Responder;

    size_t workerThreads = 0;           ///< WorkService threads (0 = hardware concurrency)
    size_t mailboxCapacity = 1024;      ///< Messages queued per actor
    size_t maxPeers = 64;               ///< Registry slots

    bool gateLocalCandidates = false;   ///< Hold local candidates until the remote description is set

    uint16_t rtpBasePort = 5000;        ///< First UDP port for RTP ingest
    size_t rtpStreamCount = 0;          ///< Number of RTP ingest ports (0 = no ingest)
};

/**
 * @brief Parses a relay configuration from JSON text
 *
 * Missing keys keep their defaults and unknown keys are ignored. A key of the
 * wrong JSON type fails with ConfigError.
 */
Result<RelayConfig> parseRelayConfig(const std::string& jsonText);

/**
 * @brief Loads a relay configuration file
 * @param path Path of a JSON document
 */
Result<RelayConfig> loadRelayConfig(const std::string& path);

const char* routingModeToString(RoutingMode mode);

} // namespace PeerRelay::Signaling
