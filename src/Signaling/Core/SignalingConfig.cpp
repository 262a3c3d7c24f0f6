/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

#include "SignalingConfig.h"

#include <Logging/Logger.h>
#include <json/json.h>

#include <format>
#include <limits>
#include <fstream>
#include <memory>
#include <sstream>

namespace PeerRelay::Signaling
{

namespace
{

// Reads typed members out of one JSON object. The first type error wins and
// every later read becomes a no-op.
class ObjectReader
{
public:
    ObjectReader(const Json::Value& object, std::string path, std::string& error)
        : _object(object), _path(std::move(path)), _error(error) {}

    void readString(const char* key, std::string& out) {
        if (!present(key)) return;
        const auto& v = _object[key];
        if (!v.isString()) return fail(key, "string");
        out = v.asString();
    }

    void readBool(const char* key, bool& out) {
        if (!present(key)) return;
        const auto& v = _object[key];
        if (!v.isBool()) return fail(key, "boolean");
        out = v.asBool();
    }

    template <typename T>
    void readUnsigned(const char* key, T& out) {
        if (!present(key)) return;
        const auto& v = _object[key];
        if (!v.isUInt64() || v.asUInt64() > static_cast<Json::UInt64>(std::numeric_limits<T>::max())) {
            return fail(key, "unsigned integer");
        }
        out = static_cast<T>(v.asUInt64());
    }

    void readInt(const char* key, int& out) {
        if (!present(key)) return;
        const auto& v = _object[key];
        if (!v.isInt()) return fail(key, "integer");
        out = v.asInt();
    }

    void readMillis(const char* key, std::chrono::milliseconds& out) {
        uint64_t ms = static_cast<uint64_t>(out.count());
        readUnsigned(key, ms);
        out = std::chrono::milliseconds(ms);
    }

    void readStringArray(const char* key, std::vector<std::string>& out) {
        if (!present(key)) return;
        const auto& v = _object[key];
        if (!v.isArray()) return fail(key, "array of strings");
        std::vector<std::string> values;
        for (const auto& item : v) {
            if (!item.isString()) return fail(key, "array of strings");
            values.push_back(item.asString());
        }
        out = std::move(values);
    }

    const Json::Value* child(const char* key) {
        if (!present(key)) return nullptr;
        const auto& v = _object[key];
        if (!v.isObject()) {
            fail(key, "object");
            return nullptr;
        }
        return &v;
    }

private:
    bool present(const char* key) const {
        return _error.empty() && _object.isMember(key) && !_object[key].isNull();
    }

    void fail(const char* key, const char* expected) {
        _error = std::format("'{}{}' must be a {}", _path, key, expected);
    }

    const Json::Value& _object;
    std::string _path;
    std::string& _error;
};

bool parseDialect(const std::string& text, WireDialect& out) {
    if (text == "flat") {
        out = WireDialect::Flat;
    } else if (text == "tagged") {
        out = WireDialect::Tagged;
    } else {
        return false;
    }
    return true;
}

bool parseRoutingMode(const std::string& text, RoutingMode& out) {
    if (text == "single") {
        out = RoutingMode::SinglePeer;
    } else if (text == "perPeer") {
        out = RoutingMode::PerPeer;
    } else if (text == "room") {
        out = RoutingMode::Room;
    } else {
        return false;
    }
    return true;
}

bool parsePolicyKind(const std::string& text, RestartPolicy::Kind& out) {
    if (text == "never") {
        out = RestartPolicy::Kind::Never;
    } else if (text == "upToN") {
        out = RestartPolicy::Kind::UpToN;
    } else if (text == "backoff") {
        out = RestartPolicy::Kind::InfiniteWithBackoff;
    } else {
        return false;
    }
    return true;
}

}  // namespace

const char* routingModeToString(RoutingMode mode) {
    switch (mode) {
        case RoutingMode::SinglePeer:
            return "single";
        case RoutingMode::PerPeer:
            return "perPeer";
        case RoutingMode::Room:
            return "room";
    }
    return "?";
}

Result<RelayConfig> parseRelayConfig(const std::string& jsonText) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string parseErrors;
    if (!reader->parse(jsonText.data(), jsonText.data() + jsonText.size(), &root, &parseErrors)) {
        return Result<RelayConfig>::err(SignalingError::ConfigError, "Invalid JSON: " + parseErrors);
    }
    if (!root.isObject()) {
        return Result<RelayConfig>::err(SignalingError::ConfigError, "Configuration root must be an object");
    }

    RelayConfig config;
    std::string error;
    ObjectReader top(root, "", error);

    if (const auto* engine = top.child("engine")) {
        ObjectReader r(*engine, "engine.", error);
        r.readStringArray("iceServers", config.engine.iceServers);
        r.readString("bindAddress", config.engine.bindAddress);
        r.readUnsigned("portRangeBegin", config.engine.portRangeBegin);
        r.readUnsigned("portRangeEnd", config.engine.portRangeEnd);
        r.readInt("maxMessageSize", config.engine.maxMessageSize);
        r.readBool("enableIceTcp", config.engine.enableIceTcp);
        r.readString("videoMid", config.engine.videoMid);
        r.readString("videoStreamId", config.engine.videoStreamId);
        r.readUnsigned("videoSsrc", config.engine.videoSsrc);
        r.readInt("videoPayloadType", config.engine.videoPayloadType);
    }

    if (const auto* transport = top.child("transport")) {
        ObjectReader r(*transport, "transport.", error);
        r.readString("url", config.transport.url);
        r.readUnsigned("listenPort", config.transport.listenPort);
        r.readBool("enableTls", config.transport.enableTls);
        r.readString("localId", config.transport.localId);
        r.readString("roomId", config.transport.roomId);
        r.readInt("handshakeTimeoutMs", config.transport.handshakeTimeoutMs);

        std::string dialect;
        r.readString("dialect", dialect);
        if (error.empty() && !dialect.empty() && !parseDialect(dialect, config.transport.dialect)) {
            error = std::format("Unknown transport.dialect '{}'", dialect);
        }
    }

    if (const auto* restart = top.child("restart")) {
        ObjectReader r(*restart, "restart.", error);
        std::string policy;
        r.readString("policy", policy);
        if (error.empty() && !policy.empty() && !parsePolicyKind(policy, config.restartPolicy.kind)) {
            error = std::format("Unknown restart.policy '{}'", policy);
        }
        r.readUnsigned("maxRestarts", config.restartPolicy.maxRestarts);
        r.readMillis("initialBackoffMs", config.restartPolicy.initialBackoff);
        r.readMillis("maxBackoffMs", config.restartPolicy.maxBackoff);
    }

    std::string routingMode;
    top.readString("routingMode", routingMode);
    if (error.empty() && !routingMode.empty() && !parseRoutingMode(routingMode, config.routingMode)) {
        error = std::format("Unknown routingMode '{}'", routingMode);
    }

    if (const auto* single = top.child("singlePeer")) {
        ObjectReader r(*single, "singlePeer.", error);
        r.readString("id", config.singlePeerId);
        std::string role;
        r.readString("role", role);
        if (error.empty() && !role.empty()) {
            if (role == "server") {
                config.singlePeerRole = NegotiationRole::Responder;
            } else if (role == "client") {
                config.singlePeerRole = NegotiationRole::Initiator;
            } else {
                error = std::format("Unknown singlePeer.role '{}'", role);
            }
        }
    }

    top.readUnsigned("workerThreads", config.workerThreads);
    top.readUnsigned("mailboxCapacity", config.mailboxCapacity);
    top.readUnsigned("maxPeers", config.maxPeers);
    top.readBool("gateLocalCandidates", config.gateLocalCandidates);
    top.readUnsigned("rtpBasePort", config.rtpBasePort);
    top.readUnsigned("rtpStreamCount", config.rtpStreamCount);

    if (!error.empty()) {
        return Result<RelayConfig>::err(SignalingError::ConfigError, error);
    }
    if (config.singlePeerId.empty()) {
        return Result<RelayConfig>::err(SignalingError::ConfigError, "singlePeer.id must not be empty");
    }
    if (config.mailboxCapacity == 0 || config.maxPeers == 0) {
        return Result<RelayConfig>::err(SignalingError::ConfigError, "mailboxCapacity and maxPeers must be non-zero");
    }
    return Result<RelayConfig>::ok(std::move(config));
}

Result<RelayConfig> loadRelayConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<RelayConfig>::err(SignalingError::ConfigError, std::format("Cannot open config file {}", path));
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    auto result = parseRelayConfig(buffer.str());
    if (result.success()) {
        ENTROPY_LOG_INFO(std::format("Loaded relay config from {} (routing={}, maxPeers={})", path,
                                     routingModeToString(result.value.routingMode), result.value.maxPeers));
    }
    return result;
}

}  // namespace PeerRelay::Signaling
