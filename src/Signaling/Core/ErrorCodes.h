/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

/**
 * @file ErrorCodes.h
 * @brief Error handling types for PeerRelay signaling
 *
 * Defines error codes and result types used by every engine, registry and
 * router boundary. Nothing in the signaling core reports failure by aborting.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace PeerRelay {
namespace Signaling {

/**
 * @brief Error codes for signaling operations
 */
enum class SignalingError {
    None,                       ///< No error
    InvalidMessage,             ///< Malformed wire message (JSON, framing)
    InvalidParameter,           ///< Invalid parameter provided
    ProtocolViolation,          ///< Message not valid for the current negotiation state
    EngineFailure,              ///< The WebRTC/media engine rejected an operation
    AlreadyExists,              ///< Peer id already registered
    NotFound,                   ///< Peer id not registered
    ConnectionClosed,           ///< Transport was closed
    Timeout,                    ///< Operation timed out
    SessionClosed,              ///< Session was torn down before the operation completed
    RouteNotFound,              ///< No actor registered under the route key
    MailboxFull,                ///< Actor mailbox reached its capacity
    MailboxClosed,              ///< Actor is stopped or failed
    ResourceLimitExceeded,      ///< Registry slots exhausted
    ConfigError                 ///< Configuration could not be loaded
};

/**
 * @brief Convert error code to human-readable string
 * @param error The error code
 * @return Description of the error
 */
inline const char* errorToString(SignalingError error) {
    switch (error) {
        case SignalingError::None: return "No error";
        case SignalingError::InvalidMessage: return "Invalid message";
        case SignalingError::InvalidParameter: return "Invalid parameter";
        case SignalingError::ProtocolViolation: return "Protocol violation";
        case SignalingError::EngineFailure: return "Engine failure";
        case SignalingError::AlreadyExists: return "Already exists";
        case SignalingError::NotFound: return "Not found";
        case SignalingError::ConnectionClosed: return "Connection closed";
        case SignalingError::Timeout: return "Timeout";
        case SignalingError::SessionClosed: return "Session closed";
        case SignalingError::RouteNotFound: return "Route not found";
        case SignalingError::MailboxFull: return "Mailbox full";
        case SignalingError::MailboxClosed: return "Mailbox closed";
        case SignalingError::ResourceLimitExceeded: return "Resource limit exceeded";
        case SignalingError::ConfigError: return "Configuration error";
        default: return "Unknown error";
    }
}

/**
 * @brief Result type for operations that may fail
 *
 * Encapsulates a value and an error code. Check success() before accessing value.
 *
 * @code
 * auto result = registry.add("peer_7", NegotiationRole::Responder);
 * if (result.success()) {
 *     result.value.startNegotiation();
 * } else {
 *     ENTROPY_LOG_WARNING(result.errorMessage);
 * }
 * @endcode
 */
template<typename T>
struct Result {
    T value;                    ///< Result value (valid only if error == None)
    SignalingError error;       ///< Error code
    std::string errorMessage;   ///< Optional detailed error message

    bool success() const {
        return error == SignalingError::None;
    }

    bool failed() const {
        return error != SignalingError::None;
    }

    /**
     * @brief Get the value or throw on error
     * @return The contained value
     * @throws std::runtime_error if operation failed
     */
    T& valueOrThrow() {
        if (failed()) {
            throw std::runtime_error(errorMessage.empty() ?
                errorToString(error) : errorMessage);
        }
        return value;
    }

    static Result<T> ok(T val) {
        return Result<T>{std::move(val), SignalingError::None, ""};
    }

    static Result<T> err(SignalingError err, std::string message = "") {
        return Result<T>{T{}, err, std::move(message)};
    }
};

/**
 * @brief Result specialization for void operations
 */
template<>
struct Result<void> {
    SignalingError error;
    std::string errorMessage;

    bool success() const { return error == SignalingError::None; }
    bool failed() const { return error != SignalingError::None; }

    void throwOnError() const {
        if (failed()) {
            throw std::runtime_error(errorMessage.empty() ?
                errorToString(error) : errorMessage);
        }
    }

    static Result<void> ok() {
        return Result<void>{SignalingError::None, ""};
    }

    static Result<void> err(SignalingError err, std::string message = "") {
        return Result<void>{err, std::move(message)};
    }
};

} // namespace Signaling
} // namespace PeerRelay
