//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed errors raised by the tool-server host and JSON-RPC error payload helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "toolhost/JSONRPCTypes.h"

namespace toolhost {
namespace errors {

// Failure kinds surfaced by the host. Handshake failures and malformed frames are absorbed
// internally and never appear here.
enum class ErrorCategory {
    UnsupportedTransport,
    SpawnFailed,
    Timeout,
    TransportClosed,
    RemoteError,
    NotRunning,
    InvalidConfig,
    Protocol
};

inline const char* toString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::UnsupportedTransport: return "unsupported-transport";
        case ErrorCategory::SpawnFailed: return "spawn-failed";
        case ErrorCategory::Timeout: return "timeout";
        case ErrorCategory::TransportClosed: return "transport-closed";
        case ErrorCategory::RemoteError: return "remote-error";
        case ErrorCategory::NotRunning: return "not-running";
        case ErrorCategory::InvalidConfig: return "invalid-config";
        case ErrorCategory::Protocol: return "protocol";
    }
    return "unknown";
}

//==========================================================================================================
// ToolHostError
// Purpose: Base exception for every failure the host reports to its immediate caller.
//==========================================================================================================
class ToolHostError : public std::runtime_error {
public:
    ToolHostError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    ErrorCategory category() const noexcept { return category_; }

private:
    ErrorCategory category_;
};

// Typed view of a JSON-RPC error object { code, message, data? }.
struct RpcError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
};

//==========================================================================================================
// RemoteError
// Purpose: Server-reported application error. The raw error payload is kept verbatim; code/message
//          are populated when the payload has the standard JSON-RPC shape.
//==========================================================================================================
class RemoteError : public ToolHostError {
public:
    RemoteError(JSONValue payload, std::optional<RpcError> parsed)
        : ToolHostError(ErrorCategory::RemoteError, SerializeJSON(payload)),
          payload_(std::move(payload)), parsed_(std::move(parsed)) {}

    const JSONValue& payload() const noexcept { return payload_; }
    const std::optional<RpcError>& rpcError() const noexcept { return parsed_; }

private:
    JSONValue payload_;
    std::optional<RpcError> parsed_;
};

// Convert a JSON-RPC error object (shape: { code, message, data? }) to RpcError.
// Returns std::nullopt when the input is not a valid error object.
//
// Args:
//   errVal: JSONValue expected to be an Object with code/message and optional data.
inline std::optional<RpcError> RpcErrorFromValue(const JSONValue& errVal) {
    const JSONValue* code = errVal.find("code");
    const JSONValue* msg = errVal.find("message");
    if (code == nullptr || msg == nullptr || !code->isInt() || !msg->isString()) {
        return std::nullopt;
    }
    RpcError e;
    e.code = static_cast<int>(std::get<int64_t>(code->value));
    e.message = std::get<std::string>(msg->value);
    if (const JSONValue* data = errVal.find("data")) {
        e.data = *data;
    }
    return e;
}

// Builds the exception thrown for a response whose error member is set.
inline RemoteError MakeRemoteError(const JSONValue& errVal) {
    return RemoteError(errVal, RpcErrorFromValue(errVal));
}

} // namespace errors
} // namespace toolhost
