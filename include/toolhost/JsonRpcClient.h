//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcClient.h
// Purpose: JSON-RPC client for one tool server - request correlation, notifications and handshake
//==========================================================================================================

#pragma once

#include "Transport.h"
#include "JSONRPCTypes.h"
#include "Protocol.h"
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace toolhost {

//==========================================================================================================
// ClientOptions
// Purpose: Tunables for a JsonRpcClient.
// Fields:
//   requestTimeout: Deadline for writing a request and receiving its response.
//   clientInfo: Identity announced in the initialize handshake.
//   protocolVersion: Protocol revision announced in the initialize handshake.
//   maxToolPages: Upper bound on tools/list pages followed through nextCursor.
//   initializedMethod: Notification sent once initialize is acknowledged.
//==========================================================================================================
struct ClientOptions {
    std::chrono::milliseconds requestTimeout{30000};
    Implementation clientInfo;
    std::string protocolVersion{PROTOCOL_VERSION};
    std::size_t maxToolPages{64};
    std::string initializedMethod{Methods::Initialized};
};

//==========================================================================================================
// DefaultClientOptions
// Purpose: Library defaults with TOOLHOST_REQUEST_TIMEOUT_MS applied when set to a positive integer.
//==========================================================================================================
ClientOptions DefaultClientOptions();

//==========================================================================================================
// JsonRpcClient
// Purpose: Speaks JSON-RPC 2.0 with exactly one server. Any number of threads may issue requests
//          concurrently; each blocks only itself until its response, a timeout, or transport closure.
// Notes:
//   - Responses are matched purely by id. Unparseable lines and frames with unknown ids are dropped.
//   - Timed-out requests are abandoned locally; nothing is sent to the server.
//==========================================================================================================
class JsonRpcClient {
public:
    explicit JsonRpcClient(ClientOptions options = DefaultClientOptions());
    ~JsonRpcClient();

    JsonRpcClient(const JsonRpcClient&) = delete;
    JsonRpcClient& operator=(const JsonRpcClient&) = delete;

    ////////////////////////////////////////// Connection management ///////////////////////////////////////////
    //==========================================================================================================
    // Takes ownership of a transport and starts its reader.
    // Args:
    //   transport: Transport connected to the server (must not be started yet).
    //==========================================================================================================
    void Connect(std::unique_ptr<ITransport> transport);

    //==========================================================================================================
    // Closes the transport. Requests still waiting fail with TransportClosed. Safe to call twice.
    //==========================================================================================================
    void Close();

    bool IsConnected() const;

    ////////////////////////////////////////// Core messaging ///////////////////////////////////////////
    //==========================================================================================================
    // Request
    // Purpose: Sends a request and blocks until the matching response arrives. requestTimeout is one
    //          deadline covering the write (including waiting behind other writers) and the response.
    // Args:
    //   method: JSON-RPC method name.
    //   params: Parameters object, omitted from the frame when nullopt.
    // Returns:
    //   The response's result member (null when the server sent none).
    // Throws:
    //   errors::ToolHostError(Timeout) when the frame cannot be written or answered in time.
    //   errors::ToolHostError(TransportClosed) when the write fails or the server goes away.
    //   errors::RemoteError when the response carries an error member.
    //==========================================================================================================
    JSONValue Request(const std::string& method, const std::optional<JSONValue>& params = std::nullopt);

    //==========================================================================================================
    // Notify
    // Purpose: Sends a one-way frame without an id; returns once it is written.
    // Throws:
    //   errors::ToolHostError(Timeout) when the write does not finish within requestTimeout.
    //   errors::ToolHostError(TransportClosed) when the write fails.
    //==========================================================================================================
    void Notify(const std::string& method, const std::optional<JSONValue>& params = std::nullopt);

    ////////////////////////////////////////// Tool protocol ///////////////////////////////////////////
    //==========================================================================================================
    // Initialize
    // Purpose: Best-effort handshake. Sends initialize and, once acknowledged, the initialized
    //          notification. Some servers never answer initialize and remain usable anyway.
    // Returns:
    //   true when the server acknowledged; false otherwise. Never throws.
    //==========================================================================================================
    bool Initialize();

    bool IsInitialized() const;

    // Server identity from the last successful Initialize(); empty fields before that.
    ServerInfo GetServerInfo() const;

    //==========================================================================================================
    // ListTools
    // Purpose: Collects every advertised tool, following nextCursor pages.
    // Returns:
    //   Tools in server order; an empty vector when the server has none or the call fails.
    //==========================================================================================================
    std::vector<RemoteTool> ListTools();

    //==========================================================================================================
    // CallTool
    // Purpose: Invokes a tool with named arguments.
    // Returns:
    //   The raw result payload.
    // Throws:
    //   Same as Request().
    //==========================================================================================================
    JSONValue CallTool(const std::string& name, const JSONValue::Object& arguments);

    // Number of requests currently waiting for a response.
    std::size_t PendingCount() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolhost
