//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: Tool protocol data structures and constants used by the client side of the host
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <string>
#include <vector>
#include <optional>

namespace toolhost {

///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// Protocol revision announced in the initialize handshake
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information (clientInfo / serverInfo)
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
// A tool as advertised by one server in tools/list. raw keeps the whole descriptor object.
struct RemoteTool {
    std::string name;
    std::string description;
    JSONValue inputSchema;
    JSONValue raw;
};

// Server side of a completed initialize handshake
struct ServerInfo {
    Implementation implementation;
    std::string protocolVersion;
    JSONValue capabilities;
};

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    // Client to server
    constexpr const char* Initialize = "initialize";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";

    // Notifications. The confirmation after initialize is selectable through
    // ClientOptions::initializedMethod; servers strict about the 2024-11-05 names want the long form.
    constexpr const char* Initialized = "initialized";
    constexpr const char* InitializedNotification = "notifications/initialized";
}

} // namespace toolhost
