//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolAdapter.h
// Purpose: Flattens the tools of every running server into named local callables
//==========================================================================================================

#pragma once

#include "toolhost/JSONRPCTypes.h"
#include <functional>
#include <map>
#include <string>

namespace toolhost {

class ServerManager;

// Prefix of every failure string returned by a tool callable.
constexpr const char* TOOL_FAILURE_MARKER = "\xE2\x9D\x8C ";

//==========================================================================================================
// ToolDescriptor
// Purpose: One discovered tool and the server that provides it.
// Fields:
//   toolName: Name exposed to callers.
//   serverId: Owning server.
//   remoteName: Name sent in tools/call.
//   metadata: Tool descriptor object as advertised by the server.
//==========================================================================================================
struct ToolDescriptor {
    std::string toolName;
    std::string serverId;
    std::string remoteName;
    JSONValue metadata;
};

// Named arguments in, display string out. Never throws.
using ToolCallable = std::function<std::string(const JSONValue::Object& arguments)>;

//==========================================================================================================
// ToolAdapter
// Purpose: Discovery and call routing over a ServerManager. The manager must outlive the adapter
//          and every callable it builds.
//==========================================================================================================
class ToolAdapter {
public:
    explicit ToolAdapter(ServerManager& manager);

    //==========================================================================================================
    // ListAvailableTools
    // Purpose: Lists tools of every running server in start order. A server that fails or reports
    //          nothing contributes nothing. On a name collision the later server wins.
    //==========================================================================================================
    std::map<std::string, ToolDescriptor> ListAvailableTools() const;

    //==========================================================================================================
    // BuildToolCallable
    // Purpose: Binds a tool to a server id. The client is resolved on every call, so a server that
    //          stopped in the meantime yields a failure string instead of an exception.
    // Returns:
    //   Callable returning the result rendered as text, or a string starting with TOOL_FAILURE_MARKER.
    //==========================================================================================================
    ToolCallable BuildToolCallable(const std::string& serverId, const std::string& toolName) const;

    // ListAvailableTools() bound through BuildToolCallable(), keyed by tool name.
    std::map<std::string, ToolCallable> BuildToolTable() const;

private:
    ServerManager& manager_;
};

} // namespace toolhost
