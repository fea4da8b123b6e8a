//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolAdapter.cpp
// Purpose: Tool discovery across servers and per-call routing
//==========================================================================================================
#include <stdexcept>

#include "logging/Logger.h"
#include "toolhost/ServerManager.h"
#include "toolhost/ToolAdapter.h"

namespace toolhost {

ToolAdapter::ToolAdapter(ServerManager& manager) : manager_(manager) {
    FUNC_SCOPE();
}

std::map<std::string, ToolDescriptor> ToolAdapter::ListAvailableTools() const {
    FUNC_SCOPE();
    std::map<std::string, ToolDescriptor> discovered;
    for (const auto& serverId : manager_.ListServerIds()) {
        auto client = manager_.GetClient(serverId);
        if (!client) {
            continue;
        }
        const auto tools = client->ListTools();
        LOG_DEBUG("Server '{}' advertises {} tool(s)", serverId, tools.size());
        for (const auto& tool : tools) {
            auto it = discovered.find(tool.name);
            if (it != discovered.end()) {
                LOG_DEBUG("Tool '{}' from server '{}' overrides server '{}'", tool.name, serverId, it->second.serverId);
            }
            ToolDescriptor descriptor;
            descriptor.toolName = tool.name;
            descriptor.serverId = serverId;
            descriptor.remoteName = tool.name;
            descriptor.metadata = tool.raw;
            discovered[tool.name] = std::move(descriptor);
        }
    }
    return discovered;
}

ToolCallable ToolAdapter::BuildToolCallable(const std::string& serverId, const std::string& toolName) const {
    FUNC_SCOPE();
    ServerManager* manager = &manager_;
    return [manager, serverId, toolName](const JSONValue::Object& arguments) -> std::string {
        auto client = manager->GetClient(serverId);
        if (!client) {
            return std::string(TOOL_FAILURE_MARKER) + "MCP server not available: " + serverId;
        }
        try {
            return ToDisplayString(client->CallTool(toolName, arguments));
        } catch (const std::exception& e) {
            LOG_DEBUG("Tool '{}' on server '{}' failed: {}", toolName, serverId, e.what());
            return std::string(TOOL_FAILURE_MARKER) + "MCP tool error: " + e.what();
        }
    };
}

std::map<std::string, ToolCallable> ToolAdapter::BuildToolTable() const {
    FUNC_SCOPE();
    std::map<std::string, ToolCallable> table;
    for (const auto& [name, descriptor] : ListAvailableTools()) {
        table[name] = BuildToolCallable(descriptor.serverId, descriptor.remoteName);
    }
    return table;
}

} // namespace toolhost
