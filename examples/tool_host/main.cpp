//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Tool host example - starts configured servers, lists their tools and optionally calls one
//==========================================================================================================

#include "logging/Logger.h"
#include "toolhost/ServerConfig.h"
#include "toolhost/ServerManager.h"
#include "toolhost/ToolAdapter.h"
#include "toolhost/version.h"
#include <iostream>
#include <optional>
#include <set>
#include <sstream>
#include <string>

using namespace toolhost;

//==========================================================================================================
// getArgValue
// Purpose: Parses key=value style CLI options.
// Args:
//   argc: Argument count
//   argv: Argument vector
//   key: Key string including leading dashes (e.g., "--config")
// Returns:
//   Optional string containing the value when present
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (size_t i = 1; i < static_cast<size_t>(argc); ++i) {
        std::string a = argv[i];
        auto eq = a.find('=');
        if (eq != std::string::npos) {
            std::string k = a.substr(0, eq);
            std::string v = a.substr(eq + 1);
            if (k == key) {
                return v;
            }
        }
    }
    return std::nullopt;
}

// Comma separated list -> set, empty items dropped
static std::set<std::string> splitIds(const std::string& csv) {
    std::set<std::string> out;
    std::stringstream ss(csv);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            out.insert(item);
        }
    }
    return out;
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    Logger::configureFromEnv();
    LOG_INFO("tool_host {}", getVersionString());

    // An explicit --config must exist; the default location is seeded with a starter file
    const auto explicitConfig = getArgValue(argc, argv, "--config");
    const std::string configPath = explicitConfig.value_or(ServerConfig::DefaultPath());
    std::optional<ServerConfig> config;
    try {
        if (explicitConfig) {
            config = ServerConfig::LoadIfExists(configPath);
        } else {
            config = ServerConfig::LoadOrCreate(configPath);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("{}", e.what());
        return 2;
    }
    if (!config) {
        LOG_ERROR("No server configuration found at {}", configPath);
        return 2;
    }

    JSONValue::Object callArgs;
    if (auto argsJson = getArgValue(argc, argv, "--args"); argsJson.has_value()) {
        try {
            JSONValue parsed = ParseJSON(*argsJson);
            if (!parsed.isObject()) {
                LOG_ERROR("--args must be a JSON object");
                return 2;
            }
            callArgs = std::get<JSONValue::Object>(parsed.value);
        } catch (const std::exception& e) {
            LOG_ERROR("Invalid --args JSON: {}", e.what());
            return 2;
        }
    }

    ServerManager manager;
    const auto selected = splitIds(getArgValue(argc, argv, "--servers").value_or(""));
    const auto started = manager.StartServers(config->Definitions(), selected);
    LOG_INFO("Started {} server(s)", started.size());

    for (const auto& [id, state] : manager.Status()) {
        std::cout << id << ": " << ToString(state) << std::endl;
    }

    ToolAdapter adapter(manager);
    const auto tools = adapter.ListAvailableTools();
    for (const auto& [name, descriptor] : tools) {
        std::string description;
        if (const JSONValue* d = descriptor.metadata.find("description"); d != nullptr && d->isString()) {
            description = std::get<std::string>(d->value);
        }
        std::cout << "  " << name << " [" << descriptor.serverId << "] " << description << std::endl;
    }

    int rc = 0;
    if (auto toolName = getArgValue(argc, argv, "--call"); toolName.has_value()) {
        auto it = tools.find(*toolName);
        if (it == tools.end()) {
            LOG_ERROR("Unknown tool: {}", *toolName);
            rc = 1;
        } else {
            auto callable = adapter.BuildToolCallable(it->second.serverId, it->second.remoteName);
            const std::string output = callable(callArgs);
            std::cout << output << std::endl;
            if (output.rfind(TOOL_FAILURE_MARKER, 0) == 0) {
                rc = 1;
            }
        }
    }

    manager.StopAll();
    return rc;
}
