//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerManager.cpp
// Purpose: Tool-server lifecycle management (start/stop/status)
//==========================================================================================================
#include <algorithm>
#include <stdexcept>

#include "logging/Logger.h"
#include "toolhost/ServerManager.h"
#include "toolhost/ServerProcess.hpp"
#include "toolhost/errors/Errors.h"

namespace toolhost {

const char* ToString(ServerState state) {
    switch (state) {
        case ServerState::Running: return "running";
        case ServerState::Stopped: return "stopped";
    }
    return "stopped";
}

struct ServerManager::Entry {
    ServerDefinition definition;
    std::unique_ptr<ServerProcess> process;
    std::shared_ptr<JsonRpcClient> client;
    std::chrono::system_clock::time_point startedAt;

    RunningServerInfo snapshot() const {
        RunningServerInfo info;
        info.definition = definition;
        info.pid = process ? process->GetPid() : -1;
        info.startedAt = startedAt;
        if (process && !process->IsRunning()) {
            const int code = process->GetExitCode();
            if (code >= 0) {
                info.exitCode = code;
            }
        }
        return info;
    }

    bool running() const { return process && process->IsRunning(); }
};

namespace {

// Closes the client (its stdin EOF lets well-behaved servers exit) and then terminates the process.
template <typename EntryT>
void shutdownEntry(EntryT& entry, std::chrono::milliseconds timeout) {
    const std::string& id = entry.definition.serverId;
    try {
        if (entry.client) {
            entry.client->Close();
        }
    } catch (const std::exception& e) {
        LOG_WARN("Error closing client for server '{}': {}", id, e.what());
    }
    try {
        if (entry.process) {
            const bool graceful = entry.process->Terminate(timeout);
            LOG_INFO("Stopped server '{}'{} (exit code {})", id, graceful ? "" : " (killed)",
                     entry.process->GetExitCode());
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error terminating server '{}': {}", id, e.what());
    }
}

} // namespace

ServerManager::ServerManager(ClientOptions options) : options_(std::move(options)) {
    FUNC_SCOPE();
}

ServerManager::~ServerManager() {
    FUNC_SCOPE();
    StopAll();
}

RunningServerInfo ServerManager::StartServer(const ServerDefinition& def) {
    FUNC_SCOPE();
    if (def.transport != TransportKind::Stdio) {
        throw errors::ToolHostError(errors::ErrorCategory::UnsupportedTransport,
                                    fmt::format("Unsupported transport '{}' for server '{}'",
                                                def.transportName, def.serverId));
    }

    std::shared_ptr<Entry> entry;
    std::shared_ptr<Entry> exited;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = servers_.find(def.serverId);
        if (it != servers_.end()) {
            if (it->second->running()) {
                LOG_DEBUG("Server '{}' already running", def.serverId);
                return it->second->snapshot();
            }
            LOG_INFO("Server '{}' has exited (code {}); starting a new process", def.serverId,
                     it->second->process ? it->second->process->GetExitCode() : -1);
            exited = it->second;
            servers_.erase(it);
            order_.erase(std::remove(order_.begin(), order_.end(), def.serverId), order_.end());
        }

        entry = std::make_shared<Entry>();
        entry->definition = def;
        entry->process = ServerProcess::Spawn(def);
        entry->client = std::make_shared<JsonRpcClient>(options_);
        entry->client->Connect(entry->process->CreateTransport());
        entry->startedAt = std::chrono::system_clock::now();

        servers_[def.serverId] = entry;
        order_.push_back(def.serverId);
    }

    if (exited) {
        shutdownEntry(*exited, std::chrono::milliseconds(0));
    }

    if (entry->client->Initialize()) {
        const ServerInfo info = entry->client->GetServerInfo();
        LOG_INFO("Server '{}' initialized ({} {})", def.serverId, info.implementation.name, info.implementation.version);
    } else {
        LOG_WARN("Server '{}' did not complete the handshake; tool calls may fail", def.serverId);
    }
    return entry->snapshot();
}

std::vector<std::string> ServerManager::StartServers(const std::vector<ServerDefinition>& defs,
                                                     const std::set<std::string>& allowedIds) {
    FUNC_SCOPE();
    std::vector<std::string> started;
    for (const auto& def : defs) {
        if (!allowedIds.empty() && allowedIds.count(def.serverId) == 0) {
            LOG_DEBUG("Skipping server '{}' (not selected)", def.serverId);
            continue;
        }
        if (def.command.empty()) {
            LOG_WARN("Skipping server '{}': no command configured", def.serverId);
            continue;
        }
        try {
            StartServer(def);
            started.push_back(def.serverId);
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to start server '{}': {}", def.serverId, e.what());
        }
    }
    return started;
}

void ServerManager::StopServer(const std::string& serverId, std::chrono::milliseconds timeout) {
    FUNC_SCOPE();
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = servers_.find(serverId);
        if (it == servers_.end()) {
            return;
        }
        entry = it->second;
        servers_.erase(it);
        order_.erase(std::remove(order_.begin(), order_.end(), serverId), order_.end());
    }
    shutdownEntry(*entry, timeout);
}

void ServerManager::StopAll() {
    FUNC_SCOPE();
    std::vector<std::shared_ptr<Entry>> entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& id : order_) {
            auto it = servers_.find(id);
            if (it != servers_.end()) {
                entries.push_back(it->second);
            }
        }
        servers_.clear();
        order_.clear();
    }
    for (auto& entry : entries) {
        shutdownEntry(*entry, std::chrono::milliseconds(3000));
    }
}

std::shared_ptr<JsonRpcClient> ServerManager::GetClient(const std::string& serverId) const {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(serverId);
    if (it == servers_.end() || !it->second->running()) {
        return nullptr;
    }
    return it->second->client;
}

std::map<std::string, ServerState> ServerManager::Status() const {
    FUNC_SCOPE();
    std::map<std::string, ServerState> status;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, entry] : servers_) {
        status[id] = entry->running() ? ServerState::Running : ServerState::Stopped;
    }
    return status;
}

std::vector<std::string> ServerManager::ListServerIds() const {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(mutex_);
    return order_;
}

std::optional<RunningServerInfo> ServerManager::GetServerInfo(const std::string& serverId) const {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(serverId);
    if (it == servers_.end()) {
        return std::nullopt;
    }
    return it->second->snapshot();
}

} // namespace toolhost
