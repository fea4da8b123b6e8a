//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerManager.h
// Purpose: Owns the running tool-server processes and their clients
//==========================================================================================================

#pragma once

#include "toolhost/JsonRpcClient.h"
#include "toolhost/ServerDefinition.h"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace toolhost {

class ServerProcess;

enum class ServerState {
    Running,
    Stopped
};

// "running" / "stopped"
const char* ToString(ServerState state);

//==========================================================================================================
// RunningServerInfo
// Purpose: Snapshot of one recorded server.
//==========================================================================================================
struct RunningServerInfo {
    ServerDefinition definition;
    int pid{-1};
    std::chrono::system_clock::time_point startedAt;
    std::optional<int> exitCode; // set once the process has exited
};

//==========================================================================================================
// ServerManager
// Purpose: Starts, stops and reports on tool servers. One entry per server id at any time.
// Notes:
//   - The running-set lock is never held across a tool call or the handshake, so a slow server
//     does not block operations on the others.
//   - The destructor stops every server.
//==========================================================================================================
class ServerManager {
public:
    explicit ServerManager(ClientOptions options = DefaultClientOptions());
    ~ServerManager();

    ServerManager(const ServerManager&) = delete;
    ServerManager& operator=(const ServerManager&) = delete;

    //==========================================================================================================
    // StartServer
    // Purpose: Spawns the server, connects a client and attempts the handshake. Returns the existing
    //          entry unchanged when the id is already running.
    // Returns:
    //   Snapshot of the recorded server.
    // Throws:
    //   errors::ToolHostError(UnsupportedTransport) before spawning for non-stdio definitions.
    //   errors::ToolHostError(SpawnFailed) when the process cannot be started; nothing is recorded.
    //==========================================================================================================
    RunningServerInfo StartServer(const ServerDefinition& def);

    //==========================================================================================================
    // StartServers
    // Purpose: Starts definitions in the given order. Ids outside a non-empty allow-list and
    //          definitions with an empty command are skipped. Failures are logged and skipped.
    // Returns:
    //   Ids that are running after the call, in definition order.
    //==========================================================================================================
    std::vector<std::string> StartServers(const std::vector<ServerDefinition>& defs,
                                          const std::set<std::string>& allowedIds = {});

    //==========================================================================================================
    // StopServer
    // Purpose: Terminates the process (SIGTERM, then SIGKILL after timeout) and always removes the
    //          entry. Unknown ids are a no-op.
    //==========================================================================================================
    void StopServer(const std::string& serverId,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds(3000));

    void StopAll();

    // Client for a live server; nullptr when absent or its process has exited.
    std::shared_ptr<JsonRpcClient> GetClient(const std::string& serverId) const;

    // Recorded ids with their actual process state.
    std::map<std::string, ServerState> Status() const;

    // Recorded ids in start order.
    std::vector<std::string> ListServerIds() const;

    std::optional<RunningServerInfo> GetServerInfo(const std::string& serverId) const;

private:
    struct Entry;

    ClientOptions options_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Entry>> servers_;
    std::vector<std::string> order_;
};

} // namespace toolhost
