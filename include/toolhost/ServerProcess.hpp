//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerProcess.hpp
// Purpose: Owned OS process handle for one spawned tool server
//==========================================================================================================
#pragma once

#include "toolhost/ServerDefinition.h"
#include "toolhost/Transport.h"
#include <chrono>
#include <memory>
#include <string>

namespace toolhost {

//==========================================================================================================
// ServerProcess
// Purpose: Launches a server with piped stdio and controls its lifetime.
// Notes:
//   - stdin/stdout are handed to a StdioTransport through CreateTransport().
//   - stderr is drained on a background thread and logged at debug level.
//   - The destructor terminates a child that is still running.
//==========================================================================================================
class ServerProcess {
public:
    //==========================================================================================================
    // Spawn
    // Purpose: Starts def.command with def.args. The child environment is the host environment with
    //          def.env overlaid. Commands without '/' are resolved through PATH.
    // Returns:
    //   The running process.
    // Throws:
    //   errors::ToolHostError(SpawnFailed) when the command cannot be found or executed.
    //==========================================================================================================
    static std::unique_ptr<ServerProcess> Spawn(const ServerDefinition& def);

    ~ServerProcess();

    ServerProcess(const ServerProcess&) = delete;
    ServerProcess& operator=(const ServerProcess&) = delete;

    //==========================================================================================================
    // CreateTransport
    // Purpose: Transfers the stdin/stdout pipe ends to a new StdioTransport. Only the first call succeeds.
    // Throws:
    //   errors::ToolHostError(NotRunning) when the pipes were already taken.
    //==========================================================================================================
    std::unique_ptr<ITransport> CreateTransport();

    // Non-blocking check; reaps the child once it has exited.
    bool IsRunning() const;

    //==========================================================================================================
    // Terminate
    // Purpose: Requests graceful exit (SIGTERM), waits up to timeout, then force-kills and reaps.
    // Returns:
    //   true when the child exited on its own within the timeout.
    //==========================================================================================================
    bool Terminate(std::chrono::milliseconds timeout);

    int GetPid() const;

    // Exit status once the child has been reaped (the signal number if it was killed); -1 before that.
    int GetExitCode() const;

private:
    class Impl;
    explicit ServerProcess(std::unique_ptr<Impl> impl);
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolhost
