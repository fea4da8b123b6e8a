//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerProcess.cpp
// Purpose: Tool-server process spawning and termination on top of Boost.Process
//==========================================================================================================

#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <csignal>
#include <cerrno>
#include <cstring>
#include <sys/types.h>
#include <sys/wait.h>

#include <chrono>
#include <optional>
#include <mutex>
#include <stop_token>
#include <string>
#include <system_error>
#include <thread>

#include <boost/filesystem/path.hpp>
#include <boost/process/args.hpp>
#include <boost/process/child.hpp>
#include <boost/process/env.hpp>
#include <boost/process/environment.hpp>
#include <boost/process/exe.hpp>
#include <boost/process/io.hpp>
#include <boost/process/pipe.hpp>
#include <boost/process/search_path.hpp>

#include "logging/Logger.h"
#include "toolhost/ServerProcess.hpp"
#include "toolhost/StdioTransport.hpp"
#include "toolhost/errors/Errors.h"

namespace bp = boost::process;

namespace toolhost {

namespace {

void setCloexec(int fd) {
    if (fd < 0) {
        return;
    }
    int fl = ::fcntl(fd, F_GETFD, 0);
    if (fl >= 0) {
        (void)::fcntl(fd, F_SETFD, fl | FD_CLOEXEC);
    }
}

void setCloexec(const bp::pipe& p) {
    setCloexec(p.native_source());
    setCloexec(p.native_sink());
}

// Moves the surviving parent-side descriptor out of a pipe so its destructor leaves it open.
int takeSink(bp::pipe& p) {
    int fd = p.native_sink();
    p.assign_sink(-1);
    return fd;
}

int takeSource(bp::pipe& p) {
    int fd = p.native_source();
    p.assign_source(-1);
    return fd;
}

// Same convention as bp::child::exit_code(): exit status, or the signal number for a killed child.
int decodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return WTERMSIG(status);
    }
    return status;
}

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Drains the child's stderr into the debug log until EOF or stop is requested.
void pumpStderr(std::stop_token stop, int fd, std::string serverId) {
    std::string buffer;
    char tmp[4096];
    while (!stop.stop_requested()) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        int rc = ::poll(&pfd, 1, 100);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (rc == 0) {
            continue;
        }
        ssize_t n = ::read(fd, tmp, sizeof(tmp));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            break;
        }
        if (n == 0) {
            break;
        }
        buffer.append(tmp, static_cast<std::size_t>(n));
        std::size_t nl;
        while ((nl = buffer.find('\n')) != std::string::npos) {
            std::string line = buffer.substr(0, nl);
            buffer.erase(0, nl + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (!line.empty()) {
                LOG_DEBUG("[{} stderr] {}", serverId, line);
            }
        }
    }
    if (!buffer.empty()) {
        LOG_DEBUG("[{} stderr] {}", serverId, buffer);
    }
}

} // namespace

class ServerProcess::Impl {
public:
    std::string serverId;
    mutable std::mutex childMutex;
    mutable bp::child child;
    int stdinFd{-1};
    int stdoutFd{-1};
    int stderrFd{-1};
    std::optional<int> killedExitCode; // set when Terminate reaped the child itself
    std::jthread stderrPump;

    ~Impl() {
        stopPump();
        closeFd(stdinFd);
        closeFd(stdoutFd);
    }

    void stopPump() {
        if (stderrPump.joinable()) {
            stderrPump.request_stop();
            stderrPump.join();
        }
        closeFd(stderrFd);
    }

    bool runningLocked() const {
        if (!child.valid()) {
            return false;
        }
        std::error_code ec;
        bool running = child.running(ec);
        if (ec) {
            LOG_DEBUG("ServerProcess[{}]: running() failed: {}", serverId, ec.message());
            return false;
        }
        return running;
    }
};

ServerProcess::ServerProcess(std::unique_ptr<Impl> impl) : pImpl(std::move(impl)) {}

ServerProcess::~ServerProcess() {
    FUNC_SCOPE();
    if (IsRunning()) {
        (void)Terminate(std::chrono::milliseconds(1000));
    }
}

std::unique_ptr<ServerProcess> ServerProcess::Spawn(const ServerDefinition& def) {
    FUNC_SCOPE();
    if (def.command.empty()) {
        throw errors::ToolHostError(errors::ErrorCategory::SpawnFailed,
                                    fmt::format("Server '{}' has no command", def.serverId));
    }

    boost::filesystem::path exe;
    if (def.command.find('/') != std::string::npos) {
        exe = def.command;
    } else {
        exe = bp::search_path(def.command);
        if (exe.empty()) {
            throw errors::ToolHostError(errors::ErrorCategory::SpawnFailed,
                                        fmt::format("Command not found on PATH for server '{}': {}",
                                                    def.serverId, def.command));
        }
    }

    bp::environment env = boost::this_process::environment();
    for (const auto& [key, value] : def.env) {
        env[key] = value;
    }

    auto impl = std::make_unique<Impl>();
    impl->serverId = def.serverId;
    try {
        bp::pipe toChild;
        bp::pipe fromChild;
        bp::pipe errFromChild;
        // Keep parent-side ends out of every other child; dup2 clears the flag on the child's 0/1/2.
        setCloexec(toChild);
        setCloexec(fromChild);
        setCloexec(errFromChild);

        std::error_code ec;
        bp::child child(bp::exe = exe.string(), bp::args = def.args,
                        bp::std_in < toChild, bp::std_out > fromChild, bp::std_err > errFromChild,
                        env, ec);
        if (ec || !child.valid()) {
            throw errors::ToolHostError(errors::ErrorCategory::SpawnFailed,
                                        fmt::format("Failed to start server '{}' ({}): {}",
                                                    def.serverId, exe.string(), ec.message()));
        }
        impl->child = std::move(child);
        impl->stdinFd = takeSink(toChild);
        impl->stdoutFd = takeSource(fromChild);
        impl->stderrFd = takeSource(errFromChild);
    } catch (const errors::ToolHostError&) {
        throw;
    } catch (const std::exception& e) {
        throw errors::ToolHostError(errors::ErrorCategory::SpawnFailed,
                                    fmt::format("Failed to start server '{}': {}", def.serverId, e.what()));
    }

    impl->stderrPump = std::jthread(pumpStderr, impl->stderrFd, impl->serverId);
    LOG_INFO("Started server '{}' (pid {}): {}", def.serverId, impl->child.id(), exe.string());
    return std::unique_ptr<ServerProcess>(new ServerProcess(std::move(impl)));
}

std::unique_ptr<ITransport> ServerProcess::CreateTransport() {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->childMutex);
    if (pImpl->stdinFd < 0 || pImpl->stdoutFd < 0) {
        throw errors::ToolHostError(errors::ErrorCategory::NotRunning,
                                    fmt::format("Server '{}' pipes already taken", pImpl->serverId));
    }
    auto transport = std::make_unique<StdioTransport>(pImpl->stdoutFd, pImpl->stdinFd);
    pImpl->stdinFd = -1;
    pImpl->stdoutFd = -1;
    return transport;
}

bool ServerProcess::IsRunning() const {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->childMutex);
    return pImpl->runningLocked();
}

bool ServerProcess::Terminate(std::chrono::milliseconds timeout) {
    FUNC_SCOPE();
    bool graceful = true;
    {
        std::lock_guard<std::mutex> lock(pImpl->childMutex);
        if (pImpl->runningLocked()) {
            const auto pid = pImpl->child.id();
            if (::kill(pid, SIGTERM) != 0) {
                LOG_DEBUG("ServerProcess[{}]: SIGTERM failed (errno={} msg={})", pImpl->serverId, errno, ::strerror(errno));
            }
            const auto deadline = std::chrono::steady_clock::now() + timeout;
            bool exited = false;
            while (std::chrono::steady_clock::now() < deadline) {
                if (!pImpl->runningLocked()) {
                    exited = true;
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
            }
            if (!exited && pImpl->runningLocked()) {
                graceful = false;
                LOG_WARN("Server '{}' (pid {}) ignored SIGTERM for {} ms; killing", pImpl->serverId, pid,
                         static_cast<long long>(timeout.count()));
                std::error_code ec;
                pImpl->child.terminate(ec);
                if (ec) {
                    LOG_ERROR("ServerProcess[{}]: kill failed: {}", pImpl->serverId, ec.message());
                }
                // terminate() only polls once; after it the child is never waited for again
                int status = 0;
                pid_t rc;
                do {
                    rc = ::waitpid(pid, &status, 0);
                } while (rc < 0 && errno == EINTR);
                if (rc == pid) {
                    pImpl->killedExitCode = decodeWaitStatus(status);
                } else if (errno == ECHILD) {
                    // Already reaped inside terminate(), which discards the status
                    pImpl->killedExitCode = SIGKILL;
                } else {
                    LOG_ERROR("ServerProcess[{}]: waitpid failed (errno={} msg={})", pImpl->serverId, errno, ::strerror(errno));
                }
            }
        }
    }
    pImpl->stopPump();
    return graceful;
}

int ServerProcess::GetPid() const {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->childMutex);
    return pImpl->child.valid() ? static_cast<int>(pImpl->child.id()) : -1;
}

int ServerProcess::GetExitCode() const {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->childMutex);
    if (pImpl->killedExitCode) {
        return *pImpl->killedExitCode;
    }
    if (!pImpl->child.valid() || pImpl->runningLocked()) {
        return -1;
    }
    return pImpl->child.exit_code();
}

} // namespace toolhost
