//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.cpp
// Purpose: Newline-delimited stdio transport implementation
//==========================================================================================================

#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <csignal>
#include <cerrno>
#include <cstring>
#include <sys/epoll.h>
#include <sys/eventfd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "logging/Logger.h"
#include "toolhost/StdioTransport.hpp"
#include "toolhost/errors/Errors.h"

namespace toolhost {

namespace {

std::once_flag sigpipeOnce;

void ignoreSigpipe() {
    // A server that exits while we write must surface as EPIPE, never terminate the host.
    std::call_once(sigpipeOnce, []() { (void)::signal(SIGPIPE, SIG_IGN); });
}

void setNonBlockingCloexec(int fd) {
    if (fd < 0) {
        return;
    }
    int fl = ::fcntl(fd, F_GETFL, 0);
    if (fl >= 0) {
        (void)::fcntl(fd, F_SETFL, fl | O_NONBLOCK);
    }
    int fdfl = ::fcntl(fd, F_GETFD, 0);
    if (fdfl >= 0) {
        (void)::fcntl(fd, F_SETFD, fdfl | FD_CLOEXEC);
    }
}

bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](char c) { return c == ' ' || c == '\t' || c == '\r'; });
}

} // namespace

class StdioTransport::Impl {
public:
    std::atomic<bool> connected{false};
    std::atomic<bool> closing{false};
    bool started{false};
    bool closed{false};
    int readFd{-1};
    int writeFd{-1};
    int wakeEventFd{-1};
    std::string sessionId;
    ITransport::FrameHandler frameHandler;
    ITransport::ErrorHandler errorHandler;
    std::thread readerThread;
    std::timed_mutex writeMutex; // single writer on the server's stdin
    bool desynced{false};        // a frame was cut short; guarded by writeMutex
    std::mutex lifecycleMutex; // guards started/closed
    std::size_t maxLineBytes{8 * 1024 * 1024};
    std::chrono::milliseconds writeTimeout{0}; // 0 = disabled

    Impl(int rfd, int wfd) : readFd(rfd), writeFd(wfd) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "stdio-" + std::to_string(dis(gen));

        ignoreSigpipe();
        setNonBlockingCloexec(readFd);
        setNonBlockingCloexec(writeFd);

        wakeEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wakeEventFd < 0) {
            LOG_ERROR("StdioTransport: failed to create eventfd (errno={} msg={})", errno, ::strerror(errno));
        }
    }

    ~Impl() {
        close();
        if (wakeEventFd >= 0) { ::close(wakeEventFd); wakeEventFd = -1; }
    }

    void wakeReader() {
        if (wakeEventFd < 0) {
            return;
        }
        uint64_t one = 1;
        for (;;) {
            ssize_t w = ::write(wakeEventFd, &one, sizeof(one));
            if (w >= 0 || errno == EAGAIN || errno == EWOULDBLOCK) {
                break;
            }
            if (errno == EINTR) {
                continue;
            }
            LOG_WARN("StdioTransport: eventfd write failed (errno={} msg={})", errno, ::strerror(errno));
            break;
        }
    }

    void deliver(std::string line) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || isBlank(line)) {
            return;
        }
        if (line.size() > maxLineBytes) {
            LOG_WARN("StdioTransport: dropping oversized frame ({} bytes, max={})", line.size(), maxLineBytes);
            return;
        }
        if (!frameHandler) {
            return;
        }
        try {
            frameHandler(line);
        } catch (const std::exception& e) {
            LOG_ERROR("StdioTransport: frame handler threw: {}", e.what());
        }
    }

    // Splits complete lines off the front of buffer. discarding is set while skipping an oversized line.
    void drainLines(std::string& buffer, bool& discarding) {
        std::size_t start = 0;
        for (;;) {
            std::size_t nl = buffer.find('\n', start);
            if (nl == std::string::npos) {
                break;
            }
            if (discarding) {
                discarding = false;
            } else {
                deliver(buffer.substr(start, nl - start));
            }
            start = nl + 1;
        }
        buffer.erase(0, start);
        if (buffer.size() > maxLineBytes) {
            LOG_WARN("StdioTransport: frame exceeds {} bytes without newline; discarding until next newline", maxLineBytes);
            buffer.clear();
            discarding = true;
        }
    }

    void startReader() {
        readerThread = std::thread([this]() {
            std::string buffer;
            bool discarding = false;
            std::string reason;
            std::vector<char> tmp(64 * 1024);
            constexpr int waitTimeoutMs = 100;

            int ep = ::epoll_create1(EPOLL_CLOEXEC);
            if (ep < 0) {
                reason = "StdioTransport: epoll_create1 failed";
                LOG_ERROR("StdioTransport: epoll_create1 failed (errno={} msg={})", errno, ::strerror(errno));
            } else {
                epoll_event evIn{}; evIn.events = EPOLLIN | EPOLLRDHUP; evIn.data.fd = readFd;
                if (::epoll_ctl(ep, EPOLL_CTL_ADD, readFd, &evIn) != 0) {
                    reason = "StdioTransport: cannot watch server stdout";
                    LOG_ERROR("StdioTransport: epoll_ctl failed (errno={} msg={})", errno, ::strerror(errno));
                }
                if (wakeEventFd >= 0) {
                    epoll_event evWake{}; evWake.events = EPOLLIN; evWake.data.fd = wakeEventFd;
                    (void)::epoll_ctl(ep, EPOLL_CTL_ADD, wakeEventFd, &evWake);
                }
            }

            while (reason.empty() && !closing.load()) {
                epoll_event events[2];
                int rc = ::epoll_wait(ep, events, 2, waitTimeoutMs);
                if (rc < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    reason = "StdioTransport: epoll_wait failed";
                    LOG_ERROR("StdioTransport: epoll_wait failed (errno={} msg={})", errno, ::strerror(errno));
                    break;
                }
                bool readable = false;
                for (int k = 0; k < rc; ++k) {
                    if (events[k].data.fd == readFd) {
                        readable = true;
                    } else {
                        uint64_t v = 0;
                        ssize_t r;
                        do {
                            r = ::read(wakeEventFd, &v, sizeof(v));
                        } while (r < 0 && errno == EINTR);
                    }
                }
                if (closing.load() || !readable) {
                    continue;
                }

                bool eof = false;
                for (;;) {
                    ssize_t n = ::read(readFd, tmp.data(), tmp.size());
                    if (n > 0) {
                        buffer.append(tmp.data(), static_cast<std::size_t>(n));
                        continue;
                    }
                    if (n == 0) {
                        eof = true;
                        reason = "StdioTransport: EOF from server";
                        break;
                    }
                    if (errno == EINTR) {
                        continue;
                    }
                    if (errno == EAGAIN || errno == EWOULDBLOCK) {
                        break;
                    }
                    eof = true;
                    reason = "StdioTransport: read error";
                    LOG_ERROR("StdioTransport: read error (errno={} msg={})", errno, ::strerror(errno));
                    break;
                }
                drainLines(buffer, discarding);
                if (eof && !discarding && !buffer.empty()) {
                    // Final line without terminator
                    deliver(std::move(buffer));
                    buffer.clear();
                }
            }
            if (ep >= 0) {
                ::close(ep);
            }

            const bool wasClosing = closing.load();
            connected = false;
            if (!wasClosing) {
                LOG_INFO("{} ({})", reason, sessionId);
                if (errorHandler) {
                    try {
                        errorHandler(reason);
                    } catch (const std::exception& e) {
                        LOG_ERROR("StdioTransport: error handler threw: {}", e.what());
                    }
                }
            }
        });
    }

    void close() {
        {
            std::lock_guard<std::mutex> lk(lifecycleMutex);
            if (closed) {
                return;
            }
            closed = true;
        }
        closing = true;
        connected = false;
        wakeReader();
        bool detached = false;
        if (readerThread.joinable()) {
            if (readerThread.get_id() == std::this_thread::get_id()) {
                // Closed from inside a frame/error callback; the loop exits on its own.
                readerThread.detach();
                detached = true;
            } else {
                readerThread.join();
            }
        }
        {
            std::lock_guard<std::timed_mutex> lk(writeMutex);
            if (writeFd >= 0) { ::close(writeFd); writeFd = -1; }
        }
        if (!detached && readFd >= 0) {
            ::close(readFd);
            readFd = -1;
        }
    }

    void send(const std::string& payload, std::optional<std::chrono::steady_clock::time_point> deadline) {
        if (!connected.load() || closing.load()) {
            throw errors::ToolHostError(errors::ErrorCategory::TransportClosed, "StdioTransport: not connected");
        }
        std::string frame;
        frame.reserve(payload.size() + 1);
        frame.append(payload);
        frame.push_back('\n');

        std::unique_lock<std::timed_mutex> lk(writeMutex, std::defer_lock);
        if (deadline) {
            if (!lk.try_lock_until(*deadline)) {
                throw errors::ToolHostError(errors::ErrorCategory::Timeout,
                                            "StdioTransport: timed out waiting for another writer");
            }
        } else {
            lk.lock();
        }
        if (writeFd < 0) {
            throw errors::ToolHostError(errors::ErrorCategory::TransportClosed, "StdioTransport: closed");
        }
        if (desynced) {
            throw errors::ToolHostError(errors::ErrorCategory::TransportClosed,
                                        "StdioTransport: stream unusable after an incomplete write");
        }

        const auto start = std::chrono::steady_clock::now();
        std::optional<std::chrono::steady_clock::time_point> limit = deadline;
        if (writeTimeout.count() > 0 && (!limit || start + writeTimeout < *limit)) {
            limit = start + writeTimeout;
        }

        std::size_t total = 0;
        while (total < frame.size()) {
            if (closing.load()) {
                throw errors::ToolHostError(errors::ErrorCategory::TransportClosed, "StdioTransport: closed during write");
            }
            ssize_t w = ::write(writeFd, frame.data() + total, frame.size() - total);
            if (w > 0) {
                total += static_cast<std::size_t>(w);
                continue;
            }
            if (w < 0 && errno == EINTR) {
                continue;
            }
            if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                int waitMs = 50;
                if (limit) {
                    const auto now = std::chrono::steady_clock::now();
                    if (now >= *limit) {
                        if (total > 0) {
                            desynced = true;
                            connected = false;
                        }
                        LOG_ERROR("StdioTransport: write timed out after {} ms ({} of {} bytes written)",
                                  static_cast<long long>(std::chrono::duration_cast<std::chrono::milliseconds>(now - start).count()),
                                  total, frame.size());
                        throw errors::ToolHostError(errors::ErrorCategory::Timeout, "StdioTransport: write timeout");
                    }
                    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*limit - now).count() + 1;
                    waitMs = static_cast<int>(std::min<long long>(waitMs, left));
                }
                pollfd pfd{};
                pfd.fd = writeFd;
                pfd.events = POLLOUT;
                (void)::poll(&pfd, 1, waitMs);
                continue;
            }
            const int err = (w < 0) ? errno : EIO;
            LOG_WARN("StdioTransport: write failed (errno={} msg={})", err, ::strerror(err));
            if (err == EPIPE) {
                connected = false;
            }
            throw errors::ToolHostError(errors::ErrorCategory::TransportClosed,
                                        fmt::format("StdioTransport: write failed: {}", ::strerror(err)));
        }
    }
};

StdioTransport::StdioTransport(int readFd, int writeFd) : pImpl(std::make_unique<Impl>(readFd, writeFd)) { FUNC_SCOPE(); }
StdioTransport::~StdioTransport() { FUNC_SCOPE(); }

std::future<void> StdioTransport::Start(FrameHandler onFrame, ErrorHandler onError) {
    FUNC_SCOPE();
    std::promise<void> promise;
    {
        std::lock_guard<std::mutex> lk(pImpl->lifecycleMutex);
        if (pImpl->started || pImpl->closed) {
            promise.set_value();
            return promise.get_future();
        }
        pImpl->started = true;
    }
    LOG_DEBUG("Starting StdioTransport {}", pImpl->sessionId);
    pImpl->frameHandler = std::move(onFrame);
    pImpl->errorHandler = std::move(onError);
    pImpl->connected = true;
    pImpl->startReader();
    promise.set_value();
    return promise.get_future();
}

std::future<void> StdioTransport::Close() {
    FUNC_SCOPE();
    LOG_DEBUG("Closing StdioTransport {}", pImpl->sessionId);
    pImpl->close();
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

bool StdioTransport::IsConnected() const { FUNC_SCOPE(); return pImpl->connected; }

std::string StdioTransport::GetSessionId() const { FUNC_SCOPE(); return pImpl->sessionId; }

void StdioTransport::SendFrame(const std::string& payload) {
    FUNC_SCOPE();
    LOG_DEBUG("Sending frame ({} bytes) on {}", payload.size(), pImpl->sessionId);
    pImpl->send(payload, std::nullopt);
}

void StdioTransport::SendFrameUntil(const std::string& payload, std::chrono::steady_clock::time_point deadline) {
    FUNC_SCOPE();
    LOG_DEBUG("Sending frame ({} bytes) on {} with deadline", payload.size(), pImpl->sessionId);
    pImpl->send(payload, deadline);
}

void StdioTransport::SetMaxLineBytes(std::size_t maxBytes) {
    FUNC_SCOPE();
    if (maxBytes == 0) { maxBytes = 1; }
    pImpl->maxLineBytes = maxBytes;
}

void StdioTransport::SetWriteTimeoutMs(uint64_t timeoutMs) {
    FUNC_SCOPE();
    pImpl->writeTimeout = std::chrono::milliseconds(timeoutMs);
}

} // namespace toolhost
