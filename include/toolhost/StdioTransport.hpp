//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.hpp
// Purpose: Newline-delimited JSON transport over the stdio pipes of a child process
//==========================================================================================================
#pragma once

#include "toolhost/Transport.h"
#include <cstddef>
#include <cstdint>
#include <memory>

namespace toolhost {

//==========================================================================================================
// StdioTransport
// Purpose: Exchanges one JSON document per line with a tool server. Reads the server's stdout on a
//          dedicated thread and writes to the server's stdin under a single-writer lock.
// Notes:
//   - Takes ownership of both descriptors; they are closed by Close() or the destructor.
//   - Any pipe pair works, which lets tests drive the transport without spawning a process.
//==========================================================================================================
class StdioTransport : public ITransport {
public:
    //==========================================================================================================
    // Args:
    //   readFd: Descriptor carrying the server's stdout (inbound frames).
    //   writeFd: Descriptor connected to the server's stdin (outbound frames).
    //==========================================================================================================
    StdioTransport(int readFd, int writeFd);
    virtual ~StdioTransport();

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    std::future<void> Start(FrameHandler onFrame, ErrorHandler onError) override;
    std::future<void> Close() override;
    bool IsConnected() const override;
    std::string GetSessionId() const override;
    void SendFrame(const std::string& payload) override;
    void SendFrameUntil(const std::string& payload, std::chrono::steady_clock::time_point deadline) override;

    //==========================================================================================================
    // SetMaxLineBytes
    // Purpose: Lines longer than this are dropped and the reader resynchronizes at the next newline.
    // Args:
    //   maxBytes: Maximum accepted frame size (default 8 MiB).
    //==========================================================================================================
    void SetMaxLineBytes(std::size_t maxBytes);

    //==========================================================================================================
    // SetWriteTimeoutMs
    // Purpose: Per-frame write timeout while the peer is not draining its stdin. A frame that
    //          times out after part of it was written leaves the stream unusable; later sends
    //          throw TransportClosed.
    // Args:
    //   timeoutMs: Milliseconds to allow for writing a frame (0 disables the timeout).
    //==========================================================================================================
    void SetWriteTimeoutMs(uint64_t timeoutMs);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolhost
