//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Frame transport interface between the host and one tool-server process
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <string>

namespace toolhost {

//==========================================================================================================
// ITransport
// Purpose: Moves raw protocol frames (one JSON document each) to and from a single peer.
//          Frame interpretation belongs to JsonRpcClient.
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    //==========================================================================================================
    // Callback invoked on the reader thread for every received frame (without its terminator).
    //==========================================================================================================
    using FrameHandler = std::function<void(const std::string& frame)>;

    //==========================================================================================================
    // Callback invoked once when the peer goes away (EOF, hang-up, read error).
    //==========================================================================================================
    using ErrorHandler = std::function<void(const std::string& error)>;

    /////////////////////////////////////////// Connection lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Starts the reader loop.
    // Args:
    //   onFrame: Receives every complete inbound frame.
    //   onError: Receives the reason when the inbound side closes.
    // Returns:
    //   A future that completes when the transport is running.
    //==========================================================================================================
    virtual std::future<void> Start(FrameHandler onFrame, ErrorHandler onError) = 0;

    //==========================================================================================================
    // Stops the reader loop and releases the underlying descriptors.
    // Returns:
    //   A future that completes when the transport has closed.
    //==========================================================================================================
    virtual std::future<void> Close() = 0;

    //==========================================================================================================
    // Indicates whether both directions are still usable.
    //==========================================================================================================
    virtual bool IsConnected() const = 0;

    //==========================================================================================================
    // Returns a transport session identifier for diagnostics.
    //==========================================================================================================
    virtual std::string GetSessionId() const = 0;

    /////////////////////////////////////////// Frame sending ///////////////////////////////////////////
    //==========================================================================================================
    // Writes one frame. Concurrent callers are serialized so frames never interleave.
    // Args:
    //   payload: Serialized JSON document without terminator.
    // Throws:
    //   errors::ToolHostError(TransportClosed) when the peer is gone or the write fails.
    //==========================================================================================================
    virtual void SendFrame(const std::string& payload) = 0;

    //==========================================================================================================
    // Writes one frame, giving up at deadline. Time spent waiting behind other writers counts.
    // Throws:
    //   errors::ToolHostError(Timeout) when the deadline passes before the frame is written.
    //   errors::ToolHostError(TransportClosed) as for SendFrame.
    //==========================================================================================================
    virtual void SendFrameUntil(const std::string& payload, std::chrono::steady_clock::time_point deadline) = 0;
};

} // namespace toolhost
