//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Transport channel interfaces - one framed, bidirectional message stream per tool server
//==========================================================================================================

#pragma once

#include <memory>
#include <string>
#include <functional>
#include <future>
#include <optional>
#include <cstdint>

namespace toolbridge {

struct ServerConfig;

//==========================================================================================================
// ITransport
// Purpose: A framed message channel bound to one peer. Once closed (locally, by the peer, or after an
//          I/O failure) the channel is terminal: Send and Receive throw and never recover.
// Errors:
//   errors::McpException with category TransportClosed (orderly close / peer exit) or
//   TransportIOFailure (read/write/framing failure).
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    /////////////////////////////////////////// Connection lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Opens the channel (spawns the peer process where applicable).
    // Returns:
    //   A future that completes when the channel is usable, or holds TransportIOFailure when the peer
    //   could not be started.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Closes the channel and releases the peer. Wakes any thread blocked in Receive().
    // Returns:
    //   A future that completes when the channel and peer resources are released.
    //==========================================================================================================
    virtual std::future<void> Close() = 0;

    //==========================================================================================================
    // Indicates whether the channel is open.
    //==========================================================================================================
    virtual bool IsConnected() const = 0;

    //==========================================================================================================
    // Returns a transport session identifier for diagnostics.
    //==========================================================================================================
    virtual std::string GetSessionId() const = 0;

    /////////////////////////////////////////// Message exchange ///////////////////////////////////////////
    //==========================================================================================================
    // Writes one message as a single frame. Safe to call from multiple threads.
    // Args:
    //   payload: Serialized JSON text (must not contain a raw newline under newline framing).
    //==========================================================================================================
    virtual void Send(const std::string& payload) = 0;

    //==========================================================================================================
    // Blocks until one complete frame is available and returns its payload. Partial input is buffered
    // across calls. Intended for a single reader thread.
    //==========================================================================================================
    virtual std::string Receive() = 0;

    /////////////////////////////////////////// Diagnostics ///////////////////////////////////////////
    // Exit status of the peer process once it has been reaped; nullopt for in-process channels.
    virtual std::optional<int> GetExitCode() const { return std::nullopt; }

    // Tail of the peer's stderr when capture is enabled; empty otherwise.
    virtual std::string GetStderrTail() const { return std::string(); }
};

//==========================================================================================================
// Transport factory interface
// Purpose: Creates channels for configured servers. The supervisor owns one factory.
//==========================================================================================================
class ITransportFactory {
public:
    virtual ~ITransportFactory() = default;

    //==========================================================================================================
    // Creates a transport instance for the given server. The returned channel is not yet started.
    //==========================================================================================================
    virtual std::unique_ptr<ITransport> CreateTransport(const ServerConfig& config) = 0;
};

} // namespace toolbridge
