//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.hpp
// Purpose: In-memory paired transport for tests and embedding
//==========================================================================================================
#pragma once

#include "toolbridge/Transport.h"
#include <functional>
#include <memory>
#include <utility>

namespace toolbridge {

//==========================================================================================================
// InMemoryTransport
// Purpose: In-process channel end. Messages sent on one end are received on the other in order. Closing
//          either end closes the link for both; messages already queued stay readable, after which
//          Receive() throws TransportClosed (the same order a pipe delivers data before EOF).
//==========================================================================================================
class InMemoryTransport : public ITransport {
public:
    ~InMemoryTransport() override;

    //==========================================================================================================
    // CreatePair
    // Purpose: Creates two paired transports wired to each other in-memory.
    // Returns:
    //   pair(client, peer) where sending on one delivers to the other.
    //==========================================================================================================
    static std::pair<std::unique_ptr<InMemoryTransport>, std::unique_ptr<InMemoryTransport>> CreatePair(
        const std::string& label = "memory");

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    std::future<void> Start() override;
    std::future<void> Close() override;
    bool IsConnected() const override;
    std::string GetSessionId() const override;
    void Send(const std::string& payload) override;
    std::string Receive() override;

    //==========================================================================================================
    // FailStart
    // Purpose: Makes the next Start() fail with TransportIOFailure, simulating a peer that cannot launch.
    //==========================================================================================================
    void FailStart(const std::string& message);

    //==========================================================================================================
    // CloseWithError
    // Purpose: Terminates the link with TransportIOFailure instead of an orderly close.
    //==========================================================================================================
    void CloseWithError(const std::string& message);

private:
    struct Link;
    InMemoryTransport(std::shared_ptr<Link> link, int side, std::string sessionId);

    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// InMemoryTransportFactory
// Purpose: Creates a fresh pair per CreateTransport() call, returns the client end and hands the peer end
//          to `onPeer`. When onPeer returns false the client's Start() fails as a launch failure would.
//==========================================================================================================
class InMemoryTransportFactory : public ITransportFactory {
public:
    using PeerHandler = std::function<bool(const ServerConfig&, std::unique_ptr<InMemoryTransport> peer)>;

    explicit InMemoryTransportFactory(PeerHandler onPeer) : onPeer(std::move(onPeer)) {}
    std::unique_ptr<ITransport> CreateTransport(const ServerConfig& config) override;

private:
    PeerHandler onPeer;
};

} // namespace toolbridge
