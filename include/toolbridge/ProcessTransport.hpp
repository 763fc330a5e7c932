//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessTransport.hpp
// Purpose: Transport that spawns a tool server process and talks to it over its stdin/stdout pipes
//==========================================================================================================
#pragma once

#include "toolbridge/Transport.h"
#include "toolbridge/Config.h"

#include <chrono>
#include <memory>

namespace toolbridge {

//==========================================================================================================
// ProcessTransport
// Purpose: Owns one child process. Start() forks/execs the configured command; exec failures are
//          reported synchronously through the returned future. Close() closes the child's stdin, waits
//          the grace period, then escalates to SIGTERM and SIGKILL, and always reaps the child.
//==========================================================================================================
class ProcessTransport : public ITransport {
public:
    explicit ProcessTransport(ServerConfig config,
                              std::chrono::milliseconds shutdownGrace = std::chrono::milliseconds(2000));
    ~ProcessTransport() override;

    ProcessTransport(const ProcessTransport&) = delete;
    ProcessTransport& operator=(const ProcessTransport&) = delete;

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    std::future<void> Start() override;
    std::future<void> Close() override;
    bool IsConnected() const override;
    std::string GetSessionId() const override;

    void Send(const std::string& payload) override;
    std::string Receive() override;

    std::optional<int> GetExitCode() const override;
    std::string GetStderrTail() const override;

    // Child pid while running; -1 before Start() and after reaping.
    int GetPid() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

class ProcessTransportFactory : public ITransportFactory {
public:
    explicit ProcessTransportFactory(std::chrono::milliseconds shutdownGrace = std::chrono::milliseconds(2000))
        : shutdownGrace(shutdownGrace) {}
    std::unique_ptr<ITransport> CreateTransport(const ServerConfig& config) override;

private:
    std::chrono::milliseconds shutdownGrace;
};

} // namespace toolbridge
