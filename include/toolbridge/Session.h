//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.h
// Purpose: MCP protocol session - handshake, correlation of requests/responses and notification delivery
//==========================================================================================================

#pragma once

#include "Transport.h"
#include "JSONRPCTypes.h"
#include "Protocol.h"
#include "toolbridge/errors/Errors.h"
#include "toolbridge/validation/Validation.h"
#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace toolbridge {

//==========================================================================================================
// IProtocolSession
// Purpose: Client side of one MCP conversation layered on an ITransport. All request operations return
//          futures; failures are delivered as errors::McpException set on the future.
//==========================================================================================================
class IProtocolSession {
public:
    using NotificationHandler = std::function<void(const JSONRPCNotification&)>;
    using ErrorHandler = std::function<void(const errors::McpError&)>;
    using HealthHandler = std::function<void(unsigned int consecutiveTimeouts)>;

    virtual ~IProtocolSession() = default;

    ////////////////////////////////////////// Connection management ///////////////////////////////////////////
    //==========================================================================================================
    // Starts the transport and the session's reader and timeout threads.
    // Args:
    //   transport: The channel to run on (takes ownership). Must not be started yet.
    // Returns:
    //   A future that completes when the channel is open, or holds the transport's start failure.
    //==========================================================================================================
    virtual std::future<void> Connect(std::unique_ptr<ITransport> transport) = 0;

    //==========================================================================================================
    // Closes the channel. Every pending request fails with TransportClosed. The error handler is not
    // invoked for a close requested through this call.
    //==========================================================================================================
    virtual std::future<void> Close() = 0;

    virtual bool IsConnected() const = 0;

    ////////////////////////////////////////// Protocol operations ///////////////////////////////////////////
    //==========================================================================================================
    // Performs the initialize handshake and sends notifications/initialized on success. At most one
    // handshake is ever attempted per session.
    // Args:
    //   clientInfo: Name/version announced to the peer.
    //   timeout: Deadline for the initialize reply (0 = none).
    // Returns:
    //   Future resolving to the peer's ServerInfo. Errors: HandshakeFailed (error reply, unusable result,
    //   timeout or repeated call), TransportClosed / TransportIOFailure.
    //==========================================================================================================
    virtual std::future<ServerInfo> Initialize(const Implementation& clientInfo,
                                               std::chrono::milliseconds timeout) = 0;

    //==========================================================================================================
    // Lists all tools, following nextCursor pagination. Each page gets its own `timeout`.
    // Returns:
    //   Future resolving to the tools, tagged with the server name given at construction.
    //==========================================================================================================
    virtual std::future<std::vector<Tool>> ListTools(std::chrono::milliseconds timeout) = 0;

    //==========================================================================================================
    // Invokes a tool by its unqualified name.
    // Returns:
    //   Future resolving to the tool result; a result with isError=true is a successful exchange.
    //   A JSON-RPC error reply fails with ToolError carrying the peer's code/message/data.
    //==========================================================================================================
    virtual std::future<CallToolResult> CallTool(const std::string& name, const JSONValue& arguments,
                                                 std::chrono::milliseconds timeout) = 0;

    ////////////////////////////////////////// Handlers ///////////////////////////////////////////
    // Registers a handler for one notification method; replaces any previous handler for it.
    virtual void SetNotificationHandler(const std::string& method, NotificationHandler handler) = 0;
    // Invoked once when the session dies on its own (channel closed, I/O failure, malformed frame).
    virtual void SetErrorHandler(ErrorHandler handler) = 0;
    // Invoked after each timed-out request with the running count of consecutive timeouts, and with 0
    // when a response arrives after one or more timeouts.
    virtual void SetHealthHandler(HealthHandler handler) = 0;

    virtual void SetValidationMode(validation::ValidationMode mode) = 0;
    virtual validation::ValidationMode GetValidationMode() const = 0;

    ////////////////////////////////////////// Introspection ///////////////////////////////////////////
    virtual bool IsInitialized() const = 0;
    virtual std::optional<ServerInfo> GetServerInfo() const = 0;
    virtual std::size_t GetPendingRequestCount() const = 0;
    virtual unsigned int GetConsecutiveTimeouts() const = 0;
    virtual std::optional<int> GetExitCode() const = 0;
    virtual std::string GetStderrTail() const = 0;
};

//==========================================================================================================
// ProtocolSession
// Purpose: Default IProtocolSession. One reader thread resolves pending requests by correlation id; a
//          watchdog thread expires requests whose deadline has passed.
//==========================================================================================================
class ProtocolSession : public IProtocolSession {
public:
    explicit ProtocolSession(std::string serverName);
    ~ProtocolSession() override;

    ProtocolSession(const ProtocolSession&) = delete;
    ProtocolSession& operator=(const ProtocolSession&) = delete;

    std::future<void> Connect(std::unique_ptr<ITransport> transport) override;
    std::future<void> Close() override;
    bool IsConnected() const override;

    std::future<ServerInfo> Initialize(const Implementation& clientInfo,
                                       std::chrono::milliseconds timeout) override;
    std::future<std::vector<Tool>> ListTools(std::chrono::milliseconds timeout) override;
    std::future<CallToolResult> CallTool(const std::string& name, const JSONValue& arguments,
                                         std::chrono::milliseconds timeout) override;

    void SetNotificationHandler(const std::string& method, NotificationHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;
    void SetHealthHandler(HealthHandler handler) override;
    void SetValidationMode(validation::ValidationMode mode) override;
    validation::ValidationMode GetValidationMode() const override;

    bool IsInitialized() const override;
    std::optional<ServerInfo> GetServerInfo() const override;
    std::size_t GetPendingRequestCount() const override;
    unsigned int GetConsecutiveTimeouts() const override;
    std::optional<int> GetExitCode() const override;
    std::string GetStderrTail() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolbridge
