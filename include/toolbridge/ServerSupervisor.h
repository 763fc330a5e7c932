//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerSupervisor.h
// Purpose: Lifecycle supervision of configured tool servers (connect, handshake, discovery, failure)
//==========================================================================================================

#pragma once

#include "CapabilityRegistry.h"
#include "Config.h"
#include "Protocol.h"
#include "Session.h"
#include "Transport.h"
#include "toolbridge/errors/Errors.h"
#include <chrono>
#include <cstddef>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace toolbridge {

//==========================================================================================================
// ServerState
// Purpose: Per-server lifecycle state. Only the supervisor writes it.
//   Disconnected -> Connecting -> Handshaking -> Ready -> (Disconnecting | Failed)
//==========================================================================================================
enum class ServerState {
    Disconnected,
    Connecting,
    Handshaking,
    Ready,
    Disconnecting,
    Failed
};

const char* toString(ServerState state);

// Diagnostics recorded for the last failure of a server.
struct ServerErrorDetails {
    std::string serverName;
    std::string lastError;
    errors::ErrorCategory category{errors::ErrorCategory::Unknown};
    std::chrono::system_clock::time_point errorTimestamp{};
    std::string fullCommand;
    std::optional<int> exitCode;
    std::string stderrTail;
};

//==========================================================================================================
// ServerSnapshot
// Purpose: Read-only view of one server for display. Copies, never live references.
//==========================================================================================================
struct ServerSnapshot {
    std::string name;
    std::string description;
    bool enabled{true};
    ServerState state{ServerState::Disconnected};
    std::optional<std::string> lastError;
    std::optional<std::chrono::system_clock::time_point> connectedSince;
    std::optional<std::chrono::milliseconds> connectionTime;
    std::size_t toolCount{0};
    std::vector<std::string> toolNames;
    unsigned int consecutiveTimeouts{0};
    bool degraded{false};
    std::optional<ServerInfo> serverInfo;
    uint64_t generation{0};
};

struct StatusSummary {
    std::size_t total{0};
    std::size_t ready{0};
    std::size_t disconnected{0};
    std::size_t failed{0};
    std::size_t connecting{0};  // Connecting + Handshaking
    std::size_t disconnecting{0};
};

// Catalog of one Ready server, as handed to the dispatcher.
struct ReadyServer {
    std::string name;
    std::shared_ptr<const ToolCatalog> catalog;
};

//==========================================================================================================
// ServerSupervisor
// Purpose: Owns one connection per configured server and drives its state machine. Blocking steps run
//          on an internal boost::asio::thread_pool; public operations return futures. Reconnection is
//          always caller initiated (Connect / RefreshAll); nothing reconnects in the background.
//==========================================================================================================
class ServerSupervisor {
public:
    //==========================================================================================================
    // Args:
    //   configs: Ordered server list. Duplicate names keep the first entry.
    //   factory: Creates the transport for each connection attempt.
    //   settings: Timeouts, degraded threshold and validation mode.
    //   workerThreads: Pool size; 0 picks a default sized for concurrent per-server work.
    //==========================================================================================================
    ServerSupervisor(std::vector<ServerConfig> configs,
                     std::shared_ptr<ITransportFactory> factory,
                     OrchestratorSettings settings = OrchestratorSettings{},
                     std::size_t workerThreads = 0);
    ~ServerSupervisor();

    ServerSupervisor(const ServerSupervisor&) = delete;
    ServerSupervisor& operator=(const ServerSupervisor&) = delete;

    ////////////////////////////////////////// Lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Connect
    // Purpose: Runs spawn, handshake and the first discovery for one server. A Failed server is retried
    //          from scratch. Calling it while an attempt is in flight joins that attempt.
    // Returns:
    //   Future completing once the server is Ready and its first discovery has finished (a failed first
    //   discovery is logged and leaves the server Ready with an empty catalog). Errors: ServerUnavailable
    //   (unknown or disabled server, attempt cancelled), the spawn / handshake failure otherwise.
    //==========================================================================================================
    std::future<void> Connect(const std::string& name);

    // Closes the server's session and returns it to Disconnected; its catalog is discarded.
    std::future<void> Disconnect(const std::string& name);

    //==========================================================================================================
    // RefreshAll
    // Purpose: For every enabled server, connects it when Disconnected/Failed or re-runs discovery when
    //          Ready.
    // Returns:
    //   Future resolving to server name -> success.
    //==========================================================================================================
    std::future<std::map<std::string, bool>> RefreshAll();

    // Re-runs discovery on a Ready server; resolves to the number of tools now registered.
    std::future<std::size_t> RefreshTools(const std::string& name);

    //==========================================================================================================
    // ReloadConfigs
    // Purpose: Replaces the server list. Removed servers and servers whose config changed are
    //          disconnected; new or changed servers start Disconnected.
    //==========================================================================================================
    std::future<void> ReloadConfigs(std::vector<ServerConfig> configs);

    // Enables or disables one server. Disabling disconnects it.
    std::future<void> SetServerEnabled(const std::string& name, bool enabled);

    // Disconnects every server and waits for the sessions to close.
    void Shutdown();

    ////////////////////////////////////////// Views ///////////////////////////////////////////
    std::vector<ServerConfig> GetConfigs() const;
    std::vector<ServerSnapshot> GetSnapshots() const;
    std::optional<ServerSnapshot> GetServerSnapshot(const std::string& name) const;
    std::optional<ServerErrorDetails> GetServerErrorDetails(const std::string& name) const;
    StatusSummary GetStatusSummary() const;
    std::optional<ServerState> GetState(const std::string& name) const;

    // Tools of all Ready servers in configuration order, tagged with their server name.
    std::vector<Tool> ListAvailableTools() const;

    // Catalogs of all Ready servers in configuration order.
    std::vector<ReadyServer> GetReadyServers() const;

    // Session of a Ready server, or nullptr when the server is unknown or not Ready.
    std::shared_ptr<IProtocolSession> GetReadySession(const std::string& name) const;

    // Per-call timeout for a server: its configured timeoutMs or the default call timeout.
    std::chrono::milliseconds GetCallTimeout(const std::string& name) const;

    const OrchestratorSettings& GetSettings() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolbridge
