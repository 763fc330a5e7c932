//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.h
// Purpose: Tool server launch configuration and orchestrator settings
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "toolbridge/ContentFramer.h"
#include "toolbridge/JSONRPCTypes.h"
#include "toolbridge/validation/Validation.h"

namespace toolbridge {

//==========================================================================================================
// ServerConfig
// Purpose: Launch spec and identity of one tool server. The supervisor never changes it apart from the
//          enabled flag, which SetServerEnabled toggles in place.
// Fields:
//   name: Unique server identity; also the prefix of qualified tool names.
//   command/args: Executable (resolved through PATH) and its arguments.
//   env: Overrides applied on top of the parent environment.
//   cwd: Working directory for the child; inherited when unset.
//   timeoutMs: Per-server default call timeout overriding the orchestrator default.
//   captureStderr: Keep a bounded tail of the child's stderr for error details instead of inheriting it.
//==========================================================================================================
struct ServerConfig {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::string description;
    bool enabled{true};
    std::vector<std::pair<std::string, std::string>> env;
    std::optional<std::string> cwd;
    FramingMode framing{FramingMode::Newline};
    std::optional<uint64_t> timeoutMs;
    bool captureStderr{false};

    // Command line as a single display string ("cmd arg1 arg2")
    std::string FullCommand() const;

    bool operator==(const ServerConfig& other) const;
    bool operator!=(const ServerConfig& other) const { return !(*this == other); }
};

//==========================================================================================================
// ParseServerConfigs
// Purpose: Build ServerConfig records from a parsed document. Accepted shapes:
//   - an array of server objects
//   - an object with a "servers" array
//   - an object with a "mcpServers" member, either an array or an object keyed by server name
// Invalid entries (missing name/command, bad framing, duplicate name) are logged and skipped.
//==========================================================================================================
std::vector<ServerConfig> ParseServerConfigs(const JSONValue& doc);

//==========================================================================================================
// LoadServerConfigs
// Purpose: Read and parse a server list file.
// Throws:
//   std::runtime_error when the file cannot be read, is not valid JSON, or has an unsupported shape.
//==========================================================================================================
std::vector<ServerConfig> LoadServerConfigs(const std::string& path);

// Serialize configs back to the array shape. SaveServerConfigs throws std::runtime_error on I/O failure.
JSONValue ServerConfigsToJSON(const std::vector<ServerConfig>& configs);
void SaveServerConfigs(const std::string& path, const std::vector<ServerConfig>& configs);

//==========================================================================================================
// OrchestratorSettings
// Purpose: Timeouts, retry policy and limits shared by the supervisor, dispatcher and invocation loop.
//==========================================================================================================
struct OrchestratorSettings {
    std::string serversConfigPath{"config/mcp_servers.json"};
    std::chrono::milliseconds callTimeout{30000};
    std::chrono::milliseconds handshakeTimeout{10000};
    std::chrono::milliseconds discoveryTimeout{10000};
    unsigned int retryAttempts{3};
    std::chrono::milliseconds retryBackoff{250};
    bool retryUnknownIdempotency{true};
    unsigned int degradedThreshold{3};
    std::chrono::milliseconds shutdownGrace{2000};
    unsigned int maxTurns{5};
    std::string logLevel{"INFO"};
    std::optional<std::string> logFile;
    validation::ValidationMode validation{validation::ValidationMode::Off};

    // Read TOOLBRIDGE_* variables; malformed numbers keep the defaults above.
    static OrchestratorSettings FromEnvironment();
};

// Apply logLevel/logFile to the process-wide Logger.
void ApplyLoggingSettings(const OrchestratorSettings& settings);

} // namespace toolbridge
