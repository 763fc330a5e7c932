//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol data structures, method names and result parsers used by the client side
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>

namespace toolbridge {
//==========================================================================================================
// MCP Protocol types and constants
// Purpose: Shared protocol structures, capabilities, and method names.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// Protocol revision announced in initialize
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information (clientInfo / serverInfo)
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Capabilities ///////////////////////////////////////////
struct ToolsCapability {
    bool listChanged = false;
};

struct ResourcesCapability {
    bool subscribe = false;
    bool listChanged = false;
};

struct PromptsCapability {
    bool listChanged = false;
};

struct LoggingCapability {
    // Presence indicates logging notifications are supported
};

struct ServerCapabilities {
    std::optional<ToolsCapability> tools;
    std::optional<ResourcesCapability> resources;
    std::optional<PromptsCapability> prompts;
    std::optional<LoggingCapability> logging;
    std::unordered_map<std::string, JSONValue> experimental;
};

//==========================================================================================================
// ServerInfo
// Purpose: What a peer reported in its initialize reply.
//==========================================================================================================
struct ServerInfo {
    Implementation implementation;
    std::string protocolVersion;
    ServerCapabilities capabilities;
    std::optional<std::string> instructions;
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
// Behavioral hints a server may attach to a tool. Absent means "not stated".
struct ToolAnnotations {
    std::optional<std::string> title;
    std::optional<bool> readOnlyHint;
    std::optional<bool> idempotentHint;
    std::optional<bool> destructiveHint;
    std::optional<bool> openWorldHint;
};

//==========================================================================================================
// Tool
// Purpose: One discovered tool. Name is unique within `serverName`; the qualified identity is
//          (serverName, name), rendered as "server.name".
//==========================================================================================================
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;  // JSON Schema for tool parameters
    std::optional<ToolAnnotations> annotations;
    std::string serverName;

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue inputSchema = JSONValue{})
        : name(std::move(name)), description(std::move(description)),
          inputSchema(std::move(inputSchema)) {}

    std::string QualifiedName() const { return serverName + "." + name; }
};

struct CallToolResult {
    std::vector<JSONValue> content;  // Array of content items
    bool isError = false;
    std::optional<JSONValue> structuredContent;
};

struct ToolsListResult {
    std::vector<Tool> tools;
    std::optional<std::string> nextCursor;
};

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    // Client to server
    constexpr const char* Initialize = "initialize";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";

    // Either direction
    constexpr const char* Ping = "ping";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* Progress = "notifications/progress";
    constexpr const char* Log = "notifications/message";
    constexpr const char* ToolListChanged = "notifications/tools/list_changed";
    constexpr const char* Cancelled = "notifications/cancelled";
}

///////////////////////////////////////// Codecs ///////////////////////////////////////////
// Build initialize params: { protocolVersion, capabilities:{}, clientInfo:{name,version} }.
JSONValue MakeInitializeParams(const Implementation& clientInfo);

// Parse an initialize result. Returns nullopt when protocolVersion or serverInfo is missing.
std::optional<ServerInfo> ParseServerInfo(const JSONValue& result);

// Parse a tools/list result. Entries without a string name are skipped with a warning; a
// missing or non-array "tools" member yields nullopt.
std::optional<ToolsListResult> ParseToolsListResult(const JSONValue& result, const std::string& serverName);

// Parse a tools/call result. A missing content array is treated as empty content.
CallToolResult ParseCallToolResult(const JSONValue& result);

// Serialize a tool back to its tools/list wire shape (used by test peers and diagnostics).
JSONValue ToolToJSON(const Tool& tool);

} // namespace toolbridge
