//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolDispatcher.h
// Purpose: Resolution and execution of tool invocations across Ready servers
//==========================================================================================================

#pragma once

#include "InvocationLog.h"
#include "Protocol.h"
#include "ServerSupervisor.h"
#include "toolbridge/errors/Errors.h"
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace toolbridge {

//==========================================================================================================
// ToolOutcome
// Purpose: Terminal result of one invocation. A tool that ran and reported isError=true is a failure with
//          category ToolError and keeps its result payload.
//==========================================================================================================
struct ToolOutcome {
    std::string serverName;
    std::string toolName;
    bool success{false};
    std::optional<CallToolResult> result;
    std::optional<errors::McpError> error;
    std::chrono::milliseconds latency{0};
    unsigned int attempts{0};

    std::string QualifiedName() const;

    // Text fed back into the conversation as the tool's answer.
    std::string ToModelText() const;

    // Structured form: the tools/call result on success, {"error":{category,code,message,data?}} otherwise.
    JSONValue ToJSON() const;
};

struct InvokeOptions {
    std::optional<std::chrono::milliseconds> timeout;  // default: server timeoutMs or the call timeout
    std::optional<bool> idempotent;                    // overrides the tool's annotations
    std::optional<unsigned int> maxAttempts;           // default: retryAttempts setting
};

struct ToolRequest {
    std::string toolRef;
    JSONValue arguments;
    InvokeOptions options;
};

// Provider-facing function definition for one tool.
struct FunctionDefinition {
    std::string name;         // qualified "server.tool"
    std::string description;  // "[server] description"
    JSONValue parameters;     // object schema with type, properties and required

    JSONValue ToJSON() const;
};

struct ResolvedTool {
    std::string serverName;
    Tool tool;
};

//==========================================================================================================
// ToolDispatcher
// Purpose: invoke(toolRef, args): resolves the reference against the Ready servers' catalogs, calls the
//          owning session with a timeout and bounded retries for transient failures, and appends one
//          record to the invocation log per invocation.
//==========================================================================================================
class ToolDispatcher {
public:
    explicit ToolDispatcher(ServerSupervisor& supervisor,
                            std::shared_ptr<InvocationLog> log = std::make_shared<InvocationLog>());

    //==========================================================================================================
    // Resolve
    // Purpose: Maps "server.tool" or a bare tool name to its server.
    // Throws:
    //   errors::McpException with ServerUnavailable (server known but not Ready), AmbiguousTool (bare name
    //   on several Ready servers) or UnknownTool.
    //==========================================================================================================
    ResolvedTool Resolve(const std::string& toolRef) const;

    // Runs the invocation on the calling thread. Never throws for invocation failures.
    ToolOutcome Invoke(const std::string& toolRef, const JSONValue& arguments, const InvokeOptions& options = {});

    // Runs the invocation on its own thread.
    std::future<ToolOutcome> InvokeAsync(const std::string& toolRef, const JSONValue& arguments,
                                         const InvokeOptions& options = {});

    //==========================================================================================================
    // InvokeBatch
    // Purpose: Sends the first attempt of every request before waiting on any of them, then collects the
    //          results (retrying per request) and returns outcomes in request order. Total time tracks the
    //          slowest call rather than the sum.
    //==========================================================================================================
    std::vector<ToolOutcome> InvokeBatch(const std::vector<ToolRequest>& requests);

    //==========================================================================================================
    // InvokeFunctionCall
    // Purpose: Provider entry point. `argumentsJson` is the raw argument text the provider produced; empty
    //          text means no arguments. Invalid JSON yields a MalformedMessage failure.
    //==========================================================================================================
    ToolOutcome InvokeFunctionCall(const std::string& name, const std::string& argumentsJson);

    std::vector<FunctionDefinition> GetFunctionDefinitions() const;

    InvocationLog& Log() { return *log; }
    std::shared_ptr<InvocationLog> SharedLog() const { return log; }

private:
    // One invocation between resolution and its terminal outcome
    struct PendingInvocation {
        std::string server;
        std::string toolName;
        JSONValue args;
        std::chrono::milliseconds timeout{0};
        unsigned int maxAttempts{1};
        bool canRetry{false};
        std::chrono::steady_clock::time_point started;
        unsigned int attempt{0};
        std::future<CallToolResult> inFlight;
        std::optional<errors::McpError> lastError;
        std::optional<ToolOutcome> outcome;
    };

    PendingInvocation prepare(const std::string& toolRef, const JSONValue& arguments, const InvokeOptions& options);
    void issue(PendingInvocation& p);
    ToolOutcome complete(PendingInvocation& p);
    bool retryAllowed(const Tool& tool, const InvokeOptions& options) const;
    void record(const ToolOutcome& outcome, const JSONValue& arguments);
    ToolOutcome fail(std::string serverName, std::string toolName, errors::McpError err,
                     std::chrono::steady_clock::time_point started, unsigned int attempts,
                     const JSONValue& arguments);

    ServerSupervisor& supervisor;
    std::shared_ptr<InvocationLog> log;
};

} // namespace toolbridge
