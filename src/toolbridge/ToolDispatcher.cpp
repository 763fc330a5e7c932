//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolDispatcher.cpp
// Purpose: Tool resolution, invocation with retries, and provider-facing definitions
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <future>
#include <thread>

#include "logging/Logger.h"
#include "toolbridge/ToolDispatcher.h"

namespace toolbridge {

using errors::ErrorCategory;
using errors::McpError;
using errors::McpException;

namespace {

JSONValue callResultToJSON(const CallToolResult& r) {
    JSONValue::Object o;
    JSONValue::Array content;
    for (const auto& item : r.content) {
        content.push_back(std::make_shared<JSONValue>(item));
    }
    o["content"] = std::make_shared<JSONValue>(content);
    o["isError"] = std::make_shared<JSONValue>(r.isError);
    if (r.structuredContent.has_value()) {
        o["structuredContent"] = std::make_shared<JSONValue>(r.structuredContent.value());
    }
    return JSONValue{o};
}

// Joined text of all text items, or nullopt when any item is not text.
std::optional<std::string> textOnly(const CallToolResult& r) {
    std::string out;
    for (const auto& item : r.content) {
        auto type = GetStringMember(item, "type");
        auto text = GetStringMember(item, "text");
        if (!type.has_value() || *type != "text" || !text.has_value()) {
            return std::nullopt;
        }
        if (!out.empty()) {
            out.push_back('\n');
        }
        out += *text;
    }
    return out;
}

bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace

////////////////////////////////////////// ToolOutcome ///////////////////////////////////////////
std::string ToolOutcome::QualifiedName() const {
    return serverName.empty() ? toolName : serverName + "." + toolName;
}

std::string ToolOutcome::ToModelText() const {
    if (!success) {
        return "Error: " + (error.has_value() ? error->message : std::string("unknown failure"));
    }
    if (!result.has_value() || (result->content.empty() && !result->structuredContent.has_value())) {
        return "Tool executed successfully with no output.";
    }
    if (!result->content.empty()) {
        if (auto text = textOnly(result.value())) {
            return *text;
        }
    }
    return SerializeJSON(callResultToJSON(result.value()));
}

JSONValue ToolOutcome::ToJSON() const {
    if (success && result.has_value()) {
        return callResultToJSON(result.value());
    }
    JSONValue::Object err;
    const McpError e = error.value_or(errors::makeError(ErrorCategory::Unknown, "unknown failure"));
    err["category"] = std::make_shared<JSONValue>(std::string(errors::toString(e.category)));
    err["code"] = std::make_shared<JSONValue>(static_cast<int64_t>(e.code));
    err["message"] = std::make_shared<JSONValue>(e.message);
    if (e.data.has_value()) {
        err["data"] = std::make_shared<JSONValue>(e.data.value());
    }
    JSONValue::Object o;
    o["error"] = std::make_shared<JSONValue>(err);
    if (result.has_value()) {
        o["result"] = std::make_shared<JSONValue>(callResultToJSON(result.value()));
    }
    return JSONValue{o};
}

JSONValue FunctionDefinition::ToJSON() const {
    JSONValue::Object o;
    o["name"] = std::make_shared<JSONValue>(name);
    o["description"] = std::make_shared<JSONValue>(description);
    o["parameters"] = std::make_shared<JSONValue>(parameters);
    return JSONValue{o};
}

////////////////////////////////////////// ToolDispatcher ///////////////////////////////////////////
ToolDispatcher::ToolDispatcher(ServerSupervisor& supervisor, std::shared_ptr<InvocationLog> log)
    : supervisor(supervisor), log(std::move(log)) {
    FUNC_SCOPE();
}

ResolvedTool ToolDispatcher::Resolve(const std::string& toolRef) const {
    const auto ready = supervisor.GetReadyServers();

    // Qualified form: the longest configured server name followed by '.'
    std::string owner;
    for (const auto& cfg : supervisor.GetConfigs()) {
        if (toolRef.size() > cfg.name.size() + 1 && toolRef.compare(0, cfg.name.size(), cfg.name) == 0 &&
            toolRef[cfg.name.size()] == '.' && cfg.name.size() > owner.size()) {
            owner = cfg.name;
        }
    }
    if (!owner.empty()) {
        const std::string toolName = toolRef.substr(owner.size() + 1);
        auto it = std::find_if(ready.begin(), ready.end(), [&](const ReadyServer& r) { return r.name == owner; });
        if (it == ready.end()) {
            auto state = supervisor.GetState(owner);
            throw McpException(ErrorCategory::ServerUnavailable,
                               "server '" + owner + "' is not ready (" +
                               std::string(state.has_value() ? toString(state.value()) : "unknown") + ")");
        }
        const Tool* t = it->catalog->Find(toolName);
        if (t == nullptr) {
            throw McpException(ErrorCategory::UnknownTool, "tool '" + toolName + "' not found on server '" + owner + "'");
        }
        return ResolvedTool{ owner, *t };
    }

    std::vector<ResolvedTool> matches;
    for (const auto& r : ready) {
        if (const Tool* t = r.catalog->Find(toolRef)) {
            matches.push_back(ResolvedTool{ r.name, *t });
        }
    }
    if (matches.empty()) {
        throw McpException(ErrorCategory::UnknownTool, "tool '" + toolRef + "' not found on any ready server");
    }
    if (matches.size() > 1) {
        std::string servers;
        for (const auto& m : matches) {
            servers += servers.empty() ? m.serverName : ", " + m.serverName;
        }
        throw McpException(ErrorCategory::AmbiguousTool,
                           "tool '" + toolRef + "' is provided by several servers (" + servers +
                           "); qualify it as <server>." + toolRef);
    }
    return matches.front();
}

bool ToolDispatcher::retryAllowed(const Tool& tool, const InvokeOptions& options) const {
    if (options.idempotent.has_value()) {
        return options.idempotent.value();
    }
    if (tool.annotations.has_value()) {
        const auto& a = tool.annotations.value();
        if (a.readOnlyHint.value_or(false) || a.idempotentHint.value_or(false)) {
            return true;
        }
        if (a.idempotentHint.has_value() || a.destructiveHint.value_or(false)) {
            return false;
        }
    }
    return supervisor.GetSettings().retryUnknownIdempotency;
}

void ToolDispatcher::record(const ToolOutcome& outcome, const JSONValue& arguments) {
    ToolInvocationRecord r;
    r.serverName = outcome.serverName;
    r.toolName = outcome.toolName;
    r.arguments = arguments;
    r.success = outcome.success;
    if (outcome.result.has_value()) {
        r.result = callResultToJSON(outcome.result.value());
    }
    if (outcome.error.has_value()) {
        r.errorCategory = outcome.error->category;
        r.errorMessage = outcome.error->message;
    }
    r.latency = outcome.latency;
    r.timestamp = std::chrono::system_clock::now();
    r.attempts = outcome.attempts;
    log->Append(std::move(r));
}

ToolOutcome ToolDispatcher::fail(std::string serverName, std::string toolName, McpError err,
                                 std::chrono::steady_clock::time_point started, unsigned int attempts,
                                 const JSONValue& arguments) {
    ToolOutcome o;
    o.serverName = std::move(serverName);
    o.toolName = std::move(toolName);
    o.success = false;
    o.attempts = attempts;
    o.latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    LOG_ERROR("Tool {} failed ({}): {}", o.QualifiedName(), errors::toString(err.category), err.message);
    o.error = std::move(err);
    record(o, arguments);
    return o;
}

ToolDispatcher::PendingInvocation ToolDispatcher::prepare(const std::string& toolRef, const JSONValue& arguments,
                                                         const InvokeOptions& options) {
    PendingInvocation p;
    p.started = std::chrono::steady_clock::now();
    p.args = arguments.isNull() ? JSONValue{JSONValue::Object{}} : arguments;

    ResolvedTool resolved;
    try {
        resolved = Resolve(toolRef);
    } catch (const McpException& e) {
        p.outcome = fail(std::string(), toolRef, e.error(), p.started, 0, p.args);
        return p;
    }
    p.server = resolved.serverName;
    p.toolName = resolved.tool.name;
    if (!p.args.isObject()) {
        p.outcome = fail(p.server, p.toolName,
                         errors::makeError(ErrorCategory::MalformedMessage,
                                           "arguments for '" + toolRef + "' must be a JSON object"),
                         p.started, 0, p.args);
        return p;
    }

    p.timeout = options.timeout.value_or(supervisor.GetCallTimeout(p.server));
    p.maxAttempts = std::max(1u, options.maxAttempts.value_or(supervisor.GetSettings().retryAttempts));
    p.canRetry = retryAllowed(resolved.tool, options);
    LOG_INFO("Invoking {}.{} (timeout {} ms)", p.server, p.toolName, p.timeout.count());
    return p;
}

void ToolDispatcher::issue(PendingInvocation& p) {
    ++p.attempt;
    auto session = supervisor.GetReadySession(p.server);
    if (!session) {
        // A transient failure that took the session down is the better explanation
        McpError err = p.lastError.has_value()
                           ? p.lastError.value()
                           : errors::makeError(ErrorCategory::ServerUnavailable, "server '" + p.server + "' is not ready");
        p.outcome = fail(p.server, p.toolName, std::move(err), p.started, p.attempt - 1, p.args);
        return;
    }
    try {
        p.inFlight = session->CallTool(p.toolName, p.args, p.timeout);
    } catch (...) {
        std::promise<CallToolResult> failed;
        failed.set_exception(std::current_exception());
        p.inFlight = failed.get_future();
    }
}

ToolOutcome ToolDispatcher::complete(PendingInvocation& p) {
    const auto& settings = supervisor.GetSettings();
    while (!p.outcome.has_value()) {
        if (!p.inFlight.valid()) {
            issue(p);
            continue;
        }
        try {
            CallToolResult result = p.inFlight.get();
            ToolOutcome o;
            o.serverName = p.server;
            o.toolName = p.toolName;
            o.attempts = p.attempt;
            o.latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - p.started);
            if (result.isError) {
                auto text = textOnly(result);
                const std::string message = (text.has_value() && !text->empty()) ? *text : "tool reported an error";
                o.error = errors::makeError(ErrorCategory::ToolError, message);
                LOG_WARN("Tool {} reported an error: {}", o.QualifiedName(), message);
            } else {
                o.success = true;
                LOG_INFO("Tool {} completed in {} ms", o.QualifiedName(), o.latency.count());
            }
            o.result = std::move(result);
            record(o, p.args);
            p.outcome = std::move(o);
        } catch (const McpException& e) {
            if (errors::isTransient(e.category()) && p.attempt < p.maxAttempts) {
                if (p.canRetry) {
                    LOG_WARN("{}.{} attempt {}/{} failed ({}): {}; retrying in {} ms", p.server, p.toolName, p.attempt,
                             p.maxAttempts, errors::toString(e.category()), e.what(), settings.retryBackoff.count());
                    p.lastError = e.error();
                    std::this_thread::sleep_for(settings.retryBackoff);
                    continue;
                }
                LOG_DEBUG("Not retrying {}.{}: tool is not known to be idempotent", p.server, p.toolName);
            }
            p.outcome = fail(p.server, p.toolName, e.error(), p.started, p.attempt, p.args);
        } catch (const std::exception& e) {
            p.outcome = fail(p.server, p.toolName, errors::makeError(ErrorCategory::Unknown, e.what()), p.started,
                             p.attempt, p.args);
        }
    }
    return std::move(p.outcome.value());
}

ToolOutcome ToolDispatcher::Invoke(const std::string& toolRef, const JSONValue& arguments,
                                   const InvokeOptions& options) {
    FUNC_SCOPE();
    PendingInvocation p = prepare(toolRef, arguments, options);
    return complete(p);
}

std::future<ToolOutcome> ToolDispatcher::InvokeAsync(const std::string& toolRef, const JSONValue& arguments,
                                                     const InvokeOptions& options) {
    return std::async(std::launch::async, [this, toolRef, arguments, options]() {
        return Invoke(toolRef, arguments, options);
    });
}

std::vector<ToolOutcome> ToolDispatcher::InvokeBatch(const std::vector<ToolRequest>& requests) {
    FUNC_SCOPE();
    std::vector<PendingInvocation> pending;
    pending.reserve(requests.size());
    for (const auto& r : requests) {
        pending.push_back(prepare(r.toolRef, r.arguments, r.options));
    }
    // Every first attempt is on the wire before any result is awaited
    for (auto& p : pending) {
        if (!p.outcome.has_value()) {
            issue(p);
        }
    }
    std::vector<ToolOutcome> outcomes;
    outcomes.reserve(pending.size());
    for (auto& p : pending) {
        outcomes.push_back(complete(p));
    }
    return outcomes;
}

ToolOutcome ToolDispatcher::InvokeFunctionCall(const std::string& name, const std::string& argumentsJson) {
    FUNC_SCOPE();
    JSONValue args{JSONValue::Object{}};
    if (!isBlank(argumentsJson)) {
        try {
            args = ParseJSON(argumentsJson);
        } catch (const std::exception& e) {
            return fail(std::string(), name,
                        errors::makeError(ErrorCategory::MalformedMessage,
                                          std::string("Invalid function arguments JSON: ") + e.what()),
                        std::chrono::steady_clock::now(), 0, JSONValue{argumentsJson});
        }
    }
    return Invoke(name, args);
}

std::vector<FunctionDefinition> ToolDispatcher::GetFunctionDefinitions() const {
    std::vector<FunctionDefinition> defs;
    for (const auto& ready : supervisor.GetReadyServers()) {
        for (const auto& tool : ready.catalog->tools) {
            FunctionDefinition d;
            d.name = ready.name + "." + tool.name;
            d.description = "[" + ready.name + "] " + tool.description;
            JSONValue::Object params;
            if (tool.inputSchema.isObject()) {
                params = std::get<JSONValue::Object>(tool.inputSchema.value);
            }
            if (params.find("type") == params.end()) {
                params["type"] = std::make_shared<JSONValue>(std::string("object"));
            }
            if (params.find("properties") == params.end()) {
                params["properties"] = std::make_shared<JSONValue>(JSONValue::Object{});
            }
            if (params.find("required") == params.end()) {
                params["required"] = std::make_shared<JSONValue>(JSONValue::Array{});
            }
            d.parameters = JSONValue{params};
            defs.push_back(std::move(d));
        }
    }
    return defs;
}

} // namespace toolbridge
