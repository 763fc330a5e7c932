//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: Encoders/decoders for initialize, tools/list and tools/call payloads
//==========================================================================================================

#include "toolbridge/Protocol.h"
#include "logging/Logger.h"

namespace toolbridge {

namespace {
ServerCapabilities parseServerCapabilities(const JSONValue& caps) {
    ServerCapabilities out;
    if (!caps.isObject()) {
        return out;
    }
    const auto& capsObj = std::get<JSONValue::Object>(caps.value);

    auto expIt = capsObj.find("experimental");
    if (expIt != capsObj.end() && expIt->second && expIt->second->isObject()) {
        for (const auto& [k, v] : std::get<JSONValue::Object>(expIt->second->value)) {
            if (v) out.experimental[k] = *v;
        }
    }

    if (const JSONValue* tools = FindMember(caps, "tools")) {
        ToolsCapability tc;
        tc.listChanged = GetBoolMember(*tools, "listChanged").value_or(false);
        out.tools = tc;
    }
    if (const JSONValue* res = FindMember(caps, "resources")) {
        ResourcesCapability rc;
        rc.subscribe = GetBoolMember(*res, "subscribe").value_or(false);
        rc.listChanged = GetBoolMember(*res, "listChanged").value_or(false);
        out.resources = rc;
    }
    if (const JSONValue* prompts = FindMember(caps, "prompts")) {
        PromptsCapability pc;
        pc.listChanged = GetBoolMember(*prompts, "listChanged").value_or(false);
        out.prompts = pc;
    }
    if (FindMember(caps, "logging") != nullptr) {
        out.logging = LoggingCapability{};
    }
    return out;
}

std::optional<ToolAnnotations> parseAnnotations(const JSONValue& toolObj) {
    const JSONValue* a = FindMember(toolObj, "annotations");
    if (a == nullptr || !a->isObject()) {
        return std::nullopt;
    }
    ToolAnnotations ann;
    ann.title = GetStringMember(*a, "title");
    ann.readOnlyHint = GetBoolMember(*a, "readOnlyHint");
    ann.idempotentHint = GetBoolMember(*a, "idempotentHint");
    ann.destructiveHint = GetBoolMember(*a, "destructiveHint");
    ann.openWorldHint = GetBoolMember(*a, "openWorldHint");
    return ann;
}
} // namespace

JSONValue MakeInitializeParams(const Implementation& clientInfo) {
    JSONValue::Object paramsObj;
    paramsObj["protocolVersion"] = std::make_shared<JSONValue>(std::string(PROTOCOL_VERSION));
    paramsObj["capabilities"] = std::make_shared<JSONValue>(JSONValue::Object{});
    JSONValue::Object ci;
    ci["name"] = std::make_shared<JSONValue>(clientInfo.name);
    ci["version"] = std::make_shared<JSONValue>(clientInfo.version);
    paramsObj["clientInfo"] = std::make_shared<JSONValue>(ci);
    return JSONValue{paramsObj};
}

std::optional<ServerInfo> ParseServerInfo(const JSONValue& result) {
    FUNC_SCOPE();
    if (!result.isObject()) {
        return std::nullopt;
    }
    auto version = GetStringMember(result, "protocolVersion");
    const JSONValue* si = FindMember(result, "serverInfo");
    if (!version.has_value() || si == nullptr || !si->isObject()) {
        return std::nullopt;
    }
    ServerInfo info;
    info.protocolVersion = *version;
    info.implementation.name = GetStringMember(*si, "name").value_or("");
    info.implementation.version = GetStringMember(*si, "version").value_or("");
    if (const JSONValue* caps = FindMember(result, "capabilities")) {
        info.capabilities = parseServerCapabilities(*caps);
    }
    info.instructions = GetStringMember(result, "instructions");
    return info;
}

std::optional<ToolsListResult> ParseToolsListResult(const JSONValue& result, const std::string& serverName) {
    FUNC_SCOPE();
    const JSONValue* toolsV = FindMember(result, "tools");
    if (toolsV == nullptr || !toolsV->isArray()) {
        return std::nullopt;
    }
    ToolsListResult out;
    for (const auto& toolJson : std::get<JSONValue::Array>(toolsV->value)) {
        if (!toolJson || !toolJson->isObject()) {
            LOG_WARN("tools/list from '{}': skipping non-object entry", serverName);
            continue;
        }
        auto name = GetStringMember(*toolJson, "name");
        if (!name.has_value() || name->empty()) {
            LOG_WARN("tools/list from '{}': skipping entry without a name", serverName);
            continue;
        }
        Tool tool;
        tool.name = *name;
        tool.description = GetStringMember(*toolJson, "description").value_or("");
        if (const JSONValue* schema = FindMember(*toolJson, "inputSchema")) {
            tool.inputSchema = *schema;
        } else {
            JSONValue::Object empty;
            empty["type"] = std::make_shared<JSONValue>("object");
            tool.inputSchema = JSONValue{empty};
        }
        tool.annotations = parseAnnotations(*toolJson);
        tool.serverName = serverName;
        out.tools.push_back(std::move(tool));
    }
    if (const JSONValue* nc = FindMember(result, "nextCursor")) {
        if (std::holds_alternative<std::string>(nc->value)) out.nextCursor = std::get<std::string>(nc->value);
        else if (std::holds_alternative<int64_t>(nc->value)) out.nextCursor = std::to_string(std::get<int64_t>(nc->value));
    }
    if (out.nextCursor.has_value() && out.nextCursor->empty()) {
        out.nextCursor.reset();
    }
    return out;
}

CallToolResult ParseCallToolResult(const JSONValue& result) {
    CallToolResult out;
    if (const JSONValue* content = FindMember(result, "content")) {
        if (content->isArray()) {
            for (const auto& item : std::get<JSONValue::Array>(content->value)) {
                if (item) out.content.push_back(*item);
            }
        }
    }
    out.isError = GetBoolMember(result, "isError").value_or(false);
    if (const JSONValue* sc = FindMember(result, "structuredContent")) {
        out.structuredContent = *sc;
    }
    return out;
}

JSONValue ToolToJSON(const Tool& tool) {
    JSONValue::Object obj;
    obj["name"] = std::make_shared<JSONValue>(tool.name);
    obj["description"] = std::make_shared<JSONValue>(tool.description);
    obj["inputSchema"] = std::make_shared<JSONValue>(tool.inputSchema);
    if (tool.annotations.has_value()) {
        const auto& a = tool.annotations.value();
        JSONValue::Object ann;
        if (a.title) ann["title"] = std::make_shared<JSONValue>(*a.title);
        if (a.readOnlyHint) ann["readOnlyHint"] = std::make_shared<JSONValue>(*a.readOnlyHint);
        if (a.idempotentHint) ann["idempotentHint"] = std::make_shared<JSONValue>(*a.idempotentHint);
        if (a.destructiveHint) ann["destructiveHint"] = std::make_shared<JSONValue>(*a.destructiveHint);
        if (a.openWorldHint) ann["openWorldHint"] = std::make_shared<JSONValue>(*a.openWorldHint);
        obj["annotations"] = std::make_shared<JSONValue>(ann);
    }
    return JSONValue{obj};
}

} // namespace toolbridge
