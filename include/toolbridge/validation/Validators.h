//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Validators.h
// Purpose: Lightweight validators for initialize, tools/list and tools/call result shapes
//==========================================================================================================

#pragma once

#include <string>
#include <optional>
#include <vector>
#include "toolbridge/Protocol.h"

namespace toolbridge {
namespace validation {

//------------------------------ Primitive content checks ------------------------------
// A content item is an object with a string "type"; text items must also carry a string "text".
inline bool isContentItem(const JSONValue& v) {
    auto type = GetStringMember(v, "type");
    if (!type.has_value()) return false;
    if (*type == "text") {
        return GetStringMember(v, "text").has_value();
    }
    return true;
}

//------------------------------ JSON validators (raw peer results) ------------------------------
inline bool validateInitializeResultJson(const JSONValue& v) {
    if (!GetStringMember(v, "protocolVersion").has_value()) return false;
    const JSONValue* si = FindMember(v, "serverInfo");
    if (si == nullptr || !GetStringMember(*si, "name").has_value()) return false;
    const JSONValue* caps = FindMember(v, "capabilities");
    return caps != nullptr && caps->isObject();
}

inline bool validateToolsListResultJson(const JSONValue& v) {
    const JSONValue* tools = FindMember(v, "tools");
    if (tools == nullptr || !tools->isArray()) return false;
    for (const auto& p : std::get<JSONValue::Array>(tools->value)) {
        if (!p || !GetStringMember(*p, "name").has_value()) return false;
        const JSONValue* schema = FindMember(*p, "inputSchema");
        if (schema == nullptr || !schema->isObject()) return false;
    }
    if (const JSONValue* nc = FindMember(v, "nextCursor")) {
        if (!nc->isString() && !nc->isNull()) return false;
    }
    return true;
}

inline bool validateCallToolResultJson(const JSONValue& v) {
    const JSONValue* content = FindMember(v, "content");
    if (content == nullptr || !content->isArray()) return false;
    for (const auto& p : std::get<JSONValue::Array>(content->value)) {
        if (!p || !isContentItem(*p)) return false;
    }
    if (const JSONValue* e = FindMember(v, "isError")) {
        if (!std::holds_alternative<bool>(e->value)) return false;
    }
    return true;
}

} // namespace validation
} // namespace toolbridge
