//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcMessageRouter.h
// Purpose: Interface for JSON-RPC message routing (classification and dispatch)
//========================================================================================================

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <memory>

#include "toolbridge/JSONRPCTypes.h"

namespace toolbridge {

struct RouterHandlers {
    // Peer-initiated request; the returned response is written back by the caller.
    std::function<std::unique_ptr<JSONRPCResponse>(const JSONRPCRequest&)> requestHandler;
    std::function<void(const JSONRPCNotification&)> notificationHandler;
};

using ResponseResolver = std::function<void(JSONRPCResponse&&)>;

class IJsonRpcMessageRouter {
public:
    virtual ~IJsonRpcMessageRouter() = default;

    enum class MessageKind {
        Request,
        Response,
        Notification,
        Unknown
    };

    // Classify a parsed message by its top-level members without invoking handlers.
    virtual MessageKind classify(const JSONValue& doc) = 0;

    // Routes one inbound frame. For peer requests, returns the serialized response payload to send;
    // for responses/notifications returns std::nullopt.
    // Throws errors::McpException(MalformedMessage) when the frame is not JSON or not a JSON-RPC 2.0 message.
    virtual std::optional<std::string> route(
        const std::string& json,
        RouterHandlers& handlers,
        const ResponseResolver& resolve) = 0;
};

// Factory: returns the default router implementation
std::unique_ptr<IJsonRpcMessageRouter> MakeDefaultJsonRpcMessageRouter();

} // namespace toolbridge
