//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcMessageRouter.cpp
// Purpose: Default implementation for JSON-RPC message routing
//========================================================================================================

#include <optional>
#include <string>

#include "logging/Logger.h"
#include "toolbridge/JsonRpcMessageRouter.h"
#include "toolbridge/JSONRPCTypes.h"
#include "toolbridge/errors/Errors.h"

namespace toolbridge {

using errors::ErrorCategory;
using errors::McpException;

namespace {
class JsonRpcMessageRouter : public IJsonRpcMessageRouter {
public:
    MessageKind classify(const JSONValue& doc) override {
        if (!doc.isObject()) {
            return MessageKind::Unknown;
        }
        const bool hasMethod = FindMember(doc, "method") != nullptr;
        const bool hasId = FindMember(doc, "id") != nullptr;
        if (!hasMethod && (FindMember(doc, "result") != nullptr || FindMember(doc, "error") != nullptr)) {
            return MessageKind::Response;
        }
        if (!hasMethod) {
            // {"id":..,"result":null} parses result as a present null member
            const auto& o = std::get<JSONValue::Object>(doc.value);
            if (o.find("result") != o.end()) return MessageKind::Response;
            return MessageKind::Unknown;
        }
        return hasId ? MessageKind::Request : MessageKind::Notification;
    }

    std::optional<std::string> route(
        const std::string& json,
        RouterHandlers& handlers,
        const ResponseResolver& resolve) override {
        JSONValue doc;
        try {
            doc = ParseJSON(json);
        } catch (const std::exception& e) {
            throw McpException(ErrorCategory::MalformedMessage, std::string("invalid JSON from peer: ") + e.what());
        }
        if (auto ver = GetStringMember(doc, "jsonrpc"); !ver.has_value() || *ver != "2.0") {
            throw McpException(ErrorCategory::MalformedMessage, "message is not JSON-RPC 2.0");
        }

        switch (classify(doc)) {
            case MessageKind::Response: {
                JSONRPCResponse response;
                if (!response.FromJSONValue(doc)) {
                    throw McpException(ErrorCategory::MalformedMessage, "malformed JSON-RPC response");
                }
                resolve(std::move(response));
                return std::nullopt;
            }
            case MessageKind::Request: {
                JSONRPCRequest request;
                if (!request.FromJSONValue(doc)) {
                    throw McpException(ErrorCategory::MalformedMessage, "malformed JSON-RPC request");
                }
                std::unique_ptr<JSONRPCResponse> resp;
                if (handlers.requestHandler) {
                    try {
                        resp = handlers.requestHandler(request);
                    } catch (const std::exception& e) {
                        LOG_ERROR("Request handler exception: {}", e.what());
                        resp = CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, e.what());
                    }
                }
                if (!resp) {
                    resp = CreateErrorResponse(request.id, JSONRPCErrorCodes::MethodNotFound,
                                               "Method not found: " + request.method);
                }
                resp->id = request.id;
                return resp->Serialize();
            }
            case MessageKind::Notification: {
                JSONRPCNotification notification;
                if (!notification.FromJSONValue(doc)) {
                    throw McpException(ErrorCategory::MalformedMessage, "malformed JSON-RPC notification");
                }
                if (handlers.notificationHandler) {
                    handlers.notificationHandler(notification);
                }
                return std::nullopt;
            }
            case MessageKind::Unknown:
                break;
        }
        throw McpException(ErrorCategory::MalformedMessage, "unrecognized JSON-RPC message");
    }
};
} // namespace

std::unique_ptr<IJsonRpcMessageRouter> MakeDefaultJsonRpcMessageRouter() {
    return std::make_unique<JsonRpcMessageRouter>();
}

} // namespace toolbridge
