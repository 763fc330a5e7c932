//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error structures, orchestration error taxonomy and JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "toolbridge/JSONRPCTypes.h"

namespace toolbridge {
namespace errors {

// Categorization of JSON-RPC codes plus the transport/protocol/dispatch failures raised locally.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    McpInvalidRequestId,
    McpMethodNotAllowed,
    McpResourceNotFound,
    McpToolNotFound,
    McpPromptNotFound,

    // Transport: the channel died or an I/O call failed
    TransportClosed,
    TransportIOFailure,

    // Protocol: per-call and per-session failures
    Timeout,
    HandshakeFailed,
    MalformedMessage,
    ToolError,

    // Dispatch: resolution of a tool reference failed
    ServerUnavailable,
    AmbiguousTool,
    UnknownTool,

    Unknown
};

// Local error codes for the non-wire categories. Kept outside the JSON-RPC reserved range.
namespace LocalErrorCodes {
    constexpr int TransportClosed = -31001;
    constexpr int TransportIOFailure = -31002;
    constexpr int Timeout = -31003;
    constexpr int HandshakeFailed = -31004;
    constexpr int MalformedMessage = -31005;
    constexpr int ToolError = -31006;
    constexpr int ServerUnavailable = -31101;
    constexpr int AmbiguousTool = -31102;
    constexpr int UnknownTool = -31103;
}

// Typed error representation used throughout the library.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

inline const char* toString(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::JsonRpcParse: return "JsonRpcParse";
        case ErrorCategory::JsonRpcInvalidRequest: return "JsonRpcInvalidRequest";
        case ErrorCategory::JsonRpcMethodNotFound: return "JsonRpcMethodNotFound";
        case ErrorCategory::JsonRpcInvalidParams: return "JsonRpcInvalidParams";
        case ErrorCategory::JsonRpcInternal: return "JsonRpcInternal";
        case ErrorCategory::McpInvalidRequestId: return "McpInvalidRequestId";
        case ErrorCategory::McpMethodNotAllowed: return "McpMethodNotAllowed";
        case ErrorCategory::McpResourceNotFound: return "McpResourceNotFound";
        case ErrorCategory::McpToolNotFound: return "McpToolNotFound";
        case ErrorCategory::McpPromptNotFound: return "McpPromptNotFound";
        case ErrorCategory::TransportClosed: return "TransportClosed";
        case ErrorCategory::TransportIOFailure: return "TransportIOFailure";
        case ErrorCategory::Timeout: return "Timeout";
        case ErrorCategory::HandshakeFailed: return "HandshakeFailed";
        case ErrorCategory::MalformedMessage: return "MalformedMessage";
        case ErrorCategory::ToolError: return "ToolError";
        case ErrorCategory::ServerUnavailable: return "ServerUnavailable";
        case ErrorCategory::AmbiguousTool: return "AmbiguousTool";
        case ErrorCategory::UnknownTool: return "UnknownTool";
        case ErrorCategory::Unknown: break;
    }
    return "Unknown";
}

// Map a JSON-RPC/MCP numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code (JSON-RPC standard, MCP-specific, or local).
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::InvalidRequestId: return ErrorCategory::McpInvalidRequestId;
        case JSONRPCErrorCodes::MethodNotAllowed: return ErrorCategory::McpMethodNotAllowed;
        case JSONRPCErrorCodes::ResourceNotFound: return ErrorCategory::McpResourceNotFound;
        case JSONRPCErrorCodes::ToolNotFound: return ErrorCategory::McpToolNotFound;
        case JSONRPCErrorCodes::PromptNotFound: return ErrorCategory::McpPromptNotFound;
        case LocalErrorCodes::TransportClosed: return ErrorCategory::TransportClosed;
        case LocalErrorCodes::TransportIOFailure: return ErrorCategory::TransportIOFailure;
        case LocalErrorCodes::Timeout: return ErrorCategory::Timeout;
        case LocalErrorCodes::HandshakeFailed: return ErrorCategory::HandshakeFailed;
        case LocalErrorCodes::MalformedMessage: return ErrorCategory::MalformedMessage;
        case LocalErrorCodes::ToolError: return ErrorCategory::ToolError;
        case LocalErrorCodes::ServerUnavailable: return ErrorCategory::ServerUnavailable;
        case LocalErrorCodes::AmbiguousTool: return ErrorCategory::AmbiguousTool;
        case LocalErrorCodes::UnknownTool: return ErrorCategory::UnknownTool;
        default: return ErrorCategory::Unknown;
    }
}

inline int codeForCategory(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::TransportClosed: return LocalErrorCodes::TransportClosed;
        case ErrorCategory::TransportIOFailure: return LocalErrorCodes::TransportIOFailure;
        case ErrorCategory::Timeout: return LocalErrorCodes::Timeout;
        case ErrorCategory::HandshakeFailed: return LocalErrorCodes::HandshakeFailed;
        case ErrorCategory::MalformedMessage: return LocalErrorCodes::MalformedMessage;
        case ErrorCategory::ToolError: return LocalErrorCodes::ToolError;
        case ErrorCategory::ServerUnavailable: return LocalErrorCodes::ServerUnavailable;
        case ErrorCategory::AmbiguousTool: return LocalErrorCodes::AmbiguousTool;
        case ErrorCategory::UnknownTool: return LocalErrorCodes::UnknownTool;
        case ErrorCategory::JsonRpcParse: return JSONRPCErrorCodes::ParseError;
        case ErrorCategory::JsonRpcInvalidRequest: return JSONRPCErrorCodes::InvalidRequest;
        case ErrorCategory::JsonRpcMethodNotFound: return JSONRPCErrorCodes::MethodNotFound;
        case ErrorCategory::JsonRpcInvalidParams: return JSONRPCErrorCodes::InvalidParams;
        case ErrorCategory::McpInvalidRequestId: return JSONRPCErrorCodes::InvalidRequestId;
        case ErrorCategory::McpMethodNotAllowed: return JSONRPCErrorCodes::MethodNotAllowed;
        case ErrorCategory::McpResourceNotFound: return JSONRPCErrorCodes::ResourceNotFound;
        case ErrorCategory::McpToolNotFound: return JSONRPCErrorCodes::ToolNotFound;
        case ErrorCategory::McpPromptNotFound: return JSONRPCErrorCodes::PromptNotFound;
        case ErrorCategory::JsonRpcInternal:
        case ErrorCategory::Unknown: break;
    }
    return JSONRPCErrorCodes::InternalError;
}

// Build an McpError for a locally raised category.
inline McpError makeError(ErrorCategory category, std::string message,
                          std::optional<JSONValue> data = std::nullopt) {
    McpError e;
    e.code = codeForCategory(category);
    e.message = std::move(message);
    e.data = std::move(data);
    e.category = category;
    return e;
}

inline bool isTransportError(ErrorCategory c) {
    return c == ErrorCategory::TransportClosed || c == ErrorCategory::TransportIOFailure;
}

inline bool isProtocolError(ErrorCategory c) {
    return c == ErrorCategory::Timeout || c == ErrorCategory::HandshakeFailed ||
           c == ErrorCategory::MalformedMessage || c == ErrorCategory::ToolError;
}

inline bool isDispatchError(ErrorCategory c) {
    return c == ErrorCategory::ServerUnavailable || c == ErrorCategory::AmbiguousTool ||
           c == ErrorCategory::UnknownTool;
}

// Failures that a retry may cure: the call timed out or the write/read failed mid-flight.
inline bool isTransient(ErrorCategory c) {
    return c == ErrorCategory::Timeout || c == ErrorCategory::TransportIOFailure;
}

//==========================================================================================================
// McpException
// Purpose: Exception carrying an McpError. Set on promises so futures rethrow typed failures.
//==========================================================================================================
class McpException : public std::runtime_error {
public:
    explicit McpException(McpError err)
        : std::runtime_error(err.message), error_(std::move(err)) {}
    McpException(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), error_(makeError(category, message)) {}

    const McpError& error() const noexcept { return error_; }
    ErrorCategory category() const noexcept { return error_.category; }
    int code() const noexcept { return error_.code; }

private:
    McpError error_;
};

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
inline std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    if (!std::holds_alternative<JSONValue::Object>(errVal.value)) {
        return std::nullopt;
    }
    auto code = GetIntMember(errVal, "code");
    auto message = GetStringMember(errVal, "message");
    if (!code.has_value() || !message.has_value()) {
        return std::nullopt;
    }

    McpError e;
    e.code = static_cast<int>(*code);
    e.message = std::move(*message);
    if (const JSONValue* d = FindMember(errVal, "data")) {
        e.data = *d;
    }
    e.category = errorCategoryFromCode(e.code);
    return e;
}

// Extract McpError from a JSONRPCResponse if it carries an error.
inline std::optional<McpError> mcpErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return mcpErrorFromErrorValue(response.error.value());
}

// Create a JSONValue error object from a typed McpError.
inline JSONValue makeErrorValue(const McpError& err) {
    JSONValue::Object obj;
    obj["code"] = std::make_shared<JSONValue>(static_cast<int64_t>(err.code));
    obj["message"] = std::make_shared<JSONValue>(err.message);
    if (err.data.has_value()) {
        obj["data"] = std::make_shared<JSONValue>(err.data.value());
    }
    return JSONValue{obj};
}

// Convenience: Create a JSONRPCResponse error from McpError and id.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const McpError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

} // namespace errors
} // namespace toolbridge
