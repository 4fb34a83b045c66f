//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error structures, exceptions and JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "embedmcp/JSONRPCTypes.h"

namespace embedmcp {
namespace errors {

// Categorization of JSON-RPC and server error codes.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    InvalidRequestId,
    MethodNotAllowed,
    ResourceNotFound,
    ToolNotFound,
    PromptNotFound,
    AccessDenied,
    LimitExceeded,
    Timeout,
    ChannelClosed,
    Unknown
};

// Typed error representation used across the library.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code (JSON-RPC standard or server-specific).
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
        case JSONRPCErrorCodes::InvalidRequestId: return ErrorCategory::InvalidRequestId;
        case JSONRPCErrorCodes::MethodNotAllowed: return ErrorCategory::MethodNotAllowed;
        case JSONRPCErrorCodes::ResourceNotFound: return ErrorCategory::ResourceNotFound;
        case JSONRPCErrorCodes::ToolNotFound: return ErrorCategory::ToolNotFound;
        case JSONRPCErrorCodes::PromptNotFound: return ErrorCategory::PromptNotFound;
        case JSONRPCErrorCodes::AccessDenied: return ErrorCategory::AccessDenied;
        case JSONRPCErrorCodes::SubscriptionLimitExceeded: return ErrorCategory::LimitExceeded;
        case JSONRPCErrorCodes::RequestTimeout: return ErrorCategory::Timeout;
        case JSONRPCErrorCodes::ChannelClosed: return ErrorCategory::ChannelClosed;
        default: return ErrorCategory::Unknown;
    }
}

// Build an McpError with the category derived from the code.
inline McpError makeError(int code, std::string message, std::optional<JSONValue> data = std::nullopt) {
    McpError e;
    e.code = code;
    e.message = std::move(message);
    e.data = std::move(data);
    e.category = errorCategoryFromCode(code);
    return e;
}

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
    std::optional<JSONValue> data;
    if (const JSONValue* d = FindMember(errVal, "data")) {
        data = *d;
    }
    return makeError(static_cast<int>(code.value()), std::move(message.value()), std::move(data));
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
    return CreateErrorObject(err.code, err.message, err.data);
}

// Convenience: Create a JSONRPCResponse error from McpError and id.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const McpError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

//==========================================================================================================
// McpException
// Purpose: Exception carrying a typed McpError. Thrown by providers to select an exact wire code, and
//          set on outbound-request futures when the peer answers with an error.
//==========================================================================================================
class McpException : public std::runtime_error {
public:
    explicit McpException(McpError err)
        : std::runtime_error(err.message), error_(std::move(err)) {}
    McpException(int code, const std::string& message)
        : McpException(makeError(code, message)) {}

    const McpError& error() const noexcept { return error_; }
    int code() const noexcept { return error_.code; }

private:
    McpError error_;
};

//==========================================================================================================
// NotFoundError
// Purpose: Thrown by providers when a named tool/resource/prompt does not exist. Dispatch maps it to the
//          method-specific not-found code.
//==========================================================================================================
class NotFoundError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

//==========================================================================================================
// TimeoutError
// Purpose: Outbound request received no response before its deadline.
//==========================================================================================================
class TimeoutError : public McpException {
public:
    explicit TimeoutError(const std::string& message)
        : McpException(JSONRPCErrorCodes::RequestTimeout, message) {}
};

//==========================================================================================================
// ChannelError
// Purpose: Delivery failed or the owning session went away before a response arrived.
//==========================================================================================================
class ChannelError : public McpException {
public:
    explicit ChannelError(const std::string& message)
        : McpException(JSONRPCErrorCodes::ChannelClosed, message) {}
};

} // namespace errors
} // namespace embedmcp
