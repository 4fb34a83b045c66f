//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcMessageRouter.h
// Purpose: Interface for JSON-RPC message routing (classification and dispatch per session)
//========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "embedmcp/JSONRPCTypes.h"

namespace embedmcp {

struct RouterHandlers {
    std::function<std::unique_ptr<JSONRPCResponse>(const JSONRPCRequest&, const std::string& sessionId)> requestHandler;
    std::function<void(const JSONRPCNotification&, const std::string& sessionId)> notificationHandler;
    std::function<void(const std::string& error)> errorHandler;
};

// Receives client responses to server-initiated requests; returns false when nothing was waiting.
using ResponseResolver = std::function<bool(const JSONRPCResponse&)>;

class IJsonRpcMessageRouter {
public:
    virtual ~IJsonRpcMessageRouter() = default;

    enum class MessageKind {
        Request,
        Response,
        Notification,
        Unknown
    };

    // Classify a JSON-RPC message without invoking handlers.
    virtual MessageKind classify(const std::string& json) = 0;

    // Routes one inbound message from sessionId. Returns the serialized reply for requests and for
    // undecodable input; std::nullopt for notifications and responses.
    virtual std::optional<std::string> route(
        const std::string& sessionId,
        const std::string& json,
        const RouterHandlers& handlers,
        const ResponseResolver& resolve) = 0;
};

// Factory: returns the default router implementation
std::unique_ptr<IJsonRpcMessageRouter> MakeDefaultJsonRpcMessageRouter();

} // namespace embedmcp
