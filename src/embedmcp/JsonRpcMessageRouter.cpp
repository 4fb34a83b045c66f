//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcMessageRouter.cpp
// Purpose: Default implementation for JSON-RPC message routing
//========================================================================================================

#include <optional>
#include <string>

#include "embedmcp/JsonRpcMessageRouter.h"
#include "embedmcp/MessageCodec.h"
#include "embedmcp/errors/Errors.h"
#include "logging/Logger.h"

namespace embedmcp {

namespace {

class JsonRpcMessageRouter : public IJsonRpcMessageRouter {
public:
    MessageKind classify(const std::string& json) override {
        DecodeResult decoded = MessageCodec::Parse(json);
        if (!decoded.ok()) {
            return MessageKind::Unknown;
        }
        switch (KindOf(decoded.envelope.value())) {
            case EnvelopeKind::Request: return MessageKind::Request;
            case EnvelopeKind::Notification: return MessageKind::Notification;
            case EnvelopeKind::Response: return MessageKind::Response;
        }
        return MessageKind::Unknown;
    }

    std::optional<std::string> route(
        const std::string& sessionId,
        const std::string& json,
        const RouterHandlers& handlers,
        const ResponseResolver& resolve) override {
        DecodeResult decoded = MessageCodec::Parse(json);
        if (!decoded.ok()) {
            const errors::McpError& err = decoded.error.value();
            LOG_WARN("Router: rejected message from {} ({}): {}", sessionId, err.code, err.message);
            if (handlers.errorHandler) {
                handlers.errorHandler("Router: " + err.message);
            }
            return MessageCodec::SerializeError(decoded.errorId, err);
        }

        Envelope& envelope = decoded.envelope.value();
        if (auto* response = std::get_if<JSONRPCResponse>(&envelope)) {
            if (!resolve || !resolve(*response)) {
                LOG_DEBUG("Router: unmatched response id={} from {}", IdToString(response->id), sessionId);
            }
            return std::nullopt;
        }

        if (auto* notification = std::get_if<JSONRPCNotification>(&envelope)) {
            if (handlers.notificationHandler) {
                handlers.notificationHandler(*notification, sessionId);
            }
            return std::nullopt;
        }

        auto& request = std::get<JSONRPCRequest>(envelope);
        if (!handlers.requestHandler) {
            return MessageCodec::SerializeError(
                request.id, errors::makeError(JSONRPCErrorCodes::MethodNotFound, "Method not found: " + request.method));
        }
        std::unique_ptr<JSONRPCResponse> resp;
        try {
            resp = handlers.requestHandler(request, sessionId);
        } catch (const std::exception& e) {
            LOG_ERROR("Request handler exception: {}", e.what());
            return MessageCodec::SerializeError(
                request.id, errors::makeError(JSONRPCErrorCodes::InternalError, "Internal error"));
        } catch (...) {
            LOG_ERROR("Request handler threw a non-standard exception for {}", request.method);
            return MessageCodec::SerializeError(
                request.id, errors::makeError(JSONRPCErrorCodes::InternalError, "Internal error"));
        }
        if (!resp) {
            resp = CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, "Null response from handler");
        } else {
            resp->id = request.id;
        }
        return resp->Serialize();
    }
};
} // namespace

std::unique_ptr<IJsonRpcMessageRouter> MakeDefaultJsonRpcMessageRouter() {
    return std::make_unique<JsonRpcMessageRouter>();
}

} // namespace embedmcp
