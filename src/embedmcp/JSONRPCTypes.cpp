//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPCTypes.cpp
// Purpose: JSON-RPC message object forms, (de)serialization and error helpers
//==========================================================================================================

#include "embedmcp/JSONRPCTypes.h"
#include "embedmcp/MessageCodec.h"
#include "logging/Logger.h"

namespace embedmcp {

std::string IdToString(const JSONRPCId& id) {
    std::string out;
    std::visit([&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) { out = v; }
        else if constexpr (std::is_same_v<T, int64_t>) { out = std::to_string(v); }
    }, id);
    return out;
}

JSONValue IdToJSON(const JSONRPCId& id) {
    return std::visit([](const auto& v) -> JSONValue {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) { return JSONValue(nullptr); }
        else { return JSONValue(v); }
    }, id);
}

std::string JSONRPCMessage::Serialize() const {
    FUNC_SCOPE();
    return SerializeJSON(ToJSON());
}

JSONValue JSONRPCRequest::ToJSON() const {
    JSONValue::Object obj;
    obj["jsonrpc"] = std::make_shared<JSONValue>(jsonrpc);
    obj["id"] = std::make_shared<JSONValue>(IdToJSON(id));
    obj["method"] = std::make_shared<JSONValue>(method);
    if (params.has_value()) {
        obj["params"] = std::make_shared<JSONValue>(params.value());
    }
    return JSONValue(std::move(obj));
}

bool JSONRPCRequest::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    DecodeResult r = MessageCodec::Parse(json);
    if (!r.ok() || KindOf(r.envelope.value()) != EnvelopeKind::Request) {
        return false;
    }
    *this = std::get<JSONRPCRequest>(std::move(r.envelope.value()));
    return true;
}

JSONValue JSONRPCResponse::ToJSON() const {
    JSONValue::Object obj;
    obj["jsonrpc"] = std::make_shared<JSONValue>(jsonrpc);
    obj["id"] = std::make_shared<JSONValue>(IdToJSON(id));
    if (result.has_value()) {
        obj["result"] = std::make_shared<JSONValue>(result.value());
    }
    if (error.has_value()) {
        obj["error"] = std::make_shared<JSONValue>(error.value());
    }
    return JSONValue(std::move(obj));
}

bool JSONRPCResponse::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    DecodeResult r = MessageCodec::Parse(json);
    if (!r.ok() || KindOf(r.envelope.value()) != EnvelopeKind::Response) {
        return false;
    }
    *this = std::get<JSONRPCResponse>(std::move(r.envelope.value()));
    return true;
}

JSONValue JSONRPCNotification::ToJSON() const {
    JSONValue::Object obj;
    obj["jsonrpc"] = std::make_shared<JSONValue>(jsonrpc);
    obj["method"] = std::make_shared<JSONValue>(method);
    if (params.has_value()) {
        obj["params"] = std::make_shared<JSONValue>(params.value());
    }
    return JSONValue(std::move(obj));
}

bool JSONRPCNotification::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    DecodeResult r = MessageCodec::Parse(json);
    if (!r.ok() || KindOf(r.envelope.value()) != EnvelopeKind::Notification) {
        return false;
    }
    *this = std::get<JSONRPCNotification>(std::move(r.envelope.value()));
    return true;
}

bool operator==(const JSONRPCRequest& a, const JSONRPCRequest& b) {
    return a.jsonrpc == b.jsonrpc && a.id == b.id && a.method == b.method && a.params == b.params;
}

bool operator==(const JSONRPCResponse& a, const JSONRPCResponse& b) {
    return a.jsonrpc == b.jsonrpc && a.id == b.id && a.result == b.result && a.error == b.error;
}

bool operator==(const JSONRPCNotification& a, const JSONRPCNotification& b) {
    return a.jsonrpc == b.jsonrpc && a.method == b.method && a.params == b.params;
}

// Utility functions
JSONValue CreateErrorObject(int code, const std::string& message,
                            const std::optional<JSONValue>& data) {
    FUNC_SCOPE();
    JSONValue::Object errorObj;
    errorObj["code"] = std::make_shared<JSONValue>(static_cast<int64_t>(code));
    errorObj["message"] = std::make_shared<JSONValue>(message);
    if (data.has_value()) {
        errorObj["data"] = std::make_shared<JSONValue>(data.value());
    }
    return JSONValue(std::move(errorObj));
}

std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data) {
    FUNC_SCOPE();
    auto response = std::make_unique<JSONRPCResponse>();
    response->id = id;
    response->error = CreateErrorObject(code, message, data);
    return response;
}

} // namespace embedmcp
