//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageCodec.cpp
// Purpose: JSON-RPC 2.0 envelope classification, validation and serialization
//==========================================================================================================

#include "embedmcp/MessageCodec.h"

#include "logging/Logger.h"

namespace embedmcp {

namespace {

DecodeResult invalid(const std::string& message, JSONRPCId id = nullptr) {
    DecodeResult r;
    r.error = errors::makeError(JSONRPCErrorCodes::InvalidRequest, "Invalid Request",
                                JSONValue(message));
    r.errorId = std::move(id);
    return r;
}

// Reads an id member. Returns false when the member has a type JSON-RPC does not allow.
bool readId(const JSONValue& v, JSONRPCId& out) {
    if (const auto* s = std::get_if<std::string>(&v.value)) { out = *s; return true; }
    if (const auto* n = std::get_if<int64_t>(&v.value)) { out = *n; return true; }
    if (v.isNull()) { out = nullptr; return true; }
    return false;
}

bool isStructuredOrNull(const JSONValue& v) {
    return v.isObject() || v.isArray() || v.isNull();
}

} // namespace

EnvelopeKind KindOf(const Envelope& envelope) {
    switch (envelope.index()) {
        case 0: return EnvelopeKind::Request;
        case 1: return EnvelopeKind::Notification;
        default: return EnvelopeKind::Response;
    }
}

DecodeResult MessageCodec::Parse(const std::string& bytes) {
    FUNC_SCOPE();
    JSONValue root;
    try {
        root = ParseJSON(bytes);
    } catch (const JSONParseError& e) {
        LOG_DEBUG("Codec: malformed JSON: {}", e.what());
        DecodeResult r;
        r.error = errors::makeError(JSONRPCErrorCodes::ParseError, "Parse error", JSONValue(std::string(e.what())));
        r.errorId = nullptr;
        return r;
    }
    return FromJSON(root);
}

DecodeResult MessageCodec::FromJSON(const JSONValue& root) {
    if (root.isArray()) {
        return invalid("Batch requests are not supported");
    }
    if (!root.isObject()) {
        return invalid("Message must be a JSON object");
    }

    // Recover a usable id first so that validation errors can echo it.
    JSONRPCId recoveredId = nullptr;
    const JSONValue* idVal = FindMember(root, "id");
    if (idVal) {
        JSONRPCId tmp;
        if (readId(*idVal, tmp)) {
            recoveredId = tmp;
        }
    }

    auto version = GetStringMember(root, "jsonrpc");
    if (!version.has_value() || version.value() != "2.0") {
        return invalid("Missing or unsupported jsonrpc version", recoveredId);
    }

    const JSONValue* methodVal = FindMember(root, "method");
    const JSONValue* paramsVal = FindMember(root, "params");
    if (methodVal) {
        if (!methodVal->isString() || std::get<std::string>(methodVal->value).empty()) {
            return invalid("method must be a non-empty string", recoveredId);
        }
        if (paramsVal && !isStructuredOrNull(*paramsVal)) {
            return invalid("params must be an object or array", recoveredId);
        }
        std::optional<JSONValue> params;
        if (paramsVal) {
            params = *paramsVal;
        }
        const std::string& method = std::get<std::string>(methodVal->value);
        if (!idVal) {
            DecodeResult r;
            r.envelope = JSONRPCNotification(method, std::move(params));
            return r;
        }
        JSONRPCId id;
        if (!readId(*idVal, id)) {
            return invalid("id must be a string or integer");
        }
        if (std::holds_alternative<std::nullptr_t>(id)) {
            return invalid("Request id must not be null");
        }
        DecodeResult r;
        r.envelope = JSONRPCRequest(std::move(id), method, std::move(params));
        return r;
    }

    const JSONValue* resultVal = FindMember(root, "result");
    const JSONValue* errorVal = FindMember(root, "error");
    if (resultVal || errorVal) {
        if (resultVal && errorVal) {
            return invalid("Response must not carry both result and error", recoveredId);
        }
        if (!idVal) {
            return invalid("Response is missing id");
        }
        JSONRPCId id;
        if (!readId(*idVal, id)) {
            return invalid("id must be a string, integer or null");
        }
        JSONRPCResponse response;
        response.id = std::move(id);
        if (resultVal) {
            response.result = *resultVal;
        } else {
            if (!errors::mcpErrorFromErrorValue(*errorVal).has_value()) {
                return invalid("error must be an object with integer code and string message", recoveredId);
            }
            response.error = *errorVal;
        }
        DecodeResult r;
        r.envelope = std::move(response);
        return r;
    }

    return invalid("Message is neither request, notification nor response", recoveredId);
}

JSONValue MessageCodec::ToJSON(const Envelope& envelope) {
    return std::visit([](const auto& m) { return m.ToJSON(); }, envelope);
}

std::string MessageCodec::Serialize(const Envelope& envelope) {
    return SerializeJSON(ToJSON(envelope));
}

std::string MessageCodec::SerializeError(const JSONRPCId& id, const errors::McpError& error) {
    return errors::makeErrorResponse(id, error)->Serialize();
}

} // namespace embedmcp
