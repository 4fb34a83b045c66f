//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageCodec.h
// Purpose: Stateless parse/serialize of JSON-RPC 2.0 envelopes
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <variant>

#include "embedmcp/JSONRPCTypes.h"
#include "embedmcp/errors/Errors.h"

namespace embedmcp {

//==========================================================================================================
// Envelope
// Purpose: One JSON-RPC message; exactly one of request, notification or response.
//==========================================================================================================
using Envelope = std::variant<JSONRPCRequest, JSONRPCNotification, JSONRPCResponse>;

enum class EnvelopeKind { Request, Notification, Response };

EnvelopeKind KindOf(const Envelope& envelope);

//==========================================================================================================
// DecodeResult
// Purpose: Outcome of MessageCodec::Parse. Either envelope is set, or error is set together with the id
//          the error response must carry (null unless an id could be recovered from a well-formed object).
//==========================================================================================================
struct DecodeResult {
    std::optional<Envelope> envelope;
    std::optional<errors::McpError> error;
    JSONRPCId errorId{nullptr};

    bool ok() const { return envelope.has_value(); }
};

class MessageCodec {
public:
    //==========================================================================================================
    // Parse
    // Purpose: Decodes one JSON-RPC message. Never throws.
    // Rules:
    //   method + id                 -> Request
    //   method without id           -> Notification
    //   result or error, no method  -> Response
    //   anything else               -> InvalidRequest
    //   malformed JSON              -> ParseError with null id
    //==========================================================================================================
    static DecodeResult Parse(const std::string& bytes);

    // Decodes an already parsed JSON value using the same rules as Parse.
    static DecodeResult FromJSON(const JSONValue& value);

    static JSONValue ToJSON(const Envelope& envelope);
    static std::string Serialize(const Envelope& envelope);

    // Serializes an error response for the given id.
    static std::string SerializeError(const JSONRPCId& id, const errors::McpError& error);
};

} // namespace embedmcp
