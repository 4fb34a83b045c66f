//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_message_router.cpp
// Purpose: Tests for JsonRpcMessageRouter
//==========================================================================================================

#include <gtest/gtest.h>

#include <optional>
#include <stdexcept>
#include <string>

#include "embedmcp/JSONRPCTypes.h"
#include "embedmcp/JsonRpcMessageRouter.h"

namespace embedmcp {

namespace {
JSONRPCResponse parseResponse(const std::string& text) {
    JSONRPCResponse parsed;
    EXPECT_TRUE(parsed.Deserialize(text)) << text;
    return parsed;
}

int errorCode(const JSONRPCResponse& resp) {
    return resp.error.has_value() ? static_cast<int>(GetIntMember(*resp.error, "code").value_or(0)) : 0;
}
} // namespace

TEST(Router, ClassifyBasic) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    EXPECT_EQ(router->classify(JSONRPCRequest(std::string("id-1"), "ping").Serialize()),
              IJsonRpcMessageRouter::MessageKind::Request);
    EXPECT_EQ(router->classify(JSONRPCResponse(std::string("id-1"), JSONValue(static_cast<int64_t>(123))).Serialize()),
              IJsonRpcMessageRouter::MessageKind::Response);
    EXPECT_EQ(router->classify(JSONRPCNotification("notify").Serialize()),
              IJsonRpcMessageRouter::MessageKind::Notification);
    EXPECT_EQ(router->classify("{"), IJsonRpcMessageRouter::MessageKind::Unknown);
    EXPECT_EQ(router->classify(R"({"jsonrpc":"2.0","id":"x"})"), IJsonRpcMessageRouter::MessageKind::Unknown);
}

TEST(Router, InvalidJsonYieldsParseErrorAndCallsErrorHandler) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    bool errored = false;
    RouterHandlers handlers{};
    handlers.errorHandler = [&](const std::string&) { errored = true; };
    auto out = router->route("ws_1", "{", handlers, ResponseResolver());
    ASSERT_TRUE(out.has_value());
    auto resp = parseResponse(out.value());
    EXPECT_EQ(errorCode(resp), JSONRPCErrorCodes::ParseError);
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(resp.id));
    EXPECT_TRUE(errored);
}

TEST(Router, RequestHandlerSeesSessionAndIdIsPreserved) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    std::string seenSession;
    RouterHandlers handlers{};
    handlers.requestHandler = [&](const JSONRPCRequest& req, const std::string& sessionId) {
        seenSession = sessionId;
        return std::make_unique<JSONRPCResponse>(req.id, JSONValue(std::string("pong")));
    };
    auto out = router->route("sse_42", R"({"jsonrpc":"2.0","id":17,"method":"ping"})", handlers, ResponseResolver());
    ASSERT_TRUE(out.has_value());
    auto resp = parseResponse(out.value());
    EXPECT_EQ(std::get<int64_t>(resp.id), 17);
    EXPECT_EQ(seenSession, "sse_42");
}

TEST(Router, RequestHandlerThrowsReturnsInternalError) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    RouterHandlers handlers{};
    handlers.requestHandler = [](const JSONRPCRequest&, const std::string&) -> std::unique_ptr<JSONRPCResponse> {
        throw std::runtime_error("secret detail");
    };
    auto out = router->route("s", JSONRPCRequest(std::string("t-1"), "boom").Serialize(), handlers, ResponseResolver());
    ASSERT_TRUE(out.has_value());
    auto resp = parseResponse(out.value());
    EXPECT_EQ(errorCode(resp), JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(std::get<std::string>(resp.id), "t-1");
    EXPECT_EQ(out->find("secret detail"), std::string::npos);
}

TEST(Router, NonStandardThrowStillGetsInternalError) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    RouterHandlers handlers{};
    handlers.requestHandler = [](const JSONRPCRequest&, const std::string&) -> std::unique_ptr<JSONRPCResponse> {
        throw 42;
    };
    auto out = router->route("s", JSONRPCRequest(static_cast<int64_t>(9), "odd").Serialize(), handlers,
                             ResponseResolver());
    ASSERT_TRUE(out.has_value());
    auto resp = parseResponse(out.value());
    EXPECT_EQ(errorCode(resp), JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(std::get<int64_t>(resp.id), 9);
}

TEST(Router, NullHandlerResponseBecomesInternalError) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    RouterHandlers handlers{};
    handlers.requestHandler = [](const JSONRPCRequest&, const std::string&) -> std::unique_ptr<JSONRPCResponse> {
        return nullptr;
    };
    auto out = router->route("s", JSONRPCRequest(static_cast<int64_t>(2), "x").Serialize(), handlers, ResponseResolver());
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(errorCode(parseResponse(out.value())), JSONRPCErrorCodes::InternalError);
}

TEST(Router, NotificationsAndResponsesProduceNoReply) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    int notified = 0;
    int resolved = 0;
    RouterHandlers handlers{};
    handlers.notificationHandler = [&](const JSONRPCNotification& n, const std::string&) {
        EXPECT_EQ(n.method, "notifications/initialized");
        ++notified;
    };
    ResponseResolver resolve = [&](const JSONRPCResponse& r) {
        EXPECT_EQ(std::get<std::string>(r.id), "srv-req-1");
        ++resolved;
        return true;
    };
    EXPECT_FALSE(router->route("s", R"({"jsonrpc":"2.0","method":"notifications/initialized"})", handlers, resolve)
                     .has_value());
    EXPECT_FALSE(router->route("s", R"({"jsonrpc":"2.0","id":"srv-req-1","result":{}})", handlers, resolve)
                     .has_value());
    EXPECT_EQ(notified, 1);
    EXPECT_EQ(resolved, 1);
}

} // namespace embedmcp
