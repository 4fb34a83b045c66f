//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_method_dispatch.cpp
// Purpose: Tests for MethodDispatcher handler table, paging and error mapping
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "embedmcp/Dispatcher.h"
#include "embedmcp/Registries.h"
#include "embedmcp/errors/Errors.h"
#include "embedmcp/version.h"

namespace embedmcp {

namespace {

class FakeSubscriptions : public subscriptions::ISubscriptionService {
public:
    subscriptions::SubscribeResult next{subscriptions::SubscribeResult::Ok};
    std::vector<std::pair<std::string, std::string>> calls;

    subscriptions::SubscribeResult Subscribe(const std::string& sessionId, const std::string& uri) override {
        calls.emplace_back(sessionId, uri);
        return next;
    }
    bool Unsubscribe(const std::string&, const std::string&) override { return false; }
};

JSONValue object(std::initializer_list<std::pair<const char*, JSONValue>> members) {
    JSONValue::Object obj;
    for (const auto& [k, v] : members) {
        obj[k] = std::make_shared<JSONValue>(v);
    }
    return JSONValue{obj};
}

int errorCode(const JSONRPCResponse& resp) {
    return resp.error.has_value() ? static_cast<int>(GetIntMember(*resp.error, "code").value_or(0)) : 0;
}

std::string errorMessage(const JSONRPCResponse& resp) {
    return resp.error.has_value() ? GetStringMember(*resp.error, "message").value_or("") : "";
}

const JSONValue::Array& arrayMember(const JSONRPCResponse& resp, const std::string& key) {
    const JSONValue* v = FindMember(*resp.result, key);
    EXPECT_NE(v, nullptr) << key;
    return std::get<JSONValue::Array>(v->value);
}

class DispatchTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* name : {"zeta", "alpha", "mid"}) {
            tools.Register(Tool{name, std::string("tool ") + name}, [name](const JSONValue&) {
                CallToolResult r;
                r.content.push_back(MakeTextContent(name));
                return r;
            });
        }
        tools.Register(Tool{"boom", "throws"}, [](const JSONValue&) -> CallToolResult {
            throw std::runtime_error("database password is hunter2");
        });
        tools.Register(Tool{"odd", "throws a non-standard type"}, [](const JSONValue&) -> CallToolResult {
            throw 42;
        });
        tools.Register(Tool{"strict", "rejects args"}, [](const JSONValue&) -> CallToolResult {
            throw std::invalid_argument("count must be positive");
        });
        tools.Register(Tool{"denied", "domain error"}, [](const JSONValue&) -> CallToolResult {
            throw errors::McpException(JSONRPCErrorCodes::AccessDenied, "not allowed");
        });
        resources.Register(Resource{"app://b", "b"}, [](const std::string& uri) {
            ReadResourceResult r;
            r.contents.push_back(MakeTextResourceContent(uri, "B"));
            return r;
        });
        resources.Register(Resource{"app://a", "a"}, [](const std::string& uri) {
            ReadResourceResult r;
            r.contents.push_back(MakeTextResourceContent(uri, "A"));
            return r;
        });
        prompts.Register(Prompt{"greet", "Greeting"}, [](const JSONValue& args) {
            GetPromptResult r;
            r.description = "greet";
            r.messages.push_back(MakePromptMessage("user", "Hello " + GetStringMember(args, "who").value_or("?")));
            return r;
        });
        dispatcher = std::make_unique<MethodDispatcher>(Implementation{"test-server", "1.2.3"}, &tools, &resources,
                                                        &prompts, &subs, []() {
                                                            return std::vector<Root>{{"file:///data", "data"}};
                                                        });
    }

    std::unique_ptr<JSONRPCResponse> call(const std::string& method, std::optional<JSONValue> params = std::nullopt,
                                          JSONRPCId id = static_cast<int64_t>(1)) {
        return dispatcher->Handle(JSONRPCRequest(std::move(id), method, std::move(params)), RequestContext{"ws_1"});
    }

    ToolRegistry tools;
    ResourceRegistry resources;
    PromptRegistry prompts;
    FakeSubscriptions subs;
    std::unique_ptr<MethodDispatcher> dispatcher;
};

} // namespace

TEST_F(DispatchTest, InitializeReportsVersionCapabilitiesAndServerInfo) {
    auto resp = call("initialize", object({{"protocolVersion", JSONValue(std::string("2025-11-25"))}}));
    ASSERT_TRUE(resp->result.has_value());
    EXPECT_EQ(GetStringMember(*resp->result, "protocolVersion").value_or(""), "2025-11-25");
    const JSONValue* info = FindMember(*resp->result, "serverInfo");
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(GetStringMember(*info, "name").value_or(""), "test-server");
    const JSONValue* caps = FindMember(*resp->result, "capabilities");
    ASSERT_NE(caps, nullptr);
    const JSONValue* res = FindMember(*caps, "resources");
    ASSERT_NE(res, nullptr);
    const JSONValue* subscribe = FindMember(*res, "subscribe");
    ASSERT_NE(subscribe, nullptr);
    EXPECT_TRUE(std::get<bool>(subscribe->value));
    EXPECT_NE(FindMember(*caps, "logging"), nullptr);
}

TEST(Dispatch, InitializeCarriesLibraryVersionFromMakeServerInfo) {
    EXPECT_EQ(getVersionString(), "0.1.0");
    MethodDispatcher dispatcher(MakeServerInfo("versioned"), nullptr, nullptr, nullptr, nullptr);
    auto resp = dispatcher.Handle(JSONRPCRequest(static_cast<int64_t>(1), "initialize"), RequestContext{"ws_1"});
    ASSERT_TRUE(resp->result.has_value());
    const JSONValue* info = FindMember(*resp->result, "serverInfo");
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(GetStringMember(*info, "name").value_or(""), "versioned");
    EXPECT_EQ(GetStringMember(*info, "version").value_or(""), getVersionString());
}

TEST_F(DispatchTest, ToolsListReturnsArrayNeverError) {
    auto resp = call("tools/list");
    EXPECT_EQ(std::get<int64_t>(resp->id), 1);
    ASSERT_FALSE(resp->IsError());
    const auto& items = arrayMember(*resp, "tools");
    ASSERT_EQ(items.size(), 7u);
    EXPECT_EQ(GetStringMember(*items[0], "name").value_or(""), "alpha");
    EXPECT_EQ(FindMember(*resp->result, "nextCursor"), nullptr);
}

TEST_F(DispatchTest, PagingWithCursorAndLimit) {
    auto first = call("tools/list", object({{"limit", JSONValue(static_cast<int64_t>(4))}}));
    ASSERT_FALSE(first->IsError());
    EXPECT_EQ(arrayMember(*first, "tools").size(), 4u);
    auto cursor = GetStringMember(*first->result, "nextCursor");
    ASSERT_TRUE(cursor.has_value());

    auto second = call("tools/list", object({{"cursor", JSONValue(cursor.value())},
                                             {"limit", JSONValue(static_cast<int64_t>(4))}}));
    ASSERT_FALSE(second->IsError());
    EXPECT_EQ(arrayMember(*second, "tools").size(), 3u);
    EXPECT_EQ(FindMember(*second->result, "nextCursor"), nullptr);

    auto bad = call("tools/list", object({{"cursor", JSONValue(std::string("abc"))}}));
    EXPECT_EQ(errorCode(*bad), JSONRPCErrorCodes::InvalidParams);
    auto zero = call("tools/list", object({{"limit", JSONValue(static_cast<int64_t>(0))}}));
    EXPECT_EQ(errorCode(*zero), JSONRPCErrorCodes::InvalidParams);
}

TEST_F(DispatchTest, UnknownMethodPreservesId) {
    auto resp = call("does/not/exist", std::nullopt, std::string("abc"));
    EXPECT_EQ(errorCode(*resp), JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(std::get<std::string>(resp->id), "abc");
}

TEST_F(DispatchTest, ProviderErrorsMapToCodes) {
    auto missing = call("tools/call", object({{"name", JSONValue(std::string("nope"))}}));
    EXPECT_EQ(errorCode(*missing), JSONRPCErrorCodes::ToolNotFound);

    auto invalid = call("tools/call", object({{"name", JSONValue(std::string("strict"))}}));
    EXPECT_EQ(errorCode(*invalid), JSONRPCErrorCodes::InvalidParams);

    auto passthrough = call("tools/call", object({{"name", JSONValue(std::string("denied"))}}));
    EXPECT_EQ(errorCode(*passthrough), JSONRPCErrorCodes::AccessDenied);

    auto internal = call("tools/call", object({{"name", JSONValue(std::string("boom"))}}));
    EXPECT_EQ(errorCode(*internal), JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(errorMessage(*internal), "Internal error");

    auto odd = call("tools/call", object({{"name", JSONValue(std::string("odd"))}}), std::string("odd-1"));
    EXPECT_EQ(errorCode(*odd), JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(errorMessage(*odd), "Internal error");
    EXPECT_EQ(std::get<std::string>(odd->id), "odd-1");

    auto resource = call("resources/read", object({{"uri", JSONValue(std::string("app://zzz"))}}));
    EXPECT_EQ(errorCode(*resource), JSONRPCErrorCodes::ResourceNotFound);

    auto prompt = call("prompts/get", object({{"name", JSONValue(std::string("nope"))}}));
    EXPECT_EQ(errorCode(*prompt), JSONRPCErrorCodes::PromptNotFound);
}

TEST_F(DispatchTest, ParamsShapeIsValidated) {
    auto missingName = call("tools/call", object({}));
    EXPECT_EQ(errorCode(*missingName), JSONRPCErrorCodes::InvalidParams);

    JSONValue::Array arr;
    auto arrayParams = call("tools/list", JSONValue{arr});
    EXPECT_EQ(errorCode(*arrayParams), JSONRPCErrorCodes::InvalidParams);

    auto badArgs = call("tools/call", object({{"name", JSONValue(std::string("alpha"))},
                                              {"arguments", JSONValue(std::string("x"))}}));
    EXPECT_EQ(errorCode(*badArgs), JSONRPCErrorCodes::InvalidParams);
}

TEST_F(DispatchTest, CallToolReadResourceAndGetPrompt) {
    auto tool = call("tools/call", object({{"name", JSONValue(std::string("mid"))}}));
    ASSERT_FALSE(tool->IsError());
    EXPECT_EQ(GetStringMember(*arrayMember(*tool, "content")[0], "text").value_or(""), "mid");

    auto read = call("resources/read", object({{"uri", JSONValue(std::string("app://a"))}}));
    ASSERT_FALSE(read->IsError());
    EXPECT_EQ(GetStringMember(*arrayMember(*read, "contents")[0], "text").value_or(""), "A");

    auto listed = call("resources/list");
    ASSERT_FALSE(listed->IsError());
    EXPECT_EQ(GetStringMember(*arrayMember(*listed, "resources")[0], "uri").value_or(""), "app://a");

    auto prompt = call("prompts/get", object({{"name", JSONValue(std::string("greet"))},
                                              {"arguments", object({{"who", JSONValue(std::string("Ada"))}})}}));
    ASSERT_FALSE(prompt->IsError());
    EXPECT_EQ(arrayMember(*prompt, "messages").size(), 1u);

    auto roots = call("roots/list");
    ASSERT_FALSE(roots->IsError());
    EXPECT_EQ(GetStringMember(*arrayMember(*roots, "roots")[0], "uri").value_or(""), "file:///data");
}

TEST_F(DispatchTest, SubscribeForwardsSessionAndMapsFailures) {
    auto ok = call("resources/subscribe", object({{"uri", JSONValue(std::string("app://a"))}}));
    ASSERT_FALSE(ok->IsError());
    EXPECT_TRUE(ok->result->isObject());
    ASSERT_EQ(subs.calls.size(), 1u);
    EXPECT_EQ(subs.calls[0].first, "ws_1");

    subs.next = subscriptions::SubscribeResult::AccessDenied;
    auto denied = call("resources/subscribe", object({{"uri", JSONValue(std::string("file:///etc/passwd"))}}));
    EXPECT_EQ(errorCode(*denied), JSONRPCErrorCodes::AccessDenied);

    subs.next = subscriptions::SubscribeResult::LimitExceeded;
    auto limited = call("resources/subscribe", object({{"uri", JSONValue(std::string("file:///data/x"))}}));
    EXPECT_EQ(errorCode(*limited), JSONRPCErrorCodes::SubscriptionLimitExceeded);

    auto unsub = call("resources/unsubscribe", object({{"uri", JSONValue(std::string("app://a"))}}));
    ASSERT_FALSE(unsub->IsError());
}

TEST_F(DispatchTest, ClientSideMethodIsNotAllowed) {
    auto resp = call("sampling/createMessage", object({}));
    EXPECT_EQ(errorCode(*resp), JSONRPCErrorCodes::MethodNotAllowed);
}

TEST_F(DispatchTest, InitializedNotificationInvokesCallback) {
    std::string initialized;
    dispatcher->SetInitializedCallback([&](const std::string& sessionId) { initialized = sessionId; });
    dispatcher->HandleNotification(JSONRPCNotification("notifications/initialized"), RequestContext{"sse_9"});
    dispatcher->HandleNotification(JSONRPCNotification("notifications/unknown"), RequestContext{"sse_9"});
    EXPECT_EQ(initialized, "sse_9");
}

TEST_F(DispatchTest, ConcurrentHandleIsSafe) {
    std::atomic<int> good{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < 50; ++i) {
                const int64_t id = t * 1000 + i;
                auto resp = call("tools/list", std::nullopt, id);
                if (!resp->IsError() && std::get<int64_t>(resp->id) == id) {
                    ++good;
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    EXPECT_EQ(good.load(), 400);
}

TEST(Dispatch, AbsentProvidersGiveEmptyListsAndNoSubscribe) {
    MethodDispatcher dispatcher(Implementation{"bare", "0"}, nullptr, nullptr, nullptr, nullptr);
    auto list = dispatcher.Handle(JSONRPCRequest(static_cast<int64_t>(1), "resources/list"), RequestContext{"s"});
    ASSERT_FALSE(list->IsError());
    EXPECT_TRUE(std::get<JSONValue::Array>(FindMember(*list->result, "resources")->value).empty());

    JSONValue::Object p;
    p["uri"] = std::make_shared<JSONValue>(std::string("app://x"));
    auto sub = dispatcher.Handle(JSONRPCRequest(static_cast<int64_t>(2), "resources/subscribe", JSONValue{p}),
                                 RequestContext{"s"});
    EXPECT_EQ(errorCode(*sub), JSONRPCErrorCodes::MethodNotFound);
    EXPECT_FALSE(dispatcher.Capabilities().resources.has_value());
}

} // namespace embedmcp
