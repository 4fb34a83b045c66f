//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Dispatcher.h
// Purpose: Maps JSON-RPC requests to provider calls and protocol-compliant responses
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "embedmcp/JSONRPCTypes.h"
#include "embedmcp/MethodTable.h"
#include "embedmcp/Protocol.h"
#include "embedmcp/Providers.h"
#include "embedmcp/subscriptions/SubscriptionManager.h"

namespace embedmcp {

// Per-request context handed to every handler.
struct RequestContext {
    std::string sessionId;
};

//==========================================================================================================
// MethodDispatcher
// Purpose: Handler table built once at construction; Handle() is reentrant and never throws.
// Error mapping:
//   errors::McpException     -> its own code and message
//   errors::NotFoundError    -> ToolNotFound / ResourceNotFound / PromptNotFound by method
//   std::invalid_argument    -> InvalidParams
//   other std::exception     -> InternalError "Internal error" (details are logged only)
// Notes:
//   - Providers are borrowed and must outlive the dispatcher; any of them may be null.
//==========================================================================================================
class MethodDispatcher {
public:
    using RootsSource = std::function<std::vector<Root>()>;
    using InitializedCallback = std::function<void(const std::string& sessionId)>;

    MethodDispatcher(Implementation serverInfo, IToolProvider* tools, IResourceProvider* resources,
                     IPromptProvider* prompts, subscriptions::ISubscriptionService* subscriptions,
                     RootsSource roots = RootsSource());

    MethodDispatcher(const MethodDispatcher&) = delete;
    MethodDispatcher& operator=(const MethodDispatcher&) = delete;

    std::unique_ptr<JSONRPCResponse> Handle(const JSONRPCRequest& request, const RequestContext& context) const;

    // Client notifications; never produce a response.
    void HandleNotification(const JSONRPCNotification& notification, const RequestContext& context) const;

    void SetInitializedCallback(InitializedCallback callback);

    ServerCapabilities Capabilities() const;
    const Implementation& ServerInfo() const { return serverInfo; }

private:
    using Handler = std::function<JSONValue(const JSONValue& params, const RequestContext& context)>;

    JSONValue handleInitialize(const JSONValue& params, const RequestContext& context) const;
    JSONValue handleListTools(const JSONValue& params) const;
    JSONValue handleCallTool(const JSONValue& params) const;
    JSONValue handleListResources(const JSONValue& params) const;
    JSONValue handleReadResource(const JSONValue& params) const;
    JSONValue handleListResourceTemplates(const JSONValue& params) const;
    JSONValue handleSubscribe(const JSONValue& params, const RequestContext& context) const;
    JSONValue handleUnsubscribe(const JSONValue& params, const RequestContext& context) const;
    JSONValue handleListPrompts(const JSONValue& params) const;
    JSONValue handleGetPrompt(const JSONValue& params) const;
    JSONValue handleListRoots(const JSONValue& params) const;

    Implementation serverInfo;
    IToolProvider* tools;
    IResourceProvider* resources;
    IPromptProvider* prompts;
    subscriptions::ISubscriptionService* subscriptions;
    RootsSource roots;
    InitializedCallback initializedCallback;
    std::unordered_map<Method, Handler> handlers;
};

} // namespace embedmcp
