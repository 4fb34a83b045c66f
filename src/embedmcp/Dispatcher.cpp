//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Dispatcher.cpp
// Purpose: Maps JSON-RPC requests to provider calls and protocol-compliant responses
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <optional>
#include <stdexcept>

#include "embedmcp/Dispatcher.h"
#include "embedmcp/errors/Errors.h"
#include "logging/Logger.h"

namespace embedmcp {

namespace {

const JSONValue& emptyObject() {
    static const JSONValue empty{JSONValue::Object{}};
    return empty;
}

// Absent params behave like {}; anything other than an object is rejected.
const JSONValue& paramsOf(const JSONRPCRequest& request) {
    if (!request.params.has_value()) {
        return emptyObject();
    }
    if (!request.params->isObject()) {
        throw std::invalid_argument("params must be an object");
    }
    return request.params.value();
}

std::string requireString(const JSONValue& params, const std::string& key) {
    auto v = GetStringMember(params, key);
    if (!v.has_value() || v->empty()) {
        throw std::invalid_argument("Missing or invalid '" + key + "'");
    }
    return v.value();
}

JSONValue optionalObject(const JSONValue& params, const std::string& key) {
    const JSONValue* v = FindMember(params, key);
    if (v == nullptr || v->isNull()) {
        return JSONValue{JSONValue::Object{}};
    }
    if (!v->isObject()) {
        throw std::invalid_argument("'" + key + "' must be an object");
    }
    return *v;
}

struct Page {
    std::size_t start{0};
    std::optional<std::size_t> limit;
};

Page parsePage(const JSONValue& params) {
    Page page;
    if (const JSONValue* c = FindMember(params, "cursor")) {
        if (!c->isString()) {
            throw std::invalid_argument("Invalid cursor");
        }
        const auto& s = std::get<std::string>(c->value);
        if (s.empty() || s.size() > 18 ||
            !std::all_of(s.begin(), s.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
            throw std::invalid_argument("Invalid cursor");
        }
        page.start = static_cast<std::size_t>(std::stoull(s));
    }
    if (const JSONValue* l = FindMember(params, "limit")) {
        if (!std::holds_alternative<int64_t>(l->value) || std::get<int64_t>(l->value) <= 0) {
            throw std::invalid_argument("Invalid limit");
        }
        page.limit = static_cast<std::size_t>(std::get<int64_t>(l->value));
    }
    return page;
}

// Sorts items by key, slices them by cursor/limit and emits { <arrayKey>: [...], nextCursor? }.
template <typename T, typename KeyFn>
JSONValue pagedList(std::vector<T> items, const char* arrayKey, KeyFn keyOf, const JSONValue& params) {
    const Page page = parsePage(params);
    std::sort(items.begin(), items.end(), [&keyOf](const T& a, const T& b) { return keyOf(a) < keyOf(b); });
    const std::size_t total = items.size();
    const std::size_t start = std::min(page.start, total);
    const std::size_t end = page.limit.has_value() ? std::min(total, start + page.limit.value()) : total;

    JSONValue::Array arr;
    for (std::size_t i = start; i < end; ++i) {
        arr.push_back(std::make_shared<JSONValue>(ToJSON(items[i])));
    }
    JSONValue::Object obj;
    obj[arrayKey] = std::make_shared<JSONValue>(std::move(arr));
    if (end < total) {
        obj["nextCursor"] = std::make_shared<JSONValue>(std::to_string(end));
    }
    return JSONValue{std::move(obj)};
}

int notFoundCodeFor(Method method) {
    switch (method) {
        case Method::CallTool: return JSONRPCErrorCodes::ToolNotFound;
        case Method::GetPrompt: return JSONRPCErrorCodes::PromptNotFound;
        case Method::ReadResource:
        case Method::Subscribe:
        case Method::Unsubscribe:
            return JSONRPCErrorCodes::ResourceNotFound;
        default:
            return JSONRPCErrorCodes::InternalError;
    }
}

} // namespace

MethodDispatcher::MethodDispatcher(Implementation serverInfo, IToolProvider* tools, IResourceProvider* resources,
                                   IPromptProvider* prompts, subscriptions::ISubscriptionService* subscriptions,
                                   RootsSource roots)
    : serverInfo(std::move(serverInfo)), tools(tools), resources(resources), prompts(prompts),
      subscriptions(subscriptions), roots(std::move(roots)) {
    handlers[Method::Initialize] = [this](const JSONValue& p, const RequestContext& c) { return handleInitialize(p, c); };
    handlers[Method::Ping] = [](const JSONValue&, const RequestContext&) { return JSONValue{JSONValue::Object{}}; };
    handlers[Method::ListTools] = [this](const JSONValue& p, const RequestContext&) { return handleListTools(p); };
    handlers[Method::CallTool] = [this](const JSONValue& p, const RequestContext&) { return handleCallTool(p); };
    handlers[Method::ListResources] = [this](const JSONValue& p, const RequestContext&) { return handleListResources(p); };
    handlers[Method::ReadResource] = [this](const JSONValue& p, const RequestContext&) { return handleReadResource(p); };
    handlers[Method::ListResourceTemplates] = [this](const JSONValue& p, const RequestContext&) {
        return handleListResourceTemplates(p);
    };
    handlers[Method::Subscribe] = [this](const JSONValue& p, const RequestContext& c) { return handleSubscribe(p, c); };
    handlers[Method::Unsubscribe] = [this](const JSONValue& p, const RequestContext& c) { return handleUnsubscribe(p, c); };
    handlers[Method::ListPrompts] = [this](const JSONValue& p, const RequestContext&) { return handleListPrompts(p); };
    handlers[Method::GetPrompt] = [this](const JSONValue& p, const RequestContext&) { return handleGetPrompt(p); };
    handlers[Method::ListRoots] = [this](const JSONValue& p, const RequestContext&) { return handleListRoots(p); };
    handlers[Method::CreateMessage] = [](const JSONValue&, const RequestContext&) -> JSONValue {
        throw errors::McpException(JSONRPCErrorCodes::MethodNotAllowed,
                                   "sampling/createMessage is a server-to-client request");
    };
}

void MethodDispatcher::SetInitializedCallback(InitializedCallback callback) {
    initializedCallback = std::move(callback);
}

ServerCapabilities MethodDispatcher::Capabilities() const {
    ServerCapabilities caps;
    if (tools != nullptr) {
        caps.tools = ToolsCapability{true};
    }
    if (resources != nullptr) {
        caps.resources = ResourcesCapability{subscriptions != nullptr, true};
    }
    if (prompts != nullptr) {
        caps.prompts = PromptsCapability{true};
    }
    caps.logging = LoggingCapability{};
    return caps;
}

std::unique_ptr<JSONRPCResponse> MethodDispatcher::Handle(const JSONRPCRequest& request,
                                                          const RequestContext& context) const {
    auto method = MethodFromName(request.method);
    if (!method.has_value()) {
        LOG_DEBUG("Method not found: {}", request.method);
        return errors::makeErrorResponse(request.id, errors::makeError(JSONRPCErrorCodes::MethodNotFound,
                                                                       "Method not found: " + request.method));
    }
    const Handler& handler = handlers.at(method.value());
    try {
        JSONValue result = handler(paramsOf(request), context);
        return std::make_unique<JSONRPCResponse>(request.id, std::move(result));
    } catch (const errors::McpException& e) {
        LOG_DEBUG("{} failed with code {}: {}", request.method, e.code(), e.what());
        return errors::makeErrorResponse(request.id, e.error());
    } catch (const errors::NotFoundError& e) {
        return errors::makeErrorResponse(request.id, errors::makeError(notFoundCodeFor(method.value()), e.what()));
    } catch (const std::invalid_argument& e) {
        return errors::makeErrorResponse(request.id,
                                         errors::makeError(JSONRPCErrorCodes::InvalidParams, e.what()));
    } catch (const std::exception& e) {
        LOG_ERROR("Unhandled error in {} (id={}, session={}): {}", request.method, IdToString(request.id),
                  context.sessionId, e.what());
        return errors::makeErrorResponse(request.id,
                                         errors::makeError(JSONRPCErrorCodes::InternalError, "Internal error"));
    } catch (...) {
        LOG_ERROR("Unhandled non-standard exception in {} (id={}, session={})", request.method,
                  IdToString(request.id), context.sessionId);
        return errors::makeErrorResponse(request.id,
                                         errors::makeError(JSONRPCErrorCodes::InternalError, "Internal error"));
    }
}

void MethodDispatcher::HandleNotification(const JSONRPCNotification& notification,
                                          const RequestContext& context) const {
    if (notification.method == Methods::Initialized) {
        LOG_INFO("Session {} initialized", context.sessionId);
        if (initializedCallback) {
            initializedCallback(context.sessionId);
        }
    } else if (notification.method == Methods::Cancelled) {
        std::string requestId;
        if (notification.params.has_value()) {
            if (const JSONValue* rid = FindMember(notification.params.value(), "requestId")) {
                requestId = SerializeJSON(*rid);
            }
        }
        LOG_INFO("Session {} cancelled request {}", context.sessionId, requestId);
    } else {
        LOG_DEBUG("Ignoring notification {} from {}", notification.method, context.sessionId);
    }
}

//////////////////////////////////////////// Handlers ////////////////////////////////////////////

JSONValue MethodDispatcher::handleInitialize(const JSONValue& params, const RequestContext& context) const {
    if (auto client = FindMember(params, "clientInfo")) {
        LOG_INFO("initialize from session {} (client {})", context.sessionId,
                 GetStringMember(*client, "name").value_or("unknown"));
    }
    JSONValue::Object obj;
    obj["protocolVersion"] = std::make_shared<JSONValue>(std::string(PROTOCOL_VERSION));
    obj["capabilities"] = std::make_shared<JSONValue>(ToJSON(Capabilities()));
    obj["serverInfo"] = std::make_shared<JSONValue>(ToJSON(serverInfo));
    return JSONValue{std::move(obj)};
}

JSONValue MethodDispatcher::handleListTools(const JSONValue& params) const {
    std::vector<Tool> items;
    if (tools != nullptr) {
        items = tools->ListTools();
    }
    return pagedList(std::move(items), "tools", [](const Tool& t) -> const std::string& { return t.name; }, params);
}

JSONValue MethodDispatcher::handleCallTool(const JSONValue& params) const {
    const std::string name = requireString(params, "name");
    JSONValue arguments = optionalObject(params, "arguments");
    if (tools == nullptr) {
        throw errors::NotFoundError("Tool not found: " + name);
    }
    LOG_DEBUG("tools/call {}", name);
    return ToJSON(tools->CallTool(name, arguments));
}

JSONValue MethodDispatcher::handleListResources(const JSONValue& params) const {
    std::vector<Resource> items;
    if (resources != nullptr) {
        items = resources->ListResources();
    }
    return pagedList(std::move(items), "resources",
                     [](const Resource& r) -> const std::string& { return r.uri; }, params);
}

JSONValue MethodDispatcher::handleReadResource(const JSONValue& params) const {
    const std::string uri = requireString(params, "uri");
    if (resources == nullptr) {
        throw errors::NotFoundError("Resource not found: " + uri);
    }
    return ToJSON(resources->ReadResource(uri));
}

JSONValue MethodDispatcher::handleListResourceTemplates(const JSONValue& params) const {
    std::vector<ResourceTemplate> items;
    if (resources != nullptr) {
        items = resources->ListResourceTemplates();
    }
    return pagedList(std::move(items), "resourceTemplates",
                     [](const ResourceTemplate& t) -> const std::string& { return t.uriTemplate; }, params);
}

JSONValue MethodDispatcher::handleSubscribe(const JSONValue& params, const RequestContext& context) const {
    const std::string uri = requireString(params, "uri");
    if (subscriptions == nullptr) {
        throw errors::McpException(JSONRPCErrorCodes::MethodNotFound, "Subscriptions are not supported");
    }
    switch (subscriptions->Subscribe(context.sessionId, uri)) {
        case subscriptions::SubscribeResult::Ok:
            break;
        case subscriptions::SubscribeResult::AccessDenied:
            throw errors::McpException(JSONRPCErrorCodes::AccessDenied, "Access denied: " + uri);
        case subscriptions::SubscribeResult::LimitExceeded:
            throw errors::McpException(JSONRPCErrorCodes::SubscriptionLimitExceeded,
                                       "Subscription limit exceeded: " + uri);
    }
    return JSONValue{JSONValue::Object{}};
}

JSONValue MethodDispatcher::handleUnsubscribe(const JSONValue& params, const RequestContext& context) const {
    const std::string uri = requireString(params, "uri");
    if (subscriptions == nullptr) {
        throw errors::McpException(JSONRPCErrorCodes::MethodNotFound, "Subscriptions are not supported");
    }
    if (!subscriptions->Unsubscribe(context.sessionId, uri)) {
        LOG_DEBUG("Session {} was not subscribed to {}", context.sessionId, uri);
    }
    return JSONValue{JSONValue::Object{}};
}

JSONValue MethodDispatcher::handleListPrompts(const JSONValue& params) const {
    std::vector<Prompt> items;
    if (prompts != nullptr) {
        items = prompts->ListPrompts();
    }
    return pagedList(std::move(items), "prompts", [](const Prompt& p) -> const std::string& { return p.name; },
                     params);
}

JSONValue MethodDispatcher::handleGetPrompt(const JSONValue& params) const {
    const std::string name = requireString(params, "name");
    JSONValue arguments = optionalObject(params, "arguments");
    if (prompts == nullptr) {
        throw errors::NotFoundError("Prompt not found: " + name);
    }
    return ToJSON(prompts->GetPrompt(name, arguments));
}

JSONValue MethodDispatcher::handleListRoots(const JSONValue& params) const {
    std::vector<Root> items;
    if (roots) {
        items = roots();
    }
    return pagedList(std::move(items), "roots", [](const Root& r) -> const std::string& { return r.uri; }, params);
}

} // namespace embedmcp
