//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/embedmcp/Server.cpp
// Purpose: Embedded MCP server wiring channels, dispatch, outbound correlation and subscriptions
//==========================================================================================================

#include <atomic>
#include <stdexcept>

#include <boost/asio/thread_pool.hpp>

#include "embedmcp/Dispatcher.h"
#include "embedmcp/HttpSseChannel.hpp"
#include "embedmcp/JsonRpcMessageRouter.h"
#include "embedmcp/OutboundRequestCorrelator.h"
#include "embedmcp/Scheduler.hpp"
#include "embedmcp/Server.h"
#include "embedmcp/WebSocketChannel.hpp"
#include "embedmcp/version.h"
#include "embedmcp/errors/Errors.h"
#include "embedmcp/subscriptions/InotifyWatchBackend.hpp"
#include "logging/Logger.h"

namespace embedmcp {

namespace {
constexpr const char* kWebSocketChannel = "websocket";
constexpr const char* kHttpChannel = "http";
constexpr const char* kSubscriptionLogger = "embedmcp.subscriptions";
} // namespace

class Server::Impl : public std::enable_shared_from_this<Impl> {
public:
    ServerConfig config;
    Implementation serverInfo;
    Server::Providers providers;

    // Declaration order is teardown order in reverse; stop() runs first in any case.
    BackgroundScheduler scheduler;
    FileAccessPolicy policy;
    std::unique_ptr<subscriptions::IWatchBackend> backend;
    std::unique_ptr<subscriptions::SubscriptionManager> subs;
    SessionRegistry sessions;
    TransportManager transports;
    std::unique_ptr<OutboundRequestCorrelator> correlator;
    std::unique_ptr<MethodDispatcher> dispatcher;
    std::unique_ptr<IJsonRpcMessageRouter> router;
    RouterHandlers routerHandlers;
    boost::asio::thread_pool workers;

    std::atomic<bool> started{false};
    std::atomic<bool> stopped{false};

    Impl(ServerConfig cfg, Implementation info, Server::Providers p,
         std::unique_ptr<subscriptions::IWatchBackend> watchBackend)
        : config(std::move(cfg)), serverInfo(std::move(info)), providers(p), scheduler(2),
          backend(std::move(watchBackend)), workers(config.workerThreads) {
        config.Validate();
        for (const auto& root : config.roots) {
            policy.AddRoot(root);
        }
        if (!backend) {
            backend = std::make_unique<subscriptions::InotifyWatchBackend>(scheduler);
        }
        subs = std::make_unique<subscriptions::SubscriptionManager>(
            policy, providers.resources, *backend, scheduler, config.subscriptions);
        correlator = std::make_unique<OutboundRequestCorrelator>(
            scheduler,
            [this](const std::string& sessionId, const std::string& payload) {
                return transports.SendTo(sessionId, payload);
            },
            config.outboundTimeout);
        dispatcher = std::make_unique<MethodDispatcher>(
            serverInfo, providers.tools, providers.resources, providers.prompts, subs.get(),
            [this]() { return policy.GetRoots(); });
        dispatcher->SetInitializedCallback([this](const std::string& sessionId) {
            sessions.MarkInitialized(sessionId);
            LOG_INFO("Session {} initialized", sessionId);
        });
        router = MakeDefaultJsonRpcMessageRouter();

        routerHandlers.requestHandler = [this](const JSONRPCRequest& request, const std::string& sessionId) {
            return dispatcher->Handle(request, RequestContext{sessionId});
        };
        routerHandlers.notificationHandler = [this](const JSONRPCNotification& notification,
                                                    const std::string& sessionId) {
            dispatcher->HandleNotification(notification, RequestContext{sessionId});
        };
        routerHandlers.errorHandler = [](const std::string& error) {
            LOG_WARN("Inbound message error: {}", error);
        };
    }

    ~Impl() {
        stop();
    }

    /////////////////////////////////////////// Inbound ///////////////////////////////////////////

    std::optional<std::string> onMessage(const std::string& sessionId, const std::string& payload) {
        sessions.Touch(sessionId);
        return router->route(sessionId, payload, routerHandlers,
                             [this](const JSONRPCResponse& response) { return correlator->Resolve(response); });
    }

    void onSessionOpened(const std::string& channel, const std::string& sessionId) {
        if (!sessions.Open(sessionId, channel)) {
            LOG_WARN("Duplicate session id {} on {}", sessionId, channel);
        }
    }

    void onSessionClosed(const std::string& sessionId) {
        sessions.Close(sessionId);
        const std::size_t released = subs->ReleaseSession(sessionId);
        const std::size_t failed = correlator->FailSession(sessionId);
        if (released > 0 || failed > 0) {
            LOG_DEBUG("Session {} closed: released {} subscriptions, failed {} outbound requests", sessionId,
                      released, failed);
        }
    }

    void wireChannel(const std::string& name, const std::shared_ptr<IChannel>& channel) {
        std::weak_ptr<Impl> weak = weak_from_this();
        channel->SetMessageHandler(
            [weak](const std::string& sessionId, const std::string& payload) -> std::optional<std::string> {
                auto self = weak.lock();
                if (!self) {
                    return std::nullopt;
                }
                return self->onMessage(sessionId, payload);
            });
        channel->SetSessionOpenedHandler([weak, name](const std::string& sessionId) {
            if (auto self = weak.lock()) {
                self->onSessionOpened(name, sessionId);
            }
        });
        channel->SetSessionClosedHandler([weak](const std::string& sessionId) {
            if (auto self = weak.lock()) {
                self->onSessionClosed(sessionId);
            }
        });
        channel->SetErrorHandler([name](const std::string& error) {
            LOG_WARN("Channel '{}' error: {}", name, error);
        });
        transports.AddChannel(name, channel);
    }

    /////////////////////////////////////////// Fan-out ///////////////////////////////////////////

    void fanOutChange(const subscriptions::ResourceChanged& event) {
        JSONValue::Object params;
        params["uri"] = std::make_shared<JSONValue>(event.uri);
        const std::string payload =
            JSONRPCNotification(Methods::ResourceUpdated, JSONValue{std::move(params)}).Serialize();
        for (const auto& sessionId : subs->SessionsFor(event.uri)) {
            if (!transports.SendTo(sessionId, payload)) {
                LOG_DEBUG("resources/updated for {} not delivered to {}", event.uri, sessionId);
            }
        }
    }

    void fanOutDiagnostic(const subscriptions::SubscriptionDiagnostic& diag) {
        JSONValue::Object data;
        data["uri"] = std::make_shared<JSONValue>(diag.uri);
        data["state"] = std::make_shared<JSONValue>(std::string(subscriptions::ToString(diag.state)));
        data["message"] = std::make_shared<JSONValue>(diag.message);
        JSONValue::Object params;
        params["level"] = std::make_shared<JSONValue>(diag.level);
        params["logger"] = std::make_shared<JSONValue>(std::string(kSubscriptionLogger));
        params["data"] = std::make_shared<JSONValue>(std::move(data));
        const std::string payload = JSONRPCNotification(Methods::Log, JSONValue{std::move(params)}).Serialize();
        for (const auto& sessionId : subs->SessionsFor(diag.uri)) {
            transports.SendTo(sessionId, payload);
        }
    }

    void wireSubscriptions() {
        std::weak_ptr<Impl> weak = weak_from_this();
        subs->AddChangeListener([weak](const subscriptions::ResourceChanged& event) {
            if (auto self = weak.lock()) {
                self->fanOutChange(event);
            }
        });
        subs->AddDiagnosticListener([weak](const subscriptions::SubscriptionDiagnostic& diag) {
            if (auto self = weak.lock()) {
                self->fanOutDiagnostic(diag);
            }
        });
    }

    /////////////////////////////////////////// Lifecycle ///////////////////////////////////////////

    std::vector<ChannelInfo> start() {
        if (stopped.load()) {
            throw std::logic_error("Server cannot be restarted after Stop()");
        }
        if (started.exchange(true)) {
            throw std::logic_error("Server already started");
        }
        if (config.enableWebSocket) {
            WebSocketChannel::Options opts;
            opts.address = config.host;
            opts.port = config.wsPort;
            opts.path = config.wsPath;
            opts.serverInfo = serverInfo;
            opts.shutdownGrace = config.shutdownGrace;
            wireChannel(kWebSocketChannel, std::make_shared<WebSocketChannel>(opts, workers));
        }
        if (config.enableHttp) {
            HttpSseChannel::Options opts;
            opts.address = config.host;
            opts.port = config.httpPort;
            opts.scheme = config.httpScheme;
            opts.certFile = config.tlsCert;
            opts.keyFile = config.tlsKey;
            opts.keepAlive = config.sseKeepAlive;
            opts.shutdownGrace = config.shutdownGrace;
            try {
                wireChannel(kHttpChannel, std::make_shared<HttpSseChannel>(opts, workers));
            } catch (const std::exception& e) {
                // Without a usable certificate the HTTP channel is skipped like a failed bind.
                LOG_ERROR("HTTP/SSE channel disabled: {}", e.what());
            }
        }
        wireSubscriptions();
        auto infos = transports.StartAll();
        LOG_INFO("{} {} started with {} channels (embedmcp {})", serverInfo.name, serverInfo.version, infos.size(),
                 getVersionString());
        return infos;
    }

    void stop() {
        if (stopped.exchange(true)) {
            return;
        }
        transports.StopAll();
        workers.join();
        correlator->Shutdown();
        subs->Shutdown();
        scheduler.Stop();
        if (started.load()) {
            LOG_INFO("{} stopped", serverInfo.name);
        }
    }
};

Server::Server(ServerConfig config, Implementation serverInfo, Providers providers,
               std::unique_ptr<subscriptions::IWatchBackend> watchBackend)
    : pImpl(std::make_shared<Impl>(std::move(config), std::move(serverInfo), providers, std::move(watchBackend))) {}

Server::~Server() {
    pImpl->stop();
}

std::future<std::vector<ChannelInfo>> Server::Start() {
    std::promise<std::vector<ChannelInfo>> ready;
    auto fut = ready.get_future();
    try {
        ready.set_value(pImpl->start());
    } catch (const std::exception& e) {
        LOG_ERROR("Server failed to start: {}", e.what());
        ready.set_exception(std::current_exception());
    }
    return fut;
}

std::future<void> Server::Stop() {
    std::promise<void> done;
    auto fut = done.get_future();
    pImpl->stop();
    done.set_value();
    return fut;
}

bool Server::IsRunning() const {
    return pImpl->transports.IsRunning();
}

void Server::Suspend() {
    pImpl->subs->Suspend();
}

void Server::Resume() {
    pImpl->subs->Resume();
}

std::future<CreateMessageResult> Server::RequestCreateMessage(const std::string& sessionId,
                                                              const CreateMessageParams& params,
                                                              std::optional<std::chrono::milliseconds> timeout) {
    auto promise = std::make_shared<std::promise<CreateMessageResult>>();
    auto fut = promise->get_future();
    pImpl->correlator->IssueAsync(
        sessionId, Methods::CreateMessage, ToJSON(params),
        [promise](std::exception_ptr error, JSONValue result) {
            if (error) {
                promise->set_exception(error);
                return;
            }
            try {
                promise->set_value(CreateMessageResultFromJSON(result));
            } catch (const std::exception& e) {
                LOG_WARN("Malformed sampling result: {}", e.what());
                promise->set_exception(std::current_exception());
            }
        },
        timeout);
    return fut;
}

std::future<JSONValue> Server::SendRequest(const std::string& sessionId, const std::string& method,
                                           std::optional<JSONValue> params) {
    return pImpl->correlator->IssueWithRetry(sessionId, method, std::move(params), pImpl->config.retry);
}

bool Server::Notify(const std::string& sessionId, const std::string& method, std::optional<JSONValue> params) {
    return pImpl->transports.SendTo(sessionId, JSONRPCNotification(method, std::move(params)).Serialize());
}

std::size_t Server::BroadcastNotification(const std::string& method, std::optional<JSONValue> params) {
    if (!pImpl->transports.IsRunning()) {
        return 0;
    }
    try {
        return pImpl->transports.Broadcast(JSONRPCNotification(method, std::move(params)).Serialize());
    } catch (const errors::ChannelError& e) {
        LOG_WARN("{} broadcast failed: {}", method, e.what());
        return 0;
    }
}

void Server::NotifyToolsListChanged() {
    BroadcastNotification(Methods::ToolListChanged);
}

void Server::NotifyResourcesListChanged() {
    BroadcastNotification(Methods::ResourceListChanged);
}

void Server::NotifyPromptsListChanged() {
    BroadcastNotification(Methods::PromptListChanged);
}

const ServerConfig& Server::Config() const {
    return pImpl->config;
}

FileAccessPolicy& Server::AccessPolicy() {
    return pImpl->policy;
}

subscriptions::SubscriptionManager& Server::Subscriptions() {
    return *pImpl->subs;
}

const SessionRegistry& Server::Sessions() const {
    return pImpl->sessions;
}

std::vector<ChannelStatus> Server::Status() const {
    return pImpl->transports.Status();
}

std::size_t Server::PendingOutboundCount() const {
    return pImpl->correlator->PendingCount();
}

} // namespace embedmcp
