//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.h
// Purpose: Server configuration with defaults and EMBEDMCP_* environment overrides
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "embedmcp/OutboundRequestCorrelator.h"
#include "embedmcp/subscriptions/SubscriptionManager.h"

namespace embedmcp {

//==========================================================================================================
// ServerConfig
// Purpose: Everything Server needs besides the providers.
// Fields:
//   host: Bind address shared by both channels
//   enableWebSocket/enableHttp: Which channels to run (at least one)
//   wsPort/wsPath: WebSocket listener; port 0 picks an ephemeral port
//   httpPort/httpScheme/tlsCert/tlsKey: HTTP/SSE listener; https needs PEM cert and key
//   sseKeepAlive: Interval of SSE ping comments
//   subscriptions: Debounce, poll intervals, watcher cap, degraded threshold
//   outboundTimeout/retry: Defaults for server-initiated requests
//   workerThreads: Size of the inbound message pool
//   shutdownGrace: Time channels wait for peers to close before force-closing
//   roots: Directories (or file:// URIs) the access policy exposes
//==========================================================================================================
struct ServerConfig {
    std::string host{"0.0.0.0"};
    bool enableWebSocket{true};
    bool enableHttp{true};
    std::uint16_t wsPort{8080};
    std::string wsPath{"/mcp"};
    std::uint16_t httpPort{8081};
    std::string httpScheme{"http"};
    std::string tlsCert;
    std::string tlsKey;
    std::chrono::milliseconds sseKeepAlive{5000};

    subscriptions::SubscriptionOptions subscriptions;

    std::chrono::milliseconds outboundTimeout{30000};
    RetryPolicy retry;

    std::size_t workerThreads{4};
    std::chrono::milliseconds shutdownGrace{2000};
    std::vector<std::string> roots;

    // Defaults overridden by EMBEDMCP_* variables. Throws std::invalid_argument naming the variable
    // when a value is malformed.
    static ServerConfig FromEnvironment();

    // Throws std::invalid_argument describing the first inconsistency.
    void Validate() const;
};

} // namespace embedmcp
