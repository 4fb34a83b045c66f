//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/embedmcp/ServerConfig.cpp
// Purpose: Server configuration with defaults and EMBEDMCP_* environment overrides
//==========================================================================================================

#include <stdexcept>

#include "embedmcp/ServerConfig.h"
#include "env/EnvVars.h"

namespace embedmcp {

namespace {

std::chrono::milliseconds envMillis(const char* name, std::chrono::milliseconds def) {
    return std::chrono::milliseconds(
        static_cast<std::chrono::milliseconds::rep>(GetEnvUIntOrDefault(name, static_cast<std::uint64_t>(def.count()))));
}

std::uint16_t envPort(const char* name, std::uint16_t def) {
    return static_cast<std::uint16_t>(GetEnvUIntOrDefault(name, def, 65535));
}

std::vector<std::string> splitRoots(const std::string& raw) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start <= raw.size()) {
        auto sep = raw.find(':', start);
        std::string part = raw.substr(start, sep == std::string::npos ? std::string::npos : sep - start);
        // Keep "file://..." entries whole
        if (part == "file" && sep != std::string::npos && raw.compare(sep, 3, "://") == 0) {
            auto next = raw.find(':', sep + 3);
            part = raw.substr(start, next == std::string::npos ? std::string::npos : next - start);
            sep = next;
        }
        if (!part.empty()) {
            out.push_back(part);
        }
        if (sep == std::string::npos) {
            break;
        }
        start = sep + 1;
    }
    return out;
}

} // namespace

ServerConfig ServerConfig::FromEnvironment() {
    ServerConfig cfg;
    cfg.host = GetEnvOrDefault("EMBEDMCP_HOST", cfg.host);
    cfg.enableWebSocket = GetEnvFlagOrDefault("EMBEDMCP_ENABLE_WS", cfg.enableWebSocket);
    cfg.enableHttp = GetEnvFlagOrDefault("EMBEDMCP_ENABLE_HTTP", cfg.enableHttp);
    cfg.wsPort = envPort("EMBEDMCP_WS_PORT", cfg.wsPort);
    cfg.wsPath = GetEnvOrDefault("EMBEDMCP_WS_PATH", cfg.wsPath);
    cfg.httpPort = envPort("EMBEDMCP_HTTP_PORT", cfg.httpPort);
    cfg.httpScheme = GetEnvOrDefault("EMBEDMCP_HTTP_SCHEME", cfg.httpScheme);
    cfg.tlsCert = GetEnvOrDefault("EMBEDMCP_TLS_CERT", cfg.tlsCert);
    cfg.tlsKey = GetEnvOrDefault("EMBEDMCP_TLS_KEY", cfg.tlsKey);
    cfg.sseKeepAlive = envMillis("EMBEDMCP_SSE_KEEPALIVE_MS", cfg.sseKeepAlive);

    auto& subs = cfg.subscriptions;
    subs.debounce = envMillis("EMBEDMCP_DEBOUNCE_MS", subs.debounce);
    subs.pollBase = envMillis("EMBEDMCP_POLL_BASE_MS", subs.pollBase);
    subs.pollCeiling = envMillis("EMBEDMCP_POLL_CEILING_MS", subs.pollCeiling);
    subs.pollFloor = envMillis("EMBEDMCP_POLL_FLOOR_MS", subs.pollFloor);
    subs.maxWatchers = static_cast<std::size_t>(GetEnvUIntOrDefault("EMBEDMCP_MAX_WATCHERS", subs.maxWatchers));
    subs.degradedThreshold = static_cast<unsigned>(
        GetEnvUIntOrDefault("EMBEDMCP_DEGRADED_THRESHOLD", subs.degradedThreshold, UINT32_MAX));

    cfg.outboundTimeout = envMillis("EMBEDMCP_OUTBOUND_TIMEOUT_MS", cfg.outboundTimeout);
    cfg.retry.maxAttempts = static_cast<unsigned>(
        GetEnvUIntOrDefault("EMBEDMCP_RETRY_MAX_ATTEMPTS", cfg.retry.maxAttempts, UINT32_MAX));
    cfg.retry.initialDelay = envMillis("EMBEDMCP_RETRY_INITIAL_MS", cfg.retry.initialDelay);
    cfg.retry.maxDelay = envMillis("EMBEDMCP_RETRY_MAX_MS", cfg.retry.maxDelay);

    cfg.workerThreads = static_cast<std::size_t>(GetEnvUIntOrDefault("EMBEDMCP_WORKER_THREADS", cfg.workerThreads));
    cfg.shutdownGrace = envMillis("EMBEDMCP_SHUTDOWN_GRACE_MS", cfg.shutdownGrace);
    cfg.roots = splitRoots(GetEnvOrDefault("EMBEDMCP_ROOTS", std::string()));
    return cfg;
}

void ServerConfig::Validate() const {
    if (!enableWebSocket && !enableHttp) {
        throw std::invalid_argument("At least one channel must be enabled");
    }
    if (enableWebSocket && wsPort == httpPort && enableHttp && wsPort != 0) {
        throw std::invalid_argument("WebSocket and HTTP ports must differ (" + std::to_string(wsPort) + ")");
    }
    if (wsPath.empty() || wsPath.front() != '/') {
        throw std::invalid_argument("WebSocket path must start with '/': " + wsPath);
    }
    if (httpScheme != "http" && httpScheme != "https") {
        throw std::invalid_argument("HTTP scheme must be http or https: " + httpScheme);
    }
    if (enableHttp && httpScheme == "https" && (tlsCert.empty() || tlsKey.empty())) {
        throw std::invalid_argument("https requires EMBEDMCP_TLS_CERT and EMBEDMCP_TLS_KEY");
    }
    if (subscriptions.pollFloor > subscriptions.pollBase || subscriptions.pollBase > subscriptions.pollCeiling) {
        throw std::invalid_argument("Poll intervals must satisfy floor <= base <= ceiling");
    }
    if (subscriptions.pollFloor.count() <= 0) {
        throw std::invalid_argument("Poll floor must be positive");
    }
    if (subscriptions.degradedThreshold < 1) {
        throw std::invalid_argument("Degraded threshold must be at least 1");
    }
    if (subscriptions.maxWatchers < 1) {
        throw std::invalid_argument("Max watchers must be at least 1");
    }
    if (retry.maxAttempts < 1) {
        throw std::invalid_argument("Retry attempts must be at least 1");
    }
    if (retry.initialDelay > retry.maxDelay) {
        throw std::invalid_argument("Retry initial delay must not exceed the maximum delay");
    }
    if (workerThreads < 1) {
        throw std::invalid_argument("Worker threads must be at least 1");
    }
    if (outboundTimeout.count() <= 0) {
        throw std::invalid_argument("Outbound timeout must be positive");
    }
    if (sseKeepAlive.count() <= 0) {
        throw std::invalid_argument("SSE keep-alive must be positive");
    }
}

} // namespace embedmcp
