//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_server_config.cpp
// Purpose: Tests for ServerConfig defaults, environment overrides and validation
//==========================================================================================================

#include <gtest/gtest.h>

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

#include "embedmcp/ServerConfig.h"

using namespace embedmcp;
using namespace std::chrono_literals;

namespace {

// Sets variables for one test and unsets them afterwards.
class ScopedEnv {
public:
    ~ScopedEnv() {
        for (const auto& n : names) {
            ::unsetenv(n.c_str());
        }
    }
    void Set(const std::string& name, const std::string& value) {
        ::setenv(name.c_str(), value.c_str(), 1);
        names.push_back(name);
    }

private:
    std::vector<std::string> names;
};

} // namespace

TEST(ServerConfig, DefaultsAreValid) {
    ServerConfig cfg;
    EXPECT_NO_THROW(cfg.Validate());
    EXPECT_EQ(cfg.wsPort, 8080);
    EXPECT_EQ(cfg.httpPort, 8081);
    EXPECT_EQ(cfg.subscriptions.debounce, 500ms);
    EXPECT_EQ(cfg.subscriptions.maxWatchers, 50u);
    EXPECT_EQ(cfg.subscriptions.degradedThreshold, 3u);
    EXPECT_EQ(cfg.outboundTimeout, 30000ms);
}

TEST(ServerConfig, EnvironmentOverridesDefaults) {
    ScopedEnv env;
    env.Set("EMBEDMCP_HOST", "127.0.0.1");
    env.Set("EMBEDMCP_ENABLE_HTTP", "off");
    env.Set("EMBEDMCP_WS_PORT", "9000");
    env.Set("EMBEDMCP_WS_PATH", "/rpc");
    env.Set("EMBEDMCP_DEBOUNCE_MS", "250");
    env.Set("EMBEDMCP_MAX_WATCHERS", "8");
    env.Set("EMBEDMCP_OUTBOUND_TIMEOUT_MS", "1500");
    env.Set("EMBEDMCP_RETRY_MAX_ATTEMPTS", "5");
    env.Set("EMBEDMCP_WORKER_THREADS", "2");

    ServerConfig cfg = ServerConfig::FromEnvironment();
    EXPECT_EQ(cfg.host, "127.0.0.1");
    EXPECT_FALSE(cfg.enableHttp);
    EXPECT_TRUE(cfg.enableWebSocket);
    EXPECT_EQ(cfg.wsPort, 9000);
    EXPECT_EQ(cfg.wsPath, "/rpc");
    EXPECT_EQ(cfg.subscriptions.debounce, 250ms);
    EXPECT_EQ(cfg.subscriptions.maxWatchers, 8u);
    EXPECT_EQ(cfg.outboundTimeout, 1500ms);
    EXPECT_EQ(cfg.retry.maxAttempts, 5u);
    EXPECT_EQ(cfg.workerThreads, 2u);
    EXPECT_NO_THROW(cfg.Validate());
}

TEST(ServerConfig, MalformedValuesNameTheVariable) {
    {
        ScopedEnv env;
        env.Set("EMBEDMCP_WS_PORT", "eighty");
        try {
            (void)ServerConfig::FromEnvironment();
            FAIL() << "expected invalid_argument";
        } catch (const std::invalid_argument& e) {
            EXPECT_NE(std::string(e.what()).find("EMBEDMCP_WS_PORT"), std::string::npos);
        }
    }
    {
        ScopedEnv env;
        env.Set("EMBEDMCP_HTTP_PORT", "70000");
        EXPECT_THROW((void)ServerConfig::FromEnvironment(), std::invalid_argument);
    }
    {
        ScopedEnv env;
        env.Set("EMBEDMCP_ENABLE_WS", "maybe");
        EXPECT_THROW((void)ServerConfig::FromEnvironment(), std::invalid_argument);
    }
    {
        ScopedEnv env;
        env.Set("EMBEDMCP_DEBOUNCE_MS", "-5");
        EXPECT_THROW((void)ServerConfig::FromEnvironment(), std::invalid_argument);
    }
}

TEST(ServerConfig, RootsSplitOnColonKeepingFileUris) {
    ScopedEnv env;
    env.Set("EMBEDMCP_ROOTS", "/data/a:file:///data/b::/data/c");
    ServerConfig cfg = ServerConfig::FromEnvironment();
    ASSERT_EQ(cfg.roots.size(), 3u);
    EXPECT_EQ(cfg.roots[0], "/data/a");
    EXPECT_EQ(cfg.roots[1], "file:///data/b");
    EXPECT_EQ(cfg.roots[2], "/data/c");
}

TEST(ServerConfig, ValidateRejectsInconsistentSettings) {
    auto rejects = [](auto mutate) {
        ServerConfig cfg;
        mutate(cfg);
        EXPECT_THROW(cfg.Validate(), std::invalid_argument);
    };
    rejects([](ServerConfig& c) { c.enableWebSocket = false; c.enableHttp = false; });
    rejects([](ServerConfig& c) { c.httpPort = c.wsPort; });
    rejects([](ServerConfig& c) { c.wsPath = "mcp"; });
    rejects([](ServerConfig& c) { c.httpScheme = "ftp"; });
    rejects([](ServerConfig& c) { c.httpScheme = "https"; });
    rejects([](ServerConfig& c) { c.subscriptions.pollFloor = c.subscriptions.pollBase + 1ms; });
    rejects([](ServerConfig& c) { c.subscriptions.pollCeiling = c.subscriptions.pollBase - 1ms; });
    rejects([](ServerConfig& c) { c.subscriptions.pollFloor = 0ms; });
    rejects([](ServerConfig& c) { c.subscriptions.maxWatchers = 0; });
    rejects([](ServerConfig& c) { c.subscriptions.degradedThreshold = 0; });
    rejects([](ServerConfig& c) { c.retry.maxAttempts = 0; });
    rejects([](ServerConfig& c) { c.retry.initialDelay = c.retry.maxDelay + 1ms; });
    rejects([](ServerConfig& c) { c.workerThreads = 0; });
    rejects([](ServerConfig& c) { c.outboundTimeout = 0ms; });
    rejects([](ServerConfig& c) { c.sseKeepAlive = 0ms; });

    ServerConfig both0;
    both0.wsPort = 0;
    both0.httpPort = 0;
    EXPECT_NO_THROW(both0.Validate());

    ServerConfig tls;
    tls.httpScheme = "https";
    tls.tlsCert = "/etc/embedmcp/cert.pem";
    tls.tlsKey = "/etc/embedmcp/key.pem";
    EXPECT_NO_THROW(tls.Validate());
}
