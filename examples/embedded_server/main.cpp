//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Embedded server example: registries, a watched file root and both channels
//==========================================================================================================

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "embedmcp/FileAccessPolicy.h"
#include "embedmcp/Registries.h"
#include "embedmcp/Server.h"
#include "embedmcp/errors/Errors.h"
#include "embedmcp/version.h"
#include "env/EnvVars.h"
#include "logging/Logger.h"

using namespace embedmcp;

namespace {

JSONValue messageSchema() {
    JSONValue::Object msgType;
    msgType["type"] = std::make_shared<JSONValue>(std::string("string"));
    JSONValue::Object props;
    props["message"] = std::make_shared<JSONValue>(JSONValue{msgType});
    JSONValue::Array required;
    required.push_back(std::make_shared<JSONValue>(std::string("message")));
    JSONValue::Object schema;
    schema["type"] = std::make_shared<JSONValue>(std::string("object"));
    schema["properties"] = std::make_shared<JSONValue>(JSONValue{props});
    schema["required"] = std::make_shared<JSONValue>(JSONValue{required});
    return JSONValue{schema};
}

std::string readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw errors::NotFoundError("Cannot open " + path);
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

} // namespace

int main() {
    FUNC_SCOPE();
    Logger::configureFromEnvironment();

    ServerConfig config;
    try {
        config = ServerConfig::FromEnvironment();
        config.Validate();
    } catch (const std::exception& e) {
        LOG_ERROR("Invalid configuration: {}", e.what());
        return EXIT_FAILURE;
    }

    std::atomic<std::int64_t> uptimeReads{0};
    const auto startedAt = std::chrono::steady_clock::now();

    ToolRegistry tools;
    tools.Register(Tool{"echo", "Echo a message", messageSchema()}, [](const JSONValue& args) {
        auto message = GetStringMember(args, "message");
        if (!message.has_value()) {
            throw std::invalid_argument("message is required");
        }
        CallToolResult result;
        result.content.push_back(MakeTextContent(message.value()));
        return result;
    });

    ResourceRegistry resources;
    // Dynamic resource; subscriptions to it are polled.
    resources.Register(Resource{"app://status/uptime", "Uptime", std::string("Seconds since start"), std::string("text/plain")},
                       [&](const std::string& uri) {
                           ++uptimeReads;
                           const auto secs = std::chrono::duration_cast<std::chrono::seconds>(
                               std::chrono::steady_clock::now() - startedAt).count();
                           ReadResourceResult result;
                           result.contents.push_back(MakeTextResourceContent(uri, std::to_string(secs)));
                           return result;
                       });
    // Files under the configured roots; subscriptions to them use inotify.
    resources.RegisterTemplate(ResourceTemplate{"file:///{path}", "Files", std::string("Files under the roots")});
    for (const auto& root : config.roots) {
        const std::string readme = root + "/README.txt";
        resources.Register(Resource{FileAccessPolicy::PathToFileUri(readme), "README.txt"},
                           [readme](const std::string& uri) {
                               ReadResourceResult result;
                               result.contents.push_back(MakeTextResourceContent(uri, readFile(readme)));
                               return result;
                           });
    }

    PromptRegistry prompts;
    prompts.Register(Prompt{"summarize", "Summarize the given text"}, [](const JSONValue& args) {
        GetPromptResult result;
        result.description = "Summarize";
        result.messages.push_back(
            MakePromptMessage("user", "Summarize: " + GetStringMember(args, "text").value_or(std::string())));
        return result;
    });

    std::unique_ptr<Server> server;
    try {
        server = std::make_unique<Server>(config, MakeServerInfo("embedmcp-example"),
                                          Server::Providers{&tools, &resources, &prompts});
        for (const auto& info : server->Start().get()) {
            LOG_INFO("Listening: {} {}:{}{}", info.type, info.host, info.port, info.path);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Startup failed: {}", e.what());
        return EXIT_FAILURE;
    }

    boost::asio::io_context signals;
    boost::asio::signal_set set(signals, SIGINT, SIGTERM);
    set.async_wait([](const boost::system::error_code& ec, int signo) {
        if (!ec) {
            LOG_INFO("Signal {} received, shutting down", signo);
        }
    });
    signals.run();

    server->Stop().get();
    LOG_INFO("Served {} uptime reads", uptimeReads.load());
    return EXIT_SUCCESS;
}
