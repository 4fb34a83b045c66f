//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol data structures, method names and their JSON forms
//==========================================================================================================

#pragma once

#include "embedmcp/JSONRPCTypes.h"
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>

namespace embedmcp {
//==========================================================================================================
// MCP Protocol types and constants
// Purpose: Shared protocol structures, capabilities, and method names.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// MCP Protocol version
constexpr const char* PROTOCOL_VERSION = "2025-11-25";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Capabilities ///////////////////////////////////////////
struct ToolsCapability {
    bool listChanged = false;
};

struct ResourcesCapability {
    bool subscribe = false;
    bool listChanged = false;
};

struct PromptsCapability {
    bool listChanged = false;
};

struct LoggingCapability {
    // Presence indicates notifications/message is emitted
};

struct ServerCapabilities {
    std::optional<ToolsCapability> tools;
    std::optional<ResourcesCapability> resources;
    std::optional<PromptsCapability> prompts;
    std::optional<LoggingCapability> logging;
    std::unordered_map<std::string, JSONValue> experimental;
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;  // JSON Schema for tool parameters

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue inputSchema = JSONValue{})
        : name(std::move(name)), description(std::move(description)),
          inputSchema(std::move(inputSchema)) {}
};

struct CallToolResult {
    std::vector<JSONValue> content;  // Array of content items
    bool isError = false;
};

///////////////////////////////////////// Resources ///////////////////////////////////////////
struct Resource {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mimeType;

    Resource() = default;
    Resource(std::string uri, std::string name,
             std::optional<std::string> description = std::nullopt,
             std::optional<std::string> mimeType = std::nullopt)
        : uri(std::move(uri)), name(std::move(name)),
          description(std::move(description)), mimeType(std::move(mimeType)) {}
};

struct ResourceTemplate {
    std::string uriTemplate;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mimeType;

    ResourceTemplate() = default;
    ResourceTemplate(std::string uriTemplate, std::string name,
                     std::optional<std::string> description = std::nullopt,
                     std::optional<std::string> mimeType = std::nullopt)
        : uriTemplate(std::move(uriTemplate)), name(std::move(name)),
          description(std::move(description)), mimeType(std::move(mimeType)) {}
};

struct ReadResourceResult {
    std::vector<JSONValue> contents;  // Array of resource contents
};

///////////////////////////////////////// Prompts ///////////////////////////////////////////
struct Prompt {
    std::string name;
    std::string description;
    std::optional<JSONValue> arguments;  // Array of argument descriptors

    Prompt() = default;
    Prompt(std::string name, std::string description,
           std::optional<JSONValue> arguments = std::nullopt)
        : name(std::move(name)), description(std::move(description)),
          arguments(std::move(arguments)) {}
};

struct GetPromptResult {
    std::string description;
    std::vector<JSONValue> messages;  // Array of message objects
};

///////////////////////////////////////// Roots ///////////////////////////////////////////
struct Root {
    std::string uri;   // file:// URI of the root directory
    std::string name;
};

///////////////////////////////////////// Sampling ///////////////////////////////////////////
// Server-to-client model sampling
struct CreateMessageParams {
    std::vector<JSONValue> messages;
    std::optional<JSONValue> modelPreferences;
    std::optional<std::string> systemPrompt;
    std::optional<std::string> includeContext;
    std::optional<int> maxTokens;
    std::optional<double> temperature;
    std::optional<std::vector<std::string>> stopSequences;
    std::optional<JSONValue> metadata;
};

struct CreateMessageResult {
    std::string model;
    std::string role;
    JSONValue content;
    std::optional<std::string> stopReason;
};

///////////////////////////////////////// JSON forms ///////////////////////////////////////////
JSONValue ToJSON(const Implementation& impl);
JSONValue ToJSON(const ServerCapabilities& caps);
JSONValue ToJSON(const Tool& tool);
JSONValue ToJSON(const CallToolResult& result);
JSONValue ToJSON(const Resource& resource);
JSONValue ToJSON(const ResourceTemplate& resourceTemplate);
JSONValue ToJSON(const ReadResourceResult& result);
JSONValue ToJSON(const Prompt& prompt);
JSONValue ToJSON(const GetPromptResult& result);
JSONValue ToJSON(const Root& root);
JSONValue ToJSON(const CreateMessageParams& params);

// Throws std::invalid_argument when required members are missing or mistyped.
CreateMessageResult CreateMessageResultFromJSON(const JSONValue& value);

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    // Client to server
    constexpr const char* Initialize = "initialize";
    constexpr const char* Ping = "ping";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ListResources = "resources/list";
    constexpr const char* ReadResource = "resources/read";
    constexpr const char* Subscribe = "resources/subscribe";
    constexpr const char* Unsubscribe = "resources/unsubscribe";
    constexpr const char* ListResourceTemplates = "resources/templates/list";
    constexpr const char* ListPrompts = "prompts/list";
    constexpr const char* GetPrompt = "prompts/get";
    constexpr const char* ListRoots = "roots/list";

    // Server to client
    constexpr const char* CreateMessage = "sampling/createMessage";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* Cancelled = "notifications/cancelled";
    constexpr const char* Connection = "notifications/connection";
    constexpr const char* Log = "notifications/message";
    constexpr const char* ResourceUpdated = "notifications/resources/updated";
    constexpr const char* ResourceListChanged = "notifications/resources/list_changed";
    constexpr const char* ToolListChanged = "notifications/tools/list_changed";
    constexpr const char* PromptListChanged = "notifications/prompts/list_changed";
}

} // namespace embedmcp
