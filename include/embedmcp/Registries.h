//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Registries.h
// Purpose: In-process tool, resource and prompt registries implementing the provider interfaces
//==========================================================================================================

#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "embedmcp/Providers.h"

namespace embedmcp {

// Handler callbacks. They may throw the exceptions described in Providers.h.
using ToolHandler = std::function<CallToolResult(const JSONValue& arguments)>;
using ResourceHandler = std::function<ReadResourceResult(const std::string& uri)>;
using PromptHandler = std::function<GetPromptResult(const JSONValue& arguments)>;

//==========================================================================================================
// ToolRegistry
// Purpose: Name -> (metadata, handler) map. Thread-safe; handlers run without the registry lock held.
//==========================================================================================================
class ToolRegistry : public IToolProvider {
public:
    //==========================================================================================================
    // Registers or replaces a tool.
    // Args:
    //   tool: Metadata; tool.name is the key.
    //   handler: Invoked for tools/call.
    // Throws:
    //   std::invalid_argument when the name is empty or the handler is empty.
    //==========================================================================================================
    void Register(const Tool& tool, ToolHandler handler);

    // Returns true when a tool was removed.
    bool Unregister(const std::string& name);

    std::vector<Tool> ListTools() override;
    CallToolResult CallTool(const std::string& name, const JSONValue& arguments) override;

private:
    struct Entry {
        Tool tool;
        ToolHandler handler;
    };
    std::mutex mutex;
    std::map<std::string, Entry> tools;
};

//==========================================================================================================
// ResourceRegistry
// Purpose: URI -> (metadata, reader) map plus a list of advertised templates.
//==========================================================================================================
class ResourceRegistry : public IResourceProvider {
public:
    void Register(const Resource& resource, ResourceHandler handler);
    bool Unregister(const std::string& uri);

    void RegisterTemplate(const ResourceTemplate& resourceTemplate);
    bool UnregisterTemplate(const std::string& uriTemplate);

    std::vector<Resource> ListResources() override;
    std::vector<ResourceTemplate> ListResourceTemplates() override;

    // Throws errors::NotFoundError for unknown URIs.
    ReadResourceResult ReadResource(const std::string& uri) override;

private:
    struct Entry {
        Resource resource;
        ResourceHandler handler;
    };
    std::mutex mutex;
    std::map<std::string, Entry> resources;
    std::map<std::string, ResourceTemplate> templates;
};

//==========================================================================================================
// PromptRegistry
// Purpose: Name -> (metadata, renderer) map.
//==========================================================================================================
class PromptRegistry : public IPromptProvider {
public:
    void Register(const Prompt& prompt, PromptHandler handler);
    bool Unregister(const std::string& name);

    std::vector<Prompt> ListPrompts() override;
    GetPromptResult GetPrompt(const std::string& name, const JSONValue& arguments) override;

private:
    struct Entry {
        Prompt prompt;
        PromptHandler handler;
    };
    std::mutex mutex;
    std::map<std::string, Entry> prompts;
};

//==========================================================================================================
// Content helpers
// Purpose: Build the common content item shapes returned by handlers.
//==========================================================================================================
JSONValue MakeTextContent(const std::string& text);
JSONValue MakeTextResourceContent(const std::string& uri, const std::string& text,
                                  const std::string& mimeType = "text/plain");
JSONValue MakePromptMessage(const std::string& role, const std::string& text);

} // namespace embedmcp
