//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Registries.cpp
// Purpose: In-process tool, resource and prompt registries
//==========================================================================================================

#include <stdexcept>

#include "embedmcp/Registries.h"
#include "embedmcp/errors/Errors.h"
#include "logging/Logger.h"

namespace embedmcp {

/////////////////////////////////////////// ToolRegistry ///////////////////////////////////////////
void ToolRegistry::Register(const Tool& tool, ToolHandler handler) {
    if (tool.name.empty()) {
        throw std::invalid_argument("Tool name must not be empty");
    }
    if (!handler) {
        throw std::invalid_argument("Tool handler must not be empty: " + tool.name);
    }
    LOG_DEBUG("Registering tool: {}", tool.name);
    std::lock_guard<std::mutex> lock(mutex);
    tools[tool.name] = Entry{tool, std::move(handler)};
}

bool ToolRegistry::Unregister(const std::string& name) {
    LOG_DEBUG("Unregistering tool: {}", name);
    std::lock_guard<std::mutex> lock(mutex);
    return tools.erase(name) > 0;
}

std::vector<Tool> ToolRegistry::ListTools() {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<Tool> out;
    out.reserve(tools.size());
    for (const auto& [name, entry] : tools) {
        out.push_back(entry.tool);
    }
    return out;
}

CallToolResult ToolRegistry::CallTool(const std::string& name, const JSONValue& arguments) {
    ToolHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = tools.find(name);
        if (it == tools.end()) {
            throw errors::NotFoundError("Tool not found: " + name);
        }
        handler = it->second.handler;
    }
    return handler(arguments);
}

/////////////////////////////////////////// ResourceRegistry ///////////////////////////////////////////
void ResourceRegistry::Register(const Resource& resource, ResourceHandler handler) {
    if (resource.uri.empty()) {
        throw std::invalid_argument("Resource uri must not be empty");
    }
    if (!handler) {
        throw std::invalid_argument("Resource handler must not be empty: " + resource.uri);
    }
    LOG_DEBUG("Registering resource: {}", resource.uri);
    std::lock_guard<std::mutex> lock(mutex);
    resources[resource.uri] = Entry{resource, std::move(handler)};
}

bool ResourceRegistry::Unregister(const std::string& uri) {
    LOG_DEBUG("Unregistering resource: {}", uri);
    std::lock_guard<std::mutex> lock(mutex);
    return resources.erase(uri) > 0;
}

void ResourceRegistry::RegisterTemplate(const ResourceTemplate& resourceTemplate) {
    if (resourceTemplate.uriTemplate.empty()) {
        throw std::invalid_argument("Resource template must not be empty");
    }
    std::lock_guard<std::mutex> lock(mutex);
    templates[resourceTemplate.uriTemplate] = resourceTemplate;
}

bool ResourceRegistry::UnregisterTemplate(const std::string& uriTemplate) {
    std::lock_guard<std::mutex> lock(mutex);
    return templates.erase(uriTemplate) > 0;
}

std::vector<Resource> ResourceRegistry::ListResources() {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<Resource> out;
    out.reserve(resources.size());
    for (const auto& [uri, entry] : resources) {
        out.push_back(entry.resource);
    }
    return out;
}

std::vector<ResourceTemplate> ResourceRegistry::ListResourceTemplates() {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<ResourceTemplate> out;
    out.reserve(templates.size());
    for (const auto& [key, t] : templates) {
        out.push_back(t);
    }
    return out;
}

ReadResourceResult ResourceRegistry::ReadResource(const std::string& uri) {
    ResourceHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = resources.find(uri);
        if (it == resources.end()) {
            throw errors::NotFoundError("Resource not found: " + uri);
        }
        handler = it->second.handler;
    }
    return handler(uri);
}

/////////////////////////////////////////// PromptRegistry ///////////////////////////////////////////
void PromptRegistry::Register(const Prompt& prompt, PromptHandler handler) {
    if (prompt.name.empty()) {
        throw std::invalid_argument("Prompt name must not be empty");
    }
    if (!handler) {
        throw std::invalid_argument("Prompt handler must not be empty: " + prompt.name);
    }
    LOG_DEBUG("Registering prompt: {}", prompt.name);
    std::lock_guard<std::mutex> lock(mutex);
    prompts[prompt.name] = Entry{prompt, std::move(handler)};
}

bool PromptRegistry::Unregister(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex);
    return prompts.erase(name) > 0;
}

std::vector<Prompt> PromptRegistry::ListPrompts() {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<Prompt> out;
    out.reserve(prompts.size());
    for (const auto& [name, entry] : prompts) {
        out.push_back(entry.prompt);
    }
    return out;
}

GetPromptResult PromptRegistry::GetPrompt(const std::string& name, const JSONValue& arguments) {
    PromptHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = prompts.find(name);
        if (it == prompts.end()) {
            throw errors::NotFoundError("Prompt not found: " + name);
        }
        handler = it->second.handler;
    }
    return handler(arguments);
}

/////////////////////////////////////////// Content helpers ///////////////////////////////////////////
JSONValue MakeTextContent(const std::string& text) {
    JSONValue::Object obj;
    obj["type"] = std::make_shared<JSONValue>("text");
    obj["text"] = std::make_shared<JSONValue>(text);
    return JSONValue(std::move(obj));
}

JSONValue MakeTextResourceContent(const std::string& uri, const std::string& text, const std::string& mimeType) {
    JSONValue::Object obj;
    obj["uri"] = std::make_shared<JSONValue>(uri);
    obj["mimeType"] = std::make_shared<JSONValue>(mimeType);
    obj["text"] = std::make_shared<JSONValue>(text);
    return JSONValue(std::move(obj));
}

JSONValue MakePromptMessage(const std::string& role, const std::string& text) {
    JSONValue::Object obj;
    obj["role"] = std::make_shared<JSONValue>(role);
    obj["content"] = std::make_shared<JSONValue>(MakeTextContent(text));
    return JSONValue(std::move(obj));
}

} // namespace embedmcp
