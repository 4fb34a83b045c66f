//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: JSON forms of MCP protocol structures
//==========================================================================================================

#include <stdexcept>

#include "embedmcp/Protocol.h"

namespace embedmcp {

namespace {
void put(JSONValue::Object& obj, const char* key, JSONValue v) {
    obj[key] = std::make_shared<JSONValue>(std::move(v));
}

JSONValue arrayOf(const std::vector<JSONValue>& items) {
    JSONValue::Array arr;
    arr.reserve(items.size());
    for (const auto& item : items) {
        arr.push_back(std::make_shared<JSONValue>(item));
    }
    return JSONValue(std::move(arr));
}
} // namespace

JSONValue ToJSON(const Implementation& impl) {
    JSONValue::Object obj;
    put(obj, "name", JSONValue(impl.name));
    put(obj, "version", JSONValue(impl.version));
    return JSONValue(std::move(obj));
}

JSONValue ToJSON(const ServerCapabilities& caps) {
    JSONValue::Object obj;
    if (!caps.experimental.empty()) {
        JSONValue::Object experimentalObj;
        for (const auto& [key, val] : caps.experimental) {
            experimentalObj[key] = std::make_shared<JSONValue>(val);
        }
        put(obj, "experimental", JSONValue(std::move(experimentalObj)));
    }
    if (caps.prompts.has_value()) {
        JSONValue::Object promptsObj;
        put(promptsObj, "listChanged", JSONValue(caps.prompts->listChanged));
        put(obj, "prompts", JSONValue(std::move(promptsObj)));
    }
    if (caps.resources.has_value()) {
        JSONValue::Object resourcesObj;
        put(resourcesObj, "subscribe", JSONValue(caps.resources->subscribe));
        put(resourcesObj, "listChanged", JSONValue(caps.resources->listChanged));
        put(obj, "resources", JSONValue(std::move(resourcesObj)));
    }
    if (caps.tools.has_value()) {
        JSONValue::Object toolsObj;
        put(toolsObj, "listChanged", JSONValue(caps.tools->listChanged));
        put(obj, "tools", JSONValue(std::move(toolsObj)));
    }
    if (caps.logging.has_value()) {
        put(obj, "logging", JSONValue(JSONValue::Object{}));
    }
    return JSONValue(std::move(obj));
}

JSONValue ToJSON(const Tool& tool) {
    JSONValue::Object obj;
    put(obj, "name", JSONValue(tool.name));
    put(obj, "description", JSONValue(tool.description));
    if (tool.inputSchema.isObject()) {
        put(obj, "inputSchema", tool.inputSchema);
    } else {
        // Minimal schema so clients always see an object shape
        JSONValue::Object schema;
        put(schema, "type", JSONValue("object"));
        put(obj, "inputSchema", JSONValue(std::move(schema)));
    }
    return JSONValue(std::move(obj));
}

JSONValue ToJSON(const CallToolResult& result) {
    JSONValue::Object obj;
    put(obj, "content", arrayOf(result.content));
    put(obj, "isError", JSONValue(result.isError));
    return JSONValue(std::move(obj));
}

JSONValue ToJSON(const Resource& resource) {
    JSONValue::Object obj;
    put(obj, "uri", JSONValue(resource.uri));
    put(obj, "name", JSONValue(resource.name));
    if (resource.description.has_value()) put(obj, "description", JSONValue(resource.description.value()));
    if (resource.mimeType.has_value()) put(obj, "mimeType", JSONValue(resource.mimeType.value()));
    return JSONValue(std::move(obj));
}

JSONValue ToJSON(const ResourceTemplate& resourceTemplate) {
    JSONValue::Object obj;
    put(obj, "uriTemplate", JSONValue(resourceTemplate.uriTemplate));
    put(obj, "name", JSONValue(resourceTemplate.name));
    if (resourceTemplate.description.has_value()) put(obj, "description", JSONValue(resourceTemplate.description.value()));
    if (resourceTemplate.mimeType.has_value()) put(obj, "mimeType", JSONValue(resourceTemplate.mimeType.value()));
    return JSONValue(std::move(obj));
}

JSONValue ToJSON(const ReadResourceResult& result) {
    JSONValue::Object obj;
    put(obj, "contents", arrayOf(result.contents));
    return JSONValue(std::move(obj));
}

JSONValue ToJSON(const Prompt& prompt) {
    JSONValue::Object obj;
    put(obj, "name", JSONValue(prompt.name));
    put(obj, "description", JSONValue(prompt.description));
    if (prompt.arguments.has_value()) put(obj, "arguments", prompt.arguments.value());
    return JSONValue(std::move(obj));
}

JSONValue ToJSON(const GetPromptResult& result) {
    JSONValue::Object obj;
    put(obj, "description", JSONValue(result.description));
    put(obj, "messages", arrayOf(result.messages));
    return JSONValue(std::move(obj));
}

JSONValue ToJSON(const Root& root) {
    JSONValue::Object obj;
    put(obj, "uri", JSONValue(root.uri));
    put(obj, "name", JSONValue(root.name));
    return JSONValue(std::move(obj));
}

JSONValue ToJSON(const CreateMessageParams& params) {
    JSONValue::Object obj;
    put(obj, "messages", arrayOf(params.messages));
    if (params.modelPreferences.has_value()) put(obj, "modelPreferences", params.modelPreferences.value());
    if (params.systemPrompt.has_value()) put(obj, "systemPrompt", JSONValue(params.systemPrompt.value()));
    if (params.includeContext.has_value()) put(obj, "includeContext", JSONValue(params.includeContext.value()));
    if (params.maxTokens.has_value()) put(obj, "maxTokens", JSONValue(static_cast<int64_t>(params.maxTokens.value())));
    if (params.temperature.has_value()) put(obj, "temperature", JSONValue(params.temperature.value()));
    if (params.stopSequences.has_value()) {
        JSONValue::Array seqs;
        for (const auto& s : params.stopSequences.value()) {
            seqs.push_back(std::make_shared<JSONValue>(s));
        }
        put(obj, "stopSequences", JSONValue(std::move(seqs)));
    }
    if (params.metadata.has_value()) put(obj, "metadata", params.metadata.value());
    return JSONValue(std::move(obj));
}

CreateMessageResult CreateMessageResultFromJSON(const JSONValue& value) {
    if (!value.isObject()) {
        throw std::invalid_argument("sampling result must be an object");
    }
    auto model = GetStringMember(value, "model");
    auto role = GetStringMember(value, "role");
    const JSONValue* content = FindMember(value, "content");
    if (!model.has_value() || !role.has_value() || !content) {
        throw std::invalid_argument("sampling result requires model, role and content");
    }
    CreateMessageResult out;
    out.model = std::move(model.value());
    out.role = std::move(role.value());
    out.content = *content;
    out.stopReason = GetStringMember(value, "stopReason");
    return out;
}

} // namespace embedmcp
