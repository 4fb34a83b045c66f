//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Providers.h
// Purpose: Narrow interfaces through which the server consults the embedding application
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "embedmcp/Protocol.h"

namespace embedmcp {

//==========================================================================================================
// Provider error contract
// Providers report domain failures by throwing:
//   errors::NotFoundError      -> ToolNotFound / ResourceNotFound / PromptNotFound
//   std::invalid_argument      -> InvalidParams
//   errors::McpException       -> passed through with its own code
//   anything else              -> InternalError with a generic message
//==========================================================================================================

//==========================================================================================================
// IToolProvider
// Purpose: Tool inventory and invocation.
//==========================================================================================================
class IToolProvider {
public:
    virtual ~IToolProvider() = default;

    virtual std::vector<Tool> ListTools() = 0;

    //==========================================================================================================
    // Invokes a tool.
    // Args:
    //   name: Tool name.
    //   arguments: JSON arguments (an empty object when the caller sent none).
    // Returns:
    //   CallToolResult; isError=true reports a tool-level failure that is still a successful RPC.
    //==========================================================================================================
    virtual CallToolResult CallTool(const std::string& name, const JSONValue& arguments) = 0;
};

//==========================================================================================================
// IResourceProvider
// Purpose: Resource inventory and reads. ReadResource is also the polling source for change detection.
//==========================================================================================================
class IResourceProvider {
public:
    virtual ~IResourceProvider() = default;

    virtual std::vector<Resource> ListResources() = 0;
    virtual std::vector<ResourceTemplate> ListResourceTemplates() = 0;
    virtual ReadResourceResult ReadResource(const std::string& uri) = 0;
};

//==========================================================================================================
// IPromptProvider
// Purpose: Prompt inventory and rendering.
//==========================================================================================================
class IPromptProvider {
public:
    virtual ~IPromptProvider() = default;

    virtual std::vector<Prompt> ListPrompts() = 0;
    virtual GetPromptResult GetPrompt(const std::string& name, const JSONValue& arguments) = 0;
};

//==========================================================================================================
// IAccessPolicy
// Purpose: Decides which URIs may be subscribed and which of them map onto watchable local files.
//==========================================================================================================
class IAccessPolicy {
public:
    virtual ~IAccessPolicy() = default;

    // true when the URI may be subscribed at all.
    virtual bool IsAccessible(const std::string& uri) const = 0;

    // Local filesystem path for file-backed URIs under an accessible root; nullopt for dynamic URIs.
    virtual std::optional<std::string> ResolveLocalPath(const std::string& uri) const = 0;
};

} // namespace embedmcp
