//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MethodTable.h
// Purpose: Finite set of request methods understood by the dispatcher
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

namespace embedmcp {

enum class Method {
    Initialize,
    Ping,
    ListTools,
    CallTool,
    ListResources,
    ReadResource,
    ListResourceTemplates,
    Subscribe,
    Unsubscribe,
    ListPrompts,
    GetPrompt,
    ListRoots,
    CreateMessage
};

// Resolves a wire method name; nullopt for anything outside the table.
std::optional<Method> MethodFromName(const std::string& name);
const char* MethodName(Method method);

} // namespace embedmcp
