//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MethodTable.cpp
// Purpose: Finite set of request methods understood by the dispatcher
//==========================================================================================================

#include <unordered_map>

#include "embedmcp/MethodTable.h"
#include "embedmcp/Protocol.h"

namespace embedmcp {

namespace {
const std::unordered_map<std::string, Method>& nameTable() {
    static const std::unordered_map<std::string, Method> table = {
        {Methods::Initialize, Method::Initialize},
        {Methods::Ping, Method::Ping},
        {Methods::ListTools, Method::ListTools},
        {Methods::CallTool, Method::CallTool},
        {Methods::ListResources, Method::ListResources},
        {Methods::ReadResource, Method::ReadResource},
        {Methods::ListResourceTemplates, Method::ListResourceTemplates},
        {Methods::Subscribe, Method::Subscribe},
        {Methods::Unsubscribe, Method::Unsubscribe},
        {Methods::ListPrompts, Method::ListPrompts},
        {Methods::GetPrompt, Method::GetPrompt},
        {Methods::ListRoots, Method::ListRoots},
        {Methods::CreateMessage, Method::CreateMessage},
    };
    return table;
}
} // namespace

std::optional<Method> MethodFromName(const std::string& name) {
    const auto& table = nameTable();
    auto it = table.find(name);
    if (it == table.end()) {
        return std::nullopt;
    }
    return it->second;
}

const char* MethodName(Method method) {
    switch (method) {
        case Method::Initialize: return Methods::Initialize;
        case Method::Ping: return Methods::Ping;
        case Method::ListTools: return Methods::ListTools;
        case Method::CallTool: return Methods::CallTool;
        case Method::ListResources: return Methods::ListResources;
        case Method::ReadResource: return Methods::ReadResource;
        case Method::ListResourceTemplates: return Methods::ListResourceTemplates;
        case Method::Subscribe: return Methods::Subscribe;
        case Method::Unsubscribe: return Methods::Unsubscribe;
        case Method::ListPrompts: return Methods::ListPrompts;
        case Method::GetPrompt: return Methods::GetPrompt;
        case Method::ListRoots: return Methods::ListRoots;
        case Method::CreateMessage: return Methods::CreateMessage;
    }
    return "";
}

} // namespace embedmcp
