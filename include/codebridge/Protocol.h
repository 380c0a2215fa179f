//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol constants (versions, method names) used by the dispatcher
//==========================================================================================================

#pragma once

#include <array>
#include <string>

namespace codebridge {

///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// Newest protocol revision this server speaks; answered when the client asks for an unknown one.
constexpr const char* PROTOCOL_VERSION = "2025-11-25";

// Revisions accepted verbatim from the client's initialize request.
constexpr std::array<const char*, 4> SUPPORTED_PROTOCOL_VERSIONS = {
    "2025-11-25", "2025-06-18", "2025-03-26", "2024-11-05"
};

// Picks the client's revision when supported, PROTOCOL_VERSION otherwise.
inline std::string NegotiateProtocolVersion(const std::string& requested) {
    for (const char* v : SUPPORTED_PROTOCOL_VERSIONS) {
        if (requested == v) return requested;
    }
    return PROTOCOL_VERSION;
}

namespace Methods {
    // Lifecycle
    constexpr const char* Initialize = "initialize";
    constexpr const char* Shutdown = "shutdown";
    constexpr const char* Ping = "ping";

    // Tools
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ToolPrefix = "tools/"; // tools/search, tools/symbols, ...

    // Resources and prompts
    constexpr const char* ListResources = "resources/list";
    constexpr const char* ListResourceTemplates = "resources/templates/list";
    constexpr const char* ReadResource = "resources/read";
    constexpr const char* Subscribe = "resources/subscribe";
    constexpr const char* Unsubscribe = "resources/unsubscribe";
    constexpr const char* ListPrompts = "prompts/list";
    constexpr const char* GetPrompt = "prompts/get";

    // Argument completion
    constexpr const char* Complete = "completion/complete";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* Cancelled = "notifications/cancelled";
    constexpr const char* Exit = "exit";
}

} // namespace codebridge
