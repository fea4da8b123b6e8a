//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerDefinition.h
// Purpose: Immutable description of one tool-providing subprocess
//==========================================================================================================

#pragma once

#include <map>
#include <string>
#include <vector>

namespace toolhost {

// Only pipe/stdio transport is supported; Unknown preserves configured values we cannot serve.
enum class TransportKind {
    Stdio,
    Unknown
};

inline TransportKind transportKindFromString(const std::string& s) {
    return s == "stdio" ? TransportKind::Stdio : TransportKind::Unknown;
}

//==========================================================================================================
// ServerDefinition
// Purpose: Pure data for one server. Environment values are expected to be expanded already.
// Fields:
//   serverId: Unique caller-assigned identifier.
//   displayName: Human-readable name.
//   command/args: Executable and ordered argument list.
//   env: Variables overlaid on the ambient environment of the host process.
//   transport/transportName: Parsed transport kind and the raw configured text.
//   priority: Lower values are considered first by callers that sort definitions.
//==========================================================================================================
struct ServerDefinition {
    std::string serverId;
    std::string displayName;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    TransportKind transport{TransportKind::Stdio};
    std::string transportName{"stdio"};
    int priority{100};
};

} // namespace toolhost
