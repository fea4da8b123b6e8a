//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.h
// Purpose: Declarative server list loaded from a JSON configuration file
//==========================================================================================================

#pragma once

#include "toolhost/ServerDefinition.h"
#include <optional>
#include <string>
#include <vector>

namespace toolhost {

//==========================================================================================================
// ServerConfig
// Purpose: Parsed form of
//            { "servers": { "<id>": { "name", "command", "args", "env", "transport", "priority" } } }
//          Missing members default to name=<id>, command="", args=[], env={}, transport="stdio",
//          priority=100. Unknown members are ignored.
// Throws:
//   All loaders throw errors::ToolHostError(InvalidConfig) on malformed JSON or mistyped members.
//==========================================================================================================
class ServerConfig {
public:
    ServerConfig() = default;

    static ServerConfig LoadFromString(const std::string& json);
    static ServerConfig LoadFromFile(const std::string& path);

    // nullopt when the file does not exist; a present but malformed file still throws.
    static std::optional<ServerConfig> LoadIfExists(const std::string& path);

    //==========================================================================================================
    // LoadOrCreate
    // Purpose: Loads path, first writing DefaultConfigJson() there (creating parent directories)
    //          when the file does not exist yet.
    // Throws:
    //   errors::ToolHostError(InvalidConfig) when the default file cannot be written.
    //==========================================================================================================
    static ServerConfig LoadOrCreate(const std::string& path);

    // Starter configuration written by LoadOrCreate.
    static const std::string& DefaultConfigJson();

    //==========================================================================================================
    // DefaultPath
    // Purpose: $TOOLHOST_CONFIG when set, otherwise $HOME/.toolhost/servers.json.
    //==========================================================================================================
    static std::string DefaultPath();

    //==========================================================================================================
    // Definitions
    // Purpose: Server definitions ready for ServerManager: "${VAR}" env values are replaced with the
    //          current environment value (empty when unset), sorted by ascending priority.
    //          Equal priorities keep server id order.
    //==========================================================================================================
    std::vector<ServerDefinition> Definitions() const;

    // Definitions as written, without expansion or sorting.
    const std::vector<ServerDefinition>& RawDefinitions() const { return servers_; }

private:
    std::vector<ServerDefinition> servers_;
};

} // namespace toolhost
