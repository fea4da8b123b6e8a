//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.cpp
// Purpose: JSON server configuration loading and environment expansion
//==========================================================================================================
#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <sys/stat.h>

#include <boost/filesystem.hpp>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "toolhost/ServerConfig.h"
#include "toolhost/errors/Errors.h"

namespace toolhost {

namespace {

[[noreturn]] void invalid(const std::string& message) {
    throw errors::ToolHostError(errors::ErrorCategory::InvalidConfig, message);
}

std::string stringField(const JSONValue& server, const std::string& id, const char* key, const std::string& fallback) {
    const JSONValue* v = server.find(key);
    if (v == nullptr || v->isNull()) {
        return fallback;
    }
    if (!v->isString()) {
        invalid(fmt::format("servers.{}.{} must be a string", id, key));
    }
    const auto& s = std::get<std::string>(v->value);
    return s.empty() ? fallback : s;
}

// Scalars are accepted for env values and rendered as text.
std::string scalarText(const JSONValue& v, const std::string& where) {
    if (v.isString()) {
        return std::get<std::string>(v.value);
    }
    if (v.isObject() || v.isArray()) {
        invalid(fmt::format("{} must be a string", where));
    }
    if (v.isNull()) {
        return std::string();
    }
    return SerializeJSON(v);
}

ServerDefinition parseServer(const std::string& id, const JSONValue& server) {
    if (!server.isObject()) {
        invalid(fmt::format("servers.{} must be an object", id));
    }
    ServerDefinition def;
    def.serverId = id;
    def.displayName = stringField(server, id, "name", id);
    def.command = stringField(server, id, "command", "");
    def.transportName = stringField(server, id, "transport", "stdio");
    def.transport = transportKindFromString(def.transportName);

    if (const JSONValue* args = server.find("args"); args != nullptr && !args->isNull()) {
        if (!args->isArray()) {
            invalid(fmt::format("servers.{}.args must be an array", id));
        }
        for (const auto& a : std::get<JSONValue::Array>(args->value)) {
            if (!a || !a->isString()) {
                invalid(fmt::format("servers.{}.args must contain only strings", id));
            }
            def.args.push_back(std::get<std::string>(a->value));
        }
    }

    if (const JSONValue* env = server.find("env"); env != nullptr && !env->isNull()) {
        if (!env->isObject()) {
            invalid(fmt::format("servers.{}.env must be an object", id));
        }
        for (const auto& [key, value] : std::get<JSONValue::Object>(env->value)) {
            def.env[key] = value ? scalarText(*value, fmt::format("servers.{}.env.{}", id, key)) : std::string();
        }
    }

    if (const JSONValue* prio = server.find("priority"); prio != nullptr && !prio->isNull()) {
        constexpr auto lo = std::numeric_limits<int>::min();
        constexpr auto hi = std::numeric_limits<int>::max();
        if (prio->isInt()) {
            const int64_t v = std::get<int64_t>(prio->value);
            if (v < lo || v > hi) {
                invalid(fmt::format("servers.{}.priority {} is out of range", id, v));
            }
            def.priority = static_cast<int>(v);
        } else if (std::holds_alternative<double>(prio->value)) {
            const double v = std::get<double>(prio->value);
            if (!std::isfinite(v) || v < static_cast<double>(lo) || v > static_cast<double>(hi)) {
                invalid(fmt::format("servers.{}.priority {} is out of range", id, v));
            }
            def.priority = static_cast<int>(v);
        } else {
            invalid(fmt::format("servers.{}.priority must be a number", id));
        }
    }
    return def;
}

bool fileExists(const std::string& path) {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

} // namespace

ServerConfig ServerConfig::LoadFromString(const std::string& json) {
    FUNC_SCOPE();
    JSONValue root;
    try {
        root = ParseJSON(json);
    } catch (const std::exception& e) {
        invalid(fmt::format("Invalid server configuration JSON: {}", e.what()));
    }
    if (!root.isObject()) {
        invalid("Server configuration must be a JSON object");
    }

    ServerConfig config;
    const JSONValue* servers = root.find("servers");
    if (servers == nullptr || servers->isNull()) {
        return config;
    }
    if (!servers->isObject()) {
        invalid("\"servers\" must be an object");
    }
    const auto& obj = std::get<JSONValue::Object>(servers->value);
    std::vector<std::string> ids;
    ids.reserve(obj.size());
    for (const auto& [id, value] : obj) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    for (const auto& id : ids) {
        const auto& value = obj.at(id);
        if (!value) {
            invalid(fmt::format("servers.{} must be an object", id));
        }
        config.servers_.push_back(parseServer(id, *value));
    }
    return config;
}

ServerConfig ServerConfig::LoadFromFile(const std::string& path) {
    FUNC_SCOPE();
    std::ifstream in(path);
    if (!in) {
        invalid(fmt::format("Cannot open server configuration: {}", path));
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    LOG_DEBUG("Loading server configuration from {}", path);
    return LoadFromString(ss.str());
}

std::optional<ServerConfig> ServerConfig::LoadIfExists(const std::string& path) {
    FUNC_SCOPE();
    if (!fileExists(path)) {
        LOG_DEBUG("No server configuration at {}", path);
        return std::nullopt;
    }
    return LoadFromFile(path);
}

const std::string& ServerConfig::DefaultConfigJson() {
    static const std::string json = R"({
  "servers": {
    "text-editor": {
      "name": "Text Editor",
      "command": "npx",
      "args": ["-y", "@modelcontextprotocol/server-filesystem"],
      "env": {},
      "transport": "stdio",
      "priority": 1
    },
    "web-search": {
      "name": "Web Search",
      "command": "npx",
      "args": ["-y", "@tavily-ai/tavily-mcp"],
      "env": {"TAVILY_API_KEY": "${TAVILY_API_KEY}"},
      "transport": "stdio",
      "priority": 2
    },
    "github": {
      "name": "GitHub",
      "command": "npx",
      "args": ["-y", "@modelcontextprotocol/server-github"],
      "env": {"GITHUB_PERSONAL_ACCESS_TOKEN": "${GITHUB_TOKEN}"},
      "transport": "stdio",
      "priority": 3
    }
  }
}
)";
    return json;
}

ServerConfig ServerConfig::LoadOrCreate(const std::string& path) {
    FUNC_SCOPE();
    if (fileExists(path)) {
        return LoadFromFile(path);
    }
    const boost::filesystem::path target(path);
    boost::system::error_code ec;
    if (target.has_parent_path()) {
        boost::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            invalid(fmt::format("Cannot create directory for server configuration {}: {}", path, ec.message()));
        }
    }
    {
        std::ofstream out(path, std::ios::out | std::ios::trunc);
        out << DefaultConfigJson();
        out.close();
        if (!out) {
            invalid(fmt::format("Cannot write default server configuration: {}", path));
        }
    }
    LOG_INFO("Wrote default server configuration to {}", path);
    return LoadFromString(DefaultConfigJson());
}

std::string ServerConfig::DefaultPath() {
    FUNC_SCOPE();
    const std::string overridePath = GetEnvOrDefault("TOOLHOST_CONFIG", "");
    if (!overridePath.empty()) {
        return overridePath;
    }
    const std::string home = GetEnvOrDefault("HOME", "");
    return (home.empty() ? std::string(".") : home) + "/.toolhost/servers.json";
}

std::vector<ServerDefinition> ServerConfig::Definitions() const {
    FUNC_SCOPE();
    std::vector<ServerDefinition> defs = servers_;
    for (auto& def : defs) {
        for (auto& [key, value] : def.env) {
            value = ExpandEnvReference(value);
        }
    }
    std::stable_sort(defs.begin(), defs.end(),
                     [](const ServerDefinition& a, const ServerDefinition& b) { return a.priority < b.priority; });
    return defs;
}

} // namespace toolhost
