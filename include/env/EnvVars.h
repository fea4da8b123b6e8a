//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variables and expand ${VAR} references in config values.
//==========================================================================================================
#pragma once
#include <cstdint>
#include <cstdlib>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set.
// Returns:
//   std::string with the environment value (when set) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* v = std::getenv(name);
    return v ? std::string(v) : defaultValue;
}

//==========================================================================================================
// GetEnvUint
// Purpose: Reads an unsigned integer environment variable.
// Args:
//   name: Variable name.
//   defaultValue: Returned when the variable is unset, empty, or not a number.
//==========================================================================================================
inline uint64_t GetEnvUint(const char* name, uint64_t defaultValue) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v.empty()) {
        return defaultValue;
    }
    try {
        std::size_t used = 0;
        unsigned long long parsed = std::stoull(v, &used);
        if (used != v.size()) {
            return defaultValue;
        }
        return static_cast<uint64_t>(parsed);
    } catch (const std::exception&) {
        return defaultValue;
    }
}

//==========================================================================================================
// ExpandEnvReference
// Purpose: Expands a whole-value "${NAME}" reference to the environment value of NAME.
// Args:
//   value: Raw configuration value.
// Returns:
//   The environment value (empty when unset) for "${NAME}"; any other value unchanged.
//==========================================================================================================
inline std::string ExpandEnvReference(const std::string& value) {
    if (value.size() >= 3 && value.compare(0, 2, "${") == 0 && value.back() == '}') {
        const std::string key = value.substr(2, value.size() - 3);
        return GetEnvOrDefault(key.c_str(), "");
    }
    return value;
}
