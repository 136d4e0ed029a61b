//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variables safely (string, unsigned and boolean forms).
//==========================================================================================================
#pragma once
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
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
// GetEnvUInt64OrDefault
// Purpose: Reads an unsigned decimal environment variable; malformed or empty values yield defaultValue.
//==========================================================================================================
inline uint64_t GetEnvUInt64OrDefault(const char* name, uint64_t defaultValue) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v.empty()) {
        return defaultValue;
    }
    try {
        return static_cast<uint64_t>(std::stoull(v));
    } catch (const std::exception&) {
        return defaultValue;
    }
}

//==========================================================================================================
// GetEnvBoolOrDefault
// Purpose: Reads a boolean environment variable ("1"/"true"/"TRUE" are true, "0"/"false"/"FALSE" false).
//==========================================================================================================
inline bool GetEnvBoolOrDefault(const char* name, bool defaultValue) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v == "1" || v == "true" || v == "TRUE") {
        return true;
    }
    if (v == "0" || v == "false" || v == "FALSE") {
        return false;
    }
    return defaultValue;
}
