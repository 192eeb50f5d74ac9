//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variables safely.
//==========================================================================================================
#pragma once
#include <cstdlib>
#include <cstdint>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset/empty.
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
    return (v && *v) ? std::string(v) : defaultValue;
}

// Interprets "1", "true", "yes", "on" (any case for true/yes/on) as true; unset uses defaultValue.
inline bool GetEnvFlag(const char* name, bool defaultValue) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v.empty()) return defaultValue;
    if (v == "1" || v == "true" || v == "TRUE" || v == "True" || v == "yes" || v == "YES" || v == "on" || v == "ON") return true;
    return false;
}

// Unsigned integer variable; unset or unparsable values yield defaultValue.
inline std::uint64_t GetEnvUInt(const char* name, std::uint64_t defaultValue) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v.empty()) return defaultValue;
    try {
        std::size_t pos = 0;
        unsigned long long n = std::stoull(v, &pos, 10);
        if (pos != v.size()) return defaultValue;
        return static_cast<std::uint64_t>(n);
    } catch (...) {
        return defaultValue;
    }
}
