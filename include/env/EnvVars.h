//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read MCPLEAGUE_* environment variables with typed fallbacks.
//==========================================================================================================
#pragma once
#include <cstdlib>
#include <exception>
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
// GetEnvFlag
// Purpose: Reads a boolean-ish variable ("1", "true", "yes", "on" are true; "0", "false", "no", "off"
//          are false). Any other value, or an unset variable, yields defaultValue.
//==========================================================================================================
inline bool GetEnvFlag(const char* name, bool defaultValue) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v == "1" || v == "true" || v == "TRUE" || v == "yes" || v == "on") {
        return true;
    }
    if (v == "0" || v == "false" || v == "FALSE" || v == "no" || v == "off") {
        return false;
    }
    return defaultValue;
}

//==========================================================================================================
// GetEnvDouble / GetEnvUnsigned
// Purpose: Numeric reads. Malformed values fall back to the default rather than aborting start-up.
//==========================================================================================================
inline double GetEnvDouble(const char* name, double defaultValue) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v.empty()) {
        return defaultValue;
    }
    try {
        return std::stod(v);
    } catch (const std::exception&) {
        return defaultValue;
    }
}

inline unsigned long long GetEnvUnsigned(const char* name, unsigned long long defaultValue) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v.empty() || v[0] == '-') {
        return defaultValue;
    }
    try {
        return std::stoull(v);
    } catch (const std::exception&) {
        return defaultValue;
    }
}
