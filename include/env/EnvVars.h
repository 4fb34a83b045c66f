//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read EMBEDMCP_* environment variables with typed defaults.
//==========================================================================================================
#pragma once
#include <cstdlib>
#include <cctype>
#include <cstdint>
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
// GetEnvFlagOrDefault
// Purpose: Reads a boolean flag. Accepts 1/0, true/false, yes/no, on/off (case-insensitive).
// Throws:
//   std::invalid_argument when the variable is set to anything else.
//==========================================================================================================
inline bool GetEnvFlagOrDefault(const char* name, bool defaultValue) {
    std::string raw = GetEnvOrDefault(name, std::string());
    if (raw.empty()) {
        return defaultValue;
    }
    std::string v;
    v.reserve(raw.size());
    for (char c : raw) v.push_back(static_cast<char>(::tolower(static_cast<unsigned char>(c))));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw std::invalid_argument(std::string(name) + ": expected a boolean, got '" + raw + "'");
}

//==========================================================================================================
// GetEnvUIntOrDefault
// Purpose: Reads a non-negative integer.
// Throws:
//   std::invalid_argument when the value is non-numeric or exceeds maxValue.
//==========================================================================================================
inline std::uint64_t GetEnvUIntOrDefault(const char* name, std::uint64_t defaultValue,
                                         std::uint64_t maxValue = UINT64_MAX) {
    const std::string raw = GetEnvOrDefault(name, std::string());
    if (raw.empty()) {
        return defaultValue;
    }
    for (char c : raw) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument(std::string(name) + ": expected a non-negative integer, got '" + raw + "'");
        }
    }
    std::uint64_t value = 0;
    try {
        value = std::stoull(raw);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(std::string(name) + ": value out of range '" + raw + "'");
    }
    if (value > maxValue) {
        throw std::invalid_argument(std::string(name) + ": value " + raw + " exceeds " + std::to_string(maxValue));
    }
    return value;
}
