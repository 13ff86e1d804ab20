#pragma once
#ifndef CALLCLIENT_CONFIG_H
#define CALLCLIENT_CONFIG_H

#include <string>
#include <cstdlib>

// Header-only environment helpers used for config overrides

namespace EnvConfig {

inline std::string getEnv(const char* name, const std::string& defValue) {
    if (const char* v = std::getenv(name)) return std::string(v);
    return defValue;
}

inline bool hasEnv(const char* name) {
    const char* v = std::getenv(name);
    return v != nullptr && *v != '\0';
}

} // namespace EnvConfig

#endif // CALLCLIENT_CONFIG_H
