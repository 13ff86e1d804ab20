#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "ClientConfig.h"

namespace ConfigUtils {
    // Builds the effective configuration: the file (looked up in the working
    // directory, then next to the executable) when present, then CALL_* env overrides.
    // Returns false only when the file exists but is invalid or fails validation.
    bool LoadClientConfig(ClientConfig::Configuration& outConfig, const std::string& fileName = "config.json");
}
