#include "ConfigUtils.h"
#include "ErrorUtils.h"
#include "Logging.h"

#include <fstream>
#include <climits>
#include <unistd.h>

namespace ConfigUtils {

namespace {

enum class LoadResult { Loaded, NotFound, Invalid };

std::string executableDirectory()
{
    char exePath[PATH_MAX] = {0};
    ssize_t len = ::readlink("/proc/self/exe", exePath, sizeof(exePath) - 1);
    if (len <= 0) {
        return std::string();
    }
    std::string exeDir(exePath, static_cast<size_t>(len));
    size_t lastSlash = exeDir.find_last_of('/');
    if (lastSlash == std::string::npos) {
        return std::string();
    }
    return exeDir.substr(0, lastSlash);
}

LoadResult loadFile(nlohmann::json& outConfig, const std::string& fileName)
{
    std::string configPath = fileName;
    std::ifstream configFile(configPath);

    // If not found in the current directory, try the executable directory
    if (!configFile.is_open() && fileName.find('/') == std::string::npos) {
        std::string exeDir = executableDirectory();
        if (!exeDir.empty()) {
            configPath = exeDir + "/" + fileName;
            configFile.open(configPath);
            LOG_DEBUG("[Config] Trying config path: " + configPath);
        }
    }

    if (!configFile.is_open()) {
        return LoadResult::NotFound;
    }

    try {
        configFile >> outConfig;
        LOG_INFO("[Config] Loaded " + configPath);
        return LoadResult::Loaded;
    } catch (const std::exception& e) {
        LOG_CONFIG_ERROR("Error reading " + configPath, e.what());
        return LoadResult::Invalid;
    }
}

} // namespace

bool LoadClientConfig(ClientConfig::Configuration& outConfig, const std::string& fileName)
{
    nlohmann::json config;
    LoadResult result = loadFile(config, fileName);
    if (result == LoadResult::Invalid) {
        return false;
    }
    if (result == LoadResult::Loaded) {
        if (!ClientConfig::loadFromJson(config, outConfig)) {
            return false;
        }
    } else {
        LOG_INFO("[Config] No " + fileName + " found, using defaults");
    }

    ClientConfig::applyEnvironmentOverrides(outConfig);

    std::string error;
    if (!ClientConfig::validateConfiguration(outConfig, error)) {
        LOG_CONFIG_ERROR("Configuration rejected", error);
        return false;
    }
    return true;
}

}
