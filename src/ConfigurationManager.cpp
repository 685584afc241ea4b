#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include "ConfigurationManager.hpp"

ConfigurationManager::ConfigurationManager()
    : ConfigurationManager(resolveDataDir())
{
}

ConfigurationManager::ConfigurationManager(std::filesystem::path directory)
    : dataDir(std::move(directory))
{
    loadPreferences();
}

std::filesystem::path ConfigurationManager::resolveDataDir()
{
    if (const char* envDir = std::getenv("CITYBUS_DATA_DIR"); envDir && *envDir)
        return envDir;

    if (const char* home = std::getenv("HOME"); home && *home)
        return std::filesystem::path(home) / ".citybus";

    return "user_data";
}

void ConfigurationManager::loadPreferences()
{
    std::filesystem::path configPath = dataDir / CONFIG_FILE_NAME;
    std::error_code ec;
    if (!std::filesystem::exists(configPath, ec))
        return;

    try
    {
        std::ifstream file(configPath);
        if (!file.is_open())
            throw std::runtime_error("cannot open " + configPath.string());

        nlohmann::json data = nlohmann::json::parse(file);
        UserPreferences loaded = preferences;
        if (data.contains("stop"))
            loaded.stop = data.at("stop").get<int>();
        if (data.contains("day"))
            loaded.day = data.at("day").get<int>();

        preferences = loaded;
    }
    catch (std::exception const& e)
    {
        std::cerr << "[Config] Warning: Could not read config file: " << e.what() << "\n";
    }
}

std::filesystem::path const& ConfigurationManager::getDataDir() const noexcept { return dataDir; }
UserPreferences const& ConfigurationManager::getPreferences() const noexcept { return preferences; }
