#pragma once
#include <string>
#include <filesystem>

struct UserPreferences
{
    int stop = 214;
    int day  = 5;   // 1=Monday ... 7=Sunday
};

class ConfigurationManager
{
private:
    std::filesystem::path dataDir;
    UserPreferences preferences;

    static std::filesystem::path resolveDataDir();
    void loadPreferences();

public:
    ConfigurationManager();
    explicit ConfigurationManager(std::filesystem::path directory);

    static inline const std::string WEB_HOST   = "patra.citybus.gr";
    static inline const std::string WEB_ORIGIN = "https://patra.citybus.gr";
    static inline const std::string TOKEN_PAGE = "/el/stops";
    static inline const std::string API_HOST   = "rest.citybus.gr";
    static inline const std::string API_BASE   = "/api/v1/el/112";
    static inline const std::string HTTPS_PORT = "443";
    static inline const std::string TIME_ZONE  = "Europe/Athens";

    static inline const std::string USER_AGENT =
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64; rv:140.0) Gecko/20100101 Firefox/140.0";

    static inline const std::string CONFIG_FILE_NAME = "citybus_config.json";

    [[nodiscard]] std::filesystem::path const& getDataDir() const noexcept;
    [[nodiscard]] UserPreferences const& getPreferences() const noexcept;
};
