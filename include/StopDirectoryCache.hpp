#pragma once
#include <string>
#include <optional>
#include <utility>
#include <filesystem>
#include <boost/asio/awaitable.hpp>
#include "Types.hpp"

class CityBusClient;

// Read-if-present-else-fetch-then-write cache of the stop directory. A cache
// file, once written, is trusted until someone deletes it.
class StopDirectoryCache
{
private:
    CityBusClient& client;
    std::filesystem::path cacheDir;

    std::optional<StopDirectory> loadDirectory() const;
    std::optional<StopNameMap> loadNameMap() const;
    void store(std::filesystem::path const& path, std::string const& contents) const;

    static std::string readCacheFile(std::filesystem::path const& path);

public:
    static inline const std::string DIRECTORY_FILE = "stops.json";
    static inline const std::string NAME_MAP_FILE  = "stop_name.json";

    StopDirectoryCache(CityBusClient& api, std::filesystem::path directory);

    boost::asio::awaitable<StopDirectory> getDirectory();
    boost::asio::awaitable<StopNameMap> getNameMap();

    // Case-insensitive substring match on stop names; an empty query keeps everything.
    boost::asio::awaitable<StopNameMap> searchNames(std::string query);

    static StopNameMap toNameMap(StopDirectory const& directory);

    [[nodiscard]] std::filesystem::path directoryFile() const;
    [[nodiscard]] std::filesystem::path nameMapFile() const;
};
