#include "StopDirectoryCache.hpp"

#include <iostream>
#include <fstream>
#include <sstream>
#include <random>
#include <unordered_map>
#include <boost/locale.hpp>
#include "CityBusClient.hpp"
#include "Errors.hpp"
#include "Parser.hpp"

namespace
{
std::locale const& foldingLocale()
{
    static const std::locale locale = boost::locale::generator()("C.UTF-8");
    return locale;
}

std::string foldCase(std::string const& text)
{
    return boost::locale::fold_case(text, foldingLocale());
}
}

StopDirectoryCache::StopDirectoryCache(CityBusClient& api, std::filesystem::path directory)
    : client(api)
    , cacheDir(std::move(directory))
{
}

std::filesystem::path StopDirectoryCache::directoryFile() const { return cacheDir / DIRECTORY_FILE; }
std::filesystem::path StopDirectoryCache::nameMapFile() const { return cacheDir / NAME_MAP_FILE; }

std::string StopDirectoryCache::readCacheFile(std::filesystem::path const& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
        throw CacheReadError("could not open " + path.string());

    std::stringstream ss;
    ss << file.rdbuf();
    if (file.bad())
        throw CacheReadError("could not read " + path.string());

    return ss.str();
}

std::optional<StopDirectory> StopDirectoryCache::loadDirectory() const
{
    std::filesystem::path path = directoryFile();
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
        return std::nullopt;

    try
    {
        try
        {
            return Parser::parseDirectory(readCacheFile(path));
        }
        catch (PayloadError const& e)
        {
            throw CacheReadError(path.string() + " is corrupt: " + e.what());
        }
    }
    catch (CacheReadError const& e)
    {
        std::cerr << "[Cache] Warning: " << e.what() << ", ignoring it\n";
        return std::nullopt;
    }
}

std::optional<StopNameMap> StopDirectoryCache::loadNameMap() const
{
    std::filesystem::path path = nameMapFile();
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
        return std::nullopt;

    try
    {
        try
        {
            return Parser::parseNameMap(readCacheFile(path));
        }
        catch (PayloadError const& e)
        {
            throw CacheReadError(path.string() + " is corrupt: " + e.what());
        }
    }
    catch (CacheReadError const& e)
    {
        std::cerr << "[Cache] Warning: " << e.what() << ", ignoring it\n";
        return std::nullopt;
    }
}

void StopDirectoryCache::store(std::filesystem::path const& path, std::string const& contents) const
{
    std::random_device seed;
    std::filesystem::path temp = path;
    temp += ".tmp-" + std::to_string(seed());

    std::error_code ec;
    std::filesystem::create_directories(cacheDir, ec);
    if (ec)
    {
        std::cerr << "[Cache] Warning: could not create " << cacheDir.string() << ": " << ec.message() << "\n";
        return;
    }

    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        file << contents << "\n";
        if (!file.good())
        {
            std::cerr << "[Cache] Warning: could not write " << temp.string() << "\n";
            file.close();
            std::filesystem::remove(temp, ec);
            return;
        }
    }

    // Rename is atomic within one directory, so readers never see a half-written cache.
    std::filesystem::rename(temp, path, ec);
    if (ec)
    {
        std::cerr << "[Cache] Warning: could not replace " << path.string() << ": " << ec.message() << "\n";
        std::filesystem::remove(temp, ec);
    }
}

StopNameMap StopDirectoryCache::toNameMap(StopDirectory const& directory)
{
    StopNameMap names;
    std::unordered_map<std::string, std::size_t> position;
    for (auto const& stop : directory)
    {
        std::string code = std::to_string(stop.code);
        auto [it, inserted] = position.emplace(code, names.size());
        if (inserted)
            names.emplace_back(std::move(code), stop.name);
        else
            names[it->second].second = stop.name;
    }
    return names;
}

boost::asio::awaitable<StopDirectory> StopDirectoryCache::getDirectory()
{
    if (std::optional<StopDirectory> cached = loadDirectory())
    {
        std::clog << "[Cache] Found local cache\n";
        co_return std::move(*cached);
    }

    std::clog << "[Cache] Fetching from API\n";
    StopDirectory directory = co_await client.fetchDirectory();

    store(directoryFile(), Parser::directoryToJson(directory).dump(2));
    store(nameMapFile(), Parser::nameMapToJson(toNameMap(directory)).dump(2));

    std::clog << "[Cache] Stored " << directory.size() << " stops in " << cacheDir.string() << "\n";
    co_return directory;
}

boost::asio::awaitable<StopNameMap> StopDirectoryCache::getNameMap()
{
    if (std::optional<StopNameMap> cached = loadNameMap())
    {
        std::clog << "[Cache] Found local cache\n";
        co_return std::move(*cached);
    }

    StopDirectory directory = co_await getDirectory();
    StopNameMap names = toNameMap(directory);

    store(nameMapFile(), Parser::nameMapToJson(names).dump(2));

    co_return names;
}

boost::asio::awaitable<StopNameMap> StopDirectoryCache::searchNames(std::string query)
{
    StopNameMap names = co_await getNameMap();
    if (query.empty())
        co_return names;

    std::string needle = foldCase(query);
    StopNameMap matches;
    for (auto const& [code, name] : names)
    {
        if (foldCase(name).find(needle) != std::string::npos)
            matches.emplace_back(code, name);
    }
    co_return matches;
}
