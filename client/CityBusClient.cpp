#include <stdexcept>
#include "ConfigurationManager.hpp"
#include "Parser.hpp"
#include "CityBusClient.hpp"

CityBusClient::CityBusClient(HttpTransport& http, CredentialResolver& resolver)
    : transport(http)
    , credentials(resolver)
{
}

std::string CityBusClient::schedulePath(int stopCode, int day)
{
    return ConfigurationManager::API_BASE + "/trips/stop/" + std::to_string(stopCode) + "/day/" + std::to_string(day);
}

std::string CityBusClient::livePath(int stopCode)
{
    return ConfigurationManager::API_BASE + "/stops/live/" + std::to_string(stopCode);
}

std::string CityBusClient::directoryPath()
{
    return ConfigurationManager::API_BASE + "/stops";
}

HttpRequest CityBusClient::buildApiRequest(std::string const& path, std::string const& token) const
{
    HttpRequest request;
    request.host   = ConfigurationManager::API_HOST;
    request.target = path;
    // The API refuses requests that do not look like they come from the web front end.
    request.headers = {
        {"User-Agent",    ConfigurationManager::USER_AGENT},
        {"Accept",        "application/json, text/javascript, */*; q=0.01"},
        {"Referer",       ConfigurationManager::WEB_ORIGIN + "/"},
        {"Origin",        ConfigurationManager::WEB_ORIGIN},
        {"Authorization", "Bearer " + token}
    };
    return request;
}

boost::asio::awaitable<std::string> CityBusClient::fetchAuthorized(std::string path, Endpoint endpoint)
{
    std::string token = co_await credentials.resolveToken();
    HttpResponse response = co_await transport.get(buildApiRequest(path, token));

    if (!response.ok())
    {
        bool expired = endpoint == Endpoint::Schedule && response.status == 401;
        throw HttpStatusError(response.status, endpoint, expired);
    }

    co_return std::move(response.body);
}

boost::asio::awaitable<std::vector<TripEntry>> CityBusClient::fetchSchedule(int stopCode, int day)
{
    if (stopCode <= 0)
        throw std::invalid_argument("stop code must be positive");
    if (day < 1 || day > 7)
        throw std::invalid_argument("day must be between 1 (Monday) and 7 (Sunday)");

    std::string body = co_await fetchAuthorized(schedulePath(stopCode, day), Endpoint::Schedule);
    co_return Parser::parseSchedule(body);
}

boost::asio::awaitable<LiveResponse> CityBusClient::fetchLive(int stopCode)
{
    if (stopCode <= 0)
        throw std::invalid_argument("stop code must be positive");

    std::string body = co_await fetchAuthorized(livePath(stopCode), Endpoint::Live);
    co_return Parser::parseLive(body);
}

boost::asio::awaitable<StopDirectory> CityBusClient::fetchDirectory()
{
    std::string body = co_await fetchAuthorized(directoryPath(), Endpoint::Directory);
    co_return Parser::parseDirectory(body);
}
