#pragma once
#include <string>
#include <vector>
#include <boost/asio/awaitable.hpp>
#include "CredentialResolver.hpp"
#include "Errors.hpp"
#include "HttpTransport.hpp"
#include "Types.hpp"

class CityBusClient
{
private:
    HttpTransport& transport;
    CredentialResolver& credentials;

    HttpRequest buildApiRequest(std::string const& path, std::string const& token) const;
    boost::asio::awaitable<std::string> fetchAuthorized(std::string path, Endpoint endpoint);

public:
    CityBusClient(HttpTransport& http, CredentialResolver& resolver);

    // day: 1=Monday ... 7=Sunday
    boost::asio::awaitable<std::vector<TripEntry>> fetchSchedule(int stopCode, int day);
    boost::asio::awaitable<LiveResponse> fetchLive(int stopCode);
    boost::asio::awaitable<StopDirectory> fetchDirectory();

    static std::string schedulePath(int stopCode, int day);
    static std::string livePath(int stopCode);
    static std::string directoryPath();
};
