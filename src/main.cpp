#include <string>
#include <iostream>
#include <optional>
#include <utility>
#include <chrono>
#include <boost/asio.hpp>
#include "ConfigurationManager.hpp"
#include "HttpsClient.hpp"
#include "CredentialResolver.hpp"
#include "CityBusClient.hpp"
#include "StopDirectoryCache.hpp"
#include "ProximitySearch.hpp"
#include "Renderer.hpp"
#include "RunBlocking.hpp"
#include "CommandLine.hpp"

namespace
{
boost::asio::awaitable<void> runCommand(CommandLine const& args, CityBusClient& client, StopDirectoryCache& cache, Renderer const& renderer)
{
    switch (args.command)
    {
    case Command::Live:
    {
        LiveResponse live = co_await client.fetchLive(args.stop);
        std::cout << renderer.live(live, std::chrono::system_clock::now());
        break;
    }
    case Command::Names:
    {
        auto names = co_await cache.searchNames(args.nameQuery);
        std::cout << Renderer::names(names);
        break;
    }
    case Command::Nearby:
    {
        StopDirectory directory = co_await cache.getDirectory();
        std::optional<Coordinate> origin;
        if (args.latitude)
            origin = Coordinate{*args.latitude, *args.longitude};

        EnvironmentLocationProvider locations;
        auto results = ProximitySearch::findNearby(directory, args.radiusMeters, origin, locations);
        std::cout << renderer.nearby(results, args.radiusMeters);
        break;
    }
    case Command::Schedule:
    {
        auto trips = co_await client.fetchSchedule(args.stop, args.day);
        std::cout << renderer.schedule(trips);
        break;
    }
    case Command::Help:
        std::cout << USAGE;
        break;
    }
    co_return;
}
}

int main(int argc, char* argv[])
{
    Command command = Command::Schedule;
    try
    {
        ConfigurationManager config;
        CommandLine args = parseCommandLineArgs(argc, argv, config.getPreferences());
        command = args.command;

        boost::asio::io_context io;
        HttpsClient http(io);
        PageTokenResolver credentials(http);
        CityBusClient client(http, credentials);
        StopDirectoryCache cache(client, config.getDataDir());
        Renderer renderer(Renderer::terminalSupportsColor());

        runBlocking(io, runCommand(args, client, cache, renderer));
    }
    catch (std::exception const&)
    {
        Failure failure = describeFailure(std::current_exception(), command);
        std::cerr << failure.message;
        return failure.exitCode;
    }

    return 0;
}
