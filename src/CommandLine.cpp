#include <cmath>
#include "Errors.hpp"
#include "CommandLine.hpp"

const char* const USAGE =
    "Usage: citybus [--stop N] [--day N] [--live]\n"
    "               [--names [QUERY]] [--nearby [METRES] [--lat X --lon Y]]\n"
    "\n"
    "Get Patras CityBus times for a stop and day.\n"
    "\n"
    "  --stop N          Stop code\n"
    "  --day N           Day of week (1=Monday, ..., 7=Sunday)\n"
    "  --live            Show live bus times instead of scheduled\n"
    "  --names [QUERY]   Print the stop code-to-name map, filtered by QUERY if given\n"
    "  --nearby [METRES] List stops within METRES (default 500) of --lat/--lon\n"
    "                    or of CITYBUS_LOCATION=\"lat,lon\"\n"
    "  --help            Show this message\n"
    "\n"
    "Notes:\n"
    "- Live times require internet\n"
    "- Greek characters (UTF-8) supported\n"
    "- The stop directory is cached in $CITYBUS_DATA_DIR (default ~/.citybus);\n"
    "  delete stops.json there to pick up changes to the network\n";

namespace
{
int parseInt(std::string const& option, std::string const& value)
{
    std::size_t used = 0;
    int parsed = 0;
    try
    {
        parsed = std::stoi(value, &used);
    }
    catch (std::exception const&)
    {
        throw UsageError(option + " expects an integer, got '" + value + "'");
    }
    if (used != value.size())
        throw UsageError(option + " expects an integer, got '" + value + "'");
    return parsed;
}

double parseDouble(std::string const& option, std::string const& value)
{
    std::size_t used = 0;
    double parsed = 0.0;
    try
    {
        parsed = std::stod(value, &used);
    }
    catch (std::exception const&)
    {
        throw UsageError(option + " expects a number, got '" + value + "'");
    }
    if (used != value.size() || !std::isfinite(parsed))
        throw UsageError(option + " expects a number, got '" + value + "'");
    return parsed;
}

bool hasValue(int i, int argc, char const* const argv[])
{
    return i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0;
}
}

CommandLine parseCommandLineArgs(int argc, char const* const argv[], UserPreferences const& defaults)
{
    CommandLine args;
    args.stop = defaults.stop;
    args.day  = defaults.day;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h")
        {
            args.command = Command::Help;
        }
        else if (arg == "--stop" && hasValue(i, argc, argv))
        {
            args.stop = parseInt(arg, argv[++i]);
        }
        else if (arg == "--day" && hasValue(i, argc, argv))
        {
            args.day = parseInt(arg, argv[++i]);
        }
        else if (arg == "--live")
        {
            args.command = Command::Live;
        }
        else if (arg == "--names")
        {
            args.command = Command::Names;
            if (hasValue(i, argc, argv))
                args.nameQuery = argv[++i];
        }
        else if (arg == "--nearby")
        {
            args.command = Command::Nearby;
            if (hasValue(i, argc, argv))
                args.radiusMeters = parseDouble(arg, argv[++i]);
        }
        else if (arg == "--lat" && i + 1 < argc)
        {
            args.latitude = parseDouble(arg, argv[++i]);
        }
        else if (arg == "--lon" && i + 1 < argc)
        {
            args.longitude = parseDouble(arg, argv[++i]);
        }
        else
        {
            throw UsageError("unknown or malformed argument: " + arg);
        }
    }

    switch (args.command)
    {
    case Command::Schedule:
        if (args.day < 1 || args.day > 7)
            throw UsageError("--day must be between 1 (Monday) and 7 (Sunday)");
        [[fallthrough]];
    case Command::Live:
        if (args.stop <= 0)
            throw UsageError("--stop must be a positive stop code");
        break;
    case Command::Nearby:
        if (args.latitude.has_value() != args.longitude.has_value())
            throw UsageError("--lat and --lon must be given together");
        if (args.latitude && (std::fabs(*args.latitude) > 90.0 || std::fabs(*args.longitude) > 180.0))
            throw UsageError("--lat/--lon are out of range");
        if (args.radiusMeters < 0.0)
            throw UsageError("--nearby expects a non-negative distance");
        break;
    case Command::Names:
    case Command::Help:
        break;
    }

    return args;
}

std::string failurePrefix(Command command)
{
    switch (command)
    {
    case Command::Live:
        return "Error fetching live data: ";
    case Command::Names:
    case Command::Nearby:
        return "Error fetching stops: ";
    default:
        return "Error fetching data: ";
    }
}

Failure describeFailure(std::exception_ptr error, Command command)
{
    try
    {
        std::rethrow_exception(error);
    }
    catch (UsageError const& e)
    {
        return {std::string("citybus: ") + e.what() + "\n\n" + USAGE, 2};
    }
    catch (HttpStatusError const& e)
    {
        if (e.tokenLikelyExpired())
            return {std::string(e.what()) + "\n", 1};
        return {failurePrefix(command) + e.what() + "\n", 1};
    }
    catch (CredentialFetchError const& e)
    {
        return {std::string("Error getting Bearer token: ") + e.what() + "\n", 1};
    }
    catch (TokenNotFoundError const& e)
    {
        return {std::string(e.what()) + "\n", 1};
    }
    catch (LocationUnavailableError const& e)
    {
        return {std::string(e.what()) + "\n", 1};
    }
    catch (NetworkError const& e)
    {
        return {failurePrefix(command) + e.what() + "\n", 1};
    }
    catch (PayloadError const& e)
    {
        return {failurePrefix(command) + e.what() + "\n", 1};
    }
    catch (std::exception const& e)
    {
        return {std::string("Main Error: ") + e.what() + "\n", 1};
    }
}
