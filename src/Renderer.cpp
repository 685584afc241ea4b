#include <sstream>
#include <cmath>
#include <cstdlib>
#include <unistd.h>
#include <date/tz.h>
#include "ConfigurationManager.hpp"
#include "Parser.hpp"
#include "Renderer.hpp"

namespace
{
constexpr char const* BOLD   = "1";
constexpr char const* DIM    = "2";
constexpr char const* GREEN  = "32";
constexpr char const* YELLOW = "33";
constexpr char const* CYAN   = "36";

std::size_t displayWidth(std::string const& text)
{
    std::size_t width = 0;
    for (unsigned char c : text)
    {
        if ((c & 0xC0) != 0x80)
            ++width;
    }
    return width;
}
}

Renderer::Renderer(bool useColor)
    : color(useColor)
{
}

bool Renderer::terminalSupportsColor()
{
    return ::isatty(STDOUT_FILENO) && !std::getenv("NO_COLOR");
}

std::string Renderer::paint(std::string const& text, char const* code) const
{
    if (!color)
        return text;
    return std::string("\033[") + code + "m" + text + "\033[0m";
}

std::string Renderer::pad(std::string const& text, std::size_t width)
{
    std::size_t current = displayWidth(text);
    if (current >= width)
        return text;
    return text + std::string(width - current, ' ');
}

std::string Renderer::arrivalClock(std::chrono::system_clock::time_point now, int minutes)
{
    auto zone = date::locate_zone(ConfigurationManager::TIME_ZONE);
    auto arrival = date::floor<std::chrono::minutes>(now + std::chrono::minutes(minutes));
    date::zoned_time local{zone, arrival};
    return date::format("%H:%M", local);
}

std::string Renderer::schedule(std::vector<TripEntry> const& trips) const
{
    if (trips.empty())
        return "No bus times found.\n";

    std::stringstream ss;
    ss << paint(trips.front().stopName, BOLD) << "\n";
    ss << paint(pad("Time", 6) + " " + pad("Route", 30) + " " + "Code", BOLD) << "\n";
    ss << std::string(45, '-') << "\n";

    for (auto const& trip : trips)
    {
        ss << paint(pad(trip.tripTime, 6), GREEN) << " "
           << pad(trip.routeName, 30) << " "
           << paint(trip.lineCode, CYAN) << "\n";
    }
    return ss.str();
}

std::string Renderer::live(LiveResponse const& response, std::chrono::system_clock::time_point now) const
{
    if (response.vehicles.empty())
        return "No live vehicles found.\n";

    std::stringstream ss;
    ss << paint(pad("Mins", 5) + " " + pad("Time", 6) + " " + pad("Route", 30) + " " + "Line", BOLD) << "\n";
    ss << std::string(50, '-') << "\n";

    for (auto const& vehicle : response.vehicles)
    {
        std::string mins = "N/A";
        std::string clock = "N/A";
        char const* tone = DIM;
        if (vehicle.departureMins)
        {
            mins  = std::to_string(*vehicle.departureMins);
            clock = arrivalClock(now, *vehicle.departureMins);
            tone  = *vehicle.departureMins <= 5 ? YELLOW : GREEN;
        }

        ss << paint(pad(mins, 5), tone) << " "
           << pad(clock, 6) << " "
           << pad(vehicle.routeName, 30) << " "
           << paint(vehicle.lineCode, CYAN) << "\n";
    }
    return ss.str();
}

std::string Renderer::nearby(std::vector<ProximityResult> const& results, double maxDistanceMeters) const
{
    std::stringstream ss;
    if (results.empty())
    {
        ss << "No stops within " << std::llround(maxDistanceMeters) << " m.\n";
        return ss.str();
    }

    ss << paint(pad("Code", 6) + " " + pad("Name", 40) + " " + "Distance (m)", BOLD) << "\n";
    ss << std::string(60, '-') << "\n";

    for (auto const& result : results)
    {
        ss << paint(pad(std::to_string(result.stop.code), 6), CYAN) << " "
           << pad(result.stop.name, 40) << " "
           << std::llround(result.distanceMeters) << "\n";
    }
    return ss.str();
}

std::string Renderer::names(StopNameMap const& stopNames)
{
    return Parser::nameMapToJson(stopNames).dump(2) + "\n";
}
